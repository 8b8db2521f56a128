/**
 * @file risk_model.cpp
 * @brief Implementation of RiskModel base class utilities
 */

#include "risk/risk_model.hpp"
#include <stdexcept>

namespace cemv
{
    namespace risk
    {
        void RiskModel::validate_observations(const Eigen::MatrixXd &observations)
        {
            if (observations.rows() == 0 || observations.cols() == 0)
            {
                throw std::invalid_argument("Observation matrix cannot be empty.");
            }

            if (observations.rows() < 2)
            {
                throw std::invalid_argument("Not enough observations to compute risk model. At least 2 rows are required for covariance estimation. Received: " + std::to_string(observations.rows()));
            }
        }

        Eigen::MatrixXd RiskModel::ensure_symmetric(const Eigen::MatrixXd &matrix)
        {
            return 0.5 * (matrix + matrix.transpose());
        }

        Eigen::MatrixXd RiskModel::make_psd(const Eigen::MatrixXd &covariance, double min_eigenvalue)
        {
            const Eigen::Index n = covariance.rows();
            if (n == 0 || covariance.cols() != n)
            {
                throw std::invalid_argument("make_psd requires a non-empty square matrix");
            }

            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(covariance);
            if (solver.info() != Eigen::Success || !solver.eigenvalues().allFinite())
            {
                return covariance + min_eigenvalue * Eigen::MatrixXd::Identity(n, n);
            }

            Eigen::VectorXd clipped = solver.eigenvalues().cwiseMax(min_eigenvalue);
            const Eigen::MatrixXd &vectors = solver.eigenvectors();

            return vectors * clipped.asDiagonal() * vectors.transpose();
        }
    } // namespace risk
} // namespace cemv
