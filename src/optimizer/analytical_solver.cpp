/**
 * @file analytical_solver.cpp
 * @brief Implementation of the closed-form fallback solver
 */

#include "optimizer/analytical_solver.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace cemv
{
    namespace optimizer
    {

        AnalyticalSolver::AnalyticalSolver(double risk_aversion) : OptimizerInterface(risk_aversion)
        {
        }

        std::string AnalyticalSolver::get_name() const
        {
            return "AnalyticalSolver";
        }

        nlohmann::json AnalyticalSolver::get_parameters() const
        {
            nlohmann::json params;
            params["optimizer_type"] = "Analytical";
            params["risk_aversion"] = risk_aversion_;
            params["regularization"] = REGULARIZATION;
            return params;
        }

        Eigen::VectorXd AnalyticalSolver::equal_weights(Eigen::Index n)
        {
            return Eigen::VectorXd::Constant(n, 1.0 / static_cast<double>(n));
        }

        Eigen::MatrixXd AnalyticalSolver::pseudo_inverse(const Eigen::MatrixXd &matrix)
        {
            Eigen::JacobiSVD<Eigen::MatrixXd> svd(matrix, Eigen::ComputeThinU | Eigen::ComputeThinV);

            const Eigen::VectorXd &sigma = svd.singularValues();
            const double sigma_max = sigma.size() > 0 ? sigma.maxCoeff() : 0.0;
            const double cutoff = static_cast<double>(std::max(matrix.rows(), matrix.cols())) *
                                  std::numeric_limits<double>::epsilon() * sigma_max;

            Eigen::VectorXd inverted = Eigen::VectorXd::Zero(sigma.size());
            for (Eigen::Index i = 0; i < sigma.size(); ++i)
            {
                if (sigma(i) > cutoff)
                {
                    inverted(i) = 1.0 / sigma(i);
                }
            }

            return svd.matrixV() * inverted.asDiagonal() * svd.matrixU().transpose();
        }

        OptimizationResult AnalyticalSolver::optimize(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance) const
        {
            validate_inputs(expected_returns, covariance);

            const Eigen::Index n = expected_returns.size();
            const Eigen::VectorXd ones = Eigen::VectorXd::Ones(n);

            Eigen::MatrixXd regularized = covariance + REGULARIZATION * Eigen::MatrixXd::Identity(n, n);
            Eigen::MatrixXd A = pseudo_inverse(regularized);

            const double B = A.sum();
            const Eigen::VectorXd C = A * expected_returns;
            const double C_sum = C.sum();

            Eigen::VectorXd weights;
            std::string message;

            if (!std::isfinite(B) || std::abs(B) < DEGENERACY_THRESHOLD)
            {
                weights = equal_weights(n);
                message = "Degenerate inverse, equal weights";
            }
            else
            {
                const double nu = 2.0 * risk_aversion_ * (C_sum - 1.0) / B;
                weights = (A * (expected_returns - nu * ones)) / (2.0 * risk_aversion_);
                weights = weights.cwiseMax(0.0);

                const double total = weights.sum();
                if (!std::isfinite(total) || total <= DEGENERACY_THRESHOLD)
                {
                    weights = equal_weights(n);
                    message = "No positive weight after clipping, equal weights";
                }
                else
                {
                    weights /= total;
                    message = "Closed-form solution";
                }
            }

            OptimizationResult result = calculate_statistics(weights, expected_returns, covariance);
            result.success = true;
            result.message = message;
            result.iterations = 0;
            return result;
        }

    } // namespace optimizer
} // namespace cemv
