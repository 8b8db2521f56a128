/**
 * @file risk_model.hpp
 * @brief Abstract interface for covariance estimation methods
 *
 * Provides a common interface for covariance estimators feeding the
 * mean-variance optimizer, plus the PSD repair step that makes an
 * estimated matrix usable by a convex solver.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace cemv
{
    namespace risk
    {

        /**
         * @class RiskModel
         * @brief Abstract base class for covariance estimation
         *
         * Usage Example:
         * @code
         * std::unique_ptr<RiskModel> model = std::make_unique<SampleCovariance>();
         * Eigen::MatrixXd cov = model->estimate_covariance(panel.get_prices());
         * @endcode
         */
        class RiskModel
        {
        public:
            virtual ~RiskModel() = default;

            /**
             * @brief Estimate covariance matrix from observations
             * @param observations Matrix (rows = observations, cols = assets); may contain NaN
             * @return Covariance matrix (n_assets x n_assets), symmetric
             * @throws std::invalid_argument if fewer than 2 observations or no assets
             */
            virtual Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &observations) const = 0;

            /**
             * @brief Get the name of the risk model
             */
            virtual std::string get_name() const = 0;

            /**
             * @brief Clip eigenvalues so the matrix is positive semi-definite
             * @param covariance Symmetric input matrix
             * @param min_eigenvalue Floor applied to every eigenvalue
             * @return V * diag(max(lambda, min_eigenvalue)) * V^T, or
             *         covariance + min_eigenvalue * I if the decomposition fails
             */
            static Eigen::MatrixXd make_psd(const Eigen::MatrixXd &covariance,
                                            double min_eigenvalue = 1e-8);

        protected:
            /**
             * @brief Validate observation matrix shape
             * @throws std::invalid_argument if validation fails
             */
            static void validate_observations(const Eigen::MatrixXd &observations);

            /**
             * @brief Enforce exact symmetry: (M + M^T) / 2
             */
            static Eigen::MatrixXd ensure_symmetric(const Eigen::MatrixXd &matrix);
        };

    } // namespace risk
} // namespace cemv
