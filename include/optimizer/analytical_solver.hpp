/**
 * @file analytical_solver.hpp
 * @brief Closed-form fallback for the mean-variance program
 *
 * Used when the QP backend fails. With A = pinv(Sigma + 1e-8 I):
 *
 *     B     = sum(A)
 *     C     = A * mu,  C_sum = sum(C)
 *     nu    = 2 * lambda * (C_sum - 1) / B
 *     w     = (1 / (2 * lambda)) * A * (mu - nu * 1)
 *
 * Negatives are clipped and the vector renormalized. Degenerate cases
 * (|B| < 1e-12, nothing left after clipping, non-finite values) give
 * equal weights, so the solver always returns a usable vector.
 */

#pragma once

#include "optimizer/optimizer_interface.hpp"

namespace cemv
{
    namespace optimizer
    {

        /**
         * @class AnalyticalSolver
         * @brief Lagrangian solution via SVD pseudoinverse
         *
         * Usage Example:
         * @code
         * AnalyticalSolver fallback(0.01);
         * OptimizationResult result = fallback.optimize(mu, Q);  // always success
         * @endcode
         */
        class AnalyticalSolver : public OptimizerInterface
        {
        public:
            static constexpr double REGULARIZATION = 1e-8;
            static constexpr double DEGENERACY_THRESHOLD = 1e-12;

            /**
             * @throws std::invalid_argument if lambda <= 0
             */
            explicit AnalyticalSolver(double risk_aversion = 0.01);

            ~AnalyticalSolver() override = default;

            /**
             * @brief Closed-form weights; success is always true
             * @throws std::invalid_argument if inputs are malformed
             */
            OptimizationResult optimize(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance) const override;

            /**
             * @return "AnalyticalSolver"
             */
            std::string get_name() const override;

            nlohmann::json get_parameters() const override;

            /**
             * @brief Moore-Penrose pseudoinverse
             *
             * Singular values below max(rows, cols) * eps * sigma_max are
             * treated as zero.
             */
            static Eigen::MatrixXd pseudo_inverse(const Eigen::MatrixXd &matrix);

            static Eigen::VectorXd equal_weights(Eigen::Index n);
        };

    } // namespace optimizer
} // namespace cemv
