/**
 * @file mean_variance_optimizer.hpp
 * @brief Constrained mean-variance optimizer (QP)
 *
 * Mathematical Formulation:
 *
 * Maximize:     mu^T * w - lambda * w^T * Sigma * w
 * Subject to:   sum(w_i) = 1
 *               w_i >= 0
 *
 * which is handed to the QP backend as
 *
 * Minimize:     (1/2) * w^T * (2 * lambda * Sigma_psd) * w - mu^T * w
 *
 * where Sigma_psd is the covariance with eigenvalues clipped at 1e-8.
 * After the solve negatives are clipped to 0 and the vector renormalized.
 */

#pragma once

#include "optimizer/optimizer_interface.hpp"
#include "optimizer/quadratic_solver.hpp"
#include <memory>

namespace cemv
{
    namespace optimizer
    {

        /**
         * @class MeanVarianceOptimizer
         * @brief Long-only mean-variance optimizer on top of a QP backend
         *
         * Every numerical failure of the backend (infeasible, not converged,
         * time limit, setup failure, exceptions) comes back as
         * success = false; callers fall back to AnalyticalSolver.
         *
         * Usage Example:
         * @code
         * MeanVarianceOptimizer optimizer(0.01);
         * OptimizationResult result = optimizer.optimize(mu, Q);
         * if (!result.success) {
         *     result = AnalyticalSolver(0.01).optimize(mu, Q);
         * }
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class MeanVarianceOptimizer : public OptimizerInterface
        {
        public:
            static constexpr double PSD_EIGENVALUE_FLOOR = 1e-8;

            /**
             * @param risk_aversion lambda > 0
             * @param solver QP backend; OSQPSolver with default options when null
             * @throws std::invalid_argument if lambda <= 0
             */
            explicit MeanVarianceOptimizer(double risk_aversion = 0.01,
                                           std::unique_ptr<QuadraticSolver> solver = nullptr);

            ~MeanVarianceOptimizer() override = default;

            /**
             * @brief Solve the long-only program
             * @throws std::invalid_argument if inputs are malformed
             */
            OptimizationResult optimize(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance) const override;

            /**
             * @return "MeanVarianceOptimizer"
             */
            std::string get_name() const override;

            nlohmann::json get_parameters() const override;

            /**
             * @brief Build the QP for (mu, Sigma) without solving it
             */
            QuadraticProblem build_problem(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance) const;

            void set_solver_options(const SolverOptions &options);
            const QuadraticSolver &get_solver() const { return *solver_; }

        private:
            std::unique_ptr<QuadraticSolver> solver_; ///< QP backend
        };

    } // namespace optimizer
} // namespace cemv
