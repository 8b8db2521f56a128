/**
 * @file optimizer_interface.hpp
 * @brief Abstract interface for mean-variance weight solvers
 *
 * Both the QP-based solver and its closed-form fallback answer the same
 * question: the long-only weights maximizing mu'x - lambda * x'Qx with
 * sum(x) = 1. This interface lets the pipeline treat them uniformly.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include <Eigen/Dense>
#include <string>
#include <nlohmann/json.hpp>

namespace cemv
{
    namespace optimizer
    {

        /**
         * @enum SolverKind
         * @brief Which solver produced a weight vector
         */
        enum class SolverKind
        {
            QP,      ///< Quadratic program solved to optimality
            FALLBACK ///< Closed-form Lagrangian solution
        };

        /**
         * @return "qp" or "fallback"
         */
        std::string to_string(SolverKind kind);

        /**
         * @struct SolveReport
         * @brief Per-call record of how the raw weights were obtained
         */
        struct SolveReport
        {
            SolverKind solver = SolverKind::QP;
            std::string message;
            int iterations = 0;

            nlohmann::json to_json() const;
        };

        /**
         * @struct OptimizationResult
         * @brief Container for optimization results
         */
        struct OptimizationResult
        {
            Eigen::VectorXd weights; ///< Long-only weights summing to 1
            double expected_return;  ///< mu'w
            double volatility;       ///< sqrt(w'Qw)
            bool success;            ///< Solver converged
            std::string message;     ///< Status message
            int iterations;          ///< Number of iterations
            double objective_value;  ///< mu'w - lambda * w'Qw

            OptimizationResult();

            /**
             * @brief Check if result is usable
             */
            bool is_valid() const;
        };

        /**
         * @class OptimizerInterface
         * @brief Abstract base class for weight solvers
         *
         * Usage Example:
         * @code
         * std::unique_ptr<OptimizerInterface> solver =
         *     std::make_unique<MeanVarianceOptimizer>(0.01);
         * OptimizationResult result = solver->optimize(mu, Q);
         * if (!result.success) { ... }
         * @endcode
         */
        class OptimizerInterface
        {
        public:
            virtual ~OptimizerInterface() = default;

            /**
             * @brief Solve for long-only weights
             * @param expected_returns Expected returns for each asset (N x 1)
             * @param covariance Covariance matrix (N x N)
             * @return OptimizationResult; numerical failure is success = false
             * @throws std::invalid_argument if inputs are malformed
             */
            virtual OptimizationResult optimize(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance) const = 0;

            /**
             * @brief Get optimizer name
             */
            virtual std::string get_name() const = 0;

            /**
             * @brief Get optimizer parameters as JSON
             */
            virtual nlohmann::json get_parameters() const = 0;

            double get_risk_aversion() const { return risk_aversion_; }

            /**
             * @brief Validate input data
             * @throws std::invalid_argument on empty, mismatched or non-finite inputs
             */
            static void validate_inputs(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance);

        protected:
            /**
             * @param risk_aversion lambda > 0
             * @throws std::invalid_argument if lambda <= 0
             */
            explicit OptimizerInterface(double risk_aversion);

            /**
             * @brief Fill return, volatility and objective of a weight vector
             */
            OptimizationResult calculate_statistics(
                const Eigen::VectorXd &weights,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance) const;

            double risk_aversion_; ///< lambda
        };

    } // namespace optimizer
} // namespace cemv
