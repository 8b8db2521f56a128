/**
 * @file quadratic_solver.hpp
 * @brief Quadratic programming problem, options and result structures
 *
 * Shared by every QP backend of the optimizer. Problems have the form:
 *
 * Minimize:     (1/2) * x^T * P * x + q^T * x
 * Subject to:   A_eq * x = b_eq      (equality constraints)
 *               l <= x <= u          (box constraints)
 */

#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>

namespace cemv
{
    namespace optimizer
    {

        /**
         * @struct QuadraticProblem
         * @brief Quadratic programming problem data
         */
        struct QuadraticProblem
        {
            Eigen::MatrixXd P; ///< Quadratic term (N x N), symmetric
            Eigen::VectorXd q; ///< Linear term (N x 1)

            Eigen::MatrixXd A_eq; ///< Equality constraint matrix (K x N), may be empty
            Eigen::VectorXd b_eq; ///< Equality constraint values (K x 1)

            Eigen::VectorXd lower_bounds; ///< Lower bounds (N x 1)
            Eigen::VectorXd upper_bounds; ///< Upper bounds (N x 1)

            QuadraticProblem() = default;

            /**
             * @brief Number of decision variables
             */
            Eigen::Index dimension() const { return q.size(); }

            /**
             * @brief Validate problem dimensions and data
             * @throws std::invalid_argument if problem is ill-formed
             */
            void validate() const;
        };

        /**
         * @struct SolverOptions
         * @brief Options for quadratic solvers
         */
        struct SolverOptions
        {
            int max_iterations = 10000;     ///< Maximum iterations
            double tolerance = 1e-6;        ///< Absolute and relative convergence tolerance
            double time_limit = 0.0;        ///< Wall-clock limit in seconds, 0 disables it
            bool accept_inaccurate = false; ///< Treat "solved inaccurate" as success
            bool verbose = false;           ///< Print solver progress

            SolverOptions() = default;

            /**
             * @brief Load from the "solver" JSON object
             * @throws std::invalid_argument if a value is out of range
             */
            static SolverOptions from_json(const nlohmann::json &j);

            /**
             * @throws std::invalid_argument if a value is out of range
             */
            void validate() const;
        };

        /**
         * @struct SolverResult
         * @brief Result from a quadratic solver
         *
         * A failed solve is reported through success = false and message;
         * solvers never throw for numerical failures.
         */
        struct SolverResult
        {
            Eigen::VectorXd solution; ///< Solution (empty when setup failed)
            double objective_value;   ///< Final objective value
            bool success;             ///< Convergence achieved
            int iterations;           ///< Number of iterations
            std::string message;      ///< Status message

            SolverResult();
        };

        /**
         * @class QuadraticSolver
         * @brief Abstract quadratic programming backend
         *
         * Usage Example:
         * @code
         * QuadraticProblem problem;
         * problem.P = 2.0 * risk_aversion * covariance;
         * problem.q = -expected_returns;
         * problem.A_eq = Eigen::MatrixXd::Ones(1, n);
         * problem.b_eq = Eigen::VectorXd::Ones(1);
         *
         * std::unique_ptr<QuadraticSolver> solver = std::make_unique<OSQPSolver>();
         * SolverResult result = solver->solve(problem);
         * @endcode
         */
        class QuadraticSolver
        {
        public:
            virtual ~QuadraticSolver() = default;

            /**
             * @brief Solve quadratic program
             * @param problem Problem data
             * @return Solver result; numerical failures are reported, not thrown
             * @throws std::invalid_argument if the problem is ill-formed
             */
            virtual SolverResult solve(const QuadraticProblem &problem) const = 0;

            /**
             * @brief Get the backend name
             */
            virtual std::string get_name() const = 0;

            void set_options(const SolverOptions &options) { options_ = options; }
            const SolverOptions &get_options() const { return options_; }

        protected:
            explicit QuadraticSolver(const SolverOptions &options = SolverOptions())
                : options_(options) {}

            SolverOptions options_; ///< Solver configuration
        };

    } // namespace optimizer
} // namespace cemv
