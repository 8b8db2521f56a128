/**
 * @file osqp_solver.hpp
 * @brief OSQP-based quadratic programming solver
 *
 * Wraps the OSQP library for the mean-variance program of the optimizer.
 *
 * Problem formulation:
 *   minimize     (1/2) x^T P x + q^T x
 *   subject to   A_eq x = b_eq    (equality constraints)
 *                lb <= x <= ub     (box constraints)
 *
 * Only a fully solved status counts as success unless
 * SolverOptions::accept_inaccurate is set. Infeasibility, iteration and
 * time limits, setup errors and non-finite output are reported through
 * SolverResult, never thrown.
 */

#pragma once

#include "quadratic_solver.hpp"
#include <Eigen/Dense>
#include <osqp/osqp.h>
#include <vector>

namespace cemv
{
    namespace optimizer
    {

        /**
         * @class OSQPSolver
         * @brief Quadratic programming solver using the OSQP library
         *
         * Usage Example:
         * @code
         * SolverOptions options;
         * options.max_iterations = 10000;
         * options.tolerance = 1e-6;
         * OSQPSolver solver(options);
         *
         * SolverResult result = solver.solve(problem);
         * if (!result.success) {
         *     std::cerr << "Warning: QP failed: " << result.message << "\n";
         * }
         * @endcode
         *
         * Thread Safety: Each call builds its own OSQP workspace, so concurrent
         * calls on one instance are safe.
         */
        class OSQPSolver : public QuadraticSolver
        {
        public:
            explicit OSQPSolver(const SolverOptions &options = SolverOptions());

            ~OSQPSolver() override = default;

            /**
             * @brief Solve quadratic programming problem
             * @param problem QP problem data
             * @return Solution with status, iterations, and objective value
             * @throws std::invalid_argument if problem dimensions are inconsistent
             */
            SolverResult solve(const QuadraticProblem &problem) const override;

            /**
             * @return "OSQP"
             */
            std::string get_name() const override;

        private:
            /**
             * @brief Convert Eigen dense matrix to OSQP sparse CSC format
             * @param upper_triangular_only Only store upper triangle (P must be given this way)
             */
            static void convert_to_csc(
                const Eigen::MatrixXd &dense,
                std::vector<OSQPFloat> &data,
                std::vector<OSQPInt> &indices,
                std::vector<OSQPInt> &indptr,
                bool upper_triangular_only);

            /**
             * @brief Build constraint matrix and bounds
             * @return Number of constraint rows (m)
             *
             * Constructs A = [A_eq; I], l = [b_eq; lb], u = [b_eq; ub].
             */
            static OSQPInt build_constraint_matrix(
                const QuadraticProblem &problem,
                std::vector<OSQPFloat> &A_data,
                std::vector<OSQPInt> &A_indices,
                std::vector<OSQPInt> &A_indptr,
                std::vector<OSQPFloat> &l,
                std::vector<OSQPFloat> &u);
        };

    } // namespace optimizer
} // namespace cemv
