/**
 * @file quadratic_solver.cpp
 * @brief Validation and configuration of quadratic programming problems
 */

#include "optimizer/quadratic_solver.hpp"
#include <stdexcept>

namespace cemv
{
    namespace optimizer
    {

        // ===========================
        // QuadraticProblem
        // ===========================

        void QuadraticProblem::validate() const
        {
            const Eigen::Index n = q.size();

            if (n == 0)
            {
                throw std::invalid_argument("Quadratic problem has no variables");
            }

            if (P.rows() != n || P.cols() != n)
            {
                throw std::invalid_argument(
                    "P matrix must be " + std::to_string(n) + "x" + std::to_string(n) +
                    ", got " + std::to_string(P.rows()) + "x" + std::to_string(P.cols()));
            }

            if (A_eq.size() > 0)
            {
                if (A_eq.cols() != n)
                {
                    throw std::invalid_argument("A_eq column count does not match problem dimension");
                }
                if (b_eq.size() != A_eq.rows())
                {
                    throw std::invalid_argument("b_eq size does not match A_eq rows");
                }
            }

            if (lower_bounds.size() != n || upper_bounds.size() != n)
            {
                throw std::invalid_argument("Bounds must have one entry per variable");
            }

            if ((lower_bounds.array() > upper_bounds.array()).any())
            {
                throw std::invalid_argument("Lower bound exceeds upper bound");
            }
        }

        // ===========================
        // SolverOptions
        // ===========================

        SolverOptions SolverOptions::from_json(const nlohmann::json &j)
        {
            SolverOptions options;
            options.max_iterations = j.value("max_iterations", 10000);
            options.tolerance = j.value("tolerance", 1e-6);
            options.time_limit = j.value("time_limit", 0.0);
            options.accept_inaccurate = j.value("accept_inaccurate", false);
            options.verbose = j.value("verbose", false);
            options.validate();
            return options;
        }

        void SolverOptions::validate() const
        {
            if (max_iterations < 1)
            {
                throw std::invalid_argument("Solver max_iterations must be positive");
            }
            if (!(tolerance > 0.0))
            {
                throw std::invalid_argument("Solver tolerance must be positive");
            }
            if (time_limit < 0.0)
            {
                throw std::invalid_argument("Solver time_limit cannot be negative");
            }
        }

        SolverResult::SolverResult()
            : objective_value(0.0), success(false), iterations(0), message("Not solved")
        {
        }

    } // namespace optimizer
} // namespace cemv
