/**
 * @file osqp_solver.cpp
 * @brief Implementation of OSQP solver wrapper
 */

#include "optimizer/osqp_solver.hpp"
#include <cmath>
#include <memory>

namespace cemv
{
    namespace optimizer
    {

        namespace
        {
            struct WorkspaceDeleter
            {
                void operator()(::OSQPSolver *workspace) const
                {
                    if (workspace != nullptr)
                    {
                        osqp_cleanup(workspace);
                    }
                }
            };

            using WorkspacePtr = std::unique_ptr<::OSQPSolver, WorkspaceDeleter>;

            SolverResult failure(const std::string &message)
            {
                SolverResult result;
                result.success = false;
                result.message = message;
                return result;
            }
        } // namespace

        OSQPSolver::OSQPSolver(const SolverOptions &options) : QuadraticSolver(options)
        {
        }

        std::string OSQPSolver::get_name() const
        {
            return "OSQP";
        }

        void OSQPSolver::convert_to_csc(
            const Eigen::MatrixXd &dense,
            std::vector<OSQPFloat> &data,
            std::vector<OSQPInt> &indices,
            std::vector<OSQPInt> &indptr,
            bool upper_triangular_only)
        {
            const Eigen::Index rows = dense.rows();
            const Eigen::Index cols = dense.cols();

            data.clear();
            indices.clear();
            indptr.clear();
            indptr.reserve(static_cast<size_t>(cols) + 1);

            indptr.push_back(0);

            for (Eigen::Index j = 0; j < cols; ++j)
            {
                Eigen::Index row_limit = upper_triangular_only ? (j + 1) : rows;

                for (Eigen::Index i = 0; i < row_limit; ++i)
                {
                    double val = dense(i, j);
                    if (std::abs(val) > 1e-14)
                    {
                        data.push_back(static_cast<OSQPFloat>(val));
                        indices.push_back(static_cast<OSQPInt>(i));
                    }
                }
                indptr.push_back(static_cast<OSQPInt>(data.size()));
            }
        }

        OSQPInt OSQPSolver::build_constraint_matrix(
            const QuadraticProblem &problem,
            std::vector<OSQPFloat> &A_data,
            std::vector<OSQPInt> &A_indices,
            std::vector<OSQPInt> &A_indptr,
            std::vector<OSQPFloat> &l,
            std::vector<OSQPFloat> &u)
        {
            const Eigen::Index n = problem.dimension();
            const Eigen::Index n_eq = (problem.A_eq.size() > 0) ? problem.A_eq.rows() : 0;
            const Eigen::Index m = n_eq + n;

            A_data.clear();
            A_indices.clear();
            A_indptr.clear();
            l.assign(static_cast<size_t>(m), 0.0);
            u.assign(static_cast<size_t>(m), 0.0);

            A_indptr.push_back(0);

            for (Eigen::Index j = 0; j < n; ++j)
            {
                for (Eigen::Index i = 0; i < n_eq; ++i)
                {
                    double val = problem.A_eq(i, j);
                    if (std::abs(val) > 1e-14)
                    {
                        A_data.push_back(static_cast<OSQPFloat>(val));
                        A_indices.push_back(static_cast<OSQPInt>(i));
                    }
                }

                // Box row for x_j
                A_data.push_back(1.0);
                A_indices.push_back(static_cast<OSQPInt>(n_eq + j));

                A_indptr.push_back(static_cast<OSQPInt>(A_data.size()));
            }

            for (Eigen::Index i = 0; i < n_eq; ++i)
            {
                l[static_cast<size_t>(i)] = problem.b_eq(i);
                u[static_cast<size_t>(i)] = problem.b_eq(i);
            }

            for (Eigen::Index i = 0; i < n; ++i)
            {
                l[static_cast<size_t>(n_eq + i)] = std::isfinite(problem.lower_bounds(i))
                                                       ? problem.lower_bounds(i)
                                                       : -OSQP_INFTY;
                u[static_cast<size_t>(n_eq + i)] = std::isfinite(problem.upper_bounds(i))
                                                       ? problem.upper_bounds(i)
                                                       : OSQP_INFTY;
            }

            return static_cast<OSQPInt>(m);
        }

        SolverResult OSQPSolver::solve(const QuadraticProblem &problem) const
        {
            problem.validate();

            const Eigen::Index n = problem.dimension();

            if (!problem.P.allFinite() || !problem.q.allFinite())
            {
                return failure("Non-finite problem data");
            }

            std::vector<OSQPFloat> P_data;
            std::vector<OSQPInt> P_indices;
            std::vector<OSQPInt> P_indptr;
            convert_to_csc(problem.P, P_data, P_indices, P_indptr, true);

            std::vector<OSQPFloat> q(problem.q.data(), problem.q.data() + n);

            std::vector<OSQPFloat> A_data;
            std::vector<OSQPInt> A_indices;
            std::vector<OSQPInt> A_indptr;
            std::vector<OSQPFloat> l;
            std::vector<OSQPFloat> u;

            OSQPInt m = build_constraint_matrix(problem, A_data, A_indices, A_indptr, l, u);

            OSQPCscMatrix P_csc{};
            P_csc.m = static_cast<OSQPInt>(n);
            P_csc.n = static_cast<OSQPInt>(n);
            P_csc.p = P_indptr.data();
            P_csc.i = P_indices.data();
            P_csc.x = P_data.data();
            P_csc.nzmax = static_cast<OSQPInt>(P_data.size());
            P_csc.nz = -1;

            OSQPCscMatrix A_csc{};
            A_csc.m = m;
            A_csc.n = static_cast<OSQPInt>(n);
            A_csc.p = A_indptr.data();
            A_csc.i = A_indices.data();
            A_csc.x = A_data.data();
            A_csc.nzmax = static_cast<OSQPInt>(A_data.size());
            A_csc.nz = -1;

            OSQPSettings settings;
            osqp_set_default_settings(&settings);
            settings.verbose = options_.verbose ? 1 : 0;
            settings.eps_abs = options_.tolerance;
            settings.eps_rel = options_.tolerance;
            settings.max_iter = options_.max_iterations;
            settings.time_limit = options_.time_limit;
            settings.polishing = 1;

            ::OSQPSolver *raw_workspace = nullptr;
            OSQPInt exit_flag = osqp_setup(&raw_workspace, &P_csc, q.data(), &A_csc,
                                           l.data(), u.data(), m, static_cast<OSQPInt>(n), &settings);
            WorkspacePtr workspace(raw_workspace);

            if (exit_flag != 0 || !workspace)
            {
                return failure("OSQP setup failed with code " + std::to_string(exit_flag));
            }

            exit_flag = osqp_solve(workspace.get());
            if (exit_flag != 0)
            {
                return failure("OSQP solve failed with code " + std::to_string(exit_flag));
            }

            SolverResult result;
            result.iterations = static_cast<int>(workspace->info->iter);
            result.objective_value = workspace->info->obj_val;
            result.message = workspace->info->status;

            const OSQPInt status = workspace->info->status_val;
            const bool solved = status == OSQP_SOLVED ||
                                (options_.accept_inaccurate && status == OSQP_SOLVED_INACCURATE);
            if (!solved || workspace->solution == nullptr || workspace->solution->x == nullptr)
            {
                result.success = false;
                return result;
            }

            result.solution = Eigen::Map<const Eigen::Matrix<OSQPFloat, Eigen::Dynamic, 1>>(
                                  workspace->solution->x, n)
                                  .cast<double>();

            if (!result.solution.allFinite())
            {
                result.success = false;
                result.message = "Non-finite solution";
                return result;
            }

            result.success = true;
            return result;
        }

    } // namespace optimizer
} // namespace cemv
