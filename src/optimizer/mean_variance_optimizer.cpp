/**
 * @file mean_variance_optimizer.cpp
 * @brief Implementation of mean-variance portfolio optimizer
 */

#include "optimizer/mean_variance_optimizer.hpp"
#include "optimizer/osqp_solver.hpp"
#include "risk/risk_model.hpp"
#include <stdexcept>
#include <cmath>

namespace cemv
{
    namespace optimizer
    {

        MeanVarianceOptimizer::MeanVarianceOptimizer(
            double risk_aversion,
            std::unique_ptr<QuadraticSolver> solver)
            : OptimizerInterface(risk_aversion),
              solver_(std::move(solver))
        {
            if (!solver_)
            {
                solver_ = std::make_unique<OSQPSolver>();
            }
        }

        std::string MeanVarianceOptimizer::get_name() const
        {
            return "MeanVarianceOptimizer";
        }

        nlohmann::json MeanVarianceOptimizer::get_parameters() const
        {
            nlohmann::json params;
            params["optimizer_type"] = "MeanVariance";
            params["risk_aversion"] = risk_aversion_;
            params["backend"] = solver_->get_name();
            params["max_iterations"] = solver_->get_options().max_iterations;
            params["tolerance"] = solver_->get_options().tolerance;
            params["time_limit"] = solver_->get_options().time_limit;
            return params;
        }

        void MeanVarianceOptimizer::set_solver_options(const SolverOptions &options)
        {
            options.validate();
            solver_->set_options(options);
        }

        QuadraticProblem MeanVarianceOptimizer::build_problem(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance) const
        {
            validate_inputs(expected_returns, covariance);

            const Eigen::Index n = expected_returns.size();

            // Minimize: (1/2) * w^T * (2 lambda Sigma) * w - mu^T * w
            QuadraticProblem problem;
            problem.P = 2.0 * risk_aversion_ * risk::RiskModel::make_psd(covariance, PSD_EIGENVALUE_FLOOR);
            problem.q = -expected_returns;

            // Equality constraint: sum(w) = 1
            problem.A_eq = Eigen::MatrixXd::Ones(1, n);
            problem.b_eq = Eigen::VectorXd::Ones(1);

            problem.lower_bounds = Eigen::VectorXd::Zero(n);
            problem.upper_bounds = Eigen::VectorXd::Ones(n);

            return problem;
        }

        OptimizationResult MeanVarianceOptimizer::optimize(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance) const
        {
            QuadraticProblem problem = build_problem(expected_returns, covariance);

            OptimizationResult result;
            SolverResult solver_result;
            try
            {
                solver_result = solver_->solve(problem);
            }
            catch (const std::exception &e)
            {
                result.success = false;
                result.message = std::string("QP solver error: ") + e.what();
                return result;
            }

            if (!solver_result.success)
            {
                result.success = false;
                result.message = solver_result.message;
                result.iterations = solver_result.iterations;
                return result;
            }

            Eigen::VectorXd weights = solver_result.solution.cwiseMax(0.0);
            const double total = weights.sum();
            if (!std::isfinite(total) || total <= 1e-12)
            {
                result.success = false;
                result.message = "Degenerate QP solution (sum " + std::to_string(total) + ")";
                result.iterations = solver_result.iterations;
                return result;
            }
            weights /= total;

            result = calculate_statistics(weights, expected_returns, covariance);
            result.success = true;
            result.message = solver_result.message;
            result.iterations = solver_result.iterations;

            return result;
        }

    } // namespace optimizer
} // namespace cemv
