/**
 * @file portfolio_optimizer.cpp
 * @brief Implementation of the weight construction pipeline
 */

#include "optimizer/portfolio_optimizer.hpp"
#include "optimizer/osqp_solver.hpp"
#include "optimizer/weight_transforms.hpp"
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace cemv
{
    namespace optimizer
    {

        namespace
        {
            std::unique_ptr<QuadraticSolver> default_backend(const EngineConfig &config,
                                                             std::unique_ptr<QuadraticSolver> solver)
            {
                if (!solver)
                {
                    return std::make_unique<OSQPSolver>(config.solver);
                }
                return solver;
            }

            const EngineConfig &validated(const EngineConfig &config)
            {
                config.validate();
                return config;
            }

            std::vector<double> to_std_vector(const Eigen::VectorXd &v)
            {
                return std::vector<double>(v.data(), v.data() + v.size());
            }
        } // namespace

        // ============================================================================
        // OptimizerMetrics
        // ============================================================================

        void OptimizerMetrics::record(const SolveReport &report)
        {
            if (report.solver == SolverKind::QP)
            {
                qp_successes_.fetch_add(1, std::memory_order_relaxed);
            }
            else
            {
                fallback_uses_.fetch_add(1, std::memory_order_relaxed);
            }
        }

        void OptimizerMetrics::reset()
        {
            qp_successes_.store(0);
            fallback_uses_.store(0);
        }

        nlohmann::json OptimizerMetrics::to_json() const
        {
            return nlohmann::json{
                {"qp_successes", qp_successes()},
                {"fallback_uses", fallback_uses()},
                {"total_solves", total_solves()}};
        }

        void OptimizerMetrics::print_summary() const
        {
            std::cout << "\n=== Optimizer Metrics ===\n";
            std::cout << "QP solves:      " << qp_successes() << "\n";
            std::cout << "Fallback solves: " << fallback_uses() << "\n";
            std::cout << "Total:          " << total_solves() << "\n";
            std::cout << "=========================\n"
                      << std::endl;
        }

        // ============================================================================
        // PortfolioWeights
        // ============================================================================

        const Eigen::VectorXd &PortfolioWeights::select(rebalance::StrategyType strategy) const
        {
            switch (strategy)
            {
            case rebalance::StrategyType::LONG_ONLY:
                return initial;
            case rebalance::StrategyType::MARKET_NEUTRAL:
                return neutralized;
            case rebalance::StrategyType::LONG_ONLY_LIMITED:
                return limited;
            case rebalance::StrategyType::MARKET_NEUTRAL_LIMITED:
                return neutralized_limited;
            }
            throw std::invalid_argument("Unknown strategy type");
        }

        nlohmann::json PortfolioWeights::to_json() const
        {
            return nlohmann::json{
                {"symbols", symbols},
                {"initial_weight", to_std_vector(initial)},
                {"neutralized_weight", to_std_vector(neutralized)},
                {"limited_weight", to_std_vector(limited)},
                {"neutralized_limited_weight", to_std_vector(neutralized_limited)},
                {"solve_report", report.to_json()}};
        }

        void PortfolioWeights::print_summary() const
        {
            std::cout << "\n=== Portfolio Weights (" << to_string(report.solver) << ") ===\n";
            std::cout << std::left << std::setw(10) << "Symbol"
                      << std::right << std::setw(12) << "Initial"
                      << std::setw(12) << "Neutral"
                      << std::setw(12) << "Limited"
                      << std::setw(14) << "NeutralLim" << "\n";
            std::cout << std::string(60, '-') << "\n";

            std::cout << std::fixed << std::setprecision(6);
            for (size_t i = 0; i < symbols.size(); ++i)
            {
                const auto idx = static_cast<Eigen::Index>(i);
                std::cout << std::left << std::setw(10) << symbols[i]
                          << std::right << std::setw(12) << initial(idx)
                          << std::setw(12) << neutralized(idx)
                          << std::setw(12) << limited(idx)
                          << std::setw(14) << neutralized_limited(idx) << "\n";
            }

            std::cout << std::string(60, '-') << "\n";
            std::cout << "Solver message: " << report.message << "\n"
                      << std::endl;
        }

        // ============================================================================
        // PortfolioOptimizer
        // ============================================================================

        PortfolioOptimizer::PortfolioOptimizer(const EngineConfig &config,
                                               std::unique_ptr<QuadraticSolver> solver)
            : config_(validated(config)),
              estimator_(config.ewm_span, config.return_period),
              qp_(config.risk_aversion, default_backend(config, std::move(solver))),
              fallback_(config.risk_aversion)
        {
        }

        Eigen::VectorXd PortfolioOptimizer::solve_raw(const Eigen::VectorXd &expected_returns,
                                                      const Eigen::MatrixXd &covariance,
                                                      SolveReport &report) const
        {
            OptimizationResult result = qp_.optimize(expected_returns, covariance);

            if (result.success)
            {
                report.solver = SolverKind::QP;
                report.message = result.message;
                report.iterations = result.iterations;
                return result.weights;
            }

            if (config_.verbose)
            {
                std::cerr << "Warning: QP solve failed (" << result.message
                          << "), using analytical fallback\n";
            }

            OptimizationResult fallback = fallback_.optimize(expected_returns, covariance);
            report.solver = SolverKind::FALLBACK;
            report.message = result.message + "; " + fallback.message;
            report.iterations = result.iterations;
            return fallback.weights;
        }

        PortfolioWeights PortfolioOptimizer::optimize(const Eigen::VectorXd &expected_returns,
                                                      const Eigen::MatrixXd &covariance,
                                                      const std::vector<std::string> &symbols,
                                                      OptimizerMetrics *metrics) const
        {
            if (static_cast<Eigen::Index>(symbols.size()) != expected_returns.size())
            {
                throw std::invalid_argument(
                    "Symbol count (" + std::to_string(symbols.size()) +
                    ") does not match expected returns size (" +
                    std::to_string(expected_returns.size()) + ")");
            }

            PortfolioWeights weights;
            weights.symbols = symbols;

            Eigen::VectorXd raw = solve_raw(expected_returns, covariance, weights.report);

            weights.initial = normalize_weights_exact(raw);
            weights.neutralized = neutralize_weights_exact(weights.initial);
            weights.limited = normalize_weights_limit(weights.initial, config_.max_weight);
            weights.neutralized_limited = neutralize_weights_limit(weights.initial, config_.max_weight);

            if (metrics != nullptr)
            {
                metrics->record(weights.report);
            }

            return weights;
        }

        PortfolioWeights PortfolioOptimizer::optimize(const MarketData &panel,
                                                      OptimizerMetrics *metrics) const
        {
            risk::ReturnEstimate estimate = estimator_.estimate(panel);
            return optimize(estimate.expected_returns, estimate.covariance, panel.get_tickers(), metrics);
        }

    } // namespace optimizer
} // namespace cemv
