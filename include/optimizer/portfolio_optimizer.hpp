/**
 * @file portfolio_optimizer.hpp
 * @brief End-to-end weight construction for one price panel
 *
 * Pipeline:
 *   price panel -> ReturnEstimator -> (mu, Q)
 *               -> MeanVarianceOptimizer, or AnalyticalSolver if the QP fails
 *               -> normalize_weights_exact                (initial)
 *               -> neutralize_weights_exact(initial)      (neutralized)
 *               -> normalize_weights_limit(initial)       (limited)
 *               -> neutralize_weights_limit(initial)      (neutralized_limited)
 *
 * Every call returns a SolveReport saying which solver produced the raw
 * weights. Counters across calls live in a caller-owned OptimizerMetrics.
 */

#pragma once

#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "optimizer/analytical_solver.hpp"
#include "optimizer/mean_variance_optimizer.hpp"
#include "rebalance/strategy.hpp"
#include "risk/return_estimator.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cemv
{
    namespace optimizer
    {

        /**
         * @class OptimizerMetrics
         * @brief Thread-safe tally of QP successes and fallback uses
         *
         * Usage Example:
         * @code
         * OptimizerMetrics metrics;
         * for (const auto &window : windows) {
         *     optimizer.optimize(window, &metrics);
         * }
         * metrics.print_summary();
         * @endcode
         */
        class OptimizerMetrics
        {
        public:
            OptimizerMetrics() = default;
            OptimizerMetrics(const OptimizerMetrics &) = delete;
            OptimizerMetrics &operator=(const OptimizerMetrics &) = delete;

            void record(const SolveReport &report);

            std::uint64_t qp_successes() const { return qp_successes_.load(); }
            std::uint64_t fallback_uses() const { return fallback_uses_.load(); }
            std::uint64_t total_solves() const { return qp_successes() + fallback_uses(); }

            void reset();

            nlohmann::json to_json() const;
            void print_summary() const;

        private:
            std::atomic<std::uint64_t> qp_successes_{0};
            std::atomic<std::uint64_t> fallback_uses_{0};
        };

        /**
         * @struct PortfolioWeights
         * @brief The four weight policies for one panel, aligned to symbols
         */
        struct PortfolioWeights
        {
            std::vector<std::string> symbols;
            Eigen::VectorXd initial;             ///< Long-only, sums to 1
            Eigen::VectorXd neutralized;         ///< Market-neutral, sums to 0
            Eigen::VectorXd limited;             ///< Long-only, capped at max_weight
            Eigen::VectorXd neutralized_limited; ///< Market-neutral, within +/- max_weight
            SolveReport report;

            /**
             * @brief The vector a strategy trades on
             */
            const Eigen::VectorXd &select(rebalance::StrategyType strategy) const;

            nlohmann::json to_json() const;
            void print_summary() const;
        };

        /**
         * @class PortfolioOptimizer
         * @brief Runs the estimator, solver and weight transforms
         *
         * Usage Example:
         * @code
         * EngineConfig config = DataLoader::load_config("config/engine.json");
         * PortfolioOptimizer optimizer(config);
         * PortfolioWeights weights = optimizer.optimize(panel);
         * weights.print_summary();
         * @endcode
         *
         * Thread Safety: optimize() is const and safe to call concurrently
         * as long as each thread passes its own or a shared OptimizerMetrics.
         */
        class PortfolioOptimizer
        {
        public:
            /**
             * @param config Engine configuration (risk aversion, cap, estimator, solver)
             * @param solver QP backend; OSQPSolver configured from config.solver when null
             * @throws std::invalid_argument if config is invalid
             */
            explicit PortfolioOptimizer(const EngineConfig &config,
                                        std::unique_ptr<QuadraticSolver> solver = nullptr);

            /**
             * @brief Estimate (mu, Q) from a price panel and build the four policies
             * @param metrics Optional sink for the solve report
             * @throws std::invalid_argument if the panel has fewer than 2 rows or no symbols
             */
            PortfolioWeights optimize(const MarketData &panel,
                                      OptimizerMetrics *metrics = nullptr) const;

            /**
             * @brief Build the four policies from precomputed (mu, Q)
             * @throws std::invalid_argument if sizes disagree
             */
            PortfolioWeights optimize(const Eigen::VectorXd &expected_returns,
                                      const Eigen::MatrixXd &covariance,
                                      const std::vector<std::string> &symbols,
                                      OptimizerMetrics *metrics = nullptr) const;

            /**
             * @brief Raw long-only weights: QP, or the closed form when it fails
             */
            Eigen::VectorXd solve_raw(const Eigen::VectorXd &expected_returns,
                                      const Eigen::MatrixXd &covariance,
                                      SolveReport &report) const;

            const EngineConfig &get_config() const { return config_; }
            const risk::ReturnEstimator &get_estimator() const { return estimator_; }

        private:
            EngineConfig config_;
            risk::ReturnEstimator estimator_;
            MeanVarianceOptimizer qp_;
            AnalyticalSolver fallback_;
        };

    } // namespace optimizer
} // namespace cemv
