/**
 * @file weight_history.hpp
 * @brief Rolling-window weight history over a dated price panel
 *
 * For every window of T consecutive rows the pipeline is run on the symbols
 * of that month's universe, yielding one record per symbol and date. The
 * records are what the target-weight selection reads back later.
 */

#pragma once

#include "data/market_data.hpp"
#include "optimizer/portfolio_optimizer.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace cemv
{
    namespace optimizer
    {

        /// "YYYY-MM" -> symbols eligible that month
        using UniverseMap = std::map<std::string, std::vector<std::string>>;

        /**
         * @struct OptimizedWeightRecord
         * @brief Four policy weights of one symbol at one window end date
         */
        struct OptimizedWeightRecord
        {
            std::string date;
            std::string symbol;
            double initial_weight = 0.0;
            double neutralized_weight = 0.0;
            double limited_weight = 0.0;
            double neutralized_limited_weight = 0.0;
            double market_price = 0.0; ///< Last valid price in the window
            std::string algorithm = "CEMV";

            nlohmann::json to_json() const;

            /**
             * @throws std::invalid_argument if date or symbol is missing
             */
            static OptimizedWeightRecord from_json(const nlohmann::json &j);
        };

        /**
         * @class WeightHistoryBuilder
         * @brief Runs a PortfolioOptimizer over rolling windows
         *
         * Usage Example:
         * @code
         * PortfolioOptimizer optimizer(config);
         * WeightHistoryBuilder builder(optimizer, config.window);
         * OptimizerMetrics metrics;
         * auto records = builder.build(panel, universe, &metrics);
         * WeightHistoryBuilder::save_csv(records, "output/weights.csv");
         * @endcode
         */
        class WeightHistoryBuilder
        {
        public:
            static constexpr const char *CSV_HEADER =
                "date,symbol,initial_weight,neutralized_weight,limited_weight,"
                "neutralized_limited_weight,market_price,algorithm";

            /**
             * @param optimizer Pipeline to run; must outlive the builder
             * @param window Rows per window (>= 2)
             * @throws std::invalid_argument if window < 2
             */
            WeightHistoryBuilder(const PortfolioOptimizer &optimizer, size_t window);

            /**
             * @brief Build records for every window of the panel
             * @param panel Dated price panel, rows ascending
             * @param universe Monthly universe; empty means every panel symbol
             * @param metrics Optional sink for the per-window solve reports
             * @return Records ordered by date, then by universe order
             *
             * The universe is refreshed whenever a window ends in a new month.
             * Windows with fewer than 2 eligible symbols are skipped.
             */
            std::vector<OptimizedWeightRecord> build(const MarketData &panel,
                                                     const UniverseMap &universe = {},
                                                     OptimizerMetrics *metrics = nullptr) const;

            size_t get_window() const { return window_; }

            // ========================================================================
            // Persistence
            // ========================================================================

            /**
             * @throws std::runtime_error if the file cannot be written
             */
            static void save_csv(const std::vector<OptimizedWeightRecord> &records,
                                 const std::string &filepath);

            /**
             * @throws std::runtime_error if the file cannot be read or has no records
             */
            static std::vector<OptimizedWeightRecord> load_csv(const std::string &filepath);

            static nlohmann::json to_json(const std::vector<OptimizedWeightRecord> &records);

            /**
             * @brief Latest date present in the records ("" if none)
             */
            static std::string latest_date(const std::vector<OptimizedWeightRecord> &records);

        private:
            const PortfolioOptimizer &optimizer_;
            size_t window_;

            static std::vector<std::string> eligible_symbols(const MarketData &panel,
                                                             const UniverseMap &universe,
                                                             const std::string &month);
        };

    } // namespace optimizer
} // namespace cemv
