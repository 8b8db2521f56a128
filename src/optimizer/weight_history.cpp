/**
 * @file weight_history.cpp
 * @brief Implementation of the rolling-window weight history
 */

#include "optimizer/weight_history.hpp"
#include "data/data_loader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <set>
#include <stdexcept>

namespace cemv
{
    namespace optimizer
    {

        // ============================================================================
        // OptimizedWeightRecord
        // ============================================================================

        nlohmann::json OptimizedWeightRecord::to_json() const
        {
            return nlohmann::json{
                {"date", date},
                {"symbol", symbol},
                {"initial_weight", initial_weight},
                {"neutralized_weight", neutralized_weight},
                {"limited_weight", limited_weight},
                {"neutralized_limited_weight", neutralized_limited_weight},
                {"market_price", market_price},
                {"algorithm", algorithm}};
        }

        OptimizedWeightRecord OptimizedWeightRecord::from_json(const nlohmann::json &j)
        {
            OptimizedWeightRecord record;
            record.date = j.value("date", "");
            record.symbol = j.value("symbol", "");
            if (record.date.empty() || record.symbol.empty())
            {
                throw std::invalid_argument("Weight record needs both date and symbol");
            }
            record.initial_weight = j.value("initial_weight", 0.0);
            record.neutralized_weight = j.value("neutralized_weight", 0.0);
            record.limited_weight = j.value("limited_weight", 0.0);
            record.neutralized_limited_weight = j.value("neutralized_limited_weight", 0.0);
            record.market_price = j.value("market_price", 0.0);
            record.algorithm = j.value("algorithm", "CEMV");
            return record;
        }

        // ============================================================================
        // WeightHistoryBuilder
        // ============================================================================

        WeightHistoryBuilder::WeightHistoryBuilder(const PortfolioOptimizer &optimizer, size_t window)
            : optimizer_(optimizer), window_(window)
        {
            if (window_ < 2)
            {
                throw std::invalid_argument("History window must be >= 2, got: " + std::to_string(window_));
            }
        }

        std::vector<std::string> WeightHistoryBuilder::eligible_symbols(const MarketData &panel,
                                                                        const UniverseMap &universe,
                                                                        const std::string &month)
        {
            if (universe.empty())
            {
                return panel.get_tickers();
            }

            std::vector<std::string> symbols;
            auto it = universe.find(month);
            if (it == universe.end())
            {
                return symbols;
            }

            std::set<std::string> seen;
            for (const auto &symbol : it->second)
            {
                if (panel.has_ticker(symbol) && seen.insert(symbol).second)
                {
                    symbols.push_back(symbol);
                }
            }
            return symbols;
        }

        std::vector<OptimizedWeightRecord> WeightHistoryBuilder::build(const MarketData &panel,
                                                                       const UniverseMap &universe,
                                                                       OptimizerMetrics *metrics) const
        {
            std::vector<OptimizedWeightRecord> records;
            const size_t n_rows = panel.num_dates();
            if (n_rows < window_)
            {
                return records;
            }

            const auto &dates = panel.get_dates();
            std::string current_month;
            std::vector<std::string> symbols;

            for (size_t end = window_ - 1; end < n_rows; ++end)
            {
                const std::string &end_date = dates[end];
                const std::string month = end_date.substr(0, 7);

                if (month != current_month || symbols.empty())
                {
                    current_month = month;
                    symbols = eligible_symbols(panel, universe, month);
                }

                if (symbols.size() < 2)
                {
                    if (optimizer_.get_config().verbose)
                    {
                        std::cerr << "Warning: skipping window ending " << end_date
                                  << ", only " << symbols.size() << " eligible symbol(s)\n";
                    }
                    continue;
                }

                MarketData window = panel.slice_rows(end + 1 - window_, window_).select_assets(symbols);
                PortfolioWeights weights = optimizer_.optimize(window, metrics);
                Eigen::VectorXd last_prices = window.last_valid_prices();

                for (size_t j = 0; j < symbols.size(); ++j)
                {
                    const auto idx = static_cast<Eigen::Index>(j);
                    OptimizedWeightRecord record;
                    record.date = end_date;
                    record.symbol = symbols[j];
                    record.initial_weight = weights.initial(idx);
                    record.neutralized_weight = weights.neutralized(idx);
                    record.limited_weight = weights.limited(idx);
                    record.neutralized_limited_weight = weights.neutralized_limited(idx);
                    record.market_price = std::isfinite(last_prices(idx)) ? last_prices(idx) : 0.0;
                    records.push_back(record);
                }
            }

            return records;
        }

        // ============================================================================
        // Persistence
        // ============================================================================

        void WeightHistoryBuilder::save_csv(const std::vector<OptimizedWeightRecord> &records,
                                            const std::string &filepath)
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << CSV_HEADER << "\n";
            file << std::setprecision(17);
            for (const auto &r : records)
            {
                file << r.date << "," << r.symbol << ","
                     << r.initial_weight << "," << r.neutralized_weight << ","
                     << r.limited_weight << "," << r.neutralized_limited_weight << ","
                     << r.market_price << "," << r.algorithm << "\n";
            }
        }

        std::vector<OptimizedWeightRecord> WeightHistoryBuilder::load_csv(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;
            if (!std::getline(file, line) || DataLoader::trim(line) != CSV_HEADER)
            {
                throw std::runtime_error("Unexpected weight history header in " + filepath);
            }

            std::vector<OptimizedWeightRecord> records;
            while (std::getline(file, line))
            {
                if (DataLoader::trim(line).empty())
                    continue;

                auto fields = DataLoader::parse_csv_line(line);
                if (fields.size() < 8)
                {
                    throw std::runtime_error("Malformed weight history row: " + line);
                }

                OptimizedWeightRecord record;
                record.date = DataLoader::trim(fields[0]);
                record.symbol = DataLoader::trim(fields[1]);
                record.initial_weight = DataLoader::safe_stod(fields[2]);
                record.neutralized_weight = DataLoader::safe_stod(fields[3]);
                record.limited_weight = DataLoader::safe_stod(fields[4]);
                record.neutralized_limited_weight = DataLoader::safe_stod(fields[5]);
                record.market_price = DataLoader::safe_stod(fields[6]);
                record.algorithm = DataLoader::trim(fields[7]);
                records.push_back(record);
            }

            if (records.empty())
            {
                throw std::runtime_error("No weight records found in " + filepath);
            }

            return records;
        }

        nlohmann::json WeightHistoryBuilder::to_json(const std::vector<OptimizedWeightRecord> &records)
        {
            nlohmann::json j = nlohmann::json::array();
            for (const auto &record : records)
            {
                j.push_back(record.to_json());
            }
            return j;
        }

        std::string WeightHistoryBuilder::latest_date(const std::vector<OptimizedWeightRecord> &records)
        {
            std::string latest;
            for (const auto &record : records)
            {
                latest = std::max(latest, record.date);
            }
            return latest;
        }

    } // namespace optimizer
} // namespace cemv
