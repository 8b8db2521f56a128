/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and engine configuration
 */

#include "data/data_loader.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <random>
#include <ctime>
#include <iomanip>
#include <limits>
#include <set>

namespace cemv
{

    // ===========================
    // EngineConfig
    // ===========================

    EngineConfig EngineConfig::from_json(const nlohmann::json &j)
    {
        EngineConfig config;
        config.risk_aversion = j.value("risk_aversion", 0.01);
        config.max_weight = j.value("max_weight", 0.15);
        config.weight_tolerance = j.value("weight_tolerance", 1.0);
        config.ewm_span = j.value("ewm_span", 21);
        config.return_period = j.value("return_period", 2);
        config.window = j.value("window", 21);
        config.currency = j.value("currency", "VND");
        config.strategy = rebalance::parse_strategy(j.value("strategy", "market_neutral"));
        config.min_target_weight_pct = j.value("min_target_weight_pct", 1.0);
        config.limit_weight_pct = j.value("limit_weight_pct", 15.0);
        config.sell_quantity_mode =
            rebalance::parse_sell_quantity_mode(j.value("sell_quantity_mode", "per_share"));
        config.verbose = j.value("verbose", false);

        if (j.contains("solver"))
        {
            config.solver = optimizer::SolverOptions::from_json(j["solver"]);
        }

        config.validate();
        return config;
    }

    void EngineConfig::validate() const
    {
        if (!(risk_aversion > 0.0))
        {
            throw std::invalid_argument(
                "risk_aversion must be positive, got: " + std::to_string(risk_aversion));
        }
        if (!(max_weight > 0.0) || max_weight > 1.0)
        {
            throw std::invalid_argument(
                "max_weight must be in (0, 1], got: " + std::to_string(max_weight));
        }
        if (weight_tolerance < 0.0)
        {
            throw std::invalid_argument(
                "weight_tolerance cannot be negative, got: " + std::to_string(weight_tolerance));
        }
        if (ewm_span < 1)
        {
            throw std::invalid_argument("ewm_span must be >= 1, got: " + std::to_string(ewm_span));
        }
        if (return_period < 1)
        {
            throw std::invalid_argument(
                "return_period must be >= 1, got: " + std::to_string(return_period));
        }
        if (window < 2)
        {
            throw std::invalid_argument("window must be >= 2, got: " + std::to_string(window));
        }
        if (currency.empty())
        {
            throw std::invalid_argument("currency cannot be empty");
        }
        if (min_target_weight_pct < 0.0)
        {
            throw std::invalid_argument("min_target_weight_pct cannot be negative");
        }
        if (!(limit_weight_pct > 0.0) || limit_weight_pct > 100.0)
        {
            throw std::invalid_argument(
                "limit_weight_pct must be in (0, 100], got: " + std::to_string(limit_weight_pct));
        }
        solver.validate();
    }

    nlohmann::json EngineConfig::to_json() const
    {
        return nlohmann::json{
            {"risk_aversion", risk_aversion},
            {"max_weight", max_weight},
            {"weight_tolerance", weight_tolerance},
            {"ewm_span", ewm_span},
            {"return_period", return_period},
            {"window", window},
            {"currency", currency},
            {"strategy", rebalance::to_string(strategy)},
            {"min_target_weight_pct", min_target_weight_pct},
            {"limit_weight_pct", limit_weight_pct},
            {"sell_quantity_mode", rebalance::to_string(sell_quantity_mode)},
            {"solver", {{"max_iterations", solver.max_iterations},
                        {"tolerance", solver.tolerance},
                        {"time_limit", solver.time_limit},
                        {"accept_inaccurate", solver.accept_inaccurate}}}};
    }

    // ===========================
    // CSV Loading - Wide Format
    // ===========================

    MarketData DataLoader::load_csv_wide(const std::string &filepath,
                                         const std::vector<std::string> &tickers)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        std::vector<std::string> all_tickers;
        std::vector<std::string> dates;
        std::vector<std::vector<double>> price_data;

        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        if (header.empty() || trim(header[0]) != "date")
        {
            throw std::runtime_error("CSV must start with 'date' column");
        }

        for (size_t i = 1; i < header.size(); ++i)
        {
            all_tickers.push_back(trim(header[i]));
        }

        std::vector<size_t> column_indices;
        std::vector<std::string> selected_tickers;

        if (tickers.empty())
        {
            for (size_t i = 0; i < all_tickers.size(); ++i)
            {
                column_indices.push_back(i);
                selected_tickers.push_back(all_tickers[i]);
            }
        }
        else
        {
            for (const auto &ticker : tickers)
            {
                auto it = std::find(all_tickers.begin(), all_tickers.end(), ticker);
                if (it != all_tickers.end())
                {
                    column_indices.push_back(static_cast<size_t>(std::distance(all_tickers.begin(), it)));
                    selected_tickers.push_back(ticker);
                }
            }

            if (column_indices.empty())
            {
                throw std::runtime_error("None of the requested symbols found in " + filepath);
            }
        }

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            std::string date = trim(fields[0]);
            if (!is_valid_date_format(date))
            {
                continue; // Skip invalid dates
            }

            dates.push_back(date);

            std::vector<double> row_prices;
            row_prices.reserve(column_indices.size());

            for (size_t idx : column_indices)
            {
                row_prices.push_back(idx + 1 < fields.size()
                                         ? safe_stod(fields[idx + 1])
                                         : std::numeric_limits<double>::quiet_NaN());
            }

            price_data.push_back(std::move(row_prices));
        }

        if (dates.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        Eigen::MatrixXd prices(static_cast<Eigen::Index>(dates.size()),
                               static_cast<Eigen::Index>(selected_tickers.size()));
        for (size_t i = 0; i < dates.size(); ++i)
        {
            for (size_t j = 0; j < selected_tickers.size(); ++j)
            {
                prices(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = price_data[i][j];
            }
        }

        return MarketData(prices, dates, selected_tickers);
    }

    // ===========================
    // CSV Loading - Long Format
    // ===========================

    MarketData DataLoader::load_csv_long(const std::string &filepath,
                                         const std::vector<std::string> &tickers)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        std::map<std::string, std::map<std::string, double>> data_map; // date -> symbol -> price
        std::set<std::string> all_dates;
        std::set<std::string> all_tickers;

        // Header
        std::getline(file, line);

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() < 3)
                continue;

            std::string date = trim(fields[0]);
            std::string ticker = trim(fields[1]);
            double price = safe_stod(fields[2]);

            if (!is_valid_date_format(date) || ticker.empty())
                continue;

            if (!tickers.empty() &&
                std::find(tickers.begin(), tickers.end(), ticker) == tickers.end())
            {
                continue;
            }

            data_map[date][ticker] = price;
            all_dates.insert(date);
            all_tickers.insert(ticker);
        }

        if (all_dates.empty() || all_tickers.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        std::vector<std::string> dates(all_dates.begin(), all_dates.end());
        std::vector<std::string> ticker_vec(all_tickers.begin(), all_tickers.end());

        Eigen::MatrixXd prices = Eigen::MatrixXd::Constant(
            static_cast<Eigen::Index>(dates.size()),
            static_cast<Eigen::Index>(ticker_vec.size()),
            std::numeric_limits<double>::quiet_NaN());

        for (size_t i = 0; i < dates.size(); ++i)
        {
            const auto &row = data_map[dates[i]];
            for (size_t j = 0; j < ticker_vec.size(); ++j)
            {
                auto it = row.find(ticker_vec[j]);
                if (it != row.end())
                {
                    prices(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = it->second;
                }
            }
        }

        return MarketData(prices, dates, ticker_vec);
    }

    // ========================
    // Auto-detect CSV Format
    // ========================

    MarketData DataLoader::load_csv(const std::string &filepath,
                                    const std::vector<std::string> &tickers)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        std::getline(file, line);
        file.close();

        auto header = parse_csv_line(line);

        // Wide format: date, ticker1, ticker2, ...
        // Long format: date, ticker, price
        if (header.size() == 3 &&
            (trim(header[1]) == "ticker" || trim(header[1]) == "symbol"))
        {
            return load_csv_long(filepath, tickers);
        }
        return load_csv_wide(filepath, tickers);
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error in " + filepath + ": " + e.what());
        }

        return j;
    }

    EngineConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        if (j.contains("engine"))
        {
            return EngineConfig::from_json(j["engine"]);
        }

        return EngineConfig::from_json(nlohmann::json::object());
    }

    std::map<std::string, std::vector<std::string>> DataLoader::load_universe(
        const std::string &filepath)
    {
        auto j = load_json(filepath);
        if (!j.is_object())
        {
            throw std::runtime_error("Universe file must hold a JSON object: " + filepath);
        }

        std::map<std::string, std::vector<std::string>> universe;
        for (auto it = j.begin(); it != j.end(); ++it)
        {
            if (!is_valid_month_format(it.key()))
            {
                throw std::runtime_error("Universe key is not a YYYY-MM month: " + it.key());
            }

            try
            {
                universe[it.key()] = it.value().get<std::vector<std::string>>();
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("Universe entry " + it.key() +
                                         " must be a list of symbols: " + e.what());
            }
        }

        return universe;
    }

    void DataLoader::save_json(const nlohmann::json &j, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << j.dump(2) << "\n";
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    MarketData DataLoader::generate_synthetic_data(
        const std::vector<std::string> &tickers,
        size_t num_days,
        const std::string &start_date,
        double volatility,
        double drift,
        std::optional<unsigned int> seed)
    {
        std::random_device rd;
        std::mt19937 gen(seed ? *seed : rd());
        std::normal_distribution<double> dist(drift, volatility);

        Eigen::MatrixXd prices(static_cast<Eigen::Index>(num_days),
                               static_cast<Eigen::Index>(tickers.size()));
        std::vector<std::string> dates;
        dates.reserve(num_days);

        for (size_t i = 0; i < num_days; ++i)
        {
            dates.push_back(add_days(start_date, static_cast<int>(i)));
        }

        for (Eigen::Index j = 0; j < prices.cols(); ++j)
        {
            if (num_days == 0)
                break;

            prices(0, j) = 100.0;

            for (Eigen::Index i = 1; i < prices.rows(); ++i)
            {
                prices(i, j) = prices(i - 1, j) * (1.0 + dist(gen));
            }
        }

        return MarketData(prices, dates, tickers);
    }

    // =======================
    // Parsing Helpers
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    bool DataLoader::is_valid_date_format(const std::string &date)
    {
        if (date.length() != 10)
            return false;
        if (date[4] != '-' || date[7] != '-')
            return false;

        for (size_t i = 0; i < date.length(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(date[i])))
                return false;
        }

        return true;
    }

    bool DataLoader::is_valid_month_format(const std::string &month)
    {
        return month.length() == 7 && is_valid_date_format(month + "-01");
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty())
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        try
        {
            size_t consumed = 0;
            double value = std::stod(trimmed, &consumed);
            if (consumed != trimmed.size())
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return value;
        }
        catch (const std::invalid_argument &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::out_of_range &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

    std::string DataLoader::add_days(const std::string &start_date, int days_offset)
    {
        struct tm tm = {};
        std::istringstream ss(start_date);
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail())
        {
            throw std::invalid_argument("Invalid start date: " + start_date);
        }

        // Normalized by mktime; noon keeps DST shifts off the date boundary
        tm.tm_mday += days_offset;
        tm.tm_hour = 12;
        tm.tm_isdst = -1;
        std::mktime(&tm);

        char buffer[11];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);

        return std::string(buffer);
    }

} // namespace cemv
