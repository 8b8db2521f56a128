/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Loads price panels from CSV files, engine configuration and other inputs
 * from JSON files, and writes JSON output. This is the only part of the
 * library that touches the filesystem.
 */

#ifndef CEMV_DATA_LOADER_HPP
#define CEMV_DATA_LOADER_HPP

#include "market_data.hpp"
#include "optimizer/quadratic_solver.hpp"
#include "rebalance/strategy.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>


namespace cemv {

/**
 * @struct EngineConfig
 * @brief Parameters of the optimizer pipeline and the recommendation engine
 *
 * Read from the "engine" object of the configuration file:
 * @code
 * {
 *   "engine": {
 *     "risk_aversion": 0.01,
 *     "max_weight": 0.15,
 *     "weight_tolerance": 1.0,
 *     "strategy": "market_neutral",
 *     "solver": { "max_iterations": 10000, "tolerance": 1e-6 }
 *   }
 * }
 * @endcode
 */
struct EngineConfig {
    double risk_aversion = 0.01;                 ///< lambda in mu'x - lambda x'Qx
    double max_weight = 0.15;                    ///< Cap of the limited weight vectors
    double weight_tolerance = 1.0;               ///< Percentage points ignored by the recommender
    int ewm_span = 21;                           ///< EWMA span of the return series
    int return_period = 2;                       ///< Lag of the percentage change
    int window = 21;                             ///< Rolling window of the weight history
    std::string currency = "VND";                ///< Currency of every Money value
    rebalance::StrategyType strategy = rebalance::StrategyType::MARKET_NEUTRAL;
    double min_target_weight_pct = 1.0;          ///< Targets below this are dropped
    double limit_weight_pct = 15.0;              ///< Targets above this are capped
    rebalance::SellQuantityMode sell_quantity_mode = rebalance::SellQuantityMode::PER_SHARE;
    optimizer::SolverOptions solver;             ///< QP backend options
    bool verbose = false;                        ///< Print solver warnings to stderr

    /**
     * @brief Load from the "engine" JSON object
     * @throws std::invalid_argument if a value is out of range or a name is unknown
     */
    static EngineConfig from_json(const nlohmann::json& j);

    /**
     * @throws std::invalid_argument if a value is out of range
     */
    void validate() const;

    nlohmann::json to_json() const;
};

/**
 * @class DataLoader
 * @brief Loads and parses input data from files
 *
 * Supports price CSV files in two layouts:
 * - Format 1: date, ticker1, ticker2, ... (wide format)
 * - Format 2: date, ticker, price (long format)
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load price panel from CSV file (wide format)
     *
     * Expected format:
     * date,FPT,VNM,HPG,...
     * 2024-01-02,95.1,68.2,27.9,...
     *
     * Empty cells load as NaN.
     *
     * @param filepath Path to CSV file
     * @param tickers Optional list of tickers to load (loads all if empty)
     * @return MarketData object
     * @throws std::runtime_error if file cannot be loaded
     */
    static MarketData load_csv_wide(const std::string& filepath,
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Load price panel from CSV file (long format)
     *
     * Expected format:
     * date,symbol,price
     * 2024-01-02,FPT,95.1
     * 2024-01-02,VNM,68.2
     *
     * Symbols come out in ascending order; missing (date, symbol) pairs are NaN.
     *
     * @throws std::runtime_error if file cannot be loaded
     */
    static MarketData load_csv_long(const std::string& filepath,
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Auto-detect CSV format and load
     */
    static MarketData load_csv(const std::string& filepath,
                               const std::vector<std::string>& tickers = {});

    // ========================================================================
    // JSON Loading
    // ========================================================================

    /**
     * @brief Load JSON file
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load engine configuration
     *
     * Reads the "engine" object; a file without one yields the defaults.
     */
    static EngineConfig load_config(const std::string& config_path);

    /**
     * @brief Load monthly universe lists
     *
     * Expected format: { "2024-01": ["FPT", "VNM"], "2024-02": [...] }
     *
     * @return Map from "YYYY-MM" to symbol list
     * @throws std::runtime_error if a key is not a YYYY-MM month
     */
    static std::map<std::string, std::vector<std::string>> load_universe(
        const std::string& filepath);

    /**
     * @brief Write JSON to file (pretty printed, 2-space indent)
     * @throws std::runtime_error if file cannot be written
     */
    static void save_json(const nlohmann::json& j, const std::string& filepath);

    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================

    /**
     * @brief Generate synthetic price panel (geometric random walk)
     * @param tickers List of ticker symbols
     * @param num_days Number of trading days
     * @param start_date Starting date
     * @param volatility Daily volatility (default 0.02)
     * @param drift Daily drift (default 0.0005)
     * @param seed Fixed seed for reproducible panels; random if absent
     */
    static MarketData generate_synthetic_data(
        const std::vector<std::string>& tickers,
        size_t num_days,
        const std::string& start_date = "2024-01-01",
        double volatility = 0.02,
        double drift = 0.0005,
        std::optional<unsigned int> seed = std::nullopt
    );

    // ========================================================================
    // Parsing Helpers
    // ========================================================================

    /**
     * @brief Parse CSV line into tokens (double quotes group commas)
     */
    static std::vector<std::string> parse_csv_line(const std::string& line);

    /**
     * @brief Validate date format (YYYY-MM-DD)
     */
    static bool is_valid_date_format(const std::string& date);

    static std::string trim(const std::string& str);

    /**
     * @brief Convert string to double
     * @return Double value, or NaN if the cell is empty or not a number
     */
    static double safe_stod(const std::string& str);

private:
    static bool is_valid_month_format(const std::string& month);

    static std::string add_days(const std::string& start_date, int days_offset);
};

} // namespace cemv

#endif // CEMV_DATA_LOADER_HPP
