#ifndef CEMV_REBALANCE_PORTFOLIO_PROCESSOR_HPP
#define CEMV_REBALANCE_PORTFOLIO_PROCESSOR_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/money.hpp"
#include "rebalance/position.hpp"

namespace cemv {
namespace rebalance {

/**
 * @struct Deal
 * @brief One raw holding from the broker feed
 *
 * JSON keys: symbol, accumulateQuantity, marketPrice, averageCostPrice,
 * breakEvenPrice, realizedProfit, unrealizedProfit.
 */
struct Deal {
    std::string symbol;
    double accumulate_quantity = 0.0;
    double market_price = 0.0;
    double average_cost_price = 0.0;
    double break_even_price = 0.0;
    double realized_profit = 0.0;
    double unrealized_profit = 0.0;

    static Deal from_json(const nlohmann::json& j);
};

/**
 * @struct AccountBalance
 * @brief Cash and valuation of the account
 *
 * JSON keys: availableCash, netAssetValue, stockValue.
 */
struct AccountBalance {
    core::Money available_cash;
    core::Money net_asset_value;
    core::Money stock_value;

    /// cash / NAV * 100, or 0 when NAV <= 0
    core::Decimal cash_ratio() const;

    /// {"available_cash", "net_asset_value", "cash_ratio"}
    nlohmann::json to_json() const;

    static AccountBalance from_json(const nlohmann::json& j,
                                    const std::string& currency = core::Money::DEFAULT_CURRENCY);
};

/**
 * @struct HoldingsSnapshot
 * @brief Account id, balance and raw deals as read from a holdings file
 *
 * @code
 * {
 *   "accountId": "0001",
 *   "balance": {"availableCash": 1.0e8, "netAssetValue": 1.0e9, "stockValue": 9.0e8},
 *   "deals": [{"symbol": "FPT", "accumulateQuantity": 1000, "marketPrice": 95000, ...}]
 * }
 * @endcode
 */
struct HoldingsSnapshot {
    std::string account_id;
    AccountBalance balance;
    std::vector<Deal> deals;

    /// @throws std::invalid_argument if "balance" is missing
    static HoldingsSnapshot from_json(const nlohmann::json& j,
                                      const std::string& currency = core::Money::DEFAULT_CURRENCY);
};

/**
 * @class PortfolioProcessor
 * @brief Converts raw deals into Position values
 */
class PortfolioProcessor {
public:
    explicit PortfolioProcessor(std::string currency = core::Money::DEFAULT_CURRENCY);

    /**
     * @brief Build positions weighted against NAV and stock value
     *
     * Deals without symbol or with non-positive quantity or price are
     * skipped. Result is sorted by weight descending. Empty when NAV <= 0
     * or there are no deals.
     */
    std::vector<Position> process_deals_to_positions(const std::vector<Deal>& deals,
                                                     const AccountBalance& balance) const;

private:
    std::string currency_;
};

} // namespace rebalance
} // namespace cemv

#endif // CEMV_REBALANCE_PORTFOLIO_PROCESSOR_HPP
