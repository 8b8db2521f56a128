#ifndef CEMV_REBALANCE_TRADE_RECOMMENDATION_HPP
#define CEMV_REBALANCE_TRADE_RECOMMENDATION_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/money.hpp"
#include "core/weight.hpp"

namespace cemv {
namespace rebalance {

enum class TradeAction {
    BUY,
    SELL
};

enum class TradePriority {
    HIGH,
    MEDIUM,
    LOW
};

std::string to_string(TradeAction action);
std::string to_string(TradePriority priority);

/**
 * @struct TradeRecommendation
 * @brief One buy/sell instruction produced by the recommendation engine
 *
 * amount is the cash delta needed to move from current to target weight.
 * Consumed by an execution layer; never persisted here.
 */
struct TradeRecommendation {
    std::string symbol;
    TradeAction action = TradeAction::BUY;
    core::Weight current_weight;
    core::Weight target_weight;
    core::Money amount;
    TradePriority priority = TradePriority::LOW;
    std::string reason;
    std::optional<core::Money> action_price;
    std::optional<long long> action_quantity;

    /// |target - current| in percentage points
    core::Decimal weight_gap() const;

    nlohmann::json to_json() const;
};

} // namespace rebalance
} // namespace cemv

#endif // CEMV_REBALANCE_TRADE_RECOMMENDATION_HPP
