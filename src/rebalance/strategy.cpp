#include "rebalance/strategy.hpp"
#include <stdexcept>

namespace cemv {
namespace rebalance {

StrategyType parse_strategy(const std::string& name) {
    if (name == "long_only") return StrategyType::LONG_ONLY;
    if (name == "market_neutral") return StrategyType::MARKET_NEUTRAL;
    if (name == "long_only_limited") return StrategyType::LONG_ONLY_LIMITED;
    if (name == "market_neutral_limited") return StrategyType::MARKET_NEUTRAL_LIMITED;
    throw std::invalid_argument("Unknown strategy type: '" + name +
                                "'. Expected long_only, market_neutral, "
                                "long_only_limited or market_neutral_limited");
}

std::string to_string(StrategyType strategy) {
    switch (strategy) {
    case StrategyType::LONG_ONLY:
        return "long_only";
    case StrategyType::MARKET_NEUTRAL:
        return "market_neutral";
    case StrategyType::LONG_ONLY_LIMITED:
        return "long_only_limited";
    case StrategyType::MARKET_NEUTRAL_LIMITED:
        return "market_neutral_limited";
    }
    return "market_neutral";
}

SellQuantityMode parse_sell_quantity_mode(const std::string& name) {
    if (name == "per_share") return SellQuantityMode::PER_SHARE;
    if (name == "legacy_total_value") return SellQuantityMode::LEGACY_TOTAL_VALUE;
    throw std::invalid_argument("Unknown sell_quantity_mode: '" + name +
                                "'. Expected per_share or legacy_total_value");
}

std::string to_string(SellQuantityMode mode) {
    return mode == SellQuantityMode::PER_SHARE ? "per_share" : "legacy_total_value";
}

} // namespace rebalance
} // namespace cemv
