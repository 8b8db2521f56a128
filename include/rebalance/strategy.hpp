#ifndef CEMV_REBALANCE_STRATEGY_HPP
#define CEMV_REBALANCE_STRATEGY_HPP

#include <string>

namespace cemv {
namespace rebalance {

/**
 * @enum StrategyType
 * @brief Which of the four optimizer weight vectors drives the targets
 */
enum class StrategyType {
    LONG_ONLY,              ///< normalized weights
    MARKET_NEUTRAL,         ///< mean-centered weights
    LONG_ONLY_LIMITED,      ///< normalized weights capped at max_weight
    MARKET_NEUTRAL_LIMITED  ///< centered weights capped at +/- max_weight
};

/**
 * @enum SellQuantityMode
 * @brief Unit used to turn a SELL cash amount into a share count
 */
enum class SellQuantityMode {
    PER_SHARE,          ///< divide by the per-share market price
    LEGACY_TOTAL_VALUE  ///< divide by the position's total market value
};

/**
 * @brief Parse "long_only", "market_neutral", "long_only_limited" or
 *        "market_neutral_limited"
 * @throws std::invalid_argument for any other name
 */
StrategyType parse_strategy(const std::string& name);
std::string to_string(StrategyType strategy);

/**
 * @brief Parse "per_share" or "legacy_total_value"
 * @throws std::invalid_argument for any other name
 */
SellQuantityMode parse_sell_quantity_mode(const std::string& name);
std::string to_string(SellQuantityMode mode);

} // namespace rebalance
} // namespace cemv

#endif // CEMV_REBALANCE_STRATEGY_HPP
