#ifndef CEMV_REBALANCE_RECOMMENDATION_ENGINE_HPP
#define CEMV_REBALANCE_RECOMMENDATION_ENGINE_HPP

#include <string>
#include <vector>
#include "core/decimal.hpp"
#include "core/money.hpp"
#include "rebalance/position.hpp"
#include "rebalance/strategy.hpp"
#include "rebalance/target_weights.hpp"
#include "rebalance/trade_recommendation.hpp"

namespace cemv {
namespace rebalance {

/**
 * @class RecommendationEngine
 * @brief Turns the gap between held and target weights into BUY/SELL orders
 *
 * For every symbol in the union of positions and targets:
 * - a gap smaller than the tolerance is ignored;
 * - a positive gap yields a BUY sized from the target's market price;
 * - a negative gap yields a SELL sized by the configured SellQuantityMode.
 *
 * Priority: HIGH above 3 points, MEDIUM above 1.5, LOW otherwise.
 * Output is ordered HIGH first, then by gap, largest first.
 */
class RecommendationEngine {
public:
    static constexpr double HIGH_PRIORITY_GAP = 3.0;
    static constexpr double MEDIUM_PRIORITY_GAP = 1.5;

    /**
     * @param weight_tolerance Minimum gap in percentage points (>= 0)
     * @param sell_mode How SELL quantities are computed
     * @throws std::invalid_argument if weight_tolerance is negative
     */
    explicit RecommendationEngine(double weight_tolerance = 1.0,
                                  SellQuantityMode sell_mode = SellQuantityMode::PER_SHARE);

    /**
     * @param positions Current holdings (weights relative to NAV)
     * @param targets Desired weights in percent
     * @param available_cash Cash on the account; reported, not a sizing limit
     * @param net_asset_value Account NAV; no orders when not positive
     * @throws core::CurrencyMismatchError if amounts use different currencies
     */
    std::vector<TradeRecommendation> generate_recommendations(
        const std::vector<Position>& positions,
        const std::vector<TargetWeight>& targets,
        const core::Money& available_cash,
        const core::Money& net_asset_value) const;

    /// Priority for a signed gap (target - current)
    static TradePriority calculate_priority(const core::Decimal& weight_diff);

    double get_weight_tolerance() const { return weight_tolerance_; }
    SellQuantityMode get_sell_mode() const { return sell_mode_; }

private:
    double weight_tolerance_;
    SellQuantityMode sell_mode_;
};

} // namespace rebalance
} // namespace cemv

#endif // CEMV_REBALANCE_RECOMMENDATION_ENGINE_HPP
