// ============================================================================
// Implementation of RecommendationEngine
// ============================================================================

#include "rebalance/recommendation_engine.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace cemv {
namespace rebalance {

RecommendationEngine::RecommendationEngine(double weight_tolerance, SellQuantityMode sell_mode)
    : weight_tolerance_(weight_tolerance), sell_mode_(sell_mode) {
    if (!(weight_tolerance_ >= 0.0)) {
        throw std::invalid_argument("weight_tolerance must be non-negative");
    }
}

TradePriority RecommendationEngine::calculate_priority(const core::Decimal& weight_diff) {
    const core::Decimal gap = boost::multiprecision::abs(weight_diff);
    if (gap > core::decimal_from_double(HIGH_PRIORITY_GAP)) {
        return TradePriority::HIGH;
    }
    if (gap > core::decimal_from_double(MEDIUM_PRIORITY_GAP)) {
        return TradePriority::MEDIUM;
    }
    return TradePriority::LOW;
}

std::vector<TradeRecommendation> RecommendationEngine::generate_recommendations(
    const std::vector<Position>& positions,
    const std::vector<TargetWeight>& targets,
    const core::Money& /*available_cash*/,
    const core::Money& net_asset_value) const {
    std::vector<TradeRecommendation> recommendations;
    if (!net_asset_value.is_positive()) {
        return recommendations;
    }

    const std::string& currency = net_asset_value.currency();
    const core::Decimal& nav = net_asset_value.amount();
    const core::Decimal tolerance = core::decimal_from_double(weight_tolerance_);

    std::map<std::string, const Position*> current;
    std::map<std::string, const TargetWeight*> desired;
    std::set<std::string> symbols;
    for (const auto& position : positions) {
        current[position.symbol()] = &position;
        symbols.insert(position.symbol());
    }
    for (const auto& target : targets) {
        desired[target.symbol] = &target;
        symbols.insert(target.symbol);
    }

    for (const auto& symbol : symbols) {
        const auto pos_it = current.find(symbol);
        const auto tgt_it = desired.find(symbol);
        const Position* position = pos_it != current.end() ? pos_it->second : nullptr;
        const TargetWeight* target = tgt_it != desired.end() ? tgt_it->second : nullptr;

        const core::Decimal current_weight = position ? position->weight().percentage() : core::Decimal(0);
        const core::Decimal target_weight = target ? core::decimal_from_double(target->weight) : core::Decimal(0);
        const core::Decimal diff = target_weight - current_weight;

        if (boost::multiprecision::abs(diff) < tolerance) continue;

        const core::Money current_value = position ? position->market_value() : core::Money(core::Decimal(0), currency);
        const core::Money goal_value(target_weight / 100 * nav, currency);

        TradeRecommendation rec;
        rec.symbol = symbol;
        rec.current_weight = core::Weight(current_weight);
        rec.target_weight = core::Weight(target_weight);
        rec.priority = calculate_priority(diff);

        if (diff > tolerance) {
            const core::Money cash_needed = goal_value.minus(current_value);
            if (!cash_needed.is_positive()) continue;

            const core::Money price = core::Money::from_double(target->market_price, currency);
            rec.action = TradeAction::BUY;
            rec.amount = cash_needed;
            rec.action_price = price;
            rec.action_quantity = price.is_positive()
                ? core::decimal_floor(cash_needed.amount() / price.amount())
                : 0LL;
            rec.reason = "Increase weight from " + core::decimal_to_string(current_weight, 1) +
                         "% to " + core::decimal_to_string(target_weight, 1) + "%";
        } else if (diff < -tolerance) {
            const core::Money cash_to_raise = current_value.minus(goal_value);

            rec.action = TradeAction::SELL;
            rec.amount = cash_to_raise;
            if (sell_mode_ == SellQuantityMode::LEGACY_TOTAL_VALUE) {
                rec.action_price = current_value;
                rec.action_quantity = current_value.is_positive()
                    ? core::decimal_floor(cash_to_raise.amount() / current_value.amount())
                    : 0LL;
            } else {
                const core::Money price = position ? position->market_price()
                                                   : core::Money(core::Decimal(0), currency);
                rec.action_price = price;
                rec.action_quantity = price.is_positive()
                    ? core::decimal_floor(cash_to_raise.amount() / price.amount())
                    : 0LL;
            }
            rec.reason = "Reduce weight from " + core::decimal_to_string(current_weight, 1) +
                         "% to " + core::decimal_to_string(target_weight, 1) + "%";
        } else {
            continue;
        }

        recommendations.push_back(rec);
    }

    std::stable_sort(recommendations.begin(), recommendations.end(),
                     [](const TradeRecommendation& a, const TradeRecommendation& b) {
                         const bool a_high = a.priority == TradePriority::HIGH;
                         const bool b_high = b.priority == TradePriority::HIGH;
                         if (a_high != b_high) {
                             return a_high;
                         }
                         return a.weight_gap() > b.weight_gap();
                     });
    return recommendations;
}

} // namespace rebalance
} // namespace cemv
