#include "rebalance/target_weights.hpp"
#include <algorithm>
#include <stdexcept>

namespace cemv {
namespace rebalance {

nlohmann::json TargetWeight::to_json() const {
    return nlohmann::json{
        {"symbol", symbol},
        {"weight", weight},
        {"marketPrice", market_price}
    };
}

TargetWeight TargetWeight::from_json(const nlohmann::json& j) {
    TargetWeight target;
    target.symbol = j.value("symbol", "");
    if (target.symbol.empty()) {
        throw std::invalid_argument("Target weight entry without symbol");
    }
    target.weight = j.value("weight", 0.0);
    target.market_price = j.value("marketPrice", 0.0);
    return target;
}

TargetWeightSelector::TargetWeightSelector(StrategyType strategy,
                                           double min_weight_pct,
                                           double limit_weight_pct)
    : strategy_(strategy),
      min_weight_pct_(min_weight_pct),
      limit_weight_pct_(limit_weight_pct) {
    if (min_weight_pct_ < 0.0) {
        throw std::invalid_argument("min_weight_pct cannot be negative");
    }
    if (!(limit_weight_pct_ > 0.0) || limit_weight_pct_ > 100.0) {
        throw std::invalid_argument("limit_weight_pct must be in (0, 100]");
    }
}

double TargetWeightSelector::strategy_weight(const optimizer::OptimizedWeightRecord& record,
                                             StrategyType strategy) {
    switch (strategy) {
    case StrategyType::LONG_ONLY:
        return record.initial_weight;
    case StrategyType::MARKET_NEUTRAL:
        return record.neutralized_weight;
    case StrategyType::LONG_ONLY_LIMITED:
        return record.limited_weight;
    case StrategyType::MARKET_NEUTRAL_LIMITED:
        return record.neutralized_limited_weight;
    }
    throw std::invalid_argument("Unknown strategy type");
}

std::vector<TargetWeight> TargetWeightSelector::select(
    const std::vector<optimizer::OptimizedWeightRecord>& records,
    const std::string& date) const {
    const std::string as_of = date.empty()
        ? optimizer::WeightHistoryBuilder::latest_date(records)
        : date;

    std::vector<TargetWeight> targets;
    for (const auto& record : records) {
        if (record.date != as_of) continue;

        const double pct = strategy_weight(record, strategy_) * 100.0;
        if (!(pct >= min_weight_pct_)) continue;

        TargetWeight target;
        target.symbol = record.symbol;
        target.weight = std::min(pct, limit_weight_pct_);
        target.market_price = record.market_price;
        targets.push_back(target);
    }

    std::stable_sort(targets.begin(), targets.end(),
                     [](const TargetWeight& a, const TargetWeight& b) {
                         return a.weight > b.weight;
                     });
    return targets;
}

} // namespace rebalance
} // namespace cemv
