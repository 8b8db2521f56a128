#ifndef CEMV_REBALANCE_TARGET_WEIGHTS_HPP
#define CEMV_REBALANCE_TARGET_WEIGHTS_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "optimizer/weight_history.hpp"
#include "rebalance/strategy.hpp"

namespace cemv {
namespace rebalance {

/**
 * @struct TargetWeight
 * @brief Desired weight of one symbol, in percent of net asset value
 */
struct TargetWeight {
    std::string symbol;
    double weight = 0.0;        ///< percent, e.g. 12.5
    double market_price = 0.0;  ///< per-share price used to size BUY orders

    /// {"symbol", "weight", "marketPrice"}
    nlohmann::json to_json() const;
    static TargetWeight from_json(const nlohmann::json& j);
};

/**
 * @class TargetWeightSelector
 * @brief Turns stored weight records into target weights for one strategy
 *
 * Weights are converted to percent, entries below min_weight_pct are
 * dropped (this removes the short side of market-neutral policies), the
 * rest are capped at limit_weight_pct and sorted by weight descending.
 *
 * Usage:
 * @code
 * TargetWeightSelector selector(StrategyType::MARKET_NEUTRAL);
 * auto targets = selector.select(records);          // latest date
 * auto dated = selector.select(records, "2024-05-31");
 * @endcode
 */
class TargetWeightSelector {
public:
    TargetWeightSelector(StrategyType strategy,
                         double min_weight_pct = 1.0,
                         double limit_weight_pct = 15.0);

    /**
     * @brief Select targets from the records of one date
     * @param date Records date; the latest date in records when empty
     */
    std::vector<TargetWeight> select(const std::vector<optimizer::OptimizedWeightRecord>& records,
                                     const std::string& date = "") const;

    /// Raw weight of a record under a strategy (fraction, not percent)
    static double strategy_weight(const optimizer::OptimizedWeightRecord& record,
                                  StrategyType strategy);

    StrategyType get_strategy() const { return strategy_; }

private:
    StrategyType strategy_;
    double min_weight_pct_;
    double limit_weight_pct_;
};

} // namespace rebalance
} // namespace cemv

#endif // CEMV_REBALANCE_TARGET_WEIGHTS_HPP
