#ifndef CEMV_REBALANCE_POSITION_HPP
#define CEMV_REBALANCE_POSITION_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/money.hpp"
#include "core/weight.hpp"

namespace cemv {
namespace rebalance {

/**
 * @class Position
 * @brief Snapshot of one holding, built fresh per analysis run
 *
 * weight is relative to net asset value, weight_over_stock_value to the
 * invested (stock-only) value. Instances are never mutated; a changed input
 * produces a new Position.
 */
class Position {
public:
    Position(std::string symbol,
             long long quantity,
             core::Money market_price,
             core::Money cost_price,
             core::Money break_even_price,
             core::Weight weight,
             core::Weight weight_over_stock_value = core::Weight(),
             std::optional<core::Money> realized_profit = std::nullopt,
             std::optional<core::Money> unrealized_profit = std::nullopt);

    const std::string& symbol() const { return symbol_; }
    long long quantity() const { return quantity_; }
    const core::Money& market_price() const { return market_price_; }
    const core::Money& cost_price() const { return cost_price_; }
    const core::Money& break_even_price() const { return break_even_price_; }
    const core::Weight& weight() const { return weight_; }
    const core::Weight& weight_over_stock_value() const { return weight_over_stock_value_; }
    const std::optional<core::Money>& realized_profit() const { return realized_profit_; }
    const std::optional<core::Money>& unrealized_profit() const { return unrealized_profit_; }

    /// market_price * quantity
    core::Money market_value() const;

    nlohmann::json to_json() const;

private:
    std::string symbol_;
    long long quantity_;
    core::Money market_price_;
    core::Money cost_price_;
    core::Money break_even_price_;
    core::Weight weight_;
    core::Weight weight_over_stock_value_;
    std::optional<core::Money> realized_profit_;
    std::optional<core::Money> unrealized_profit_;
};

} // namespace rebalance
} // namespace cemv

#endif // CEMV_REBALANCE_POSITION_HPP
