// ============================================================================
// Implementation of Position
// ============================================================================

#include "rebalance/position.hpp"

#include <stdexcept>
#include <utility>

namespace cemv {
namespace rebalance {

Position::Position(std::string symbol,
                   long long quantity,
                   core::Money market_price,
                   core::Money cost_price,
                   core::Money break_even_price,
                   core::Weight weight,
                   core::Weight weight_over_stock_value,
                   std::optional<core::Money> realized_profit,
                   std::optional<core::Money> unrealized_profit)
    : symbol_(std::move(symbol)),
      quantity_(quantity),
      market_price_(std::move(market_price)),
      cost_price_(std::move(cost_price)),
      break_even_price_(std::move(break_even_price)),
      weight_(std::move(weight)),
      weight_over_stock_value_(std::move(weight_over_stock_value)),
      realized_profit_(std::move(realized_profit)),
      unrealized_profit_(std::move(unrealized_profit)) {
    if (symbol_.empty()) {
        throw std::invalid_argument("Position symbol must not be empty");
    }
}

core::Money Position::market_value() const {
    return market_price_.times(quantity_);
}

nlohmann::json Position::to_json() const {
    nlohmann::json j;
    j["symbol"] = symbol_;
    j["quantity"] = quantity_;
    j["market_price"] = market_price_.to_json();
    j["cost_price"] = cost_price_.to_json();
    j["break_even_price"] = break_even_price_.to_json();
    j["weight"] = weight_.to_json();
    j["weight_over_sv"] = weight_over_stock_value_.to_json();
    j["market_value"] = market_value().to_json();
    j["realized_profit"] = realized_profit_ ? realized_profit_->to_json() : nlohmann::json(nullptr);
    j["unrealized_profit"] = unrealized_profit_ ? unrealized_profit_->to_json() : nlohmann::json(nullptr);
    return j;
}

} // namespace rebalance
} // namespace cemv
