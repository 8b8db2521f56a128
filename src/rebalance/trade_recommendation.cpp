#include "rebalance/trade_recommendation.hpp"

namespace cemv {
namespace rebalance {

std::string to_string(TradeAction action) {
    return action == TradeAction::BUY ? "BUY" : "SELL";
}

std::string to_string(TradePriority priority) {
    switch (priority) {
    case TradePriority::HIGH:
        return "HIGH";
    case TradePriority::MEDIUM:
        return "MEDIUM";
    case TradePriority::LOW:
        return "LOW";
    }
    return "LOW";
}

core::Decimal TradeRecommendation::weight_gap() const {
    return boost::multiprecision::abs(target_weight.percentage() - current_weight.percentage());
}

nlohmann::json TradeRecommendation::to_json() const {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["action"] = to_string(action);
    j["current_weight"] = current_weight.to_json();
    j["target_weight"] = target_weight.to_json();
    j["amount"] = amount.to_json();
    j["priority"] = to_string(priority);
    j["action_price"] = action_price ? action_price->to_json() : nlohmann::json(nullptr);
    j["action_quantity"] = action_quantity ? nlohmann::json(*action_quantity) : nlohmann::json(nullptr);
    j["reason"] = reason;
    return j;
}

} // namespace rebalance
} // namespace cemv
