// ============================================================================
// Implementation of PortfolioProcessor
// ============================================================================

#include "rebalance/portfolio_processor.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace cemv {
namespace rebalance {

namespace {

double number_or_zero(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return 0.0;
    }
    if (!it->is_number()) {
        throw std::invalid_argument(std::string("Field '") + key + "' must be numeric");
    }
    return it->get<double>();
}

// Percentages above 100 come from stale broker valuations; Weight rejects them.
core::Weight bounded_weight(const core::Decimal& pct, const std::string& symbol, const char* label) {
    if (pct > 100) {
        std::cerr << "Warning: " << symbol << " " << label << " "
                  << core::decimal_to_string(pct, 2) << "% exceeds 100%, clamped\n";
        return core::Weight(core::Decimal(100));
    }
    if (pct < 0) {
        return core::Weight();
    }
    return core::Weight(pct);
}

} // namespace

Deal Deal::from_json(const nlohmann::json& j) {
    Deal deal;
    if (j.contains("symbol") && j["symbol"].is_string()) {
        deal.symbol = j["symbol"].get<std::string>();
    }
    deal.accumulate_quantity = number_or_zero(j, "accumulateQuantity");
    deal.market_price = number_or_zero(j, "marketPrice");
    deal.average_cost_price = number_or_zero(j, "averageCostPrice");
    deal.break_even_price = number_or_zero(j, "breakEvenPrice");
    deal.realized_profit = number_or_zero(j, "realizedProfit");
    deal.unrealized_profit = number_or_zero(j, "unrealizedProfit");
    return deal;
}

core::Decimal AccountBalance::cash_ratio() const {
    if (!net_asset_value.is_positive()) {
        return core::Decimal(0);
    }
    return available_cash.amount() / net_asset_value.amount() * 100;
}

nlohmann::json AccountBalance::to_json() const {
    return nlohmann::json{
        {"available_cash", available_cash.to_json()},
        {"net_asset_value", net_asset_value.to_json()},
        {"stock_value", stock_value.to_json()},
        {"cash_ratio", core::decimal_to_double(cash_ratio())}
    };
}

AccountBalance AccountBalance::from_json(const nlohmann::json& j, const std::string& currency) {
    if (!j.is_object()) {
        throw std::invalid_argument("Account balance must be a JSON object");
    }
    AccountBalance balance;
    balance.available_cash = core::Money::from_double(number_or_zero(j, "availableCash"), currency);
    balance.net_asset_value = core::Money::from_double(number_or_zero(j, "netAssetValue"), currency);
    balance.stock_value = core::Money::from_double(number_or_zero(j, "stockValue"), currency);
    return balance;
}

HoldingsSnapshot HoldingsSnapshot::from_json(const nlohmann::json& j, const std::string& currency) {
    if (!j.contains("balance")) {
        throw std::invalid_argument("Holdings snapshot has no 'balance' object");
    }

    HoldingsSnapshot snapshot;
    snapshot.account_id = j.value("accountId", "");
    snapshot.balance = AccountBalance::from_json(j["balance"], currency);

    if (j.contains("deals")) {
        if (!j["deals"].is_array()) {
            throw std::invalid_argument("'deals' must be an array");
        }
        for (const auto& item : j["deals"]) {
            snapshot.deals.push_back(Deal::from_json(item));
        }
    }
    return snapshot;
}

PortfolioProcessor::PortfolioProcessor(std::string currency)
    : currency_(std::move(currency)) {
    if (currency_.empty()) {
        throw std::invalid_argument("Currency code must not be empty");
    }
}

std::vector<Position> PortfolioProcessor::process_deals_to_positions(
    const std::vector<Deal>& deals,
    const AccountBalance& balance) const {
    std::vector<Position> positions;
    if (deals.empty() || !balance.net_asset_value.is_positive()) {
        return positions;
    }

    const core::Decimal& nav = balance.net_asset_value.amount();
    const core::Decimal& stock_value = balance.stock_value.amount();

    for (const auto& deal : deals) {
        if (deal.symbol.empty()) continue;

        const long long quantity = core::decimal_floor(core::decimal_from_double(deal.accumulate_quantity));
        if (quantity <= 0 || !(deal.market_price > 0.0)) continue;

        const core::Money price = core::Money::from_double(deal.market_price, currency_);
        const core::Decimal market_value = price.times(quantity).amount();

        const core::Weight weight = bounded_weight(market_value / nav * 100, deal.symbol, "weight");
        const core::Weight weight_over_sv = stock_value > 0
            ? bounded_weight(market_value / stock_value * 100, deal.symbol, "weight over stock value")
            : core::Weight();

        positions.emplace_back(deal.symbol,
                               quantity,
                               price,
                               core::Money::from_double(deal.average_cost_price, currency_),
                               core::Money::from_double(deal.break_even_price, currency_),
                               weight,
                               weight_over_sv,
                               core::Money::from_double(deal.realized_profit, currency_),
                               core::Money::from_double(deal.unrealized_profit, currency_));
    }

    std::stable_sort(positions.begin(), positions.end(),
                     [](const Position& a, const Position& b) {
                         return a.weight().percentage() > b.weight().percentage();
                     });
    return positions;
}

} // namespace rebalance
} // namespace cemv
