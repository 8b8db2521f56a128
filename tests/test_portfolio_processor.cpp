/**
 * @file test_portfolio_processor.cpp
 * @brief Tests for holdings parsing and deal-to-position conversion
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "rebalance/portfolio_processor.hpp"

using namespace cemv;
using namespace cemv::rebalance;
using core::Money;
using Catch::Matchers::WithinAbs;

namespace {

Deal deal(const std::string &symbol, double quantity, double price) {
    Deal d;
    d.symbol = symbol;
    d.accumulate_quantity = quantity;
    d.market_price = price;
    d.average_cost_price = price * 0.9;
    d.break_even_price = price * 0.95;
    return d;
}

AccountBalance balance(double cash, double nav, double stock_value) {
    AccountBalance b;
    b.available_cash = Money::from_double(cash);
    b.net_asset_value = Money::from_double(nav);
    b.stock_value = Money::from_double(stock_value);
    return b;
}

} // namespace

TEST_CASE("Deals become weighted positions", "[PortfolioProcessor][Critical]") {
    PortfolioProcessor processor;
    auto account = balance(750000.0, 1000000.0, 250000.0);

    std::vector<Deal> deals = {
        deal("BBB", 50.0, 1000.0),
        deal("AAA", 100.0, 2000.0)
    };

    auto positions = processor.process_deals_to_positions(deals, account);

    REQUIRE(positions.size() == 2);
    REQUIRE(positions[0].symbol() == "AAA");
    REQUIRE(positions[0].quantity() == 100);
    REQUIRE(positions[0].weight().to_double() == 20.0);
    REQUIRE(positions[0].weight_over_stock_value().to_double() == 80.0);
    REQUIRE(positions[0].market_value().to_double() == 200000.0);
    REQUIRE(positions[0].realized_profit().has_value());

    REQUIRE(positions[1].symbol() == "BBB");
    REQUIRE(positions[1].weight().to_double() == 5.0);
    REQUIRE(positions[1].weight_over_stock_value().to_double() == 20.0);
}

TEST_CASE("Unusable deals are skipped", "[PortfolioProcessor]") {
    PortfolioProcessor processor;
    auto account = balance(0.0, 1000000.0, 1000000.0);

    std::vector<Deal> deals = {
        deal("", 100.0, 1000.0),
        deal("ZERO", 0.0, 1000.0),
        deal("FRAC", 0.6, 1000.0),
        deal("NOPRICE", 100.0, 0.0),
        deal("NEG", -10.0, 1000.0),
        deal("OK", 10.9, 1000.0)
    };

    auto positions = processor.process_deals_to_positions(deals, account);

    REQUIRE(positions.size() == 1);
    REQUIRE(positions[0].symbol() == "OK");
    // Fractional quantities are floored
    REQUIRE(positions[0].quantity() == 10);
    REQUIRE(positions[0].weight().to_double() == 1.0);
}

TEST_CASE("Degenerate balances", "[PortfolioProcessor]") {
    PortfolioProcessor processor;
    std::vector<Deal> deals = {deal("AAA", 100.0, 2000.0)};

    SECTION("No NAV gives no positions") {
        REQUIRE(processor.process_deals_to_positions(deals, balance(0.0, 0.0, 0.0)).empty());
        REQUIRE(processor.process_deals_to_positions(deals, balance(0.0, -5.0, 0.0)).empty());
    }

    SECTION("No deals") {
        REQUIRE(processor.process_deals_to_positions({}, balance(0.0, 1000.0, 0.0)).empty());
    }

    SECTION("No stock value leaves the second weight at zero") {
        auto positions = processor.process_deals_to_positions(deals, balance(0.0, 1000000.0, 0.0));
        REQUIRE(positions.size() == 1);
        REQUIRE(positions[0].weight_over_stock_value().to_double() == 0.0);
    }

    SECTION("Stale valuation is clamped at 100%") {
        auto positions = processor.process_deals_to_positions(deals, balance(0.0, 100000.0, 100000.0));
        REQUIRE(positions.size() == 1);
        REQUIRE(positions[0].weight().to_double() == 100.0);
        REQUIRE(positions[0].weight_over_stock_value().to_double() == 100.0);
    }
}

TEST_CASE("Holdings snapshot from JSON", "[PortfolioProcessor]") {
    nlohmann::json j = {
        {"accountId", "0001"},
        {"balance", {{"availableCash", 100000.0}, {"netAssetValue", 1000000.0}, {"stockValue", 900000.0}}},
        {"deals", nlohmann::json::array({
            {{"symbol", "FPT"}, {"accumulateQuantity", 100}, {"marketPrice", 95000},
             {"averageCostPrice", 90000}, {"breakEvenPrice", 91000},
             {"realizedProfit", nullptr}, {"unrealizedProfit", 500000}},
            {{"symbol", "HPG"}, {"accumulateQuantity", 200}, {"marketPrice", 28000}}
        })}
    };

    auto snapshot = HoldingsSnapshot::from_json(j);

    REQUIRE(snapshot.account_id == "0001");
    REQUIRE(snapshot.deals.size() == 2);
    REQUIRE(snapshot.deals[0].realized_profit == 0.0);
    REQUIRE(snapshot.deals[0].unrealized_profit == 500000.0);
    REQUIRE(snapshot.deals[1].break_even_price == 0.0);

    SECTION("Cash ratio") {
        REQUIRE(core::decimal_to_double(snapshot.balance.cash_ratio()) == 10.0);
        REQUIRE(snapshot.balance.to_json()["cash_ratio"] == 10.0);
        REQUIRE(core::decimal_to_double(balance(5.0, 0.0, 0.0).cash_ratio()) == 0.0);
    }

    SECTION("Missing balance") {
        j.erase("balance");
        REQUIRE_THROWS_AS(HoldingsSnapshot::from_json(j), std::invalid_argument);
    }

    SECTION("Deals must be an array") {
        j["deals"] = {{"symbol", "FPT"}};
        REQUIRE_THROWS_AS(HoldingsSnapshot::from_json(j), std::invalid_argument);
    }

    SECTION("Non-numeric field") {
        j["deals"][0]["marketPrice"] = "95000";
        REQUIRE_THROWS_AS(HoldingsSnapshot::from_json(j), std::invalid_argument);
    }

    SECTION("Currency propagates to positions") {
        auto usd = HoldingsSnapshot::from_json(j, "USD");
        REQUIRE(usd.balance.net_asset_value.currency() == "USD");

        PortfolioProcessor processor("USD");
        auto positions = processor.process_deals_to_positions(usd.deals, usd.balance);
        REQUIRE(positions[0].market_price().currency() == "USD");
    }
}

TEST_CASE("Processor needs a currency", "[PortfolioProcessor]") {
    REQUIRE_THROWS_AS(PortfolioProcessor(""), std::invalid_argument);
}
