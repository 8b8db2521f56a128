/**
 * @file test_value_types.cpp
 * @brief Unit tests for Decimal helpers, Money, Weight, Position and TradeRecommendation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/decimal.hpp"
#include "core/money.hpp"
#include "core/weight.hpp"
#include "rebalance/position.hpp"
#include "rebalance/strategy.hpp"
#include "rebalance/trade_recommendation.hpp"
#include <limits>

using namespace cemv;
using core::Decimal;
using core::Money;
using core::Weight;
using Catch::Matchers::WithinAbs;

TEST_CASE("Decimal conversions", "[Decimal]") {
    SECTION("Short decimal form of a double") {
        REQUIRE(core::decimal_from_double(0.1) == Decimal("0.1"));
        REQUIRE(core::decimal_from_double(0.1) + core::decimal_from_double(0.2) == Decimal("0.3"));
    }

    SECTION("Non-finite values are rejected") {
        REQUIRE_THROWS_AS(core::decimal_from_double(std::numeric_limits<double>::quiet_NaN()),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(core::decimal_from_double(std::numeric_limits<double>::infinity()),
                          std::invalid_argument);
    }

    SECTION("Floor rounds toward negative infinity") {
        REQUIRE(core::decimal_floor(Decimal("2.7")) == 2);
        REQUIRE(core::decimal_floor(Decimal("-2.3")) == -3);
        REQUIRE(core::decimal_floor(Decimal("40000")) == 40000);
    }

    SECTION("Fixed-point formatting") {
        REQUIRE(core::decimal_to_string(Decimal(14), 1) == "14.0");
        REQUIRE(core::decimal_to_string(Decimal("3.14159"), 2) == "3.14");
    }
}

TEST_CASE("Money arithmetic", "[Money]") {
    Money cash(Decimal("1500000"));
    Money fee(Decimal("2500"));

    SECTION("Default currency") {
        REQUIRE(cash.currency() == "VND");
        REQUIRE(Money().is_zero());
    }

    SECTION("Plus and minus keep the currency") {
        REQUIRE(cash.plus(fee).amount() == Decimal("1502500"));
        REQUIRE(cash.minus(fee).amount() == Decimal("1497500"));
        REQUIRE(fee.minus(cash).amount() < 0);
        REQUIRE_FALSE(fee.minus(cash).is_positive());
    }

    SECTION("Scaling") {
        REQUIRE(Money::from_double(25300.0).times(100LL).amount() == Decimal("2530000"));
        REQUIRE(fee.times(Decimal("0.5")).amount() == Decimal("1250"));
        REQUIRE(fee.times(2.0).equals(Money(Decimal("5000"))));
    }

    SECTION("Currency mismatch is a contract violation") {
        Money usd(Decimal("10"), "USD");
        REQUIRE_THROWS_AS(cash.plus(usd), core::CurrencyMismatchError);
        REQUIRE_THROWS_AS(cash.minus(usd), std::invalid_argument);
        REQUIRE_FALSE(usd.equals(Money(Decimal("10"))));
    }

    SECTION("Invalid construction") {
        REQUIRE_THROWS_AS(Money(Decimal(1), ""), std::invalid_argument);
        REQUIRE_THROWS_AS(Money::from_double(std::numeric_limits<double>::infinity()),
                          std::invalid_argument);
    }

    SECTION("JSON form") {
        auto j = fee.to_json();
        REQUIRE(j["currency"] == "VND");
        REQUIRE_THAT(j["amount"].get<double>(), WithinAbs(2500.0, 1e-9));
    }
}

TEST_CASE("Weight range", "[Weight]") {
    REQUIRE_NOTHROW(Weight(Decimal(0)));
    REQUIRE_NOTHROW(Weight(Decimal(100)));
    REQUIRE_NOTHROW(Weight::from_double(12.5));

    REQUIRE_THROWS_AS(Weight(Decimal("-0.01")), std::invalid_argument);
    REQUIRE_THROWS_AS(Weight(Decimal("100.5")), std::invalid_argument);
    REQUIRE_THROWS_AS(Weight::from_double(std::numeric_limits<double>::quiet_NaN()),
                      std::invalid_argument);

    REQUIRE_THAT(Weight::from_double(12.5).to_double(), WithinAbs(12.5, 1e-12));
}

TEST_CASE("Position snapshot", "[Position]") {
    rebalance::Position position("FPT", 1000,
                                 Money(Decimal("95000")),
                                 Money(Decimal("80000")),
                                 Money(Decimal("81000")),
                                 Weight(Decimal("9.5")));

    REQUIRE(position.symbol() == "FPT");
    REQUIRE(position.market_value().amount() == Decimal("95000000"));
    REQUIRE_FALSE(position.realized_profit().has_value());

    auto j = position.to_json();
    REQUIRE(j["symbol"] == "FPT");
    REQUIRE(j["quantity"] == 1000);
    REQUIRE(j["realized_profit"].is_null());

    REQUIRE_THROWS_AS(rebalance::Position("", 1, Money(), Money(), Money(), Weight()),
                      std::invalid_argument);
}

TEST_CASE("Trade recommendation", "[TradeRecommendation]") {
    rebalance::TradeRecommendation rec;
    rec.symbol = "VNM";
    rec.action = rebalance::TradeAction::SELL;
    rec.current_weight = Weight(Decimal("12"));
    rec.target_weight = Weight(Decimal("7.5"));
    rec.priority = rebalance::TradePriority::HIGH;

    REQUIRE(rec.weight_gap() == Decimal("4.5"));

    auto j = rec.to_json();
    REQUIRE(j["action"] == "SELL");
    REQUIRE(j["priority"] == "HIGH");
    REQUIRE(j["action_quantity"].is_null());

    REQUIRE(rebalance::to_string(rebalance::TradeAction::BUY) == "BUY");
    REQUIRE(rebalance::to_string(rebalance::TradePriority::MEDIUM) == "MEDIUM");
}

TEST_CASE("Strategy names", "[Strategy]") {
    using rebalance::StrategyType;

    REQUIRE(rebalance::parse_strategy("long_only") == StrategyType::LONG_ONLY);
    REQUIRE(rebalance::parse_strategy("market_neutral") == StrategyType::MARKET_NEUTRAL);
    REQUIRE(rebalance::parse_strategy("long_only_limited") == StrategyType::LONG_ONLY_LIMITED);
    REQUIRE(rebalance::parse_strategy("market_neutral_limited") == StrategyType::MARKET_NEUTRAL_LIMITED);
    REQUIRE(rebalance::to_string(StrategyType::LONG_ONLY_LIMITED) == "long_only_limited");
    REQUIRE_THROWS_AS(rebalance::parse_strategy("momentum"), std::invalid_argument);

    REQUIRE(rebalance::parse_sell_quantity_mode("per_share") == rebalance::SellQuantityMode::PER_SHARE);
    REQUIRE(rebalance::parse_sell_quantity_mode("legacy_total_value") ==
            rebalance::SellQuantityMode::LEGACY_TOTAL_VALUE);
    REQUIRE_THROWS_AS(rebalance::parse_sell_quantity_mode("lots"), std::invalid_argument);
}
