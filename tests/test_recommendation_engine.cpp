/**
 * @file test_recommendation_engine.cpp
 * @brief Tests for BUY/SELL sizing, tolerance, priority and ordering
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "rebalance/recommendation_engine.hpp"

using namespace cemv;
using namespace cemv::rebalance;
using core::Decimal;
using core::Money;
using Catch::Matchers::WithinAbs;

namespace {

const double NAV = 1000000.0;

Position holding(const std::string &symbol, long long quantity, double price,
                 const std::string &currency = "VND") {
    const double pct = static_cast<double>(quantity) * price / NAV * 100.0;
    return Position(symbol, quantity,
                    Money::from_double(price, currency),
                    Money::from_double(price, currency),
                    Money::from_double(price, currency),
                    core::Weight::from_double(pct));
}

TargetWeight target(const std::string &symbol, double pct, double price) {
    TargetWeight t;
    t.symbol = symbol;
    t.weight = pct;
    t.market_price = price;
    return t;
}

Money nav() {
    return Money::from_double(NAV);
}

Money cash() {
    return Money::from_double(50000.0);
}

} // namespace

TEST_CASE("Gaps within tolerance produce nothing", "[RecommendationEngine]") {
    RecommendationEngine engine;

    SECTION("Small gap") {
        auto recs = engine.generate_recommendations({holding("AAA", 100, 1000.0)},
                                                    {target("AAA", 10.3, 1000.0)}, cash(), nav());
        REQUIRE(recs.empty());
    }

    SECTION("Gap equal to the tolerance") {
        auto recs = engine.generate_recommendations({holding("AAA", 100, 1000.0)},
                                                    {target("AAA", 11.0, 1000.0)}, cash(), nav());
        REQUIRE(recs.empty());
    }

    SECTION("No NAV") {
        auto recs = engine.generate_recommendations({holding("AAA", 100, 1000.0)},
                                                    {target("AAA", 14.0, 1000.0)}, cash(), Money());
        REQUIRE(recs.empty());
    }
}

TEST_CASE("BUY sizing", "[RecommendationEngine][Critical]") {
    RecommendationEngine engine;

    SECTION("Existing holding below target") {
        auto recs = engine.generate_recommendations({holding("AAA", 100, 1000.0)},
                                                    {target("AAA", 14.0, 1000.0)}, cash(), nav());

        REQUIRE(recs.size() == 1);
        const auto &rec = recs[0];
        REQUIRE(rec.action == TradeAction::BUY);
        REQUIRE(rec.priority == TradePriority::HIGH);
        REQUIRE(rec.amount.to_double() == 40000.0);
        REQUIRE(rec.action_price->to_double() == 1000.0);
        REQUIRE(*rec.action_quantity == 40);
        REQUIRE(rec.reason == "Increase weight from 10.0% to 14.0%");
    }

    SECTION("New symbol in the targets") {
        auto recs = engine.generate_recommendations({}, {target("DDD", 2.0, 3000.0)}, cash(), nav());

        REQUIRE(recs.size() == 1);
        REQUIRE(recs[0].action == TradeAction::BUY);
        REQUIRE(recs[0].priority == TradePriority::MEDIUM);
        REQUIRE(recs[0].amount.to_double() == 20000.0);
        REQUIRE(*recs[0].action_quantity == 6);
        REQUIRE(recs[0].current_weight.to_double() == 0.0);
    }

    SECTION("Unknown price gives a zero quantity") {
        auto recs = engine.generate_recommendations({}, {target("DDD", 2.0, 0.0)}, cash(), nav());

        REQUIRE(recs.size() == 1);
        REQUIRE(*recs[0].action_quantity == 0);
        REQUIRE(recs[0].amount.to_double() == 20000.0);
    }
}

TEST_CASE("SELL sizing", "[RecommendationEngine][Critical]") {
    std::vector<Position> positions = {holding("BBB", 200, 1000.0)};
    std::vector<TargetWeight> targets = {target("BBB", 15.0, 1000.0)};

    SECTION("Per-share quantity") {
        RecommendationEngine engine(1.0, SellQuantityMode::PER_SHARE);
        auto recs = engine.generate_recommendations(positions, targets, cash(), nav());

        REQUIRE(recs.size() == 1);
        REQUIRE(recs[0].action == TradeAction::SELL);
        REQUIRE(recs[0].priority == TradePriority::HIGH);
        REQUIRE(recs[0].amount.to_double() == 50000.0);
        REQUIRE(recs[0].action_price->to_double() == 1000.0);
        REQUIRE(*recs[0].action_quantity == 50);
        REQUIRE(recs[0].reason == "Reduce weight from 20.0% to 15.0%");
    }

    SECTION("Legacy total-value quantity") {
        RecommendationEngine engine(1.0, SellQuantityMode::LEGACY_TOTAL_VALUE);
        auto recs = engine.generate_recommendations(positions, targets, cash(), nav());

        REQUIRE(recs.size() == 1);
        REQUIRE(recs[0].action_price->to_double() == 200000.0);
        REQUIRE(*recs[0].action_quantity == 0);
        REQUIRE(recs[0].amount.to_double() == 50000.0);
    }

    SECTION("Holding without a target is sold in full") {
        RecommendationEngine engine;
        auto recs = engine.generate_recommendations({holding("CCC", 30, 1000.0)}, {}, cash(), nav());

        REQUIRE(recs.size() == 1);
        REQUIRE(recs[0].action == TradeAction::SELL);
        REQUIRE(recs[0].priority == TradePriority::MEDIUM);
        REQUIRE(recs[0].amount.to_double() == 30000.0);
        REQUIRE(*recs[0].action_quantity == 30);
        REQUIRE(recs[0].target_weight.to_double() == 0.0);
    }
}

TEST_CASE("Recommendations are ordered by priority then gap", "[RecommendationEngine]") {
    RecommendationEngine engine;

    std::vector<Position> positions = {
        holding("AAA", 100, 1000.0), // 10%
        holding("BBB", 200, 1000.0), // 20%
        holding("CCC", 30, 1000.0),  // 3%
        holding("EEE", 50, 1000.0)   // 5%
    };
    std::vector<TargetWeight> targets = {
        target("AAA", 14.0, 1000.0),
        target("BBB", 15.0, 1000.0),
        target("DDD", 2.0, 3000.0),
        target("EEE", 5.2, 1000.0)
    };

    auto recs = engine.generate_recommendations(positions, targets, cash(), nav());

    REQUIRE(recs.size() == 4);
    REQUIRE(recs[0].symbol == "BBB");
    REQUIRE(recs[1].symbol == "AAA");
    REQUIRE(recs[2].symbol == "CCC");
    REQUIRE(recs[3].symbol == "DDD");
    REQUIRE_THAT(core::decimal_to_double(recs[0].weight_gap()), WithinAbs(5.0, 1e-12));

    auto j = recs[0].to_json();
    REQUIRE(j["action"] == "SELL");
    REQUIRE(j["priority"] == "HIGH");
    REQUIRE(j["action_quantity"] == 50);
}

TEST_CASE("Priority thresholds", "[RecommendationEngine]") {
    REQUIRE(RecommendationEngine::calculate_priority(Decimal("3.01")) == TradePriority::HIGH);
    REQUIRE(RecommendationEngine::calculate_priority(Decimal("3")) == TradePriority::MEDIUM);
    REQUIRE(RecommendationEngine::calculate_priority(Decimal("1.51")) == TradePriority::MEDIUM);
    REQUIRE(RecommendationEngine::calculate_priority(Decimal("1.5")) == TradePriority::LOW);
    REQUIRE(RecommendationEngine::calculate_priority(Decimal("-4")) == TradePriority::HIGH);
    REQUIRE(RecommendationEngine::calculate_priority(Decimal("-2")) == TradePriority::MEDIUM);
}

TEST_CASE("Engine input errors", "[RecommendationEngine]") {
    REQUIRE_THROWS_AS(RecommendationEngine(-0.5), std::invalid_argument);

    RecommendationEngine engine(0.0);
    REQUIRE(engine.get_weight_tolerance() == 0.0);
    REQUIRE(engine.get_sell_mode() == SellQuantityMode::PER_SHARE);

    auto usd_holding = holding("AAA", 100, 1000.0, "USD");
    REQUIRE_THROWS_AS(engine.generate_recommendations({usd_holding}, {target("AAA", 14.0, 1000.0)},
                                                      cash(), nav()),
                      core::CurrencyMismatchError);
}
