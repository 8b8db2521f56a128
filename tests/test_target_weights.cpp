/**
 * @file test_target_weights.cpp
 * @brief Tests for strategy-based target weight selection
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "rebalance/target_weights.hpp"

using namespace cemv;
using namespace cemv::rebalance;
using optimizer::OptimizedWeightRecord;
using Catch::Matchers::WithinAbs;

namespace {

OptimizedWeightRecord record(const std::string &date, const std::string &symbol,
                             double initial, double neutralized,
                             double limited, double neutralized_limited,
                             double price) {
    OptimizedWeightRecord r;
    r.date = date;
    r.symbol = symbol;
    r.initial_weight = initial;
    r.neutralized_weight = neutralized;
    r.limited_weight = limited;
    r.neutralized_limited_weight = neutralized_limited;
    r.market_price = price;
    return r;
}

std::vector<OptimizedWeightRecord> sample_records() {
    return {
        record("2024-05-30", "FPT", 0.50, 0.20, 0.15, 0.15, 95000.0),
        record("2024-05-30", "HPG", 0.30, 0.05, 0.15, 0.05, 28000.0),
        record("2024-05-30", "VNM", 0.20, -0.25, 0.70, -0.20, 66000.0),
        record("2024-05-31", "FPT", 0.40, 0.25, 0.15, 0.15, 96000.0),
        record("2024-05-31", "HPG", 0.595, 0.12, 0.15, 0.12, 28500.0),
        record("2024-05-31", "VNM", 0.005, -0.37, 0.70, -0.27, 65500.0)
    };
}

} // namespace

TEST_CASE("Strategy picks the matching weight column", "[TargetWeights]") {
    auto r = record("2024-05-31", "FPT", 0.1, 0.2, 0.3, 0.4, 1.0);

    REQUIRE(TargetWeightSelector::strategy_weight(r, StrategyType::LONG_ONLY) == 0.1);
    REQUIRE(TargetWeightSelector::strategy_weight(r, StrategyType::MARKET_NEUTRAL) == 0.2);
    REQUIRE(TargetWeightSelector::strategy_weight(r, StrategyType::LONG_ONLY_LIMITED) == 0.3);
    REQUIRE(TargetWeightSelector::strategy_weight(r, StrategyType::MARKET_NEUTRAL_LIMITED) == 0.4);
}

TEST_CASE("Targets from the latest date", "[TargetWeights][Critical]") {
    auto records = sample_records();

    SECTION("Long-only drops small weights and caps large ones") {
        TargetWeightSelector selector(StrategyType::LONG_ONLY);
        auto targets = selector.select(records);

        // VNM at 0.5% falls below the 1% floor
        REQUIRE(targets.size() == 2);
        REQUIRE(targets[0].symbol == "FPT");
        REQUIRE(targets[1].symbol == "HPG");
        REQUIRE_THAT(targets[0].weight, WithinAbs(15.0, 1e-12));
        REQUIRE_THAT(targets[1].weight, WithinAbs(15.0, 1e-12));
        REQUIRE_THAT(targets[0].market_price, WithinAbs(96000.0, 1e-9));
    }

    SECTION("Market-neutral keeps only the long side, sorted descending") {
        TargetWeightSelector selector(StrategyType::MARKET_NEUTRAL);
        auto targets = selector.select(records);

        REQUIRE(targets.size() == 2);
        REQUIRE(targets[0].symbol == "FPT");
        REQUIRE_THAT(targets[0].weight, WithinAbs(15.0, 1e-12));
        REQUIRE(targets[1].symbol == "HPG");
        REQUIRE_THAT(targets[1].weight, WithinAbs(12.0, 1e-9));
    }

    SECTION("Custom floor and cap") {
        TargetWeightSelector selector(StrategyType::MARKET_NEUTRAL_LIMITED, 13.0, 100.0);
        auto targets = selector.select(records);

        REQUIRE(targets.size() == 1);
        REQUIRE(targets[0].symbol == "FPT");
        REQUIRE_THAT(targets[0].weight, WithinAbs(15.0, 1e-9));
    }
}

TEST_CASE("Targets from an explicit date", "[TargetWeights]") {
    auto records = sample_records();
    TargetWeightSelector selector(StrategyType::MARKET_NEUTRAL);

    SECTION("Known date") {
        auto targets = selector.select(records, "2024-05-30");
        REQUIRE(targets.size() == 2);
        REQUIRE(targets[0].symbol == "FPT");
        REQUIRE_THAT(targets[0].weight, WithinAbs(15.0, 1e-12));
        REQUIRE_THAT(targets[1].weight, WithinAbs(5.0, 1e-9));
        REQUIRE_THAT(targets[1].market_price, WithinAbs(28000.0, 1e-9));
    }

    SECTION("Unknown date gives no targets") {
        REQUIRE(selector.select(records, "2023-01-01").empty());
    }

    SECTION("No records") {
        REQUIRE(selector.select({}).empty());
    }
}

TEST_CASE("Equal weights keep record order", "[TargetWeights]") {
    std::vector<OptimizedWeightRecord> records = {
        record("2024-05-31", "VNM", 0.2, 0.0, 0.2, 0.0, 1.0),
        record("2024-05-31", "ACB", 0.2, 0.0, 0.2, 0.0, 1.0),
        record("2024-05-31", "MWG", 0.6, 0.0, 0.6, 0.0, 1.0)
    };

    TargetWeightSelector selector(StrategyType::LONG_ONLY, 1.0, 50.0);
    auto targets = selector.select(records);

    REQUIRE(targets.size() == 3);
    REQUIRE(targets[0].symbol == "MWG");
    REQUIRE_THAT(targets[0].weight, WithinAbs(50.0, 1e-12));
    REQUIRE(targets[1].symbol == "VNM");
    REQUIRE(targets[2].symbol == "ACB");
}

TEST_CASE("Selector and target validation", "[TargetWeights]") {
    REQUIRE_THROWS_AS(TargetWeightSelector(StrategyType::LONG_ONLY, -1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(TargetWeightSelector(StrategyType::LONG_ONLY, 1.0, 0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(TargetWeightSelector(StrategyType::LONG_ONLY, 1.0, 120.0), std::invalid_argument);

    TargetWeightSelector selector(StrategyType::LONG_ONLY_LIMITED);
    REQUIRE(selector.get_strategy() == StrategyType::LONG_ONLY_LIMITED);

    REQUIRE_THROWS_AS(TargetWeight::from_json({{"weight", 5.0}}), std::invalid_argument);

    auto target = TargetWeight::from_json({{"symbol", "FPT"}, {"weight", 5.0}, {"marketPrice", 95000.0}});
    REQUIRE(target.symbol == "FPT");
    REQUIRE_THAT(target.weight, WithinAbs(5.0, 1e-15));

    auto j = target.to_json();
    REQUIRE(j["marketPrice"] == 95000.0);
}
