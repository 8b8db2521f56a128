/**
 * @file test_weight_history.cpp
 * @brief Tests for the rolling-window weight history
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/data_loader.hpp"
#include "optimizer/weight_history.hpp"
#include <filesystem>
#include <fstream>
#include <set>

using namespace cemv;
using namespace cemv::optimizer;
using Catch::Matchers::WithinAbs;

class HistoryFixture {
protected:
    EngineConfig config;
    PortfolioOptimizer optimizer;
    // 30 daily rows from 2024-01-10 to 2024-02-08
    MarketData panel;

    HistoryFixture()
        : optimizer(config),
          panel(DataLoader::generate_synthetic_data({"AAA", "BBB", "CCC"}, 30, "2024-01-10",
                                                    0.02, 0.0005, 3u)) {}
};

TEST_CASE_METHOD(HistoryFixture, "History over every symbol", "[WeightHistory]") {
    WeightHistoryBuilder builder(optimizer, 21);
    OptimizerMetrics metrics;

    auto records = builder.build(panel, {}, &metrics);

    // Windows end at rows 20..29
    REQUIRE(records.size() == 10 * 3);
    REQUIRE(metrics.total_solves() == 10);
    REQUIRE(records.front().date == panel.get_dates()[20]);
    REQUIRE(records.back().date == panel.get_dates()[29]);
    REQUIRE(records.front().algorithm == "CEMV");

    SECTION("One full set of weights per date") {
        double initial_sum = 0.0;
        double neutral_sum = 0.0;
        for (size_t i = 0; i < 3; ++i) {
            initial_sum += records[i].initial_weight;
            neutral_sum += records[i].neutralized_weight;
        }
        REQUIRE_THAT(initial_sum, WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(neutral_sum, WithinAbs(0.0, 1e-9));
    }

    SECTION("Market price is the last price of the window") {
        const auto &first = records.front();
        REQUIRE_THAT(first.market_price, WithinAbs(panel.get_price(first.symbol, first.date), 1e-12));
    }

    SECTION("Latest date") {
        REQUIRE(WeightHistoryBuilder::latest_date(records) == "2024-02-08");
        REQUIRE(WeightHistoryBuilder::latest_date({}).empty());
    }
}

TEST_CASE_METHOD(HistoryFixture, "Monthly universe", "[WeightHistory]") {
    WeightHistoryBuilder builder(optimizer, 21);

    SECTION("Universe refreshes when the month changes") {
        UniverseMap universe = {
            {"2024-01", {"AAA", "BBB", "CCC"}},
            {"2024-02", {"AAA", "BBB", "ZZZ"}}
        };
        auto records = builder.build(panel, universe);

        // Two January windows (01-30, 01-31) and eight February windows
        REQUIRE(records.size() == 2 * 3 + 8 * 2);

        std::set<std::string> february;
        for (const auto &r : records) {
            if (r.date.compare(0, 7, "2024-02") == 0) {
                february.insert(r.symbol);
            }
        }
        REQUIRE(february == std::set<std::string>{"AAA", "BBB"});
    }

    SECTION("Month without a list is skipped") {
        UniverseMap universe = {{"2024-01", {"AAA", "BBB", "CCC"}}};
        auto records = builder.build(panel, universe);
        REQUIRE(records.size() == 2 * 3);
    }

    SECTION("Fewer than two eligible symbols") {
        UniverseMap universe = {{"2024-01", {"AAA"}}, {"2024-02", {"AAA"}}};
        REQUIRE(builder.build(panel, universe).empty());
    }
}

TEST_CASE_METHOD(HistoryFixture, "Window limits", "[WeightHistory]") {
    REQUIRE_THROWS_AS(WeightHistoryBuilder(optimizer, 1), std::invalid_argument);

    WeightHistoryBuilder long_window(optimizer, 31);
    REQUIRE(long_window.build(panel).empty());
    REQUIRE(long_window.get_window() == 31);
}

TEST_CASE_METHOD(HistoryFixture, "Weight history CSV", "[WeightHistory]") {
    WeightHistoryBuilder builder(optimizer, 28);
    auto records = builder.build(panel);
    REQUIRE(records.size() == 3 * 3);

    auto path = (std::filesystem::temp_directory_path() / "cemv_history.csv").string();
    WeightHistoryBuilder::save_csv(records, path);

    {
        std::ifstream in(path);
        std::string header;
        std::getline(in, header);
        REQUIRE(header == WeightHistoryBuilder::CSV_HEADER);
    }

    auto loaded = WeightHistoryBuilder::load_csv(path);
    REQUIRE(loaded.size() == records.size());
    REQUIRE(loaded[4].symbol == records[4].symbol);
    REQUIRE(loaded[4].date == records[4].date);
    REQUIRE(loaded[4].neutralized_limited_weight == records[4].neutralized_limited_weight);

    std::filesystem::remove(path);
}

TEST_CASE("Weight history input errors", "[WeightHistory]") {
    SECTION("Wrong header") {
        auto path = (std::filesystem::temp_directory_path() / "cemv_bad_history.csv").string();
        {
            std::ofstream out(path);
            out << "date,symbol,weight\n2024-01-02,FPT,0.1\n";
        }
        REQUIRE_THROWS_AS(WeightHistoryBuilder::load_csv(path), std::runtime_error);
        std::filesystem::remove(path);
    }

    SECTION("JSON record needs date and symbol") {
        REQUIRE_THROWS_AS(OptimizedWeightRecord::from_json({{"symbol", "FPT"}}), std::invalid_argument);

        auto record = OptimizedWeightRecord::from_json(
            {{"date", "2024-01-02"}, {"symbol", "FPT"}, {"limited_weight", 0.12}});
        REQUIRE_THAT(record.limited_weight, WithinAbs(0.12, 1e-15));
        REQUIRE(record.algorithm == "CEMV");
        REQUIRE(WeightHistoryBuilder::to_json({record})[0]["symbol"] == "FPT");
    }
}
