// ============================================================================
// Implementation of PortfolioAnalysisService
// ============================================================================

#include "rebalance/portfolio_analysis.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace cemv {
namespace rebalance {

namespace {

const EngineConfig& validated(const EngineConfig& config) {
    config.validate();
    return config;
}

} // namespace

size_t AnalysisReport::count(TradeAction action) const {
    return static_cast<size_t>(std::count_if(recommendations.begin(), recommendations.end(),
                                             [action](const TradeRecommendation& r) {
                                                 return r.action == action;
                                             }));
}

nlohmann::json AnalysisReport::to_json() const {
    nlohmann::json j;
    j["account_id"] = account_id;
    j["strategy"] = to_string(strategy);
    j["analysis_date"] = analysis_date;
    j["balance"] = balance.to_json();

    j["positions"] = nlohmann::json::array();
    for (const auto& position : positions) {
        j["positions"].push_back(position.to_json());
    }

    j["target_weights"] = nlohmann::json::array();
    for (const auto& target : targets) {
        j["target_weights"].push_back(target.to_json());
    }

    j["recommendations"] = nlohmann::json::array();
    for (const auto& rec : recommendations) {
        j["recommendations"].push_back(rec.to_json());
    }

    j["summary"] = {
        {"positions", positions.size()},
        {"targets", targets.size()},
        {"buy", count(TradeAction::BUY)},
        {"sell", count(TradeAction::SELL)}
    };
    return j;
}

void AnalysisReport::print_summary() const {
    std::cout << "\n=== Portfolio Analysis ===\n";
    std::cout << "Account:        " << (account_id.empty() ? "-" : account_id) << "\n";
    std::cout << "Strategy:       " << to_string(strategy) << "\n";
    std::cout << "Weights as of:  " << analysis_date << "\n";
    std::cout << "NAV:            " << core::decimal_to_string(balance.net_asset_value.amount(), 0)
              << " " << balance.net_asset_value.currency() << "\n";
    std::cout << "Cash ratio:     " << core::decimal_to_string(balance.cash_ratio(), 2) << "%\n";
    std::cout << "Positions:      " << positions.size() << "\n";
    std::cout << "Targets:        " << targets.size() << "\n";

    std::cout << "\n" << std::left << std::setw(8) << "Symbol"
              << std::setw(6) << "Side"
              << std::setw(8) << "Prio"
              << std::right << std::setw(10) << "Current"
              << std::setw(10) << "Target"
              << std::setw(12) << "Quantity" << "\n";
    std::cout << std::string(54, '-') << "\n";
    for (const auto& rec : recommendations) {
        std::cout << std::left << std::setw(8) << rec.symbol
                  << std::setw(6) << to_string(rec.action)
                  << std::setw(8) << to_string(rec.priority)
                  << std::right << std::setw(10) << core::decimal_to_string(rec.current_weight.percentage(), 2)
                  << std::setw(10) << core::decimal_to_string(rec.target_weight.percentage(), 2)
                  << std::setw(12) << (rec.action_quantity ? std::to_string(*rec.action_quantity) : "-")
                  << "\n";
    }
    std::cout << std::string(54, '-') << "\n";
    std::cout << "BUY: " << count(TradeAction::BUY) << "  SELL: " << count(TradeAction::SELL) << "\n"
              << std::endl;
}

PortfolioAnalysisService::PortfolioAnalysisService(const EngineConfig& config)
    : config_(validated(config)),
      processor_(config_.currency),
      selector_(config_.strategy, config_.min_target_weight_pct, config_.limit_weight_pct),
      engine_(config_.weight_tolerance, config_.sell_quantity_mode) {}

AnalysisReport PortfolioAnalysisService::analyze(
    const HoldingsSnapshot& snapshot,
    const std::vector<optimizer::OptimizedWeightRecord>& records,
    const std::string& date) const {
    const std::string as_of = date.empty() ? optimizer::WeightHistoryBuilder::latest_date(records) : date;
    const bool found = std::any_of(records.begin(), records.end(),
                                   [&as_of](const optimizer::OptimizedWeightRecord& r) {
                                       return r.date == as_of;
                                   });
    if (as_of.empty() || !found) {
        throw std::runtime_error("No weight records for date '" + as_of + "'");
    }

    AnalysisReport report;
    report.account_id = snapshot.account_id;
    report.strategy = config_.strategy;
    report.analysis_date = as_of;
    report.balance = snapshot.balance;
    report.positions = processor_.process_deals_to_positions(snapshot.deals, snapshot.balance);
    report.targets = selector_.select(records, as_of);
    report.recommendations = engine_.generate_recommendations(report.positions,
                                                              report.targets,
                                                              snapshot.balance.available_cash,
                                                              snapshot.balance.net_asset_value);

    if (config_.verbose && report.targets.empty()) {
        std::cerr << "Warning: no target weight above " << config_.min_target_weight_pct
                  << "% on " << as_of << "\n";
    }
    return report;
}

} // namespace rebalance
} // namespace cemv
