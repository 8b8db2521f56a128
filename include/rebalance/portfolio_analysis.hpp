#ifndef CEMV_REBALANCE_PORTFOLIO_ANALYSIS_HPP
#define CEMV_REBALANCE_PORTFOLIO_ANALYSIS_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "data/data_loader.hpp"
#include "optimizer/weight_history.hpp"
#include "rebalance/portfolio_processor.hpp"
#include "rebalance/recommendation_engine.hpp"
#include "rebalance/target_weights.hpp"

namespace cemv {
namespace rebalance {

/**
 * @struct AnalysisReport
 * @brief Holdings, targets and orders of one account at one date
 */
struct AnalysisReport {
    std::string account_id;
    StrategyType strategy = StrategyType::MARKET_NEUTRAL;
    std::string analysis_date;  ///< date of the weight records used
    AccountBalance balance;
    std::vector<Position> positions;
    std::vector<TargetWeight> targets;
    std::vector<TradeRecommendation> recommendations;

    size_t count(TradeAction action) const;

    nlohmann::json to_json() const;
    void print_summary() const;
};

/**
 * @class PortfolioAnalysisService
 * @brief Runs processor, target selection and recommendation engine in order
 *
 * Usage Example:
 * @code
 * EngineConfig config = DataLoader::load_config("config.json");
 * PortfolioAnalysisService service(config);
 * auto snapshot = HoldingsSnapshot::from_json(DataLoader::load_json("holdings.json"),
 *                                             config.currency);
 * auto records = WeightHistoryBuilder::load_csv("weights.csv");
 * AnalysisReport report = service.analyze(snapshot, records);
 * @endcode
 */
class PortfolioAnalysisService {
public:
    explicit PortfolioAnalysisService(const EngineConfig& config);

    /**
     * @param snapshot Account holdings and balance
     * @param records Stored weight history
     * @param date Weight date to rebalance towards; latest when empty
     * @throws std::runtime_error if no weight record matches the date
     */
    AnalysisReport analyze(const HoldingsSnapshot& snapshot,
                           const std::vector<optimizer::OptimizedWeightRecord>& records,
                           const std::string& date = "") const;

    const EngineConfig& get_config() const { return config_; }

private:
    EngineConfig config_;
    PortfolioProcessor processor_;
    TargetWeightSelector selector_;
    RecommendationEngine engine_;
};

} // namespace rebalance
} // namespace cemv

#endif // CEMV_REBALANCE_PORTFOLIO_ANALYSIS_HPP
