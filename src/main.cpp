/**
 * @file main.cpp
 * @brief Main entry point for the CEMV rebalancer
 *
 * Command-line application with three commands:
 * - optimize:  four CEMV weight vectors for a price panel
 * - history:   rolling-window weight history over a panel
 * - recommend: BUY/SELL list for an account against stored weights
 */

#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "optimizer/portfolio_optimizer.hpp"
#include "optimizer/weight_history.hpp"
#include "rebalance/portfolio_analysis.hpp"
#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

using namespace cemv;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "CEMV Rebalancer v1.0.0\n"
              << "Usage: " << program_name << " COMMAND [OPTIONS]\n\n"
              << "Commands:\n"
              << "  optimize              Optimize weights over the whole price panel\n"
              << "  history               Build the rolling-window weight history\n"
              << "  recommend             Generate trade recommendations for an account\n"
              << "\nOptions:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --prices PATH         Price panel CSV (optimize, history)\n"
              << "  --universe PATH       Monthly universe JSON (history)\n"
              << "  --holdings PATH       Holdings and balance JSON (recommend)\n"
              << "  --weights PATH        Weight history CSV (recommend)\n"
              << "  --date YYYY-MM-DD     Weight date to rebalance towards (default: latest)\n"
              << "  --output PATH         Path to output directory (default: results/)\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " history --config config.json --prices prices.csv --universe universe.json\n"
              << "  " << program_name << " recommend --config config.json --holdings holdings.json --weights results/weights.csv\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       CEMV Rebalancer v1.0.0                                   \n"
              << "       Constrained Mean-Variance Portfolio Construction          \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string command;
    std::string config_path;
    std::string prices_path;
    std::string universe_path;
    std::string holdings_path;
    std::string weights_path;
    std::string date;
    std::string output_dir = "results";
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--prices" && i + 1 < argc)
            {
                args.prices_path = argv[++i];
            }
            else if (arg == "--universe" && i + 1 < argc)
            {
                args.universe_path = argv[++i];
            }
            else if (arg == "--holdings" && i + 1 < argc)
            {
                args.holdings_path = argv[++i];
            }
            else if (arg == "--weights" && i + 1 < argc)
            {
                args.weights_path = argv[++i];
            }
            else if (arg == "--date" && i + 1 < argc)
            {
                args.date = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else if (args.command.empty() && arg.rfind("--", 0) != 0)
            {
                args.command = arg;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        if (show_help || config_path.empty())
        {
            return false;
        }
        if (command == "optimize" || command == "history")
        {
            return !prices_path.empty();
        }
        if (command == "recommend")
        {
            return !holdings_path.empty() && !weights_path.empty();
        }
        return false;
    }
};

/**
 * @brief Load configuration and apply command-line overrides
 */
EngineConfig load_engine_config(const CommandLineArgs &args)
{
    auto config = DataLoader::load_config(args.config_path);
    if (args.verbose)
    {
        config.verbose = true;
        std::cout << "  - Strategy: " << rebalance::to_string(config.strategy) << "\n";
        std::cout << "  - Risk aversion: " << config.risk_aversion << "\n";
        std::cout << "  - Max weight: " << config.max_weight << "\n";
        std::cout << "  - Window: " << config.window << "\n";
    }
    return config;
}

int run_optimize(const CommandLineArgs &args)
{
    std::cout << "[1/3] Loading configuration..." << std::endl;
    auto config = load_engine_config(args);

    std::cout << "[2/3] Loading market data..." << std::endl;
    auto data = DataLoader::load_csv(args.prices_path);
    std::cout << "  - Loaded " << data.num_dates() << " dates, "
              << data.num_assets() << " assets" << std::endl;
    if (args.verbose)
    {
        data.print_summary();
    }

    std::cout << "[3/3] Running CEMV optimization..." << std::endl;
    optimizer::PortfolioOptimizer pipeline(config);
    optimizer::OptimizerMetrics metrics;
    auto weights = pipeline.optimize(data, &metrics);
    weights.print_summary();

    std::filesystem::create_directories(args.output_dir);
    const std::string output_file = args.output_dir + "/weights.json";
    DataLoader::save_json(weights.to_json(), output_file);
    std::cout << "  Weights written to: " << output_file << "\n";

    if (args.verbose)
    {
        metrics.print_summary();
    }
    return 0;
}

int run_history(const CommandLineArgs &args)
{
    std::cout << "[1/4] Loading configuration..." << std::endl;
    auto config = load_engine_config(args);

    std::cout << "[2/4] Loading market data..." << std::endl;
    auto data = DataLoader::load_csv(args.prices_path);
    std::cout << "  - Loaded " << data.num_dates() << " dates, "
              << data.num_assets() << " assets" << std::endl;

    std::cout << "[3/4] Loading universe..." << std::endl;
    optimizer::UniverseMap universe;
    if (!args.universe_path.empty())
    {
        universe = DataLoader::load_universe(args.universe_path);
        std::cout << "  - " << universe.size() << " monthly lists" << std::endl;
    }
    else
    {
        std::cout << "  - No universe file, using every panel symbol" << std::endl;
    }

    std::cout << "[4/4] Building weight history (window=" << config.window << ")..." << std::endl;
    optimizer::PortfolioOptimizer pipeline(config);
    optimizer::WeightHistoryBuilder builder(pipeline, static_cast<size_t>(config.window));
    optimizer::OptimizerMetrics metrics;
    auto records = builder.build(data, universe, &metrics);

    std::filesystem::create_directories(args.output_dir);
    const std::string output_file = args.output_dir + "/weights.csv";
    optimizer::WeightHistoryBuilder::save_csv(records, output_file);
    std::cout << "  - " << records.size() << " records written to: " << output_file << "\n";

    metrics.print_summary();
    return 0;
}

int run_recommend(const CommandLineArgs &args)
{
    std::cout << "[1/3] Loading configuration..." << std::endl;
    auto config = load_engine_config(args);

    std::cout << "[2/3] Loading holdings and weights..." << std::endl;
    auto snapshot = rebalance::HoldingsSnapshot::from_json(
        DataLoader::load_json(args.holdings_path), config.currency);
    auto records = optimizer::WeightHistoryBuilder::load_csv(args.weights_path);
    std::cout << "  - " << snapshot.deals.size() << " deals, "
              << records.size() << " weight records" << std::endl;

    std::cout << "[3/3] Generating recommendations..." << std::endl;
    rebalance::PortfolioAnalysisService service(config);
    auto report = service.analyze(snapshot, records, args.date);
    report.print_summary();

    std::filesystem::create_directories(args.output_dir);
    const std::string output_file = args.output_dir + "/analysis.json";
    DataLoader::save_json(report.to_json(), output_file);
    std::cout << "  Analysis written to: " << output_file << "\n";
    return 0;
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        int status = 1;
        if (args.command == "optimize")
        {
            status = run_optimize(args);
        }
        else if (args.command == "history")
        {
            status = run_history(args);
        }
        else
        {
            status = run_recommend(args);
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "'" << args.command << "' completed in " << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return status;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
