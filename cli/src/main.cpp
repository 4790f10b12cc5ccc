// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <vector>
#include <exception>
#include <memory>
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <optional>
#include <set>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "config.hpp"
#include "table.hpp"
#include "dataset_validator.hpp"
#include "database_manager.hpp"
#include "simulation_driver.hpp"
#include "result_tables.hpp"
#include "performance.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/fmt.h>

namespace {

    struct CliOptions {
        std::string signals_path;
        std::string candles_path;
        std::string candles_db_path;
        std::string config_path;
        std::string output_dir = "results";
        std::string submission_id = "local";
        std::string results_db_path;
        std::string import_candles_db_path;
        std::string log_level = "info";
        bool show_help = false;
    };

    void printUsage(std::ostream& os) {
        os << "Usage: tradesim_cli --signals <csv> (--candles <csv> | --candles-db <sqlite>)\n"
           << "                    [--config <json>] [--output-dir <dir>] [--submission-id <id>]\n"
           << "                    [--results-db <sqlite>] [--import-candles <sqlite>]\n"
           << "                    [--log-level <trace|debug|info|warn|error>]\n";
    }

    bool parseArgs(int argc, char* argv[], CliOptions& opts, std::string& error_msg) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> bool {
                if (i + 1 >= argc) {
                    error_msg = "Missing value for " + arg;
                    return false;
                }
                ++i;
                return true;
            };

            if (arg == "--help" || arg == "-h") { opts.show_help = true; return true; }
            else if (arg == "--signals") { if (!next()) return false; opts.signals_path = argv[i]; }
            else if (arg == "--candles") { if (!next()) return false; opts.candles_path = argv[i]; }
            else if (arg == "--candles-db") { if (!next()) return false; opts.candles_db_path = argv[i]; }
            else if (arg == "--config") { if (!next()) return false; opts.config_path = argv[i]; }
            else if (arg == "--output-dir") { if (!next()) return false; opts.output_dir = argv[i]; }
            else if (arg == "--submission-id") { if (!next()) return false; opts.submission_id = argv[i]; }
            else if (arg == "--results-db") { if (!next()) return false; opts.results_db_path = argv[i]; }
            else if (arg == "--import-candles") { if (!next()) return false; opts.import_candles_db_path = argv[i]; }
            else if (arg == "--log-level") { if (!next()) return false; opts.log_level = argv[i]; }
            else {
                error_msg = "Unknown argument: " + arg;
                return false;
            }
        }

        if (opts.signals_path.empty()) {
            error_msg = "--signals is required";
            return false;
        }
        if (opts.candles_path.empty() == opts.candles_db_path.empty()) {
            error_msg = "Exactly one of --candles or --candles-db is required";
            return false;
        }
        if (!opts.import_candles_db_path.empty() && opts.candles_path.empty()) {
            error_msg = "--import-candles requires --candles";
            return false;
        }
        return true;
    }

    // Only the candles the resolver can use: traded symbols, the configured timeframes,
    // and timestamps up to the last signal (back to the staleness limit when prior candles are allowed)
    core::TimeSeries<core::Candle> loadCandlesFromDatabase(const std::string& db_path,
                                                           const core::AppConfig& config,
                                                           const std::vector<core::Signal>& signals) {
        auto logger = core::logging::getLogger();
        logger->info("Loading candles from SQLite database: {}", db_path);
        if (signals.empty()) {
            return {};
        }

        std::set<std::string> unique_symbols;
        for (const auto& signal : signals) unique_symbols.insert(signal.symbol);
        const std::vector<std::string> symbols(unique_symbols.begin(), unique_symbols.end());

        const core::PriceResolutionConfig& pricing = config.simulation.pricing;
        std::vector<std::string> timeframes{pricing.primary_timeframe};
        timeframes.insert(timeframes.end(), pricing.fallback_timeframes.begin(), pricing.fallback_timeframes.end());

        const auto bounds = std::minmax_element(signals.begin(), signals.end(),
            [](const core::Signal& a, const core::Signal& b) { return a.timestamp < b.timestamp; });
        std::optional<core::Timestamp> start_time = bounds.first->timestamp;
        if (pricing.allow_prior_fallback) {
            start_time = pricing.max_prior_staleness.count() > 0
                ? std::optional<core::Timestamp>(bounds.first->timestamp - pricing.max_prior_staleness)
                : std::nullopt;
        }

        data::DatabaseManager db_manager(db_path);
        if (!db_manager.connect()) {
            throw core::DataLoadException("Failed to open candle database: " + db_path);
        }
        core::TimeSeries<core::Candle> candles =
            db_manager.loadCandles(symbols, timeframes, start_time, bounds.second->timestamp);
        db_manager.disconnect();

        data::DatasetValidator::validateCandleRecords(candles, db_path);
        return candles;
    }

    core::TimeSeries<core::Candle> loadCandles(const CliOptions& opts, const core::AppConfig& config,
                                               const std::vector<core::Signal>& signals) {
        if (!opts.candles_path.empty()) {
            data::Table table = data::readCsv(opts.candles_path);
            return data::DatasetValidator::validateCandles(table, config.simulation.pricing.primary_timeframe);
        }
        return loadCandlesFromDatabase(opts.candles_db_path, config, signals);
    }

    void importCandles(const std::string& db_path, const core::TimeSeries<core::Candle>& candles) {
        data::DatabaseManager db_manager(db_path);
        if (!db_manager.connect() || !db_manager.initializeSchema()) {
            throw core::PersistenceException("Failed to prepare candle database: " + db_path);
        }
        if (!db_manager.saveCandles(candles)) {
            throw core::PersistenceException("Failed to import candles into " + db_path);
        }
        db_manager.disconnect();
        core::logging::getLogger()->info("Imported {} candles into {}", candles.size(), db_path);
    }

    void writeOutputs(const CliOptions& opts,
                      const simulator::SimulationResult& result,
                      const metrics::PerformanceMetrics& perf,
                      const metrics::SubmissionScore& score) {
        auto logger = core::logging::getLogger();
        std::filesystem::path out_dir(opts.output_dir);
        try {
            std::filesystem::create_directories(out_dir);
        } catch (const std::filesystem::filesystem_error& fs_err) {
            throw core::PersistenceException(fmt::format("Cannot create output directory '{}': {}",
                                                         opts.output_dir, fs_err.what()));
        }

        data::writeCsv(simulator::tradeLogToTable(result.trade_log), (out_dir / "trade_log.csv").string());
        data::writeCsv(simulator::equityCurveToTable(result.equity_curve), (out_dir / "equity_curve.csv").string());
        data::writeCsv(simulator::rejectionsToTable(result.rejections), (out_dir / "rejections.csv").string());

        core::json report = metrics::toJson(perf, score);
        report["submission_id"] = opts.submission_id;
        report["signals_processed"] = result.signals_processed;
        std::ofstream ofs((out_dir / "metrics.json").string());
        if (!ofs.is_open()) {
            throw core::PersistenceException("Failed to open " + (out_dir / "metrics.json").string() + " for writing");
        }
        ofs << report.dump(2) << '\n';
        logger->info("Results written to {}", out_dir.string());
    }

    void persistRun(const CliOptions& opts, const core::AppConfig& config, const simulator::SimulationResult& result) {
        auto logger = core::logging::getLogger();
        data::DatabaseManager db_manager(opts.results_db_path);
        if (!db_manager.connect() || !db_manager.initializeSchema()) {
            throw core::PersistenceException("Failed to prepare results database: " + opts.results_db_path);
        }

        data::RunRecord run;
        run.run_id = opts.submission_id;
        run.initial_cash = config.simulation.initial_cash;
        run.fee_rate = config.simulation.fee_rate;
        run.final_cash = result.final_cash;
        run.final_portfolio_value = result.final_portfolio_value;
        run.signals_processed = result.signals_processed;
        run.rejected_signals = result.rejections.size();

        if (!db_manager.saveRun(run, result.trade_log, result.equity_curve)) {
            throw core::PersistenceException("Failed to save run '" + run.run_id + "' to " + opts.results_db_path);
        }
        const std::size_t stored = db_manager.queryTradeLog(run.run_id).size();
        if (stored != result.trade_log.size()) {
            throw core::PersistenceException(fmt::format("Run '{}' in {} holds {} trades, expected {}",
                                                         run.run_id, opts.results_db_path, stored,
                                                         result.trade_log.size()));
        }
        db_manager.disconnect();
        logger->info("Run '{}' persisted to {}", run.run_id, opts.results_db_path);
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    std::string error_msg;
    if (!parseArgs(argc, argv, opts, error_msg)) {
        std::cerr << "Error: " << error_msg << "\n";
        printUsage(std::cerr);
        return 2;
    }
    if (opts.show_help) {
        printUsage(std::cout);
        return 0;
    }

    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        // --- Initialize Logging ---
        core::logging::initialize("tradesim_cli", core::logging::level_from_string(opts.log_level), spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("TradeSim CLI starting (submission: {})", opts.submission_id);

        // --- Configuration ---
        core::AppConfig config;
        if (!opts.config_path.empty()) {
            config = core::loadConfigFile(opts.config_path);
        } else {
            logger->info("No config file given; using default settings.");
        }
        if (!config.universe.empty()) {
            data::DatasetValidator::validateUniverse(config.universe);
        }

        // --- Datasets ---
        data::Table signal_table = data::readCsv(opts.signals_path);
        std::vector<core::Signal> signals = data::DatasetValidator::validateSignals(signal_table);
        core::TimeSeries<core::Candle> candles = loadCandles(opts, config, signals);
        logger->info("Loaded {} signals and {} candles.", signals.size(), candles.size());
        if (!opts.import_candles_db_path.empty()) {
            importCandles(opts.import_candles_db_path, candles);
        }

        if (!config.universe.empty()) {
            data::DatasetValidator::validateSignalSymbols(signals, config.universe);
        }
        data::DatasetValidator::validateMinimumTradePairs(signals, config.validation.min_trade_pairs);

        // --- Simulation ---
        simulator::SimulationResult result = simulator::simulate(signals, candles, config.simulation);

        // --- Metrics ---
        metrics::PerformanceCalculator calculator(config.metrics);
        metrics::PerformanceMetrics perf = calculator.calculate(result);
        perf.logMetrics();
        metrics::SubmissionScore score = metrics::scoreSubmission(perf, config.scoring);
        score.logScore();

        // --- Outputs ---
        writeOutputs(opts, result, perf, score);
        if (!opts.results_db_path.empty()) {
            persistRun(opts, config, result);
        }

        logger->info("TradeSim CLI finished.");

    // --- Exception Handling ---
    } catch (const core::TradeSimException& ex) {
        std::cerr << "Error: " << ex.what() << " (submission: " << opts.submission_id << ")" << std::endl;
        if (logger) logger->critical("{} (submission: {})", ex.what(), opts.submission_id);
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Unexpected error: " << ex.what() << " (submission: " << opts.submission_id << ")" << std::endl;
        if (logger) logger->critical("Unexpected error: {} (submission: {})", ex.what(), opts.submission_id);
        return 1;
    }

    return 0;
}
