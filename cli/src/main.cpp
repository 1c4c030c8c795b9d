// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <exception>
#include <cstdlib>     // Needed for std::getenv
#include <memory>
#include <fstream>
#include <optional>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "config.hpp"
#include "utils.hpp"
#include "candle_sanitizer.hpp"
#include "database_manager.hpp"
#include "sqlite_market_data_source.hpp"
#include "fallback_market_data_source.hpp"
#include "rest_market_data_source.hpp"
#include "fetch_executor.hpp"
#include "profile_repository.hpp"
#include "replay_session.hpp"
#include "trade_statistics.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <nlohmann/json.hpp>

namespace {

    struct CliOptions {
        std::string config_path;
        std::string db_path;
        std::string profile_id;
    };

    CliOptions parseArguments(int argc, char* argv[]) {
        CliOptions options;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto next = [&](const char* flag) -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument(std::string("Missing value for ") + flag);
                }
                return argv[++i];
            };
            if (arg == "--config") options.config_path = next("--config");
            else if (arg == "--db") options.db_path = next("--db");
            else if (arg == "--profile") options.profile_id = next("--profile");
            else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: replay_cli [--config <file>] [--db <path>] [--profile <id>]\n";
                std::exit(0);
            } else {
                throw std::invalid_argument("Unknown argument: " + arg);
            }
        }
        return options;
    }

    // Prints engine events as they happen
    class ConsoleListener : public session::ISessionListener {
    public:
        void onStopOut(const core::AccountState& account) override {
            std::cout << "!! STOP OUT: all positions closed, equity " << account.equity << std::endl;
        }
        void onNoData(const std::string& symbol, core::Timeframe timeframe) override {
            std::cout << "!! No data for " << symbol << " " << core::utils::timeframeToString(timeframe)
                      << " (try 'first')" << std::endl;
        }
        void onLoadComplete(const std::string& symbol, core::Timeframe timeframe,
                            simulation::LoadStatus status) override {
            std::cout << "-- " << symbol << " " << core::utils::timeframeToString(timeframe) << ": "
                      << simulation::toString(status) << std::endl;
        }
    };

    double parseNumber(const std::vector<std::string>& args, std::size_t index, double fallback = 0.0) {
        if (index >= args.size()) return fallback;
        return std::stod(args[index]);
    }

    void printResult(const trading::OrderResult& result) {
        if (result.accepted) {
            std::cout << "OK " << result.trade_id << std::endl;
        } else {
            std::cout << "REJECTED (" << trading::toString(result.reason) << "): " << result.message << std::endl;
        }
    }

    void printStatus(session::ReplaySession& replay) {
        const auto state = replay.simulationState();
        const auto account = replay.account();
        const auto sim_time = replay.simTime();
        std::cout << replay.activeSymbol() << " " << core::utils::timeframeToString(replay.activeTimeframe())
                  << " | " << (sim_time ? core::utils::timestampToString(*sim_time) : std::string("loading..."))
                  << " | bar " << state.current_index << "/" << state.max_index
                  << (state.is_playing ? " [playing " : " [paused ") << state.speed << "ms]"
                  << " | price " << replay.currentPrice() << "\n"
                  << "balance " << account.balance << " equity " << account.equity
                  << " max DD " << account.max_drawdown
                  << " margin " << replay.usedMargin() << " level " << replay.marginLevel() << "%"
                  << " | data " << simulation::toString(replay.dataStatus()) << std::endl;
    }

    void printTrades(session::ReplaySession& replay) {
        for (const auto& trade : replay.account().history) {
            std::cout << trade.id << " " << trade.symbol << " " << core::utils::toString(trade.side)
                      << " " << core::utils::toString(trade.type) << " " << trade.quantity << " @ "
                      << trade.entry_price << " SL " << trade.stop_loss << " TP " << trade.take_profit
                      << " " << core::utils::toString(trade.status) << " pnl " << trade.pnl;
            if (trade.close_reason) std::cout << " (" << core::utils::toString(*trade.close_reason) << ")";
            std::cout << "\n";
        }
        std::cout << std::flush;
    }

    bool ingestFile(data::DatabaseManager& db, const std::string& path, const std::string& symbol,
                    core::Timeframe tf) {
        auto logger = core::logging::getLogger();
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            logger->error("Cannot open {}", path);
            return false;
        }
        nlohmann::json rows;
        try {
            rows = nlohmann::json::parse(ifs);
        } catch (const nlohmann::json::parse_error& e) {
            logger->error("Failed to parse {}: {}", path, e.what());
            return false;
        }
        auto candles = data::sanitizeJsonRows(rows, symbol);
        logger->info("Ingesting {} bars of {} {} from {}", candles.size(), symbol,
                     core::utils::timeframeToString(tf), path);
        return db.saveCandles(candles, symbol, tf);
    }

} // namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        CliOptions options = parseArguments(argc, argv);

        // --- Configuration ---
        core::logging::initialize("replay_cli", spdlog::level::warn, spdlog::level::debug);
        logger = core::logging::getLogger();

        core::EngineConfig config;
        if (!options.config_path.empty()) {
            config = core::loadEngineConfig(options.config_path);
            core::logging::initialize(config.log_file, spdlog::level::warn, spdlog::level::debug);
            logger = core::logging::getLogger();
        }
        if (!options.db_path.empty()) {
            config.database_path = options.db_path;
        }
        core::logging::applyLevel(config.log_level);
        logger->info("Replay CLI starting (db: {})", config.database_path);

        // --- Storage and data source ---
        data::DatabaseManager db_manager(config.database_path);
        if (!db_manager.connect() || !db_manager.initializeSchema()) {
            logger->critical("Database {} is not usable.", config.database_path);
            return 1;
        }

        std::shared_ptr<data::IMarketDataSource> upstream;
        if (!config.rest.base_url.empty()) {
            const char* key_env = std::getenv(config.rest.api_key_env.c_str());
            if (!key_env) {
                logger->warn("{} is not set; REST requests will be anonymous.", config.rest.api_key_env);
            }
            upstream = std::make_shared<data::RestMarketDataSource>(config.rest, key_env ? key_env : "");
        } else {
            upstream = std::make_shared<data::SqliteMarketDataSource>(db_manager);
        }
        auto source = std::make_shared<data::FallbackMarketDataSource>(upstream, config.fallback_limit_cap);

        session::ProfileRepository profiles(db_manager);
        session::ReplaySession replay(config, source, std::make_shared<simulation::WorkerFetchExecutor>());
        ConsoleListener listener;
        replay.setListener(&listener);

        if (!options.profile_id.empty()) {
            auto profile = profiles.load(options.profile_id);
            if (!profile) {
                logger->critical("Profile {} not found.", options.profile_id);
                return 1;
            }
            replay.open(*profile);
        }

        // --- Command loop ---
        std::string line;
        std::cout << "> " << std::flush;
        while (std::getline(std::cin, line)) {
            std::istringstream iss(line);
            std::vector<std::string> args;
            for (std::string token; iss >> token;) args.push_back(token);
            if (args.empty()) {
                std::cout << "> " << std::flush;
                continue;
            }
            const std::string& cmd = args[0];

            try {
                if (cmd == "quit" || cmd == "exit") {
                    break;
                } else if (cmd == "new" && args.size() >= 8) {
                    // new <id> <name> <balance> <start> <end> <tf> <SYM1,SYM2,...>
                    std::vector<std::string> symbols;
                    std::stringstream list(args[7]);
                    for (std::string s; std::getline(list, s, ',');) {
                        if (!s.empty()) symbols.push_back(s);
                    }
                    auto profile = session::makeProfile(args[1], args[2], std::stod(args[3]), symbols,
                                                        core::utils::stringToTimestamp(args[4]),
                                                        core::utils::stringToTimestamp(args[5]),
                                                        core::utils::timeframeFromString(args[6]));
                    replay.open(profile);
                } else if (cmd == "load" && args.size() >= 2) {
                    auto profile = profiles.load(args[1]);
                    if (profile) replay.open(*profile);
                    else std::cout << "No such profile." << std::endl;
                } else if (cmd == "profiles") {
                    for (const auto& summary : profiles.list()) {
                        std::cout << summary.id << " " << summary.name << " "
                                  << core::utils::timestampToString(summary.updated_at) << "\n";
                    }
                } else if (cmd == "save") {
                    std::cout << (profiles.save(replay.snapshot()) ? "Saved." : "Save failed.") << std::endl;
                } else if (cmd == "symbol" && args.size() >= 2) {
                    replay.setSymbol(args[1]);
                } else if (cmd == "tf" && args.size() >= 2) {
                    replay.setTimeframe(core::utils::timeframeFromString(args[1]));
                } else if (cmd == "play") {
                    if (!replay.play()) std::cout << "Nothing to play." << std::endl;
                } else if (cmd == "pause") {
                    replay.pause();
                } else if (cmd == "step") {
                    const int count = args.size() >= 2 ? std::stoi(args[1]) : 1;
                    for (int i = 0; i < count && replay.step(); ++i) {}
                    printStatus(replay);
                } else if (cmd == "speed" && args.size() >= 2) {
                    replay.setSpeed(std::stoi(args[1]));
                } else if (cmd == "jump" && args.size() >= 2) {
                    replay.jumpToDate(core::utils::stringToTimestamp(args[1]));
                } else if (cmd == "first") {
                    replay.jumpToFirstData();
                } else if (cmd == "history") {
                    if (!replay.loadMoreHistory()) std::cout << "No history request possible." << std::endl;
                } else if ((cmd == "buy" || cmd == "sell") && args.size() >= 3) {
                    // buy|sell market <qty> [sl] [tp]  /  buy|sell limit|stop <qty> <entry> [sl] [tp]
                    trading::OrderRequest request;
                    request.side = cmd == "buy" ? core::OrderSide::Long : core::OrderSide::Short;
                    request.type = core::utils::orderTypeFromString(args[1] == "market" ? "MARKET"
                                                                  : args[1] == "limit" ? "LIMIT" : "STOP");
                    request.quantity = std::stod(args[2]);
                    std::size_t next = 3;
                    if (request.type != core::OrderType::Market) {
                        request.entry_price = parseNumber(args, next++);
                    }
                    request.stop_loss = parseNumber(args, next++);
                    request.take_profit = parseNumber(args, next++);
                    printResult(replay.placeOrder(request));
                } else if (cmd == "close" && args.size() >= 2) {
                    std::optional<double> exit_price;
                    if (args.size() >= 3) exit_price = std::stod(args[2]);
                    printResult(replay.closeOrder(args[1], exit_price));
                } else if (cmd == "modify" && args.size() >= 4) {
                    printResult(replay.modifyTrade(args[1], std::stod(args[2]), std::stod(args[3])));
                } else if (cmd == "entry" && args.size() >= 3) {
                    printResult(replay.modifyPendingEntry(args[1], std::stod(args[2])));
                } else if (cmd == "note" && args.size() >= 3) {
                    core::TradeJournal journal;
                    for (std::size_t i = 2; i < args.size(); ++i) {
                        if (!journal.notes.empty()) journal.notes += ' ';
                        journal.notes += args[i];
                    }
                    printResult(replay.annotateTrade(args[1], journal));
                } else if (cmd == "lots" && args.size() >= 3) {
                    std::cout << replay.suggestedLotSize(std::stod(args[1]), std::stod(args[2])) << " lots" << std::endl;
                } else if (cmd == "status") {
                    printStatus(replay);
                } else if (cmd == "trades") {
                    printTrades(replay);
                } else if (cmd == "stats") {
                    const auto stats = replay.statistics();
                    stats.logMetrics();
                    std::cout << "trades " << stats.total_trades << " win rate " << stats.win_rate << "% pnl "
                              << stats.total_pnl << " PF " << stats.profit_factor << " avg R "
                              << stats.avg_r_multiple << std::endl;
                } else if (cmd == "trend") {
                    for (const auto& entry : replay.trendReadings()) {
                        std::cout << core::utils::timeframeToString(entry.first) << " "
                                  << indicators::toString(entry.second) << "\n";
                    }
                    std::cout << std::flush;
                } else if (cmd == "indicators") {
                    for (const auto& view : replay.indicatorViews(true)) {
                        std::cout << view.id << " " << view.name;
                        if (!view.values.empty()) std::cout << " = " << view.values.back().value;
                        std::cout << "\n";
                    }
                    std::cout << std::flush;
                } else if (cmd == "ingest" && args.size() >= 4) {
                    const bool ok = ingestFile(db_manager, args[1], args[2], core::utils::timeframeFromString(args[3]));
                    std::cout << (ok ? "Ingested." : "Ingest failed.") << std::endl;
                } else {
                    std::cout << "Unknown command or missing arguments: " << line << std::endl;
                }
            } catch (const core::ReplayException& e) {
                std::cout << "Error: " << e.what() << std::endl;
            } catch (const std::invalid_argument& e) {
                std::cout << "Invalid argument: " << e.what() << std::endl;
            } catch (const std::out_of_range& e) {
                std::cout << "Value out of range: " << e.what() << std::endl;
            } catch (const std::runtime_error& e) {
                std::cout << "Error: " << e.what() << std::endl;
            }
            std::cout << "> " << std::flush;
        }

        if (auto final_profile = replay.close()) {
            profiles.save(*final_profile);
        }
        db_manager.disconnect();
        logger->info("Replay CLI finished.");

    // --- Exception Handling ---
    } catch (const core::ReplayException& ex) {
        std::cerr << "Replay Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Replay Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
