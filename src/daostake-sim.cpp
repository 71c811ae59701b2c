// DAOSTAKE - Simulator
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// Runs a staking scenario against an in-memory chain:
//   daostake-sim -conf=<file> -script=<file> [-datadir=<dir>]

#include "daostake/db/farmdb.h"
#include "daostake/farm/errors.h"
#include "daostake/farm/farm_config.h"
#include "daostake/sim/scenario.h"
#include "daostake/util/config.h"
#include "daostake/util/logging.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

namespace daostake {

namespace {

const char* const VERSION = "1.0.0";

void PrintHelp() {
    std::cout << "DAOSTAKE Simulator v" << VERSION << "\n\n";
    std::cout << "Usage: daostake-sim -conf=<file> -script=<file> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -conf=FILE                 Engine configuration (default: daostake.conf)\n";
    std::cout << "  -script=FILE               Scenario script (default: stdin)\n";
    std::cout << "  -datadir=DIR               Persist the final engine state here\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error\n";
    std::cout << "  -logfile=FILE              Also log to FILE\n";
    std::cout << "  -printtoconsole=0/1        Log to stderr (default: 1)\n";
    std::cout << "  -<section>.<key>=VALUE     Override a config value, e.g. -emission.start_block=10\n";
    std::cout << "  -help                      Show this help\n";
}

void SetupLogging(const farm::FarmConfig& config) {
    auto& logger = util::Logger::Instance();
    logger.Initialize();
    logger.ClearSinks();
    logger.SetLevel(config.logLevel);

    if (config.printToConsole) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = config.logLevel;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    if (!config.logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = config.logFile;
        fileConfig.level = util::LogLevel::Debug;
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            std::cerr << "Warning: cannot open log file " << config.logFile << "\n";
        }
    }
}

bool PersistState(const farm::FarmConfig& config, farm::FarmEngine& engine) {
    auto [status, store] = db::FarmStore::Open(config.dataDir);
    if (!status.ok()) {
        std::cerr << "Error: cannot open " << config.dataDir << ": " << status.ToString() << "\n";
        return false;
    }
    status = store->Save(engine.Schedule().Params(), engine.State());
    if (!status.ok()) {
        std::cerr << "Error: saving state failed: " << status.ToString() << "\n";
        return false;
    }
    LOG_INFO(util::LogCategory::DB) << "State saved to " << config.dataDir;
    return true;
}

} // anonymous namespace

int AppMain(int argc, char* argv[]) {
    util::ConfigManager args;
    util::ConfigParseResult parsed = args.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }
    if (args.GetBool("help", false) || args.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }

    // File first, then command line on top
    util::ConfigManager config;
    std::string confPath = args.GetString(util::ConfigKeys::CONF, util::DEFAULT_CONFIG_FILENAME);
    bool explicitConf = args.HasKey(util::ConfigKeys::CONF);
    if (explicitConf || std::filesystem::exists(confPath)) {
        parsed = config.ParseFile(confPath);
    }
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }
    parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }

    farm::FarmConfig farmConfig;
    parsed = farm::FarmConfig::FromConfig(config, farmConfig);
    if (!parsed.success) {
        std::cerr << "Error: " << confPath << ": " << parsed.ToString() << "\n";
        return 1;
    }

    SetupLogging(farmConfig);
    LOG_INFO(util::LogCategory::SIM) << "DAOSTAKE Simulator v" << VERSION << " starting, "
                                     << farmConfig.pools.size() << " pools";

    sim::Scenario scenario(farmConfig);

    size_t failures = 0;
    auto script = config.TryGetString(util::ConfigKeys::SCRIPT);
    if (script) {
        std::ifstream in(*script);
        if (!in.is_open()) {
            std::cerr << "Error: cannot open script " << *script << "\n";
            return 1;
        }
        failures = scenario.Run(in, std::cout);
    } else {
        failures = scenario.Run(std::cin, std::cout);
    }

    if (!farmConfig.dataDir.empty() && !PersistState(farmConfig, scenario.Engine())) {
        return 1;
    }

    LOG_INFO(util::LogCategory::SIM) << "Scenario finished, " << failures << " failed commands";
    util::Logger::Instance().Shutdown();
    return failures == 0 ? 0 : 2;
}

} // namespace daostake

int main(int argc, char* argv[]) {
    try {
        return daostake::AppMain(argc, argv);
    } catch (const daostake::farm::FarmError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
