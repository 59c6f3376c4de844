#include "main/cli.hpp"
#include "common/logger.hpp"
#include "config/app_config.hpp"
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    std::string configPath = AppConfig::DEFAULT_PATH;
    int index = 1;

    while (index < argc) {
        std::string arg = argv[index];
        if (arg == "--help" || arg == "-h") {
            AcctVaultCLI::printUsage(std::cout);
            return 0;
        }
        if (arg == "--version" || arg == "-v") {
            std::cout << "acctvault version 1.0.0\n";
            return 0;
        }
        if (arg == "--config" && index + 1 < argc) {
            configPath = argv[index + 1];
            index += 2;
            continue;
        }
        break;
    }

    if (index >= argc) {
        std::cerr << "Error: No command specified" << std::endl;
        AcctVaultCLI::printUsage(std::cerr);
        return 1;
    }
    std::string command = argv[index];

    AppConfig config;
    std::string error;
    if (!loadAppConfig(configPath, config, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    LogLevel level = config.debugMode ? LogLevel::DEBUG : Logger::levelFromString(config.logLevel);
    if (!Logger::initialize(config.applicationLogPath(), level)) {
        std::cerr << "Failed to initialize logger at " << config.applicationLogPath() << std::endl;
        return 1;
    }
    // Results are printed by the CLI; the log file keeps the detail
    Logger::setConsoleOutput(config.debugMode);

    CommandArgs args;
    if (!AcctVaultCLI::parseArguments(argc, argv, index + 1, args, error)) {
        std::cerr << "Error: " << error << std::endl;
        AcctVaultCLI::printUsage(std::cerr);
        return 1;
    }

    try {
        auto jobManager = std::make_shared<JobManager>(config);
        if (!jobManager->initialize()) {
            std::cerr << "Error: " << jobManager->getLastError() << std::endl;
            return 1;
        }

        AcctVaultCLI cli(jobManager, std::cout, std::cerr);
        return cli.run(command, args);
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        Logger::error("Error in main: " + std::string(e.what()));
        return 1;
    }
}
