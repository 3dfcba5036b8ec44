// EN: mlcctl - validate a metadata document or stream the records of one of its record sets
// FR: mlcctl - valide un document de métadonnées ou diffuse les enregistrements d'un de ses record sets

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "core/dataset.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

namespace {

struct CommandLine {
    std::string command;
    std::string file;
    std::string record_set;
    std::string config;
    long num_records = 10;
    bool debug = false;
};

void printUsage() {
    std::cout << "Usage: mlcctl COMMAND [OPTIONS]" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  validate   Validate a metadata document" << std::endl;
    std::cout << "  load       Print the records of a record set as JSON lines" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --file FILE           Metadata document (JSON)" << std::endl;
    std::cout << "  --record_set NAME     Record set to load" << std::endl;
    std::cout << "  --num_records N       Records to print, -1 for all (default 10)" << std::endl;
    std::cout << "  --config FILE         YAML configuration" << std::endl;
    std::cout << "  --debug               Verbose logging" << std::endl;
}

bool parseArguments(int argc, char* argv[], CommandLine& cli) {
    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&](std::string& target) {
            if (i + 1 >= args.size()) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            target = args[++i];
            return true;
        };
        
        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--file") {
            if (!value(cli.file)) return false;
        } else if (arg == "--record_set") {
            if (!value(cli.record_set)) return false;
        } else if (arg == "--config") {
            if (!value(cli.config)) return false;
        } else if (arg == "--num_records") {
            std::string number;
            if (!value(number)) return false;
            char* end = nullptr;
            cli.num_records = std::strtol(number.c_str(), &end, 10);
            if (!end || *end != '\0') {
                std::cerr << "Invalid --num_records: " << number << std::endl;
                return false;
            }
        } else if (arg == "--debug") {
            cli.debug = true;
        } else if (cli.command.empty() && arg.rfind("--", 0) != 0) {
            cli.command = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
    }
    return !cli.command.empty() && !cli.file.empty();
}

// EN: Configuration file, then MLC_* environment overrides, then validation
// FR: Fichier de configuration, puis surcharges d'environnement MLC_*, puis validation
bool configure(const CommandLine& cli) {
    auto& config = MLC::ConfigManager::getInstance();
    config.addValidationRules(MLC::LoaderOptions::validationRules());
    if (!cli.config.empty() && !config.loadFromFile(cli.config)) {
        std::cerr << "Cannot load configuration " << cli.config << std::endl;
        return false;
    }
    config.loadEnvironmentOverrides("MLC_");
    
    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        for (const auto& error : errors) {
            std::cerr << error << std::endl;
        }
        return false;
    }
    
    auto& logger = MLC::Logger::getInstance();
    std::string level = config.get("logging", "level").asOrDefault<std::string>("warn");
    logger.setLogLevel(cli.debug ? MLC::LogLevel::DEBUG : MLC::Logger::levelFromString(level));
    std::string log_file = config.get("logging", "file").asOrDefault<std::string>("");
    if (!log_file.empty() && !logger.setOutputFile(log_file)) {
        std::cerr << "Cannot open log file " << log_file << std::endl;
        return false;
    }
    logger.setCorrelationId(logger.generateCorrelationId());
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cli;
    if (!parseArguments(argc, argv, cli)) {
        printUsage();
        return 2;
    }
    if (!configure(cli)) {
        return 2;
    }
    
    auto options = MLC::LoaderOptions::fromConfig(MLC::ConfigManager::getInstance());
    
    try {
        MLC::Dataset dataset(cli.file, options);
        
        if (cli.command == "validate") {
            if (dataset.getIssues().hasWarnings()) {
                std::cout << dataset.getIssues().report() << std::endl;
            }
            std::cout << "Done. No validation error found." << std::endl;
            return 0;
        }
        
        if (cli.command == "load") {
            if (cli.record_set.empty()) {
                std::cerr << "The load command needs --record_set" << std::endl;
                return 2;
            }
            long printed = 0;
            for (const auto& record : dataset.records(cli.record_set)) {
                if (cli.num_records >= 0 && printed >= cli.num_records) {
                    break;
                }
                std::cout << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
                ++printed;
            }
            std::cerr << "Done. Printed " << printed << " record(s)." << std::endl;
            return 0;
        }
        
        std::cerr << "Unknown command: " << cli.command << std::endl;
        printUsage();
        return 2;
    } catch (const MLC::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const MLC::ExecutionError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
