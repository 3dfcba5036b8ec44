#include "core/dataset.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    auto& logger = MLC::Logger::getInstance();
    auto& config = MLC::ConfigManager::getInstance();
    
    logger.setLogLevel(MLC::LogLevel::INFO);
    logger.setCorrelationId(logger.generateCorrelationId());
    
    LOG_INFO("load_example", "Croissant dataset loading example");
    
    const std::string yaml_config = R"(
loader:
  cache_directory: ${HOME}/.cache/mlcroissant-cpp

http:
  connect_timeout_ms: 5000
  read_timeout_ms: 30000
  user_agent: mlcroissant-cpp-example/1.0
)";
    
    if (!config.loadFromString(yaml_config)) {
        LOG_ERROR("load_example", "Failed to load configuration");
        return 1;
    }
    
    std::string metadata = argc > 1 ? argv[1] : "examples/data/metadata.json";
    std::string record_set = argc > 2 ? argv[2] : "purchases";
    
    try {
        MLC::Dataset dataset(metadata, MLC::LoaderOptions::fromConfig(config));
        
        std::cout << "Dataset: " << dataset.getName() << std::endl;
        std::cout << "Record sets: ";
        auto names = dataset.getRecordSetNames();
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) std::cout << ", ";
            std::cout << names[i];
        }
        std::cout << std::endl;
        
        for (const auto& warning : dataset.getIssues().getWarnings()) {
            std::cout << "Warning: " << warning.toString() << std::endl;
        }
        
        size_t count = 0;
        for (const auto& record : dataset.records(record_set)) {
            std::cout << record.dump() << std::endl;
            ++count;
        }
        std::cout << "Read " << count << " record(s) from " << record_set << std::endl;
        
    } catch (const MLC::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const MLC::ExecutionError& e) {
        LOG_ERROR("load_example", e.what());
        return 1;
    }
    
    LOG_INFO("load_example", "Example completed successfully");
    return 0;
}
