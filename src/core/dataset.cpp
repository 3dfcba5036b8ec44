// EN: Dataset facade implementation
// FR: Implémentation de la façade Dataset

#include "core/dataset.hpp"
#include "infrastructure/logging/logger.hpp"
#include "operation_graph/compiler.hpp"
#include "operation_graph/executor.hpp"
#include "structure_graph/graph_builder.hpp"

#include <fstream>

namespace MLC {

namespace {
const std::string MODULE = "dataset";
}

// ----------------------------------------------------------------------------
// LoaderOptions
// ----------------------------------------------------------------------------

LoaderOptions LoaderOptions::fromConfig(const ConfigManager& config) {
    LoaderOptions options;
    options.cache_directory = config.get("loader", "cache_directory").asOrDefault<std::string>("");
    options.connect_timeout = std::chrono::milliseconds(
        config.get("http", "connect_timeout_ms").asOrDefault<int>(static_cast<int>(options.connect_timeout.count())));
    options.read_timeout = std::chrono::milliseconds(
        config.get("http", "read_timeout_ms").asOrDefault<int>(static_cast<int>(options.read_timeout.count())));
    options.user_agent = config.get("http", "user_agent").asOrDefault<std::string>(options.user_agent);
    return options;
}

std::vector<ConfigManager::ValidationRule> LoaderOptions::validationRules() {
    std::vector<ConfigManager::ValidationRule> rules;
    
    ConfigManager::ValidationRule cache_directory;
    cache_directory.key = "loader.cache_directory";
    cache_directory.type = "string";
    cache_directory.description = "Directory for downloads and extracted archives";
    rules.push_back(cache_directory);
    
    ConfigManager::ValidationRule connect_timeout;
    connect_timeout.key = "http.connect_timeout_ms";
    connect_timeout.type = "int";
    connect_timeout.min_value = 0;
    connect_timeout.description = "HTTP connection timeout in milliseconds";
    rules.push_back(connect_timeout);
    
    ConfigManager::ValidationRule read_timeout;
    read_timeout.key = "http.read_timeout_ms";
    read_timeout.type = "int";
    read_timeout.min_value = 0;
    read_timeout.description = "HTTP transfer timeout in milliseconds";
    rules.push_back(read_timeout);
    
    ConfigManager::ValidationRule user_agent;
    user_agent.key = "http.user_agent";
    user_agent.type = "string";
    rules.push_back(user_agent);
    
    ConfigManager::ValidationRule log_level;
    log_level.key = "logging.level";
    log_level.type = "string";
    log_level.allowed_values = {"debug", "info", "warn", "error"};
    rules.push_back(log_level);
    
    return rules;
}

std::filesystem::path LoaderOptions::getCacheDirectory() const {
    if (!cache_directory.empty()) {
        return cache_directory;
    }
    return std::filesystem::temp_directory_path() / "mlcroissant-cpp";
}

// ----------------------------------------------------------------------------
// RecordStream
// ----------------------------------------------------------------------------

RecordStream::RecordStream(Producer producer) : producer_(std::move(producer)) {}

std::optional<nlohmann::json> RecordStream::next() {
    if (!table_) {
        table_ = producer_();
    }
    if (position_ >= table_->getRowCount()) {
        return std::nullopt;
    }
    return table_->rowToJson(position_++);
}

RecordStream::Iterator::Iterator(RecordStream* stream) : stream_(stream) {
    advance();
}

RecordStream::Iterator& RecordStream::Iterator::operator++() {
    advance();
    return *this;
}

void RecordStream::Iterator::advance() {
    if (!stream_) {
        return;
    }
    current_ = stream_->next();
    if (!current_) {
        stream_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Dataset
// ----------------------------------------------------------------------------

Dataset::Dataset(const std::filesystem::path& file, LoaderOptions options, std::shared_ptr<IO::Fetcher> fetcher)
    : options_(std::move(options)), fetcher_(std::move(fetcher)) {
    std::ifstream stream(file);
    if (!stream.is_open()) {
        issues_.addError("Cannot read metadata file: " + file.string());
        issues_.raiseIfErrors();
    }
    nlohmann::json document = nlohmann::json::parse(stream, nullptr, false);
    if (document.is_discarded()) {
        issues_.addError("Metadata file " + file.string() + " is not valid JSON");
        issues_.raiseIfErrors();
    }
    initialize(document, std::filesystem::absolute(file).parent_path());
}

Dataset::Dataset(const nlohmann::json& document, const std::filesystem::path& base_path, LoaderOptions options,
                 std::shared_ptr<IO::Fetcher> fetcher)
    : options_(std::move(options)), fetcher_(std::move(fetcher)) {
    initialize(document, base_path);
}

void Dataset::initialize(const nlohmann::json& document, const std::filesystem::path& base_path) {
    if (!fetcher_) {
        IO::HttpFetcherOptions http;
        http.cache_directory = options_.getCacheDirectory() / "downloads";
        http.connect_timeout = options_.connect_timeout;
        http.read_timeout = options_.read_timeout;
        http.user_agent = options_.user_agent;
        fetcher_ = std::make_shared<IO::CompositeFetcher>(std::make_shared<IO::LocalFetcher>(base_path),
                                                          std::make_shared<IO::HttpFetcher>(http));
    }
    
    Graph::GraphBuilder builder(issues_);
    graph_ = builder.build(document, base_path);
}

RecordStream Dataset::records(const std::string& record_set) const {
    Operations::Compiler compiler(graph_, fetcher_, options_.getCacheDirectory());
    std::shared_ptr<Operations::OperationGraph> plan = compiler.compile({record_set});
    Operations::OperationId output = *plan->getRecordSetOutput(record_set);
    
    LOG_INFO(MODULE, "Streaming records of \"" + record_set + "\" from dataset \"" + getName() + "\"");
    return RecordStream([plan, output]() {
        Operations::Executor executor(*plan);
        executor.run();
        return std::get<Operations::Table>(executor.getOutput(output));
    });
}

} // namespace MLC
