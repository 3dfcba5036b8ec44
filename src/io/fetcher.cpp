// EN: Fetcher implementations. HTTP downloads go through libcurl into the cache directory.
// FR: Implémentations des fetchers. Les téléchargements HTTP passent par libcurl vers le répertoire de cache.

#include "io/fetcher.hpp"
#include "core/issues.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstdio>
#include <functional>
#include <iomanip>
#include <mutex>
#include <sstream>

#include <curl/curl.h>

namespace MLC::IO {

namespace {

const std::string MODULE = "fetcher";

// EN: Callback streaming the response body to a file.
// FR: Callback écrivant le corps de la réponse dans un fichier.
size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* file = static_cast<std::FILE*>(userp);
    return std::fwrite(contents, size, nmemb, file) * size;
}

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

} // namespace

LocalFetcher::LocalFetcher(std::filesystem::path base_path) : base_path_(std::move(base_path)) {}

std::filesystem::path LocalFetcher::fetch(const std::string& url, const std::string& /*checksum*/) {
    const std::string file_scheme = "file://";
    std::filesystem::path path = url.rfind(file_scheme, 0) == 0 ? url.substr(file_scheme.size()) : url;
    if (path.is_relative()) {
        path = base_path_ / path;
    }
    
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw ExecutionError("Cannot fetch \"" + url + "\": file " + path.string() + " does not exist.");
    }
    LOG_DEBUG(MODULE, "Resolved " + url + " to " + path.string());
    return path;
}

HttpFetcher::HttpFetcher(HttpFetcherOptions options) : options_(std::move(options)) {
    ensureCurlInitialized();
}

std::string HttpFetcher::cacheFileName(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    std::string last_segment = path.substr(path.find_last_of('/') + 1);
    if (last_segment.empty()) {
        last_segment = "index";
    }
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << std::hash<std::string>{}(url) << "_" << last_segment;
    return oss.str();
}

std::filesystem::path HttpFetcher::fetch(const std::string& url, const std::string& checksum) {
    std::error_code ec;
    std::filesystem::create_directories(options_.cache_directory, ec);
    if (ec) {
        throw ExecutionError("Cannot create cache directory " + options_.cache_directory.string() + ": " +
                             ec.message());
    }
    
    std::filesystem::path target = options_.cache_directory / cacheFileName(url);
    if (std::filesystem::exists(target, ec)) {
        LOG_DEBUG(MODULE, "Cache hit for " + url);
        return target;
    }
    
    std::filesystem::path partial = target;
    partial += ".part";
    download(url, partial);
    std::filesystem::rename(partial, target, ec);
    if (ec) {
        throw ExecutionError("Cannot move download of \"" + url + "\" into the cache: " + ec.message());
    }
    
    std::unordered_map<std::string, std::string> metadata = {{"url", url}, {"path", target.string()}};
    if (!checksum.empty()) {
        metadata["checksum"] = checksum;
    }
    LOG_INFO_META(MODULE, "Downloaded file", metadata);
    return target;
}

void HttpFetcher::download(const std::string& url, const std::filesystem::path& target) const {
    CURL* curl = curl_easy_init();
    if (!curl) throw ExecutionError("CURL init failed");
    
    std::FILE* file = std::fopen(target.c_str(), "wb");
    if (!file) {
        curl_easy_cleanup(curl);
        throw ExecutionError("Cannot open " + target.string() + " for writing");
    }
    
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.read_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, file);
    
    char errorBuffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);
    
    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    std::fclose(file);
    curl_easy_cleanup(curl);
    
    if (res != CURLE_OK) {
        std::error_code ec;
        std::filesystem::remove(target, ec);
        std::string errMsg = errorBuffer[0] ? errorBuffer : curl_easy_strerror(res);
        throw ExecutionError("Cannot download \"" + url + "\" (HTTP " + std::to_string(status) + "): " + errMsg);
    }
}

CompositeFetcher::CompositeFetcher(std::shared_ptr<Fetcher> local, std::shared_ptr<Fetcher> remote)
    : local_(std::move(local)), remote_(std::move(remote)) {}

bool CompositeFetcher::isRemote(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

std::filesystem::path CompositeFetcher::fetch(const std::string& url, const std::string& checksum) {
    if (isRemote(url)) {
        return remote_->fetch(url, checksum);
    }
    return local_->fetch(url, checksum);
}

} // namespace MLC::IO
