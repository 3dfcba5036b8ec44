// EN: Fetchers - turn a content URL into a local file path (local filesystem, HTTP through libcurl)
// FR: Fetchers - transforment une URL de contenu en chemin de fichier local (système de fichiers, HTTP via libcurl)

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace MLC::IO {

// EN: Capability to retrieve the bytes behind a URL. Implementations throw ExecutionError on failure.
// FR: Capacité à récupérer les octets derrière une URL. Les implémentations lèvent ExecutionError en cas d'échec.
class Fetcher {
public:
    virtual ~Fetcher() = default;
    
    // EN: Return a local path holding the content of `url`. The checksum is informative.
    // FR: Retourne un chemin local contenant le contenu de `url`. La somme de contrôle est informative.
    virtual std::filesystem::path fetch(const std::string& url, const std::string& checksum) = 0;
};

// EN: Resolves "file://" URLs and plain paths, relative paths against a base directory.
// FR: Résout les URLs "file://" et les chemins simples, les chemins relatifs par rapport à un répertoire de base.
class LocalFetcher : public Fetcher {
public:
    explicit LocalFetcher(std::filesystem::path base_path);
    
    std::filesystem::path fetch(const std::string& url, const std::string& checksum) override;

private:
    std::filesystem::path base_path_;
};

struct HttpFetcherOptions {
    std::filesystem::path cache_directory;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds read_timeout{60000};
    std::string user_agent{"mlcroissant-cpp/1.0"};
};

// EN: Downloads http(s) URLs once into the cache directory and reuses the cached copy afterwards.
// FR: Télécharge les URLs http(s) une fois dans le répertoire de cache puis réutilise la copie en cache.
class HttpFetcher : public Fetcher {
public:
    explicit HttpFetcher(HttpFetcherOptions options);
    
    std::filesystem::path fetch(const std::string& url, const std::string& checksum) override;
    
    // EN: Cache file name of a URL: hash prefix plus the last path segment.
    // FR: Nom du fichier de cache d'une URL : préfixe de hash plus le dernier segment du chemin.
    static std::string cacheFileName(const std::string& url);

private:
    void download(const std::string& url, const std::filesystem::path& target) const;
    
    HttpFetcherOptions options_;
};

// EN: Dispatches on the URL scheme: http(s) to the remote fetcher, everything else to the local one.
// FR: Aiguille selon le schéma de l'URL : http(s) vers le fetcher distant, le reste vers le fetcher local.
class CompositeFetcher : public Fetcher {
public:
    CompositeFetcher(std::shared_ptr<Fetcher> local, std::shared_ptr<Fetcher> remote);
    
    std::filesystem::path fetch(const std::string& url, const std::string& checksum) override;
    
    static bool isRemote(const std::string& url);

private:
    std::shared_ptr<Fetcher> local_;
    std::shared_ptr<Fetcher> remote_;
};

} // namespace MLC::IO
