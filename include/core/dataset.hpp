// EN: Dataset facade - load, validate and stream the records of a metadata document
// FR: Façade Dataset - charge, valide et diffuse les enregistrements d'un document de métadonnées

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/issues.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "io/fetcher.hpp"
#include "operation_graph/table.hpp"
#include "structure_graph/structure_graph.hpp"

namespace MLC {

// EN: Knobs of the loading pipeline
// FR: Réglages du pipeline de chargement
struct LoaderOptions {
    std::filesystem::path cache_directory;      // EN: Downloads and extracted archives / FR: Téléchargements et archives extraites
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds read_timeout{60000};
    std::string user_agent{"mlcroissant-cpp/1.0"};
    
    // EN: Read the "loader" and "http" sections; missing keys keep their defaults.
    // FR: Lit les sections "loader" et "http" ; les clés manquantes gardent leurs valeurs par défaut.
    static LoaderOptions fromConfig(const ConfigManager& config);
    
    // EN: Rules to register on the ConfigManager for the keys above.
    // FR: Règles à enregistrer dans le ConfigManager pour les clés ci-dessus.
    static std::vector<ConfigManager::ValidationRule> validationRules();
    
    std::filesystem::path getCacheDirectory() const;
};

// EN: Lazy, finite, single-pass sequence of records. Operations run on the first access.
// FR: Séquence paresseuse, finie, à passage unique. Les opérations s'exécutent au premier accès.
class RecordStream {
public:
    using Producer = std::function<Operations::Table()>;
    
    explicit RecordStream(Producer producer);
    
    // EN: Next record as a {field: value} object, std::nullopt once exhausted.
    // FR: Enregistrement suivant sous forme d'objet {champ: valeur}, std::nullopt une fois épuisé.
    std::optional<nlohmann::json> next();
    
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = nlohmann::json;
        using difference_type = std::ptrdiff_t;
        using pointer = const nlohmann::json*;
        using reference = const nlohmann::json&;
        
        Iterator() = default;
        explicit Iterator(RecordStream* stream);
        
        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        Iterator& operator++();
        bool operator==(const Iterator& other) const { return stream_ == other.stream_; }
        bool operator!=(const Iterator& other) const { return !(*this == other); }
    
    private:
        void advance();
        
        RecordStream* stream_{nullptr};
        std::optional<nlohmann::json> current_;
    };
    
    Iterator begin() { return Iterator(this); }
    Iterator end() { return Iterator(); }

private:
    Producer producer_;
    std::optional<Operations::Table> table_;
    size_t position_{0};
};

class Dataset {
public:
    // EN: Load from a JSON file; relative content URLs resolve against its directory.
    // FR: Charge depuis un fichier JSON ; les URLs relatives se résolvent par rapport à son répertoire.
    explicit Dataset(const std::filesystem::path& file, LoaderOptions options = {},
                     std::shared_ptr<IO::Fetcher> fetcher = nullptr);
    
    Dataset(const nlohmann::json& document, const std::filesystem::path& base_path, LoaderOptions options = {},
            std::shared_ptr<IO::Fetcher> fetcher = nullptr);
    
    const Graph::StructureGraph& getGraph() const { return *graph_; }
    const Issues& getIssues() const { return issues_; }
    const std::string& getName() const { return graph_->getName(); }
    std::vector<std::string> getRecordSetNames() const { return graph_->getRecordSetNames(); }
    
    // EN: Records of one record set. Unknown names throw ExecutionError listing the available ones.
    // FR: Enregistrements d'un record set. Un nom inconnu lève ExecutionError listant les disponibles.
    RecordStream records(const std::string& record_set) const;

private:
    void initialize(const nlohmann::json& document, const std::filesystem::path& base_path);
    
    LoaderOptions options_;
    std::shared_ptr<IO::Fetcher> fetcher_;
    Issues issues_;
    std::shared_ptr<const Graph::StructureGraph> graph_;
};

} // namespace MLC
