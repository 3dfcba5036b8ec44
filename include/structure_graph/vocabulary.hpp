// EN: Fixed vocabulary of the metadata document: property keys, type tags, data types and prefix expansion
// FR: Vocabulaire fixe du document de métadonnées : clés de propriétés, types, types de données et expansion de préfixes

#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace MLC::Graph {

namespace Vocabulary {

// EN: Namespaces of the compact IRIs
// FR: Espaces de noms des IRIs compactes
inline const std::string SCHEMA_ORG = "https://schema.org/";
inline const std::string ML_COMMONS = "http://mlcommons.org/schema/";

// EN: Document keys
// FR: Clés du document
inline const std::string CONTEXT = "@context";
inline const std::string TYPE = "@type";
inline const std::string NAME = "name";
inline const std::string DESCRIPTION = "description";
inline const std::string LICENSE = "license";
inline const std::string CITATION = "citation";
inline const std::string URL = "url";
inline const std::string VERSION = "version";
inline const std::string CREATOR = "creator";
inline const std::string CONTRIBUTOR = "contributor";
inline const std::string DISTRIBUTION = "distribution";
inline const std::string RECORD_SET = "recordSet";
inline const std::string CONTENT_URL = "contentUrl";
inline const std::string ENCODING_FORMAT = "encodingFormat";
inline const std::string SHA256 = "sha256";
inline const std::string MD5 = "md5";
inline const std::string CONTAINED_IN = "containedIn";
inline const std::string INCLUDES = "includes";
inline const std::string DATA = "data";
inline const std::string KEY = "key";
inline const std::string FIELD = "field";
inline const std::string SUB_FIELD = "subField";
inline const std::string DATA_TYPE = "dataType";
inline const std::string SOURCE = "source";
inline const std::string REFERENCES = "references";
inline const std::string APPLY_TRANSFORM = "applyTransform";
inline const std::string REGEX = "regex";

// EN: Node type tags (expanded form)
// FR: Types de nœuds (forme étendue)
inline const std::string TYPE_DATASET = SCHEMA_ORG + "Dataset";
inline const std::string TYPE_FILE_OBJECT = SCHEMA_ORG + "FileObject";
inline const std::string TYPE_FILE_SET = ML_COMMONS + "FileSet";
inline const std::string TYPE_RECORD_SET = ML_COMMONS + "RecordSet";
inline const std::string TYPE_FIELD = ML_COMMONS + "Field";

// EN: Implicit columns describing a file of a FileSet
// FR: Colonnes implicites décrivant un fichier d'un FileSet
inline const std::string FILE_PROPERTY_FILEPATH = "filepath";
inline const std::string FILE_PROPERTY_FILENAME = "filename";
inline const std::string FILE_PROPERTY_FULLPATH = "fullpath";
inline const std::string FILE_PROPERTY_CONTENT = "content";

// EN: Expanded IRI of a document key, used in issue messages.
// FR: IRI étendue d'une clé du document, utilisée dans les messages d'anomalie.
std::string propertyIri(const std::string& key);

} // namespace Vocabulary

// EN: Data types a field can declare
// FR: Types de données qu'un champ peut déclarer
enum class DataType {
    TEXT,
    URL,
    INTEGER,
    FLOAT,
    BOOLEAN,
    DATE,
    IMAGE_OBJECT
};

std::optional<DataType> dataTypeFromIri(const std::string& iri);
std::string dataTypeToString(DataType type);
std::vector<std::string> allowedDataTypeIris();

// EN: Compact IRI expansion with the default prefixes (sc, ml) and the ones declared in "@context".
// FR: Expansion des IRIs compactes avec les préfixes par défaut (sc, ml) et ceux déclarés dans "@context".
class PrefixMap {
public:
    PrefixMap();
    
    // EN: Register string-valued entries of a "@context" object; anything else is ignored.
    // FR: Enregistre les entrées chaînes d'un objet "@context" ; le reste est ignoré.
    void load(const nlohmann::json& context);
    
    std::string expand(const std::string& compact) const;

private:
    std::unordered_map<std::string, std::string> prefixes_;
};

} // namespace MLC::Graph
