// EN: Source / reference pointers between nodes, with value transforms
// FR: Pointeurs source / référence entre nœuds, avec transformations de valeurs

#pragma once

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace MLC::Graph {

// EN: Regex extraction transform. The pattern is compiled once at parse time.
// FR: Transformation d'extraction par regex. Le pattern est compilé une fois au parsing.
struct Transform {
    std::string regex;
    std::shared_ptr<const std::regex> compiled;
};

// EN: Pointer to a node (and optionally a column in it) plus ordered transforms.
// FR: Pointeur vers un nœud (et optionnellement une colonne) plus des transformations ordonnées.
struct Source {
    std::string raw;                        // EN: Reference as written, e.g. "#{users.csv/email}" / FR: Référence telle qu'écrite
    std::string node;                       // EN: Target node uid / FR: Uid du nœud cible
    std::optional<std::string> column;      // EN: Column or field inside the target / FR: Colonne ou champ dans la cible
    std::vector<Transform> transforms;
    
    bool empty() const { return node.empty(); }
    std::string toString() const;
};

// EN: Parse a source/reference value: either "#{node/column}" or {"data": "#{...}", "applyTransform": ...}.
//     Returns std::nullopt and fills `error` on malformed input.
// FR: Parse une valeur source/référence : "#{node/column}" ou {"data": "#{...}", "applyTransform": ...}.
//     Retourne std::nullopt et remplit `error` si l'entrée est malformée.
std::optional<Source> parseSource(const nlohmann::json& value, std::string& error);

// EN: Take the first non-empty capture group of a match anchored at the start of the value,
//     else return the value unchanged.
// FR: Prend le premier groupe capturant non vide d'une correspondance ancrée au début de la valeur,
//     sinon retourne la valeur inchangée.
std::string applyTransform(const std::string& value, const Transform& transform);

// EN: Apply every transform in declaration order.
// FR: Applique chaque transformation dans l'ordre de déclaration.
std::string applyTransforms(const std::string& value, const std::vector<Transform>& transforms);

// EN: Build a transform, throwing std::regex_error on an invalid pattern.
// FR: Construit une transformation, lève std::regex_error sur un pattern invalide.
Transform makeRegexTransform(const std::string& pattern);

} // namespace MLC::Graph
