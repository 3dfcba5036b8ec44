// EN: Issue log for validation runs - collects contextualized errors and warnings, raises only on demand
// FR: Journal d'anomalies pour les validations - collecte erreurs et avertissements contextualisés, ne lève qu'à la demande

#pragma once

#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace MLC {

// EN: Severity of a validation issue
// FR: Sévérité d'une anomalie de validation
enum class IssueSeverity {
    WARNING,    // EN: Reported, never fails validation / FR: Rapporté, n'échoue jamais la validation
    ERROR       // EN: Fails validation at the end of the pass / FR: Échoue la validation à la fin de la passe
};

// EN: A single validation problem with its breadcrumb
// FR: Un problème de validation unique avec son fil d'Ariane
struct Issue {
    IssueSeverity severity{IssueSeverity::ERROR};
    std::string context;    // EN: "[dataset(x) > record_set(y)]" or empty / FR: "[dataset(x) > record_set(y)]" ou vide
    std::string message;
    
    std::string toString() const;
};

// EN: Append-only accumulator of issues for one validation pass.
// FR: Accumulateur append-only d'anomalies pour une passe de validation.
class Issues {
public:
    Issues() = default;
    
    void addError(const std::string& message, const std::string& context = "");
    void addWarning(const std::string& message, const std::string& context = "");
    
    const std::vector<Issue>& getErrors() const { return errors_; }
    const std::vector<Issue>& getWarnings() const { return warnings_; }
    bool hasErrors() const { return !errors_.empty(); }
    bool hasWarnings() const { return !warnings_.empty(); }
    
    // EN: Human-readable report listing every error, then every warning, one per line.
    // FR: Rapport lisible listant chaque erreur puis chaque avertissement, un par ligne.
    std::string report() const;
    
    // EN: Throw a ValidationError carrying the report if any error was recorded.
    // FR: Lève une ValidationError portant le rapport si une erreur a été enregistrée.
    void raiseIfErrors() const;

private:
    void add(IssueSeverity severity, const std::string& message, const std::string& context);
    
    std::vector<Issue> errors_;
    std::vector<Issue> warnings_;
    std::unordered_set<std::string> seen_;  // EN: Duplicate suppression / FR: Suppression des doublons
};

// EN: Aggregate failure of a validation pass
// FR: Échec agrégé d'une passe de validation
class ValidationError : public std::runtime_error {
public:
    ValidationError(const std::string& report, std::vector<Issue> errors)
        : std::runtime_error(report), errors_(std::move(errors)) {}
    
    const std::vector<Issue>& getErrors() const { return errors_; }

private:
    std::vector<Issue> errors_;
};

// EN: Fatal error raised while executing the operation graph
// FR: Erreur fatale levée pendant l'exécution du graphe d'opérations
class ExecutionError : public std::runtime_error {
public:
    explicit ExecutionError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace MLC
