// EN: Issue log implementation
// FR: Implémentation du journal d'anomalies

#include "core/issues.hpp"

#include <sstream>

namespace MLC {

std::string Issue::toString() const {
    if (context.empty()) {
        return message;
    }
    return context + " " + message;
}

void Issues::addError(const std::string& message, const std::string& context) {
    add(IssueSeverity::ERROR, message, context);
}

void Issues::addWarning(const std::string& message, const std::string& context) {
    add(IssueSeverity::WARNING, message, context);
}

void Issues::add(IssueSeverity severity, const std::string& message, const std::string& context) {
    Issue issue{severity, context, message};
    std::string key = (severity == IssueSeverity::ERROR ? "E|" : "W|") + issue.toString();
    if (!seen_.insert(key).second) {
        return;
    }
    if (severity == IssueSeverity::ERROR) {
        errors_.push_back(std::move(issue));
    } else {
        warnings_.push_back(std::move(issue));
    }
}

std::string Issues::report() const {
    std::ostringstream oss;
    if (!errors_.empty()) {
        oss << "Found the following " << errors_.size() << " error(s) during the validation:";
        for (const auto& issue : errors_) {
            oss << "\n  -  " << issue.toString();
        }
    }
    if (!warnings_.empty()) {
        if (!errors_.empty()) {
            oss << "\n\n";
        }
        oss << "Found the following " << warnings_.size() << " warning(s) during the validation:";
        for (const auto& issue : warnings_) {
            oss << "\n  -  " << issue.toString();
        }
    }
    return oss.str();
}

void Issues::raiseIfErrors() const {
    if (hasErrors()) {
        throw ValidationError(report(), errors_);
    }
}

} // namespace MLC
