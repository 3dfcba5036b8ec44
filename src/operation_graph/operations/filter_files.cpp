// EN: FilterFiles operation and glob matching
// FR: Opération FilterFiles et correspondance de glob

#include "operation_graph/operations.hpp"
#include "core/issues.hpp"

#include <algorithm>

namespace MLC::Operations {

namespace {

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        if (end > start) {
            parts.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return parts;
}

// EN: '*' and '?' within a single component
// FR: '*' et '?' dans un seul composant
bool matchComponent(const std::string& pattern, size_t p, const std::string& text, size_t t) {
    while (p < pattern.size()) {
        if (pattern[p] == '*') {
            for (size_t skip = t; skip <= text.size(); ++skip) {
                if (matchComponent(pattern, p + 1, text, skip)) {
                    return true;
                }
            }
            return false;
        }
        if (t >= text.size() || (pattern[p] != '?' && pattern[p] != text[t])) {
            return false;
        }
        ++p;
        ++t;
    }
    return t == text.size();
}

bool matchParts(const std::vector<std::string>& pattern, size_t p, const std::vector<std::string>& path, size_t t) {
    if (p == pattern.size()) {
        return t == path.size();
    }
    if (pattern[p] == "**") {
        for (size_t skip = t; skip <= path.size(); ++skip) {
            if (matchParts(pattern, p + 1, path, skip)) {
                return true;
            }
        }
        return false;
    }
    return t < path.size() && matchComponent(pattern[p], 0, path[t], 0) && matchParts(pattern, p + 1, path, t + 1);
}

} // namespace

bool globMatch(const std::string& pattern, const std::string& path) {
    return matchParts(splitPath(pattern), 0, splitPath(path), 0);
}

FilterFiles::FilterFiles(std::string node_uid, std::string includes, std::filesystem::path default_root)
    : Operation(OperationKind::FILTER_FILES, std::move(node_uid)), includes_(std::move(includes)),
      default_root_(std::move(default_root)) {}

OperationOutput FilterFiles::call(const std::vector<OperationOutput>& inputs) const {
    std::vector<std::filesystem::path> roots;
    for (size_t i = 0; i < inputs.size(); ++i) {
        roots.push_back(pathInput(inputs, i, *this));
    }
    if (roots.empty()) {
        roots.push_back(default_root_);
    }
    
    std::vector<FilePath> files;
    for (const auto& root : roots) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            throw ExecutionError(getName() + " cannot search " + root.string() + ": not a directory.");
        }
        for (auto it = std::filesystem::recursive_directory_iterator(root, ec);
             it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                throw ExecutionError(getName() + " failed to walk " + root.string() + ": " + ec.message());
            }
            if (!it->is_regular_file()) {
                continue;
            }
            std::string relative = std::filesystem::relative(it->path(), root).generic_string();
            if (globMatch(includes_, relative)) {
                files.push_back({std::filesystem::absolute(it->path()), it->path().filename().string(), relative});
            }
        }
    }
    
    std::sort(files.begin(), files.end(), [](const FilePath& a, const FilePath& b) {
        return a.fullpath != b.fullpath ? a.fullpath < b.fullpath : a.filepath < b.filepath;
    });
    return files;
}

} // namespace MLC::Operations
