// EN: Download operation
// FR: Opération de téléchargement

#include "operation_graph/operations.hpp"
#include "core/issues.hpp"

namespace MLC::Operations {

Download::Download(std::string node_uid, std::string url, std::string checksum,
                   std::shared_ptr<IO::Fetcher> fetcher)
    : Operation(OperationKind::DOWNLOAD, std::move(node_uid)), url_(std::move(url)),
      checksum_(std::move(checksum)), fetcher_(std::move(fetcher)) {}

OperationOutput Download::call(const std::vector<OperationOutput>& inputs) const {
    if (inputs.empty()) {
        if (!fetcher_) {
            throw ExecutionError(getName() + " has no fetcher to retrieve \"" + url_ + "\".");
        }
        return fetcher_->fetch(url_, checksum_);
    }
    
    // EN: The file lives inside an already extracted container
    // FR: Le fichier se trouve dans un conteneur déjà extrait
    const auto& directory = pathInput(inputs, 0, *this);
    std::filesystem::path path = directory / std::filesystem::path(url_).relative_path();
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ExecutionError("File \"" + url_ + "\" of node \"" + getNodeUid() + "\" does not exist in " +
                             directory.string() + ".");
    }
    return path;
}

} // namespace MLC::Operations
