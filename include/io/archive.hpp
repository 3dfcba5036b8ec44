// EN: Archive extraction - tar and gzip-compressed tar through zlib
// FR: Extraction d'archives - tar et tar compressé gzip via zlib

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace MLC::IO {

// EN: Encoding formats that denote an archive
// FR: Formats d'encodage désignant une archive
bool isArchiveFormat(const std::string& encoding_format);

// EN: Unpack the regular files of `archive` under `target` and return the extracted relative paths.
//     Plain and gzip-compressed tar are both accepted. Entries escaping `target` throw ExecutionError.
// FR: Extrait les fichiers réguliers de `archive` sous `target` et retourne les chemins relatifs extraits.
//     Les tar simples et compressés gzip sont acceptés. Les entrées sortant de `target` lèvent ExecutionError.
std::vector<std::filesystem::path> extractTar(const std::filesystem::path& archive,
                                              const std::filesystem::path& target);

} // namespace MLC::IO
