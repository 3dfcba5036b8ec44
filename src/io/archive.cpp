// EN: Tar reader on top of zlib's gzread (which also reads uncompressed input as is)
// FR: Lecteur tar au-dessus de gzread de zlib (qui lit aussi les entrées non compressées telles quelles)

#include "io/archive.hpp"
#include "core/issues.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <sstream>

#include <zlib.h>

namespace MLC::IO {

namespace {

const std::string MODULE = "archive";
constexpr size_t BLOCK_SIZE = 512;

using Block = std::array<char, BLOCK_SIZE>;

// EN: RAII owner of a gzFile
// FR: Propriétaire RAII d'un gzFile
class GzReader {
public:
    explicit GzReader(const std::filesystem::path& path) : file_(gzopen(path.c_str(), "rb")) {
        if (!file_) {
            throw ExecutionError("Cannot open archive: " + path.string());
        }
    }
    ~GzReader() { gzclose(file_); }
    GzReader(const GzReader&) = delete;
    GzReader& operator=(const GzReader&) = delete;
    
    // EN: Read exactly `size` bytes; false on clean end of stream, throws on truncation.
    // FR: Lit exactement `size` octets ; false en fin de flux propre, lève en cas de troncature.
    bool read(char* buffer, size_t size) {
        size_t total = 0;
        while (total < size) {
            int n = gzread(file_, buffer + total, static_cast<unsigned>(size - total));
            if (n < 0) {
                int errnum = 0;
                throw ExecutionError(std::string("Corrupted archive: ") + gzerror(file_, &errnum));
            }
            if (n == 0) {
                if (total == 0) return false;
                throw ExecutionError("Truncated archive");
            }
            total += static_cast<size_t>(n);
        }
        return true;
    }

private:
    gzFile file_;
};

std::string field(const Block& block, size_t offset, size_t length) {
    const char* start = block.data() + offset;
    return std::string(start, strnlen(start, length));
}

uint64_t parseOctal(const Block& block, size_t offset, size_t length) {
    uint64_t value = 0;
    for (size_t i = offset; i < offset + length; ++i) {
        char c = block[i];
        if (c == '\0' || c == ' ') {
            if (value > 0) break;
            continue;
        }
        if (c < '0' || c > '7') {
            throw ExecutionError("Corrupted tar header: invalid size field");
        }
        value = value * 8 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

// EN: GNU long names are path names, never file contents
// FR: Les noms longs GNU sont des chemins, jamais des contenus de fichiers
constexpr uint64_t MAX_LONG_NAME = 64 * 1024;

// EN: Consume the blocks of an entry, writing its first `size` bytes to `out` when given
// FR: Consomme les blocs d'une entrée, en écrivant ses `size` premiers octets dans `out` si fourni
void copyEntry(GzReader& reader, uint64_t size, std::ostream* out, const std::filesystem::path& archive) {
    Block block{};
    uint64_t remaining = size;
    while (remaining > 0) {
        if (!reader.read(block.data(), BLOCK_SIZE)) {
            throw ExecutionError("Truncated archive: " + archive.string());
        }
        uint64_t chunk = std::min<uint64_t>(remaining, BLOCK_SIZE);
        if (out) {
            out->write(block.data(), static_cast<std::streamsize>(chunk));
        }
        remaining -= chunk;
    }
}

bool isZeroBlock(const Block& block) {
    return std::all_of(block.begin(), block.end(), [](char c) { return c == '\0'; });
}

// EN: Relative, normalized and without ".." components
// FR: Relatif, normalisé et sans composant ".."
bool isSafeEntry(const std::filesystem::path& entry) {
    if (entry.empty() || entry.is_absolute() || entry.has_root_name()) {
        return false;
    }
    for (const auto& part : entry.lexically_normal()) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

} // namespace

bool isArchiveFormat(const std::string& encoding_format) {
    return encoding_format == "application/x-tar" || encoding_format == "application/x-gzip" ||
           encoding_format == "application/gzip" || encoding_format == "application/x-gtar";
}

std::vector<std::filesystem::path> extractTar(const std::filesystem::path& archive,
                                              const std::filesystem::path& target) {
    GzReader reader(archive);
    std::vector<std::filesystem::path> extracted;
    std::string long_name;
    Block header{};
    
    std::filesystem::create_directories(target);
    
    while (reader.read(header.data(), BLOCK_SIZE)) {
        if (isZeroBlock(header)) {
            break;
        }
        
        std::string name = field(header, 0, 100);
        std::string prefix = field(header, 345, 155);
        if (!prefix.empty()) {
            name = prefix + "/" + name;
        }
        if (!long_name.empty()) {
            name = long_name;
            long_name.clear();
        }
        uint64_t size = parseOctal(header, 124, 12);
        char type = header[156];
        
        // EN: GNU long names precede the entry they name
        // FR: Les noms longs GNU précèdent l'entrée qu'ils nomment
        if (type == 'L') {
            if (size > MAX_LONG_NAME) {
                throw ExecutionError("Corrupted tar header: long name of " + std::to_string(size) +
                                     " bytes in " + archive.string());
            }
            std::ostringstream buffer;
            copyEntry(reader, size, &buffer, archive);
            long_name = std::string(buffer.str().c_str());
            continue;
        }
        if (type != '0' && type != '\0') {
            copyEntry(reader, size, nullptr, archive);
            continue;
        }
        
        std::filesystem::path entry(name);
        if (!isSafeEntry(entry)) {
            throw ExecutionError("Archive entry \"" + name + "\" of " + archive.string() +
                                 " escapes the extraction directory");
        }
        entry = entry.lexically_normal();
        std::filesystem::path destination = target / entry;
        std::filesystem::create_directories(destination.parent_path());
        std::ofstream out(destination, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ExecutionError("Cannot write " + destination.string());
        }
        copyEntry(reader, size, &out, archive);
        if (!out) {
            throw ExecutionError("Cannot write " + destination.string());
        }
        extracted.push_back(entry);
    }
    
    LOG_DEBUG(MODULE, "Extracted " + std::to_string(extracted.size()) + " file(s) from " + archive.string());
    return extracted;
}

} // namespace MLC::IO
