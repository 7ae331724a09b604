#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include "../error_handler/error.hpp"

namespace chunkup::infra {

// Lowercase hex of the canonical XXH3-128 digest; 32 characters.
using Fingerprint = std::string;

class ContentHasher {
public:
    // Hashes the whole file. Depends only on the bytes, never on name or mtime.
    static auto hash_file(const std::filesystem::path& path)
        -> Result<Fingerprint>;

    // Reads `in` to EOF. A stream that goes bad mid-way is a ReadError,
    // never a partial fingerprint.
    static auto hash_stream(std::istream& in)
        -> Result<Fingerprint>;

private:
    static constexpr size_t BUFFER_SIZE = 4 * 1024 * 1024; // 4MB buffer
};

} // namespace chunkup::infra
