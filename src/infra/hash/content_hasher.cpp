#include "content_hasher.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <xxhash.h>
#include <fstream>
#include <memory>
#include <vector>

namespace chunkup::infra {

namespace {

struct XXH3StateDeleter {
    void operator()(XXH3_state_t* state) const { XXH3_freeState(state); }
};

auto to_hex(const XXH128_hash_t& hash) -> Fingerprint {
    XXH128_canonical_t canonical;
    XXH128_canonicalFromHash(&canonical, hash);

    Fingerprint hex;
    hex.reserve(sizeof(canonical.digest) * 2);
    for (unsigned char byte : canonical.digest) {
        hex += fmt::format("{:02x}", byte);
    }
    return hex;
}

} // namespace

auto ContentHasher::hash_stream(std::istream& in)
    -> Result<Fingerprint>
{
    std::unique_ptr<XXH3_state_t, XXH3StateDeleter> state(XXH3_createState());
    if (!state) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to create XXH3 state"));
    }

    if (XXH3_128bits_reset(state.get()) == XXH_ERROR) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to reset XXH3 state"));
    }

    std::vector<char> buffer(BUFFER_SIZE);
    while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || in.gcount() > 0) {
        XXH3_128bits_update(state.get(), buffer.data(), static_cast<size_t>(in.gcount()));
    }

    if (in.bad()) {
        return std::unexpected(make_error(ErrorCode::ReadError, "Stream failed before end of content"));
    }

    return to_hex(XXH3_128bits_digest(state.get()));
}

auto ContentHasher::hash_file(const std::filesystem::path& path)
    -> Result<Fingerprint>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::ReadError,
                                          fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    auto fingerprint = hash_stream(file);
    if (!fingerprint) {
        return std::unexpected(make_error(fingerprint.error().code,
                                          fmt::format("Error reading {}: {}", path.string(), fingerprint.error().message)));
    }

    spdlog::debug("Fingerprint of {}: {}", path.string(), *fingerprint);
    return fingerprint;
}

} // namespace chunkup::infra
