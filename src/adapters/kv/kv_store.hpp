#pragma once

#include <optional>
#include <string>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace chunkup::adapters::kv {

// Durable string-to-string storage. Implementations must be safe to call from
// several threads; callers that read-modify-write serialize themselves.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    [[nodiscard]] virtual auto get(std::string_view key)
        -> infra::Result<std::optional<std::string>> = 0;

    [[nodiscard]] virtual auto set(std::string_view key, std::string_view value)
        -> infra::VoidResult = 0;

    // Removing a missing key is not an error.
    [[nodiscard]] virtual auto remove(std::string_view key)
        -> infra::VoidResult = 0;
};

} // namespace chunkup::adapters::kv
