#pragma once

#include <cstdint>
#include <set>
#include <string_view>
#include "../../adapters/remote/remote_endpoint.hpp"

namespace chunkup::core {

class RemoteReconciler {
public:
    explicit RemoteReconciler(adapters::remote::RemoteEndpoint& endpoint);

    // Union of `local` and what the server reports, restricted to
    // [0, total_chunks). A failed check is logged and falls back to `local`.
    [[nodiscard]] auto reconcile(std::string_view fingerprint,
                                 std::string_view file_name,
                                 std::uint32_t total_chunks,
                                 const std::set<std::uint32_t>& local)
        -> std::set<std::uint32_t>;

private:
    adapters::remote::RemoteEndpoint& endpoint_;
};

} // namespace chunkup::core
