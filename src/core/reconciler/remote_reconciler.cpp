#include "remote_reconciler.hpp"
#include <exception>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace chunkup::core {

RemoteReconciler::RemoteReconciler(adapters::remote::RemoteEndpoint& endpoint)
    : endpoint_(endpoint) {}

auto RemoteReconciler::reconcile(std::string_view fingerprint,
                                 std::string_view file_name,
                                 std::uint32_t total_chunks,
                                 const std::set<std::uint32_t>& local)
    -> std::set<std::uint32_t>
{
    std::set<std::uint32_t> confirmed;
    auto keep = [&](std::uint32_t index, std::string_view origin) {
        if (index < total_chunks) {
            confirmed.insert(index);
        } else {
            spdlog::warn("Ignoring {} chunk index {} for {}: only {} chunk(s)",
                         origin, index, file_name, total_chunks);
        }
    };

    for (auto index : local) {
        keep(index, "local");
    }

    infra::Result<std::vector<std::uint32_t>> remote;
    try {
        remote = endpoint_.check(fingerprint, file_name);
    } catch (const std::exception& e) {
        remote = std::unexpected(infra::make_error(infra::ErrorCode::Unknown, e.what()));
    }
    if (!remote) {
        // stale local entries are caught later by merge()
        (void)infra::log_and_return(infra::make_error(infra::ErrorCode::ReconcileError,
            fmt::format("Remote check failed for {} ({}): {}; continuing with {} locally confirmed chunk(s)",
                        file_name, fingerprint, remote.error().message, confirmed.size())));
        return confirmed;
    }

    for (auto index : *remote) {
        keep(index, "remote");
    }

    spdlog::info("Reconciled {}: {} local + {} remote -> {}/{} confirmed",
                 file_name, local.size(), remote->size(), confirmed.size(), total_chunks);
    return confirmed;
}

} // namespace chunkup::core
