#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <vector>
#include "../../adapters/fs/file_source.hpp"
#include "../../adapters/remote/remote_endpoint.hpp"
#include "../../extensions/resume_store.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../chunk_planner/chunk_planner.hpp"
#include "../progress/progress_aggregator.hpp"
#include "upload_session.hpp"

namespace chunkup::core {

// Drives one file through
//   Idle -> Hashing -> Reconciling -> Uploading <-> Paused -> Finalizing -> Done
// with Failed reachable from every state but Done.
//
// start() and resume() block the calling thread until the session is Done,
// Paused or Failed. pause() and cancel() may be called from another thread or
// from a listener while that is happening. Listeners run without any session
// lock held, so they may call back into the controller.
class SessionController {
public:
    using StatusListener = std::function<void(SessionStatus)>;

    SessionController(infra::Config config,
                      adapters::remote::RemoteEndpoint& endpoint,
                      extensions::ResumeStateStore& store);

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Binds `file` to a fresh session and runs it. InvalidConfig is returned
    // before any I/O and leaves the status untouched.
    [[nodiscard]] auto start(const std::filesystem::path& file) -> infra::VoidResult;

    // Continues a Paused session for the same file: reconciles again and
    // uploads whatever is still missing. Neither hashes nor re-plans.
    [[nodiscard]] auto resume(const std::filesystem::path& file) -> infra::VoidResult;

    // Stops issuing chunks and cancels the ones in flight. Accepted while
    // hashing, reconciling or uploading; returns false otherwise. An accepted
    // pause always ends the run Paused, even when nothing was left to send.
    bool pause();

    // Like pause(), but the session ends Failed with Cancelled. The resume
    // record is kept so a later start() of the same bytes picks up from it.
    // Refused (false) once the merge has been requested, and when idle,
    // done or failed.
    bool cancel();

    void set_status_listener(StatusListener listener);
    void set_progress_listener(ProgressAggregator::Listener listener);

    [[nodiscard]] auto status() const -> SessionStatus { return status_.load(); }
    [[nodiscard]] auto progress_percent() const -> double { return progress_.percent(); }
    [[nodiscard]] auto progress_stats() const -> ProgressAggregator::Stats { return progress_.get_stats(); }
    [[nodiscard]] auto confirmed_indices() const -> std::set<std::uint32_t> { return confirmed_.snapshot(); }
    [[nodiscard]] auto fingerprint() const -> std::string;
    [[nodiscard]] auto file_name() const -> std::string;
    [[nodiscard]] auto total_chunks() const -> std::uint32_t;
    [[nodiscard]] auto last_error() const -> std::optional<infra::Error>;
    [[nodiscard]] auto config() const -> const infra::Config& { return config_; }

private:
    // Reconcile, upload, finalize; loops back on IncompleteUpload.
    [[nodiscard]] auto run_phases_(bool trust_local) -> infra::VoidResult;
    [[nodiscard]] auto fail_(infra::Error error) -> infra::VoidResult;
    [[nodiscard]] auto confirmed_bytes_() const -> std::uint64_t;

    // Moves to `next` under the control lock. A pending cancel() wins
    // (returns Failed without changing status; the caller fails the run), a
    // pending pause() turns Reconciling, Uploading and Finalizing into Paused.
    // Paused and Done end the run.
    [[nodiscard]] auto advance_(SessionStatus next) -> SessionStatus;
    void announce_(SessionStatus previous, SessionStatus current);

    const infra::Config config_;
    adapters::remote::RemoteEndpoint& endpoint_;
    extensions::ResumeStateStore& store_;

    ProgressAggregator progress_;
    ConfirmedSet confirmed_;
    std::atomic<SessionStatus> status_{SessionStatus::Idle};

    // Guards everything below.
    mutable std::mutex control_mutex_;
    bool running_ = false;  // a start()/resume() is between entry and its final status
    std::stop_source stop_source_;
    std::stop_token upload_token_;
    bool pause_requested_ = false;
    bool cancel_requested_ = false;
    std::optional<infra::Error> last_error_;
    StatusListener status_listener_;

    std::filesystem::path bound_path_;
    std::unique_ptr<adapters::fs::FileSource> source_;
    std::string fingerprint_;
    std::string file_name_;
    std::vector<ChunkTask> tasks_;
};

} // namespace chunkup::core
