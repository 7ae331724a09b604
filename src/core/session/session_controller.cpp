#include "session_controller.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <system_error>
#include "../../infra/hash/content_hasher.hpp"
#include "../finalizer/merge_finalizer.hpp"
#include "../reconciler/remote_reconciler.hpp"
#include "../scheduler/upload_scheduler.hpp"

namespace chunkup::core {

namespace {

std::filesystem::path normalized(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    return ec ? path.lexically_normal() : absolute.lexically_normal();
}

} // namespace

SessionController::SessionController(infra::Config config,
                                     adapters::remote::RemoteEndpoint& endpoint,
                                     extensions::ResumeStateStore& store)
    : config_(std::move(config)), endpoint_(endpoint), store_(store) {}

void SessionController::set_status_listener(StatusListener listener) {
    std::lock_guard lock(control_mutex_);
    status_listener_ = std::move(listener);
}

void SessionController::set_progress_listener(ProgressAggregator::Listener listener) {
    progress_.set_listener(std::move(listener));
}

auto SessionController::fingerprint() const -> std::string {
    std::lock_guard lock(control_mutex_);
    return fingerprint_;
}

auto SessionController::file_name() const -> std::string {
    std::lock_guard lock(control_mutex_);
    return file_name_;
}

auto SessionController::total_chunks() const -> std::uint32_t {
    std::lock_guard lock(control_mutex_);
    return static_cast<std::uint32_t>(tasks_.size());
}

auto SessionController::last_error() const -> std::optional<infra::Error> {
    std::lock_guard lock(control_mutex_);
    return last_error_;
}

void SessionController::announce_(SessionStatus previous, SessionStatus current) {
    if (previous == current) return;

    StatusListener listener;
    std::string name;
    {
        std::lock_guard lock(control_mutex_);
        listener = status_listener_;
        name = file_name_;
    }
    spdlog::info("Session {}: {} -> {}", name, to_string(previous), to_string(current));
    if (listener) {
        listener(current);
    }
}

auto SessionController::advance_(SessionStatus next) -> SessionStatus {
    SessionStatus previous = SessionStatus::Idle;
    SessionStatus entered = next;
    {
        std::lock_guard lock(control_mutex_);
        if (cancel_requested_) {
            return SessionStatus::Failed;
        }
        if (pause_requested_ &&
            (next == SessionStatus::Reconciling ||
             next == SessionStatus::Uploading ||
             next == SessionStatus::Finalizing)) {
            entered = SessionStatus::Paused;
        }
        if (entered == SessionStatus::Uploading) {
            // pause() and cancel() from here on stop this run's sends
            stop_source_ = std::stop_source{};
            upload_token_ = stop_source_.get_token();
        }
        if (entered == SessionStatus::Paused || entered == SessionStatus::Done) {
            running_ = false;
        }
        previous = status_.exchange(entered);
    }
    announce_(previous, entered);
    return entered;
}

auto SessionController::fail_(infra::Error error) -> infra::VoidResult {
    auto logged = infra::log_and_return(std::move(error));
    SessionStatus previous = SessionStatus::Idle;
    {
        std::lock_guard lock(control_mutex_);
        last_error_ = logged;
        running_ = false;
        previous = status_.exchange(SessionStatus::Failed);
    }
    announce_(previous, SessionStatus::Failed);
    return std::unexpected(std::move(logged));
}

auto SessionController::confirmed_bytes_() const -> std::uint64_t {
    std::uint64_t bytes = 0;
    for (auto index : confirmed_.snapshot()) {
        bytes += tasks_[index].length;
    }
    return bytes;
}

auto SessionController::start(const std::filesystem::path& file) -> infra::VoidResult {
    if (auto valid = infra::validate_config(config_); !valid) {
        return std::unexpected(infra::log_and_return(std::move(valid.error())));
    }

    {
        std::lock_guard lock(control_mutex_);
        if (running_) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidState,
                                   "An upload is already running on this session"));
        }
        running_ = true;
        pause_requested_ = false;
        cancel_requested_ = false;
        last_error_.reset();
        bound_path_ = normalized(file);
        source_.reset();
        fingerprint_.clear();
        file_name_ = file.filename().string();
        tasks_.clear();
    }
    confirmed_.clear();
    progress_.reset(0);

    auto source = adapters::fs::FileSource::open(file);
    if (!source) {
        return fail_(std::move(source.error()));
    }

    (void)advance_(SessionStatus::Hashing);
    auto fingerprint = infra::ContentHasher::hash_file(file);
    if (!fingerprint) {
        return fail_(std::move(fingerprint.error()));
    }

    auto tasks = plan_chunks((*source)->size(), config_.chunk_size);
    if (!tasks) {
        return fail_(std::move(tasks.error()));
    }

    progress_.reset((*source)->size());
    {
        std::lock_guard lock(control_mutex_);
        source_ = std::move(*source);
        fingerprint_ = std::move(*fingerprint);
        tasks_ = std::move(*tasks);
    }

    spdlog::info("Uploading {} ({} bytes, {} chunk(s), fingerprint {})",
                 file_name_, source_->size(), tasks_.size(), fingerprint_);
    return run_phases_(true);
}

auto SessionController::resume(const std::filesystem::path& file) -> infra::VoidResult {
    {
        std::lock_guard lock(control_mutex_);
        if (running_) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidState,
                                   "An upload is already running on this session"));
        }
        const auto current = status_.load();
        if (current != SessionStatus::Paused) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidState,
                                   fmt::format("Cannot resume a session that is {}", to_string(current))));
        }
        if (normalized(file) != bound_path_) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidState,
                                   fmt::format("Session is bound to {}, not {}; start a new session instead",
                                               bound_path_.string(), file.string())));
        }
        running_ = true;
        pause_requested_ = false;
    }

    spdlog::info("Resuming {}: {}/{} chunk(s) confirmed", file_name_, confirmed_.size(), tasks_.size());
    return run_phases_(true);
}

bool SessionController::pause() {
    std::lock_guard lock(control_mutex_);
    const auto current = status_.load();
    if (current != SessionStatus::Hashing &&
        current != SessionStatus::Reconciling &&
        current != SessionStatus::Uploading) {
        return false;
    }
    pause_requested_ = true;
    stop_source_.request_stop();
    spdlog::info("Pause requested for {}", file_name_);
    return true;
}

bool SessionController::cancel() {
    SessionStatus previous = SessionStatus::Idle;
    std::string name;
    {
        std::lock_guard lock(control_mutex_);
        const auto current = status_.load();
        if (current == SessionStatus::Idle ||
            current == SessionStatus::Finalizing ||
            current == SessionStatus::Done ||
            current == SessionStatus::Failed) {
            return false;
        }
        cancel_requested_ = true;
        stop_source_.request_stop();
        if (running_) {
            spdlog::info("Cancel requested for {}", file_name_);
            return true; // the next transition of the running phase fails it
        }
        // Paused with nothing running
        last_error_ = infra::make_error(infra::ErrorCode::Cancelled, "Upload cancelled");
        previous = status_.exchange(SessionStatus::Failed);
        name = file_name_;
    }
    spdlog::info("Cancelled paused upload of {}", name);
    announce_(previous, SessionStatus::Failed);
    return true;
}

auto SessionController::run_phases_(bool trust_local) -> infra::VoidResult {
    const UploadContext context{
        .fingerprint = fingerprint_,
        .file_name = file_name_,
        .total_chunks = static_cast<std::uint32_t>(tasks_.size())
    };
    const auto cancelled = [] {
        return infra::make_error(infra::ErrorCode::Cancelled, "Upload cancelled");
    };

    for (int round = 1;; ++round) {
        const auto reconciling = advance_(SessionStatus::Reconciling);
        if (reconciling == SessionStatus::Failed) {
            return fail_(cancelled());
        }
        if (reconciling == SessionStatus::Paused) {
            return {};
        }

        std::set<std::uint32_t> local;
        if (trust_local) {
            auto loaded = store_.load(context.fingerprint);
            if (loaded) {
                local = std::move(*loaded);
            } else {
                spdlog::warn("Ignoring local resume state for {}: {}", context.file_name, loaded.error().message);
            }
        }

        RemoteReconciler reconciler{endpoint_};
        confirmed_.assign(reconciler.reconcile(context.fingerprint, context.file_name, context.total_chunks, local));
        progress_.set_confirmed_bytes(confirmed_bytes_());

        const auto pending = pending_chunks(tasks_, confirmed_.snapshot());
        if (!pending.empty()) {
            const auto uploading = advance_(SessionStatus::Uploading);
            if (uploading == SessionStatus::Failed) {
                return fail_(cancelled());
            }
            if (uploading == SessionStatus::Paused) {
                return {};
            }

            std::stop_token token;
            {
                std::lock_guard lock(control_mutex_);
                token = upload_token_;
            }
            UploadScheduler scheduler{endpoint_, *source_, store_, progress_, confirmed_, config_.retry};
            auto outcome = scheduler.run(pending, static_cast<std::size_t>(config_.concurrency), context, token);
            if (!outcome) {
                return fail_(std::move(outcome.error()));
            }

            if (*outcome == RunOutcome::Stopped) {
                if (advance_(SessionStatus::Paused) == SessionStatus::Failed) {
                    return fail_(cancelled());
                }
                spdlog::info("Paused {} at {}/{} chunk(s)", context.file_name, confirmed_.size(), context.total_chunks);
                return {};
            }
        }

        const auto finalizing = advance_(SessionStatus::Finalizing);
        if (finalizing == SessionStatus::Failed) {
            return fail_(cancelled());
        }
        if (finalizing == SessionStatus::Paused) {
            spdlog::info("Paused {} before merge", context.file_name);
            return {};
        }

        MergeFinalizer finalizer{endpoint_, store_};
        auto merged = finalizer.finalize(context.fingerprint, context.file_name,
                                         context.total_chunks, confirmed_.size());
        if (merged) {
            progress_.complete();
            (void)advance_(SessionStatus::Done);
            return {};
        }

        if (merged.error().code != infra::ErrorCode::IncompleteUpload || round >= config_.max_finalize_rounds) {
            return fail_(std::move(merged.error()));
        }

        // The server is missing chunks we believed confirmed: its answer alone decides what is left
        spdlog::warn("Server rejected merge of {} ({}); reconciling again from the server's view",
                     context.file_name, merged.error().message);
        if (auto cleared = store_.clear(context.fingerprint); !cleared) {
            spdlog::warn("Could not drop resume record for {}: {}", context.file_name, cleared.error().message);
        }
        trust_local = false;
    }
}

} // namespace chunkup::core
