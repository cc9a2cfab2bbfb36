#include "orchestrator.hpp"
#include <exception>
#include <system_error>
#include <thread>
#include "logger.hpp"
#include "thread_utils.hpp"

namespace fs = std::filesystem;
using procutil::ChildProcess;

std::string to_string(ProcessErrorKind kind) {
    switch (kind) {
    case ProcessErrorKind::REPO_BUSY:
        return "repo_busy";
    case ProcessErrorKind::SESSION_ALREADY_RUNNING:
        return "session_already_running";
    case ProcessErrorKind::SPAWN_FAILED:
        return "spawn_failed";
    case ProcessErrorKind::NOT_FOUND:
        return "not_found";
    case ProcessErrorKind::NOT_RUNNING:
        return "not_running";
    }
    return "spawn_failed";
}

Orchestrator::Orchestrator(Store& store, Broadcaster& broadcaster, OrchestratorConfig config)
    : store_(store), broadcaster_(broadcaster), config_(std::move(config)) {}

Orchestrator::~Orchestrator() {
    std::unique_lock<std::mutex> lk(mtx_);
    shutting_down_ = true;
    for (const auto& [session_id, run] : processes_) {
        if (run->child) {
            log_warning("Killing agent on shutdown", {{"session", session_id}});
            run->child->force_stop();
        }
    }
    auto drained = [this] { return monitoring_.empty(); };
    if (cv_.wait_for(lk, config_.shutdown_timeout, drained))
        return;

    // A descendant that left the process group still holds a pipe open.
    for (const auto& [session_id, child] : monitoring_)
        log_warning("Abandoning agent output on shutdown",
                    {{"session", session_id}, {"pid", std::to_string(child->pid())}});
    do {
        for (const auto& entry : monitoring_)
            entry.second->abandon_streams();
    } while (!cv_.wait_for(lk, std::chrono::milliseconds(100), drained));
}

ProcessError Orchestrator::make_error(ProcessErrorKind kind, const std::string& subject) const {
    const std::string& agent = config_.agent;
    switch (kind) {
    case ProcessErrorKind::REPO_BUSY:
        return {kind, "Repository " + subject + " already has a running " + agent + " process", {}};
    case ProcessErrorKind::SESSION_ALREADY_RUNNING:
        return {kind, "Session " + subject + " already has a running process", {}};
    case ProcessErrorKind::NOT_RUNNING:
        return {kind, "Session " + subject + " has no running process", {}};
    case ProcessErrorKind::NOT_FOUND:
        return {kind,
                agent + " CLI not found in PATH",
                {"Install " + agent + ": cargo install " + agent, "Or download from release page",
                 "Ensure ~/.cargo/bin is in your PATH",
                 "Restart your terminal after installation"}};
    case ProcessErrorKind::SPAWN_FAILED:
        break;
    }
    return {ProcessErrorKind::SPAWN_FAILED, "Failed to spawn " + agent + " process: " + subject, {}};
}

std::optional<ProcessError> Orchestrator::run(const std::string& session_id,
                                              const std::string& repo_id, const fs::path& repo_path,
                                              const std::string& prompt) {
    auto entry = std::make_shared<ActiveRun>();
    entry->repo_id = repo_id;
    {
        // Check and reserve in one step; the spawn happens outside the lock.
        std::lock_guard<std::mutex> lk(mtx_);
        if (shutting_down_)
            return make_error(ProcessErrorKind::SPAWN_FAILED, "shutting down");
        if (processes_.count(session_id) || finishing_.count(session_id))
            return make_error(ProcessErrorKind::SESSION_ALREADY_RUNNING, session_id);
        if (active_repos_.count(repo_id))
            return make_error(ProcessErrorKind::REPO_BUSY, repo_id);
        processes_[session_id] = entry;
        active_repos_[repo_id] = session_id;
    }

    procutil::SpawnError spawn_error;
    std::unique_ptr<ChildProcess> spawned = procutil::spawn_process(
        repo_path, {config_.agent, "run", "--autonomous", "--prompt", prompt}, &spawn_error);
    if (!spawned) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            release_locked(session_id, entry);
        }
        cv_.notify_all();
        log_error("Failed to start agent", {{"session", session_id},
                                            {"repo", repo_path.string()},
                                            {"error", spawn_error.message}});
        if (spawn_error.kind == procutil::SpawnErrorKind::NOT_FOUND)
            return make_error(ProcessErrorKind::NOT_FOUND, spawn_error.message);
        return make_error(ProcessErrorKind::SPAWN_FAILED, spawn_error.message);
    }
    std::shared_ptr<ChildProcess> child(std::move(spawned));
    log_info("Agent started", {{"session", session_id},
                               {"repo", repo_id},
                               {"pid", std::to_string(child->pid())}});

    // Running is recorded before the handle becomes cancellable so that a
    // concurrent cancel can never be overwritten by it.
    record_status(session_id, SessionStatus::RUNNING);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        entry->child = child;
        monitoring_.emplace(session_id, child);
    }
    cv_.notify_all();
    try {
        std::thread(&Orchestrator::monitor, this, session_id, entry).detach();
    } catch (const std::system_error& e) {
        log_error("Failed to start output monitor", {{"session", session_id}, {"error", e.what()}});
        child->force_stop();
        child->wait();
        {
            std::lock_guard<std::mutex> lk(mtx_);
            entry->exited = true;
            unmonitor_locked(session_id, child.get());
            if (!entry->cancelling)
                release_locked(session_id, entry);
        }
        cv_.notify_all();
        record_status(session_id, SessionStatus::ERR);
        return make_error(ProcessErrorKind::SPAWN_FAILED, e.what());
    }
    return std::nullopt;
}

void Orchestrator::pump(const std::string& session_id, ChildProcess& child,
                        ChildProcess::Stream stream) {
    const OutputStream tag =
        stream == ChildProcess::Stream::STDOUT ? OutputStream::STDOUT : OutputStream::STDERR;
    std::string line;
    while (child.read_line(stream, line)) {
        try {
            store_.insert_output_log(session_id, tag, line);
        } catch (const std::exception& e) {
            log_warning("Failed to persist " + to_string(tag) + " output",
                        {{"session", session_id}, {"error", e.what()}});
        }
        try {
            broadcaster_.broadcast(session_id, output_message(session_id, tag, line));
        } catch (const std::exception& e) {
            log_warning("Failed to broadcast " + to_string(tag) + " output",
                        {{"session", session_id}, {"error", e.what()}});
        }
    }
}

void Orchestrator::monitor(const std::string& session_id, std::shared_ptr<ActiveRun> run) {
    std::shared_ptr<ChildProcess> child = run->child;
    {
        ThreadGuard err_reader(
            std::thread([&] { pump(session_id, *child, ChildProcess::Stream::STDERR); }));
        pump(session_id, *child, ChildProcess::Stream::STDOUT);
    }
    procutil::ExitOutcome outcome = child->wait();

    bool cancelled;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        run->exited = true;
        cancelled = run->cancelling;
        // A cancel in progress owns the cleanup and the final status.
        if (!cancelled) {
            release_locked(session_id, run);
            finishing_.insert(session_id);
        }
    }
    cv_.notify_all();

    if (!cancelled) {
        const SessionStatus final_status =
            outcome.success() ? SessionStatus::COMPLETED : SessionStatus::ERR;
        record_status(session_id, final_status);
        std::map<std::string, std::string> fields{{"session", session_id},
                                                  {"status", to_string(final_status)}};
        if (outcome.exited)
            fields["exit_code"] = std::to_string(outcome.code);
        else if (outcome.signal)
            fields["signal"] = std::to_string(outcome.signal);
        log_info("Agent finished", fields);
    } else {
        log_debug("Agent exited during cancel", {{"session", session_id}});
    }

    std::lock_guard<std::mutex> lk(mtx_);
    finishing_.erase(session_id);
    unmonitor_locked(session_id, child.get());
    cv_.notify_all();
}

std::optional<ProcessError> Orchestrator::cancel(const std::string& session_id) {
    std::shared_ptr<ActiveRun> run;
    {
        std::unique_lock<std::mutex> lk(mtx_);
        auto it = processes_.find(session_id);
        if (it == processes_.end() || it->second->cancelling)
            return make_error(ProcessErrorKind::NOT_RUNNING, session_id);
        run = it->second;
        // Reserved but not spawned yet: wait for the handle or the release.
        cv_.wait(lk, [&] {
            auto cur = processes_.find(session_id);
            return cur == processes_.end() || cur->second != run || run->child;
        });
        auto cur = processes_.find(session_id);
        if (cur == processes_.end() || cur->second != run || run->cancelling)
            return make_error(ProcessErrorKind::NOT_RUNNING, session_id);
        run->cancelling = true;
    }
    log_info("Cancelling agent", {{"session", session_id}});
    run->child->request_graceful_stop();

    bool exited;
    {
        std::unique_lock<std::mutex> lk(mtx_);
        exited = cv_.wait_for(lk, config_.grace_period, [&] { return run->exited; });
    }
    if (!exited) {
        log_warning("Agent ignored SIGTERM, killing process group", {{"session", session_id}});
        run->child->force_stop();
    }

    {
        std::lock_guard<std::mutex> lk(mtx_);
        release_locked(session_id, run);
        finishing_.insert(session_id);
    }
    cv_.notify_all();
    record_status(session_id, SessionStatus::CANCELLED);
    log_info("Agent cancelled", {{"session", session_id}});
    {
        std::lock_guard<std::mutex> lk(mtx_);
        finishing_.erase(session_id);
    }
    cv_.notify_all();
    return std::nullopt;
}

void Orchestrator::release_locked(const std::string& session_id,
                                  const std::shared_ptr<ActiveRun>& run) {
    auto it = processes_.find(session_id);
    if (it != processes_.end() && it->second == run)
        processes_.erase(it);
    auto repo_it = active_repos_.find(run->repo_id);
    if (repo_it != active_repos_.end() && repo_it->second == session_id)
        active_repos_.erase(repo_it);
}

void Orchestrator::unmonitor_locked(const std::string& session_id,
                                    const ChildProcess* child) {
    auto range = monitoring_.equal_range(session_id);
    for (auto it = range.first; it != range.second; ++it) {
        if (it->second.get() == child) {
            monitoring_.erase(it);
            return;
        }
    }
}

void Orchestrator::record_status(const std::string& session_id, SessionStatus status) {
    try {
        store_.update_session_status(session_id, status);
    } catch (const std::exception& e) {
        log_error("Failed to update session status",
                  {{"session", session_id}, {"status", to_string(status)}, {"error", e.what()}});
    }
    try {
        broadcaster_.broadcast(session_id, status_message(session_id, status));
    } catch (const std::exception& e) {
        log_error("Failed to broadcast session status",
                  {{"session", session_id}, {"status", to_string(status)}, {"error", e.what()}});
    }
}

bool Orchestrator::is_repo_busy(const std::string& repo_id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return active_repos_.count(repo_id) > 0;
}

bool Orchestrator::is_session_running(const std::string& session_id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return processes_.count(session_id) > 0;
}

std::optional<std::string> Orchestrator::active_session_for_repo(const std::string& repo_id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = active_repos_.find(repo_id);
    if (it == active_repos_.end())
        return std::nullopt;
    return it->second;
}

std::vector<std::string> Orchestrator::active_sessions() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::string> out;
    out.reserve(processes_.size());
    for (const auto& entry : processes_)
        out.push_back(entry.first);
    return out;
}

bool Orchestrator::wait_for_session(const std::string& session_id,
                                    std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [&] {
        return !processes_.count(session_id) && !finishing_.count(session_id) &&
               !monitoring_.count(session_id);
    });
}
