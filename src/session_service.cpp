#include "session_service.hpp"
#include <system_error>
#include "logger.hpp"

namespace fs = std::filesystem;

std::string to_string(ServiceErrorKind kind) {
    switch (kind) {
    case ServiceErrorKind::NOT_FOUND:
        return "not_found";
    case ServiceErrorKind::BAD_REQUEST:
        return "bad_request";
    case ServiceErrorKind::USER_ACTION_REQUIRED:
        return "user_action_required";
    case ServiceErrorKind::INTERNAL:
        return "internal_error";
    }
    return "internal_error";
}

ServiceError::ServiceError(ServiceErrorKind kind, const std::string& message,
                           std::vector<std::string> help_steps)
    : std::runtime_error(message), kind_(kind), help_steps_(std::move(help_steps)) {}

SessionService::SessionService(Store& store, Orchestrator& orchestrator)
    : store_(store), orchestrator_(orchestrator) {}

Session SessionService::require_session(const std::string& session_id) {
    auto session = store_.get_session(session_id);
    if (!session)
        throw ServiceError(ServiceErrorKind::NOT_FOUND, "Session not found: " + session_id);
    return *session;
}

Repo SessionService::require_repo(const std::string& repo_id, ServiceErrorKind missing_kind) {
    auto repo = store_.get_repo(repo_id);
    if (!repo)
        throw ServiceError(missing_kind, "Repository not found: " + repo_id);
    return *repo;
}

Repo SessionService::add_repo(const fs::path& path, const std::optional<std::string>& name) {
    std::error_code ec;
    if (!fs::exists(path, ec))
        throw ServiceError(ServiceErrorKind::BAD_REQUEST, "Path does not exist: " + path.string());
    if (!git::is_git_repo(path))
        throw ServiceError(ServiceErrorKind::BAD_REQUEST,
                           "Not a git repository: " + path.string());
    fs::path canonical = fs::canonical(path, ec);
    if (ec)
        throw ServiceError(ServiceErrorKind::INTERNAL,
                           "Failed to canonicalize path: " + ec.message());
    const std::string stored = canonical.string();
    if (store_.get_repo_by_path(stored))
        throw ServiceError(ServiceErrorKind::BAD_REQUEST, "Repository already exists: " + stored);

    std::string repo_name;
    if (name && !name->empty())
        repo_name = *name;
    else
        repo_name = canonical.filename().string();
    if (repo_name.empty())
        repo_name = "unknown";
    try {
        Repo repo = store_.insert_repo(stored, repo_name);
        log_info("Repository added", {{"repo", repo.id}, {"path", repo.path}});
        return repo;
    } catch (const StoreError& e) {
        throw ServiceError(ServiceErrorKind::INTERNAL, e.what());
    }
}

Repo SessionService::ensure_repo(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::canonical(path, ec);
    if (!ec) {
        if (auto existing = store_.get_repo_by_path(canonical.string()))
            return *existing;
    }
    return add_repo(path);
}

std::vector<Repo> SessionService::list_repos() { return store_.list_repos(); }

void SessionService::delete_repo(const std::string& repo_id) {
    require_repo(repo_id, ServiceErrorKind::NOT_FOUND);
    if (orchestrator_.is_repo_busy(repo_id))
        throw ServiceError(ServiceErrorKind::BAD_REQUEST,
                           "Repository " + repo_id + " has a running session");
    try {
        store_.delete_repo(repo_id);
    } catch (const StoreError& e) {
        throw ServiceError(ServiceErrorKind::INTERNAL, e.what());
    }
    log_info("Repository removed", {{"repo", repo_id}});
}

std::vector<git::FoundRepo> SessionService::scan(const std::vector<fs::path>& roots,
                                                 size_t depth) {
    std::vector<git::FoundRepo> found;
    for (const auto& root : roots) {
        auto below = git::scan_for_repos(root, depth);
        found.insert(found.end(), below.begin(), below.end());
    }
    return found;
}

Session SessionService::create_session(const std::string& repo_id,
                                       const std::optional<std::string>& name) {
    require_repo(repo_id, ServiceErrorKind::BAD_REQUEST);
    try {
        return store_.insert_session(repo_id, name);
    } catch (const StoreError& e) {
        throw ServiceError(ServiceErrorKind::INTERNAL, e.what());
    }
}

SessionDetails SessionService::get_session(const std::string& session_id) {
    SessionDetails details;
    details.session = require_session(session_id);
    details.messages = store_.list_messages(session_id);
    return details;
}

std::vector<Session> SessionService::list_sessions() { return store_.list_sessions(); }

void SessionService::delete_session(const std::string& session_id) {
    require_session(session_id);
    if (orchestrator_.is_session_running(session_id))
        throw ServiceError(ServiceErrorKind::BAD_REQUEST,
                           "Session " + session_id + " has a running process");
    try {
        store_.delete_session(session_id);
    } catch (const StoreError& e) {
        throw ServiceError(ServiceErrorKind::INTERNAL, e.what());
    }
}

void SessionService::run_session(const std::string& session_id, const std::string& prompt) {
    if (prompt.empty())
        throw ServiceError(ServiceErrorKind::BAD_REQUEST, "Prompt must not be empty");
    Session session = require_session(session_id);
    auto repo = store_.get_repo(session.repo_id);
    if (!repo)
        throw ServiceError(ServiceErrorKind::INTERNAL,
                           "Repository not found for session: " + session_id);

    auto rejected = orchestrator_.run(session_id, repo->id, repo->path, prompt);
    if (rejected) {
        switch (rejected->kind) {
        case ProcessErrorKind::NOT_FOUND:
            throw ServiceError(ServiceErrorKind::USER_ACTION_REQUIRED, rejected->message,
                               rejected->help_steps);
        case ProcessErrorKind::SPAWN_FAILED:
            throw ServiceError(ServiceErrorKind::INTERNAL, rejected->message);
        default:
            throw ServiceError(ServiceErrorKind::BAD_REQUEST, rejected->message);
        }
    }
    try {
        store_.insert_message(session_id, MessageRole::USER, prompt);
    } catch (const StoreError& e) {
        log_warning("Failed to record prompt", {{"session", session_id}, {"error", e.what()}});
    }
}

void SessionService::cancel_session(const std::string& session_id) {
    require_session(session_id);
    if (auto rejected = orchestrator_.cancel(session_id)) {
        if (rejected->kind == ProcessErrorKind::NOT_RUNNING)
            throw ServiceError(ServiceErrorKind::BAD_REQUEST, rejected->message);
        throw ServiceError(ServiceErrorKind::INTERNAL, rejected->message);
    }
}

std::vector<OutputRecord> SessionService::session_output(const std::string& session_id,
                                                         int64_t after_id, size_t limit) {
    require_session(session_id);
    return store_.list_output_logs(session_id, after_id, limit);
}

size_t SessionService::reconcile_orphans() {
    size_t changed = 0;
    for (const auto& session : store_.list_sessions()) {
        if (session.status != SessionStatus::RUNNING ||
            orchestrator_.is_session_running(session.id))
            continue;
        try {
            store_.update_session_status(session.id, SessionStatus::ERR);
            ++changed;
            log_warning("Marked orphaned session as error", {{"session", session.id}});
        } catch (const StoreError& e) {
            log_error("Failed to reconcile session", {{"session", session.id}, {"error", e.what()}});
        }
    }
    return changed;
}
