#ifndef SESSION_SERVICE_HPP
#define SESSION_SERVICE_HPP
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "git_utils.hpp"
#include "models.hpp"
#include "orchestrator.hpp"
#include "store.hpp"

enum class ServiceErrorKind { NOT_FOUND, BAD_REQUEST, USER_ACTION_REQUIRED, INTERNAL };

std::string to_string(ServiceErrorKind kind);

/**
 * Raised by SessionService when a request is rejected. help_steps is only
 * filled for USER_ACTION_REQUIRED.
 */
class ServiceError : public std::runtime_error {
  public:
    ServiceError(ServiceErrorKind kind, const std::string& message,
                 std::vector<std::string> help_steps = {});
    ServiceErrorKind kind() const { return kind_; }
    const std::vector<std::string>& help_steps() const { return help_steps_; }

  private:
    ServiceErrorKind kind_;
    std::vector<std::string> help_steps_;
};

struct SessionDetails {
    Session session;
    std::vector<Message> messages;
};

/**
 * @brief Validating front for repositories and sessions.
 *
 * Checks that referenced records exist before touching the Orchestrator or
 * the Store and turns their rejections into ServiceError.
 */
class SessionService {
  public:
    SessionService(Store& store, Orchestrator& orchestrator);

    /**
     * @brief Register an existing working tree.
     *
     * The path must exist and be a git repository. It is stored in canonical
     * form; the name defaults to the final path component.
     */
    Repo add_repo(const std::filesystem::path& path,
                  const std::optional<std::string>& name = std::nullopt);
    /** @brief Existing record for @p path, or a newly added one. */
    Repo ensure_repo(const std::filesystem::path& path);
    std::vector<Repo> list_repos();
    /** @brief Remove a repository and everything recorded for it. Refused while busy. */
    void delete_repo(const std::string& repo_id);
    /** @brief Repositories below each of @p roots, at most @p depth levels down. */
    std::vector<git::FoundRepo> scan(const std::vector<std::filesystem::path>& roots,
                                     size_t depth = 2);

    Session create_session(const std::string& repo_id,
                           const std::optional<std::string>& name = std::nullopt);
    SessionDetails get_session(const std::string& session_id);
    std::vector<Session> list_sessions();
    /** @brief Refused while the session has a running process. */
    void delete_session(const std::string& session_id);

    /**
     * @brief Record @p prompt as a user message and start the agent.
     *
     * Returns once the process is running.
     */
    void run_session(const std::string& session_id, const std::string& prompt);
    void cancel_session(const std::string& session_id);
    std::vector<OutputRecord> session_output(const std::string& session_id, int64_t after_id = 0,
                                             size_t limit = 0);

    /**
     * @brief Demote sessions persisted as running but without a live process
     *        to error.
     *
     * @return number of sessions changed.
     */
    size_t reconcile_orphans();

  private:
    Session require_session(const std::string& session_id);
    Repo require_repo(const std::string& repo_id, ServiceErrorKind missing_kind);

    Store& store_;
    Orchestrator& orchestrator_;
};

#endif // SESSION_SERVICE_HPP
