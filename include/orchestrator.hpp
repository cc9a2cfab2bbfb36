#ifndef ORCHESTRATOR_HPP
#define ORCHESTRATOR_HPP
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "broadcast.hpp"
#include "child_process.hpp"
#include "models.hpp"
#include "store.hpp"

enum class ProcessErrorKind { REPO_BUSY, SESSION_ALREADY_RUNNING, SPAWN_FAILED, NOT_FOUND, NOT_RUNNING };

/**
 * Rejection returned by Orchestrator::run() and Orchestrator::cancel().
 * help_steps is only filled for NOT_FOUND.
 */
struct ProcessError {
    ProcessErrorKind kind;
    std::string message;
    std::vector<std::string> help_steps;
};

std::string to_string(ProcessErrorKind kind);

struct OrchestratorConfig {
    std::string agent = "ralph";
    /// Time between the graceful and the forced stop on cancel.
    std::chrono::milliseconds grace_period{5000};
    /// How long the destructor waits for output monitors before abandoning
    /// streams still held open by escaped descendants.
    std::chrono::milliseconds shutdown_timeout{10000};
};

/**
 * @brief Starts, observes and stops agent processes for sessions.
 *
 * At most one process runs per session and per repository. Every line the
 * agent prints is appended to the Store and broadcast on the session's
 * topic; status changes are persisted and broadcast the same way.
 *
 * run() returns once the process is started. A detached monitor thread
 * drains the output and records the final status. Destroying the
 * orchestrator kills all live processes and waits for their monitors; after
 * OrchestratorConfig::shutdown_timeout the remaining output is abandoned.
 */
class Orchestrator {
  public:
    Orchestrator(Store& store, Broadcaster& broadcaster, OrchestratorConfig config = {});
    ~Orchestrator();
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Launch `<agent> run --autonomous --prompt <prompt>` in @p repo_path.
     *
     * @return `std::nullopt` when the process was started, otherwise the
     *         reason it was not. Nothing is spawned or recorded on rejection.
     */
    std::optional<ProcessError> run(const std::string& session_id, const std::string& repo_id,
                                    const std::filesystem::path& repo_path,
                                    const std::string& prompt);

    /**
     * @brief Stop the session's process: SIGTERM, grace period, SIGKILL.
     *
     * Blocks for at most the grace period. The session ends as Cancelled.
     * A session whose process is still being started is waited for.
     */
    std::optional<ProcessError> cancel(const std::string& session_id);

    bool is_repo_busy(const std::string& repo_id) const;
    bool is_session_running(const std::string& session_id) const;
    std::optional<std::string> active_session_for_repo(const std::string& repo_id) const;
    std::vector<std::string> active_sessions() const;

    /**
     * @brief Block until the session's process is gone, its output drained
     *        and its final status recorded.
     *
     * @return `false` if @p timeout elapsed first.
     */
    bool wait_for_session(const std::string& session_id, std::chrono::milliseconds timeout);

    const OrchestratorConfig& config() const { return config_; }

  private:
    struct ActiveRun {
        std::string repo_id;
        std::shared_ptr<procutil::ChildProcess> child; ///< null while only reserved
        bool cancelling = false;
        bool exited = false;
    };

    void monitor(const std::string& session_id, std::shared_ptr<ActiveRun> run);
    void pump(const std::string& session_id, procutil::ChildProcess& child,
              procutil::ChildProcess::Stream stream);
    void record_status(const std::string& session_id, SessionStatus status);
    void release_locked(const std::string& session_id, const std::shared_ptr<ActiveRun>& run);
    void unmonitor_locked(const std::string& session_id, const procutil::ChildProcess* child);
    ProcessError make_error(ProcessErrorKind kind, const std::string& subject) const;

    Store& store_;
    Broadcaster& broadcaster_;
    OrchestratorConfig config_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::map<std::string, std::shared_ptr<ActiveRun>> processes_; ///< session -> run
    std::map<std::string, std::string> active_repos_;              ///< repo -> session
    std::set<std::string> finishing_; ///< released, final status not yet recorded
    /// Sessions whose output is still being drained. A cancelled session may
    /// be started again before its old monitor finishes.
    std::multimap<std::string, std::shared_ptr<procutil::ChildProcess>> monitoring_;
    bool shutting_down_ = false;
};

#endif // ORCHESTRATOR_HPP
