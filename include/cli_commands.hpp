#pragma once

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>

#include "broadcast.hpp"
#include "clone_relay.hpp"
#include "options.hpp"
#include "orchestrator.hpp"
#include "session_service.hpp"
#include "store.hpp"
#include "webhook_notifier.hpp"

namespace cli {

/**
 * @brief Everything one invocation needs, wired from Options.
 *
 * Loads `<data-dir>/state.json` on construction. Members are declared so
 * that the orchestrator is destroyed first; its monitors may still publish
 * through the hub and the webhook while it shuts down.
 */
class Runtime {
  public:
    explicit Runtime(const Options& opts);
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    /** @brief Write the store back to the state file. */
    void save();

    std::filesystem::path state_file() const { return state_file_; }
    MemoryStore& store() { return store_; }
    ConnectionHub& hub() { return hub_; }
    Orchestrator& orchestrator() { return *orchestrator_; }
    SessionService& service() { return *service_; }
    CloneRelay& relay() { return *relay_; }

  private:
    std::filesystem::path state_file_;
    MemoryStore store_;
    ConnectionHub hub_;
    std::unique_ptr<WebhookNotifier> webhook_;
    std::unique_ptr<Orchestrator> orchestrator_;
    std::unique_ptr<SessionService> service_;
    std::unique_ptr<CloneRelay> relay_;
};

/**
 * @brief Ask a running `run` command to cancel its session.
 *
 * Async-signal-safe; installed as the SIGINT/SIGTERM handler by
 * install_signal_handlers().
 */
void request_interrupt(int signum = 0);
void install_signal_handlers();
/** @brief Clear a pending interrupt request. */
void reset_interrupt();

/**
 * @brief Run `<agent>` on a repository, mirroring its output.
 *
 * The repository is registered on first use. Returns `0` when the session
 * completes and `1` otherwise.
 */
int handle_run(const Options& opts, Runtime& rt, std::ostream& out, std::ostream& err);

/** @brief Clone the URL in `opts.args[0]`, printing progress. */
int handle_clone(const Options& opts, Runtime& rt, std::ostream& out, std::ostream& err);

int handle_add(const Options& opts, Runtime& rt, std::ostream& out);
int handle_scan(const Options& opts, Runtime& rt, std::ostream& out);
int handle_repos(Runtime& rt, std::ostream& out);
int handle_remove_repo(const Options& opts, Runtime& rt, std::ostream& out);
int handle_sessions(Runtime& rt, std::ostream& out);
int handle_output(const Options& opts, Runtime& rt, std::ostream& out);
int handle_delete_session(const Options& opts, Runtime& rt, std::ostream& out);

/**
 * @brief `config` lists the stored settings, `config <key>` prints one and
 *        `config <key> <value>` sets it.
 */
int handle_config(const Options& opts, Runtime& rt, std::ostream& out, std::ostream& err);

/**
 * @brief Dispatch `opts.command`.
 *
 * Rejections from the session layer are printed to @p err with their
 * help steps and yield `1`. Usage errors throw `std::runtime_error`.
 */
int execute(const Options& opts, std::ostream& out, std::ostream& err);

} // namespace cli
