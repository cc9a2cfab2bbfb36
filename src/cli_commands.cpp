#include <chrono>
#include <csignal>
#include <filesystem>
#include <mutex>
#include <set>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "cli_commands.hpp"
#include "logger.hpp"
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace cli {

namespace {
volatile std::sig_atomic_t g_interrupted = 0;

constexpr std::chrono::milliseconds POLL_INTERVAL{200};

const std::string& require_arg(const Options& opts, size_t index, const char* what) {
    if (opts.args.size() <= index)
        throw std::runtime_error(opts.command + " requires " + what);
    return opts.args[index];
}

void print_rejection(const ServiceError& e, std::ostream& err) {
    err << "error: " << e.what() << "\n";
    for (const auto& step : e.help_steps())
        err << "  - " << step << "\n";
}
} // namespace

void request_interrupt(int) { g_interrupted = 1; }

void reset_interrupt() { g_interrupted = 0; }

void install_signal_handlers() {
    std::signal(SIGINT, request_interrupt);
#ifndef _WIN32
    std::signal(SIGTERM, request_interrupt);
#endif
}

Runtime::Runtime(const Options& opts) {
    if (!opts.data_dir.empty())
        state_file_ = opts.data_dir / "state.json";
    if (!state_file_.empty())
        store_.load_file(state_file_);
    if (!opts.webhook_url.empty()) {
        webhook_ = std::make_unique<WebhookNotifier>(opts.webhook_url, opts.webhook_secret);
        webhook_->attach(hub_);
    }
    OrchestratorConfig cfg;
    cfg.agent = opts.agent;
    cfg.grace_period = opts.grace_period;
    orchestrator_ = std::make_unique<Orchestrator>(store_, hub_, cfg);
    service_ = std::make_unique<SessionService>(store_, *orchestrator_);
    relay_ = std::make_unique<CloneRelay>(store_, opts.clone_root);
}

void Runtime::save() {
    if (state_file_.empty())
        return;
    std::error_code ec;
    fs::create_directories(state_file_.parent_path(), ec);
    if (ec)
        throw StoreError("Failed to create " + state_file_.parent_path().string() + ": " +
                         ec.message());
    store_.save_file(state_file_);
}

int handle_run(const Options& opts, Runtime& rt, std::ostream& out, std::ostream& err) {
    const std::string& repo_path = require_arg(opts, 0, "a repository path");
    const std::string& prompt = require_arg(opts, 1, "a prompt");

    Repo repo = rt.service().ensure_repo(repo_path);
    Session session = rt.service().create_session(repo.id, opts.name);
    out << "session " << session.id << "\n";

    std::mutex out_mtx;
    uint64_t sub = rt.hub().subscribe(
        session.id, [&](const std::string&, const nlohmann::json& message) {
            std::lock_guard<std::mutex> lk(out_mtx);
            const std::string type = message.value("type", "");
            if (type == "output") {
                std::ostream& dest = message.value("stream", "") == "stderr" ? err : out;
                dest << message.value("content", "") << "\n";
            } else if (type == "status") {
                out << "[" << message.value("status", "") << "]\n";
            }
        });

    reset_interrupt();
    const auto started = std::chrono::steady_clock::now();
    try {
        rt.service().run_session(session.id, prompt);
    } catch (const ServiceError&) {
        rt.hub().unsubscribe(sub);
        throw;
    }

    bool cancel_sent = false;
    while (!rt.orchestrator().wait_for_session(session.id, POLL_INTERVAL)) {
        if (!g_interrupted || cancel_sent)
            continue;
        cancel_sent = true;
        log_info("Interrupt received, cancelling session", {{"session", session.id}});
        try {
            rt.service().cancel_session(session.id);
        } catch (const ServiceError& e) {
            // The process may have exited between the poll and the cancel.
            log_debug("Cancel not applied", {{"session", session.id}, {"error", e.what()}});
        }
    }
    rt.hub().unsubscribe(sub);
    out.flush();
    err.flush();

    auto final_state = rt.store().get_session(session.id);
    SessionStatus status = final_state ? final_state->status : SessionStatus::ERR;
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started);
    log_info("Session finished", {{"session", session.id},
                                  {"status", to_string(status)},
                                  {"elapsed", format_duration_short(elapsed)}});
    out << "session " << session.id << " " << to_string(status) << "\n";
    return status == SessionStatus::COMPLETED ? 0 : 1;
}

int handle_clone(const Options& opts, Runtime& rt, std::ostream& out, std::ostream& err) {
    const std::string& url = require_arg(opts, 0, "a repository URL");
    CloneEvent last = rt.relay().clone_with_progress(url, [&](const CloneEvent& ev) {
        switch (ev.type) {
        case CloneEventType::PROGRESS:
            out << "objects " << ev.progress.received_objects << "/" << ev.progress.total_objects
                << ", deltas " << ev.progress.indexed_deltas << "/" << ev.progress.total_deltas
                << ", " << ev.progress.received_bytes << " bytes\n";
            break;
        case CloneEventType::COMPLETE:
            out << ev.message << "\n";
            if (ev.repo)
                out << ev.repo->id << "\t" << ev.repo->name << "\t" << ev.repo->path << "\n";
            break;
        case CloneEventType::ERR:
            err << "error: " << ev.message << "\n";
            for (const auto& step : ev.help_steps)
                err << "  - " << step << "\n";
            break;
        }
    });
    return last.type == CloneEventType::COMPLETE ? 0 : 1;
}

int handle_add(const Options& opts, Runtime& rt, std::ostream& out) {
    Repo repo = rt.service().add_repo(require_arg(opts, 0, "a repository path"), opts.name);
    out << repo.id << "\t" << repo.name << "\t" << repo.path << "\n";
    return 0;
}

int handle_scan(const Options& opts, Runtime& rt, std::ostream& out) {
    require_arg(opts, 0, "at least one directory");
    std::vector<fs::path> roots(opts.args.begin(), opts.args.end());
    for (const auto& found : rt.service().scan(roots, opts.scan_depth))
        out << found.name << "\t" << found.path << "\n";
    return 0;
}

int handle_repos(Runtime& rt, std::ostream& out) {
    for (const auto& repo : rt.service().list_repos())
        out << repo.id << "\t" << repo.name << "\t" << repo.path << "\n";
    return 0;
}

int handle_remove_repo(const Options& opts, Runtime& rt, std::ostream& out) {
    const std::string& id = require_arg(opts, 0, "a repository id");
    rt.service().delete_repo(id);
    out << "removed " << id << "\n";
    return 0;
}

int handle_sessions(Runtime& rt, std::ostream& out) {
    for (const auto& s : rt.service().list_sessions())
        out << s.id << "\t" << to_string(s.status) << "\t" << s.repo_id << "\t"
            << s.name.value_or("-") << "\t" << s.updated_at << "\n";
    return 0;
}

int handle_output(const Options& opts, Runtime& rt, std::ostream& out) {
    const std::string& id = require_arg(opts, 0, "a session id");
    for (const auto& rec : rt.service().session_output(id, opts.after_id, opts.limit))
        out << rec.id << "\t" << to_string(rec.stream) << "\t" << rec.content << "\n";
    return 0;
}

int handle_delete_session(const Options& opts, Runtime& rt, std::ostream& out) {
    const std::string& id = require_arg(opts, 0, "a session id");
    rt.service().delete_session(id);
    out << "deleted " << id << "\n";
    return 0;
}

int handle_config(const Options& opts, Runtime& rt, std::ostream& out, std::ostream& err) {
    if (opts.args.empty()) {
        for (const auto& [key, value] : rt.store().list_config())
            out << key << "\t" << value << "\n";
        return 0;
    }
    const std::string& key = opts.args[0];
    if (opts.args.size() == 1) {
        auto value = rt.store().get_config(key);
        if (!value) {
            err << "error: Setting not found: " << key << "\n";
            return 1;
        }
        out << *value << "\n";
        return 0;
    }
    if (opts.args.size() > 2)
        throw std::runtime_error("config takes at most a key and a value");
    rt.store().set_config(key, opts.args[1]);
    log_debug("Setting updated", {{"key", key}});
    return 0;
}

int execute(const Options& opts, std::ostream& out, std::ostream& err) {
    static const std::set<std::string> commands{"run",      "clone",  "add",
                                                "scan",     "repos",  "remove-repo",
                                                "sessions", "output", "delete-session",
                                                "config"};
    if (opts.command.empty())
        throw std::runtime_error("No command given; see --help");
    if (!commands.count(opts.command))
        throw std::runtime_error("Unknown command: " + opts.command);

    Runtime rt(opts);
    if (opts.reconcile_orphans) {
        size_t fixed = rt.service().reconcile_orphans();
        if (fixed > 0)
            log_info("Reconciled orphaned sessions", {{"count", std::to_string(fixed)}});
    }

    int rc = 1;
    try {
        if (opts.command == "run")
            rc = handle_run(opts, rt, out, err);
        else if (opts.command == "clone")
            rc = handle_clone(opts, rt, out, err);
        else if (opts.command == "add")
            rc = handle_add(opts, rt, out);
        else if (opts.command == "scan")
            rc = handle_scan(opts, rt, out);
        else if (opts.command == "repos")
            rc = handle_repos(rt, out);
        else if (opts.command == "remove-repo")
            rc = handle_remove_repo(opts, rt, out);
        else if (opts.command == "sessions")
            rc = handle_sessions(rt, out);
        else if (opts.command == "output")
            rc = handle_output(opts, rt, out);
        else if (opts.command == "config")
            rc = handle_config(opts, rt, out, err);
        else
            rc = handle_delete_session(opts, rt, out);
    } catch (const ServiceError& e) {
        print_rejection(e, err);
        rc = 1;
    }
    rt.save();
    return rc;
}

} // namespace cli
