#include "test_common.hpp"
#include "orchestrator.hpp"
#include "system_utils.hpp"
#include "thread_utils.hpp"
#include <algorithm>
#include <atomic>
#include <csignal>
#include <mutex>
#include <vector>

using namespace ralphtown::test_support;

namespace {

/** Records every broadcast for later inspection. */
class RecordingBroadcaster : public Broadcaster {
  public:
    void broadcast(const std::string& topic, const nlohmann::json& message) override {
        std::lock_guard<std::mutex> lk(mtx_);
        messages_.emplace_back(topic, message);
    }

    std::vector<std::string> statuses(const std::string& session_id) const {
        std::lock_guard<std::mutex> lk(mtx_);
        std::vector<std::string> out;
        for (const auto& [topic, msg] : messages_)
            if (topic == session_id && msg["type"] == "status")
                out.push_back(msg["status"].get<std::string>());
        return out;
    }

    size_t output_count(const std::string& session_id) const {
        std::lock_guard<std::mutex> lk(mtx_);
        return static_cast<size_t>(
            std::count_if(messages_.begin(), messages_.end(), [&](const auto& entry) {
                return entry.first == session_id && entry.second["type"] == "output";
            }));
    }

  private:
    mutable std::mutex mtx_;
    std::vector<std::pair<std::string, nlohmann::json>> messages_;
};

/** Stalls the `running` status broadcast so run() is slow to finish. */
class SlowStatusBroadcaster : public RecordingBroadcaster {
  public:
    void broadcast(const std::string& topic, const nlohmann::json& message) override {
        RecordingBroadcaster::broadcast(topic, message);
        if (message["type"] == "status" && message["status"] == "running") {
            stalled = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
    }

    std::atomic<bool> stalled{false};
};

struct Fixture {
    TempDir bin{"orch_bin"};
    TempDir work{"orch_work"};
    MemoryStore store;
    RecordingBroadcaster events;
    Repo repo;

    Fixture() { repo = store.insert_repo(work.path().string(), "work"); }

    OrchestratorConfig config(std::chrono::milliseconds grace = std::chrono::milliseconds(500)) {
        OrchestratorConfig cfg;
        cfg.agent = "ralph";
        cfg.grace_period = grace;
        return cfg;
    }

    Session new_session() { return store.insert_session(repo.id, std::nullopt); }

    SessionStatus status_of(const std::string& id) { return store.get_session(id)->status; }
};

} // namespace

#ifndef _WIN32

TEST_CASE("Orchestrator records output and completion") {
    Fixture fx;
    write_script(fx.bin.path(), "ralph",
                 "[ \"$1 $2 $3\" = 'run --autonomous --prompt' ] || exit 9\n"
                 "echo \"prompt: $4\"\necho warn >&2\nexit 0");
    PathPrefix path(fx.bin.path());
    Orchestrator orch(fx.store, fx.events, fx.config());
    Session s = fx.new_session();

    REQUIRE_FALSE(orch.run(s.id, fx.repo.id, fx.work.path(), "fix the bug"));
    REQUIRE(orch.wait_for_session(s.id, std::chrono::seconds(10)));

    REQUIRE(fx.status_of(s.id) == SessionStatus::COMPLETED);
    auto logs = fx.store.list_output_logs(s.id, 0, 0);
    REQUIRE(logs.size() == 2);
    auto out_it = std::find_if(logs.begin(), logs.end(),
                               [](const OutputRecord& r) { return r.stream == OutputStream::STDOUT; });
    REQUIRE(out_it != logs.end());
    REQUIRE(out_it->content == "prompt: fix the bug");
    REQUIRE(fx.events.statuses(s.id) == std::vector<std::string>{"running", "completed"});
    REQUIRE(fx.events.output_count(s.id) == 2);
    REQUIRE_FALSE(orch.is_repo_busy(fx.repo.id));
    REQUIRE(orch.active_sessions().empty());
}

TEST_CASE("Orchestrator marks a failing agent as error") {
    Fixture fx;
    write_script(fx.bin.path(), "ralph", "echo failing >&2\nexit 1");
    PathPrefix path(fx.bin.path());
    Orchestrator orch(fx.store, fx.events, fx.config());
    Session s = fx.new_session();
    REQUIRE_FALSE(orch.run(s.id, fx.repo.id, fx.work.path(), "p"));
    REQUIRE(orch.wait_for_session(s.id, std::chrono::seconds(10)));
    REQUIRE(fx.status_of(s.id) == SessionStatus::ERR);
    REQUIRE(fx.events.statuses(s.id).back() == "error");
}

TEST_CASE("Orchestrator keeps every line in order") {
    Fixture fx;
    write_script(fx.bin.path(), "ralph",
                 "i=1\nwhile [ $i -le 300 ]; do echo \"out $i\"; echo \"err $i\" >&2; "
                 "i=$((i+1)); done");
    PathPrefix path(fx.bin.path());
    Orchestrator orch(fx.store, fx.events, fx.config());
    Session s = fx.new_session();
    REQUIRE_FALSE(orch.run(s.id, fx.repo.id, fx.work.path(), "p"));
    REQUIRE(orch.wait_for_session(s.id, std::chrono::seconds(20)));

    std::vector<std::string> out;
    std::vector<std::string> err;
    for (const auto& rec : fx.store.list_output_logs(s.id, 0, 0))
        (rec.stream == OutputStream::STDOUT ? out : err).push_back(rec.content);
    REQUIRE(out.size() == 300);
    REQUIRE(err.size() == 300);
    for (int i = 0; i < 300; ++i) {
        REQUIRE(out[i] == "out " + std::to_string(i + 1));
        REQUIRE(err[i] == "err " + std::to_string(i + 1));
    }
}

TEST_CASE("Orchestrator allows one process per session and per repository") {
    Fixture fx;
    write_script(fx.bin.path(), "ralph", "sleep 30");
    PathPrefix path(fx.bin.path());
    Orchestrator orch(fx.store, fx.events, fx.config());
    Session first = fx.new_session();
    Session second = fx.new_session();

    REQUIRE_FALSE(orch.run(first.id, fx.repo.id, fx.work.path(), "p"));
    REQUIRE(orch.is_repo_busy(fx.repo.id));
    REQUIRE(orch.is_session_running(first.id));
    REQUIRE(orch.active_session_for_repo(fx.repo.id) == std::optional<std::string>(first.id));

    auto again = orch.run(first.id, fx.repo.id, fx.work.path(), "p");
    REQUIRE(again);
    REQUIRE(again->kind == ProcessErrorKind::SESSION_ALREADY_RUNNING);

    auto busy = orch.run(second.id, fx.repo.id, fx.work.path(), "p");
    REQUIRE(busy);
    REQUIRE(busy->kind == ProcessErrorKind::REPO_BUSY);
    REQUIRE(fx.status_of(second.id) == SessionStatus::IDLE);

    REQUIRE_FALSE(orch.cancel(first.id));
    REQUIRE(orch.wait_for_session(first.id, std::chrono::seconds(10)));
    REQUIRE(fx.status_of(first.id) == SessionStatus::CANCELLED);
    REQUIRE_FALSE(orch.is_repo_busy(fx.repo.id));
}

TEST_CASE("Orchestrator cancel escalates after the grace period") {
    Fixture fx;
    write_script(fx.bin.path(), "ralph",
                 "trap '' TERM\necho started\nwhile :; do sleep 1; done");
    PathPrefix path(fx.bin.path());
    Orchestrator orch(fx.store, fx.events, fx.config(std::chrono::milliseconds(300)));
    Session s = fx.new_session();
    REQUIRE_FALSE(orch.run(s.id, fx.repo.id, fx.work.path(), "p"));
    REQUIRE(eventually([&] { return fx.store.list_output_logs(s.id, 0, 0).size() == 1; }));

    auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(orch.cancel(s.id));
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    REQUIRE(orch.wait_for_session(s.id, std::chrono::seconds(10)));
    REQUIRE(fx.status_of(s.id) == SessionStatus::CANCELLED);
    REQUIRE(fx.events.statuses(s.id).back() == "cancelled");
}

TEST_CASE("Orchestrator rejects cancel without a running process") {
    Fixture fx;
    write_script(fx.bin.path(), "ralph", "exit 0");
    PathPrefix path(fx.bin.path());
    Orchestrator orch(fx.store, fx.events, fx.config());

    Session idle = fx.new_session();
    auto err = orch.cancel(idle.id);
    REQUIRE(err);
    REQUIRE(err->kind == ProcessErrorKind::NOT_RUNNING);

    Session done = fx.new_session();
    REQUIRE_FALSE(orch.run(done.id, fx.repo.id, fx.work.path(), "p"));
    REQUIRE(orch.wait_for_session(done.id, std::chrono::seconds(10)));
    err = orch.cancel(done.id);
    REQUIRE(err);
    REQUIRE(err->kind == ProcessErrorKind::NOT_RUNNING);
    REQUIRE(fx.status_of(done.id) == SessionStatus::COMPLETED);
}

TEST_CASE("Orchestrator rejects cancel for a session that ended in error") {
    Fixture fx;
    write_script(fx.bin.path(), "ralph", "exit 1");
    PathPrefix path(fx.bin.path());
    Orchestrator orch(fx.store, fx.events, fx.config());
    Session s = fx.new_session();
    REQUIRE_FALSE(orch.run(s.id, fx.repo.id, fx.work.path(), "p"));
    REQUIRE(orch.wait_for_session(s.id, std::chrono::seconds(10)));
    REQUIRE(fx.status_of(s.id) == SessionStatus::ERR);

    auto err = orch.cancel(s.id);
    REQUIRE(err);
    REQUIRE(err->kind == ProcessErrorKind::NOT_RUNNING);
    REQUIRE(fx.status_of(s.id) == SessionStatus::ERR);
    REQUIRE(fx.events.statuses(s.id) == std::vector<std::string>{"running", "error"});
}

TEST_CASE("Orchestrator rejects a second cancel") {
    Fixture fx;
    write_script(fx.bin.path(), "ralph", "sleep 30");
    PathPrefix path(fx.bin.path());
    Orchestrator orch(fx.store, fx.events, fx.config());
    Session s = fx.new_session();
    REQUIRE_FALSE(orch.run(s.id, fx.repo.id, fx.work.path(), "p"));
    REQUIRE_FALSE(orch.cancel(s.id));
    REQUIRE(orch.wait_for_session(s.id, std::chrono::seconds(10)));

    auto err = orch.cancel(s.id);
    REQUIRE(err);
    REQUIRE(err->kind == ProcessErrorKind::NOT_RUNNING);
    REQUIRE(fx.status_of(s.id) == SessionStatus::CANCELLED);
    REQUIRE(fx.events.statuses(s.id) == std::vector<std::string>{"running", "cancelled"});
}

TEST_CASE("Orchestrator cancels a session whose start is still being announced") {
    Fixture fx;
    write_script(fx.bin.path(), "ralph", "sleep 30");
    PathPrefix path(fx.bin.path());
    SlowStatusBroadcaster events;
    Orchestrator orch(fx.store, events, fx.config());
    Session s = fx.new_session();

    std::optional<ProcessError> run_err;
    ThreadGuard starter(
        std::thread([&] { run_err = orch.run(s.id, fx.repo.id, fx.work.path(), "p"); }));
    REQUIRE(eventually([&] { return events.stalled.load(); }));
    REQUIRE(orch.is_session_running(s.id));
    REQUIRE(fx.status_of(s.id) == SessionStatus::RUNNING);

    auto err = orch.cancel(s.id);
    starter.join();
    REQUIRE_FALSE(run_err);
    REQUIRE_FALSE(err);
    REQUIRE(orch.wait_for_session(s.id, std::chrono::seconds(10)));
    REQUIRE(fx.status_of(s.id) == SessionStatus::CANCELLED);
    REQUIRE(events.statuses(s.id) == std::vector<std::string>{"running", "cancelled"});
}

TEST_CASE("Orchestrator reports a missing agent with help steps") {
    Fixture fx;
    Orchestrator orch(fx.store, fx.events, [] {
        OrchestratorConfig cfg;
        cfg.agent = "ralphtown-missing-agent";
        return cfg;
    }());
    Session s = fx.new_session();
    auto err = orch.run(s.id, fx.repo.id, fx.work.path(), "p");
    REQUIRE(err);
    REQUIRE(err->kind == ProcessErrorKind::NOT_FOUND);
    REQUIRE(err->message == "ralphtown-missing-agent CLI not found in PATH");
    REQUIRE(err->help_steps.size() == 4);
    REQUIRE(fx.status_of(s.id) == SessionStatus::IDLE);
    REQUIRE_FALSE(orch.is_repo_busy(fx.repo.id));
    REQUIRE(fx.events.statuses(s.id).empty());
}

TEST_CASE("Orchestrator reports a missing working directory as a spawn failure") {
    Fixture fx;
    write_script(fx.bin.path(), "ralph", "exit 0");
    PathPrefix path(fx.bin.path());
    Orchestrator orch(fx.store, fx.events, fx.config());
    Session s = fx.new_session();
    auto err = orch.run(s.id, fx.repo.id, fx.work.path() / "missing", "p");
    REQUIRE(err);
    REQUIRE(err->kind == ProcessErrorKind::SPAWN_FAILED);
    REQUIRE(err->message.rfind("Failed to spawn ralph process: ", 0) == 0);
    REQUIRE_FALSE(orch.is_repo_busy(fx.repo.id));
}

TEST_CASE("Destroying the orchestrator stops running agents") {
    Fixture fx;
    write_script(fx.bin.path(), "ralph", "sleep 30");
    PathPrefix path(fx.bin.path());
    Session s = fx.new_session();
    auto start = std::chrono::steady_clock::now();
    {
        Orchestrator orch(fx.store, fx.events, fx.config());
        REQUIRE_FALSE(orch.run(s.id, fx.repo.id, fx.work.path(), "p"));
    }
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
    REQUIRE(fx.status_of(s.id) == SessionStatus::ERR);
}

TEST_CASE("Destroying the orchestrator gives up on output held by an escaped descendant") {
    if (procutil::find_executable("setsid").empty()) {
        WARN("setsid not available, skipping");
        return;
    }
    Fixture fx;
    const fs::path pid_file = fx.work.path() / "escaped.pid";
    write_script(fx.bin.path(), "ralph",
                 "setsid sleep 30 &\necho $! > '" + pid_file.string() + "'\necho started\nexit 0");
    PathPrefix path(fx.bin.path());
    Session s = fx.new_session();
    OrchestratorConfig cfg = fx.config();
    cfg.shutdown_timeout = std::chrono::milliseconds(300);
    std::optional<Orchestrator> orch;
    orch.emplace(fx.store, fx.events, cfg);
    REQUIRE_FALSE(orch->run(s.id, fx.repo.id, fx.work.path(), "p"));
    REQUIRE(eventually([&] { return fx.store.list_output_logs(s.id, 0, 0).size() == 1; }));
    auto start = std::chrono::steady_clock::now();
    orch.reset();
    auto elapsed = std::chrono::steady_clock::now() - start;

    long escaped = 0;
    std::ifstream(pid_file) >> escaped;
    if (escaped > 0)
        kill(static_cast<pid_t>(escaped), SIGKILL);
    REQUIRE(elapsed < std::chrono::seconds(5));
    REQUIRE(fx.status_of(s.id) == SessionStatus::COMPLETED);
}

#endif

TEST_CASE("ProcessErrorKind names") {
    REQUIRE(to_string(ProcessErrorKind::REPO_BUSY) == "repo_busy");
    REQUIRE(to_string(ProcessErrorKind::NOT_RUNNING) == "not_running");
}
