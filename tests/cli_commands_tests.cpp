#include "test_common.hpp"
#include "cli_commands.hpp"
#include <sstream>
#include <stdexcept>

using namespace ralphtown::test_support;

namespace {

Options make_options(const fs::path& data_dir, const std::string& command,
                     std::vector<std::string> args = {}) {
    Options opts;
    opts.data_dir = data_dir / "data";
    opts.clone_root = data_dir / "clones";
    opts.command = command;
    opts.args = std::move(args);
    opts.grace_period = std::chrono::milliseconds(300);
    return opts;
}

} // namespace

TEST_CASE("execute rejects missing and unknown commands") {
    TempDir dir("cli_unknown");
    std::ostringstream out, err;
    REQUIRE_THROWS_AS(cli::execute(make_options(dir.path(), ""), out, err), std::runtime_error);
    REQUIRE_THROWS_WITH(cli::execute(make_options(dir.path(), "launch"), out, err),
                        "Unknown command: launch");
    REQUIRE_THROWS_WITH(cli::execute(make_options(dir.path(), "output"), out, err),
                        "output requires a session id");
}

TEST_CASE("execute persists state between invocations") {
    TempDir dir("cli_state");
    std::ostringstream out, err;
    REQUIRE(cli::execute(make_options(dir.path(), "repos"), out, err) == 0);
    REQUIRE(out.str().empty());
    REQUIRE(fs::exists(dir.path() / "data" / "state.json"));

    {
        cli::Runtime rt(make_options(dir.path(), "repos"));
        rt.store().insert_repo("/work/alpha", "alpha");
        rt.save();
    }
    std::ostringstream listed;
    REQUIRE(cli::execute(make_options(dir.path(), "repos"), listed, err) == 0);
    REQUIRE(listed.str().find("\talpha\t/work/alpha\n") != std::string::npos);
}

TEST_CASE("execute prints service rejections with exit code 1") {
    TempDir dir("cli_reject");
    git::GitInitGuard guard;
    std::ostringstream out, err;
    REQUIRE(cli::execute(make_options(dir.path(), "add", {(dir.path() / "nope").string()}), out,
                         err) == 1);
    REQUIRE(err.str().rfind("error: Path does not exist: ", 0) == 0);

    std::ostringstream err2;
    REQUIRE(cli::execute(make_options(dir.path(), "delete-session", {"missing"}), out, err2) == 1);
    REQUIRE(err2.str() == "error: Session not found: missing\n");
}

TEST_CASE("execute config stores settings across invocations") {
    TempDir dir("cli_config");
    std::ostringstream out, err;
    REQUIRE(cli::execute(make_options(dir.path(), "config", {"editor", "vim"}), out, err) == 0);
    REQUIRE(cli::execute(make_options(dir.path(), "config", {"shell", "zsh"}), out, err) == 0);
    REQUIRE(out.str().empty());

    std::ostringstream listed;
    REQUIRE(cli::execute(make_options(dir.path(), "config"), listed, err) == 0);
    REQUIRE(listed.str() == "editor\tvim\nshell\tzsh\n");

    std::ostringstream one;
    REQUIRE(cli::execute(make_options(dir.path(), "config", {"shell"}), one, err) == 0);
    REQUIRE(one.str() == "zsh\n");

    std::ostringstream missing_err;
    REQUIRE(cli::execute(make_options(dir.path(), "config", {"pager"}), out, missing_err) == 1);
    REQUIRE(missing_err.str() == "error: Setting not found: pager\n");

    REQUIRE_THROWS_WITH(
        cli::execute(make_options(dir.path(), "config", {"a", "b", "c"}), out, err),
        "config takes at most a key and a value");
}

TEST_CASE("execute add, scan and remove-repo") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    TempDir dir("cli_add");
    fs::path repo = dir.path() / "src" / "proj";
    REQUIRE(make_git_repo(repo));

    std::ostringstream scanned, err;
    REQUIRE(cli::execute(make_options(dir.path(), "scan", {(dir.path() / "src").string()}),
                         scanned, err) == 0);
    REQUIRE(scanned.str() == "proj\t" + repo.string() + "\n");

    Options add = make_options(dir.path(), "add", {repo.string()});
    add.name = "named";
    std::ostringstream added;
    REQUIRE(cli::execute(add, added, err) == 0);
    const std::string line = added.str();
    const std::string id = line.substr(0, line.find('\t'));
    REQUIRE(line.find("\tnamed\t") != std::string::npos);

    std::ostringstream removed;
    REQUIRE(cli::execute(make_options(dir.path(), "remove-repo", {id}), removed, err) == 0);
    REQUIRE(removed.str() == "removed " + id + "\n");
    std::ostringstream listed;
    REQUIRE(cli::execute(make_options(dir.path(), "repos"), listed, err) == 0);
    REQUIRE(listed.str().empty());
}

#ifndef _WIN32

TEST_CASE("execute run mirrors agent output and records the session") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    TempDir dir("cli_run");
    TempDir bin("cli_run_bin");
    write_script(bin.path(), "ralph", "echo \"working on $4\"\necho note >&2");
    PathPrefix path(bin.path());
    fs::path repo = dir.path() / "proj";
    REQUIRE(make_git_repo(repo));

    std::ostringstream out, err;
    REQUIRE(cli::execute(make_options(dir.path(), "run", {repo.string(), "tidy up"}), out, err) ==
            0);
    const std::string text = out.str();
    REQUIRE(text.rfind("session ", 0) == 0);
    REQUIRE(text.find("working on tidy up\n") != std::string::npos);
    REQUIRE(text.find("[running]\n") != std::string::npos);
    REQUIRE(text.find(" completed\n") != std::string::npos);
    REQUIRE(err.str() == "note\n");

    const std::string session_id = text.substr(8, text.find('\n') - 8);
    std::ostringstream sessions;
    REQUIRE(cli::execute(make_options(dir.path(), "sessions"), sessions, err) == 0);
    REQUIRE(sessions.str().rfind(session_id + "\tcompleted\t", 0) == 0);

    std::ostringstream output;
    REQUIRE(cli::execute(make_options(dir.path(), "output", {session_id}), output, err) == 0);
    REQUIRE(output.str().find("\tstdout\tworking on tidy up\n") != std::string::npos);
    REQUIRE(output.str().find("\tstderr\tnote\n") != std::string::npos);
}

TEST_CASE("execute run returns 1 when the agent fails") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    TempDir dir("cli_run_fail");
    TempDir bin("cli_run_fail_bin");
    write_script(bin.path(), "ralph", "exit 2");
    PathPrefix path(bin.path());
    fs::path repo = dir.path() / "proj";
    REQUIRE(make_git_repo(repo));

    std::ostringstream out, err;
    REQUIRE(cli::execute(make_options(dir.path(), "run", {repo.string(), "x"}), out, err) == 1);
    REQUIRE(out.str().find(" error\n") != std::string::npos);
}

TEST_CASE("An interrupt cancels a running session") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    TempDir dir("cli_interrupt");
    TempDir bin("cli_interrupt_bin");
    write_script(bin.path(), "ralph", "echo started\nsleep 30");
    PathPrefix path(bin.path());
    fs::path repo = dir.path() / "proj";
    REQUIRE(make_git_repo(repo));

    std::ostringstream out, err;
    int rc = -1;
    std::thread interrupter([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        cli::request_interrupt();
    });
    rc = cli::execute(make_options(dir.path(), "run", {repo.string(), "x"}), out, err);
    interrupter.join();
    cli::reset_interrupt();
    REQUIRE(rc == 1);
    REQUIRE(out.str().find(" cancelled\n") != std::string::npos);
}

#endif

TEST_CASE("execute reconciles orphans on request") {
    TempDir dir("cli_orphans");
    std::string stale_id;
    {
        cli::Runtime rt(make_options(dir.path(), "sessions"));
        Repo repo = rt.store().insert_repo("/work/r", "r");
        stale_id = rt.store().insert_session(repo.id, std::nullopt).id;
        rt.store().update_session_status(stale_id, SessionStatus::RUNNING);
        rt.save();
    }
    Options opts = make_options(dir.path(), "sessions");
    opts.reconcile_orphans = true;
    std::ostringstream out, err;
    REQUIRE(cli::execute(opts, out, err) == 0);
    REQUIRE(out.str().find(stale_id + "\terror\t") != std::string::npos);
}
