#include "test_common.hpp"
#include "clone_relay.hpp"
#include <fstream>
#include <vector>

using namespace ralphtown::test_support;

TEST_CASE("extract_repo_name handles common URL forms") {
    REQUIRE(extract_repo_name("https://github.com/user/repo.git") == std::optional<std::string>("repo"));
    REQUIRE(extract_repo_name("https://github.com/user/repo") == std::optional<std::string>("repo"));
    REQUIRE(extract_repo_name("https://github.com/user/repo/") == std::optional<std::string>("repo"));
    REQUIRE(extract_repo_name("git@github.com:user/repo.git") == std::optional<std::string>("repo"));
    REQUIRE(extract_repo_name("git@host:repo.git") == std::optional<std::string>("repo"));
    REQUIRE(extract_repo_name("/srv/git/project.git") == std::optional<std::string>("project"));
    REQUIRE_FALSE(extract_repo_name(""));
    REQUIRE_FALSE(extract_repo_name("/"));
    REQUIRE_FALSE(extract_repo_name(":"));
}

TEST_CASE("format_sse frames each event kind") {
    git::CloneProgress p;
    p.received_objects = 3;
    p.total_objects = 10;
    std::string progress = format_sse(CloneEvent::make_progress(p));
    REQUIRE(progress.rfind("event: progress\ndata: {", 0) == 0);
    REQUIRE(progress.find("\"received_objects\":3") != std::string::npos);
    REQUIRE(progress.substr(progress.size() - 2) == "\n\n");

    std::string error = format_sse(CloneEvent::make_error("denied", {"try again"}));
    REQUIRE(error.rfind("event: error\n", 0) == 0);
    REQUIRE(error.find("\"help_steps\":[\"try again\"]") != std::string::npos);

    std::string plain = format_sse(CloneEvent::make_error("boom"));
    REQUIRE(plain.find("help_steps") == std::string::npos);

    Repo repo;
    repo.id = "r1";
    repo.name = "repo";
    std::string complete = format_sse(CloneEvent::make_complete(repo, "Cloned to /x/repo"));
    REQUIRE(complete.rfind("event: complete\n", 0) == 0);
    REQUIRE(complete.find("\"message\":\"Cloned to /x/repo\"") != std::string::npos);
}

TEST_CASE("CloneRelay rejects bad URLs with a single error event") {
    TempDir root("clone_bad");
    MemoryStore store;
    CloneRelay relay(store, root.path());
    std::vector<CloneEvent> events;
    CloneEvent last = relay.clone_with_progress("", [&](const CloneEvent& ev) { events.push_back(ev); });
    REQUIRE(events.size() == 1);
    REQUIRE(last.type == CloneEventType::ERR);
    REQUIRE(last.message == "Could not extract repository name from URL");
    REQUIRE(store.list_repos().empty());
}

TEST_CASE("CloneRelay refuses an existing destination") {
    TempDir root("clone_exists");
    fs::create_directories(root.path() / "repo");
    MemoryStore store;
    CloneRelay relay(store, root.path());
    CloneEvent ev = relay.clone_repository("https://example.invalid/user/repo.git");
    REQUIRE(ev.type == CloneEventType::ERR);
    REQUIRE(ev.message.rfind("Directory already exists: ", 0) == 0);
}

TEST_CASE("CloneRelay without a clone root reports the missing home") {
    MemoryStore store;
    CloneRelay relay(store, fs::path());
    CloneEvent ev = relay.clone_repository("https://example.invalid/user/repo.git");
    REQUIRE(ev.type == CloneEventType::ERR);
    REQUIRE(ev.message == "Could not determine home directory");
}

TEST_CASE("CloneRelay clones a local repository and records it") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    TempDir src("clone_src");
    TempDir root("clone_dst");
    fs::path origin = src.path() / "origin";
    REQUIRE(make_git_repo(origin));

    MemoryStore store;
    CloneRelay relay(store, root.path(), 2);
    std::vector<CloneEvent> events;
    CloneEvent last = relay.clone_with_progress(origin.string(),
                                                [&](const CloneEvent& ev) { events.push_back(ev); });
    INFO(last.message);
    REQUIRE(last.type == CloneEventType::COMPLETE);
    REQUIRE(events.back().type == CloneEventType::COMPLETE);
    size_t terminal = 0;
    for (const auto& ev : events)
        terminal += ev.terminal() ? 1 : 0;
    REQUIRE(terminal == 1);

    fs::path dest = root.path() / "origin";
    REQUIRE(fs::exists(dest / "README.md"));
    REQUIRE(last.repo);
    REQUIRE(last.repo->path == dest.string());
    REQUIRE(store.get_repo_by_path(dest.string()));
    REQUIRE(last.message == "Cloned to " + dest.string());
}

TEST_CASE("CloneRelay drops progress for a slow consumer and still completes once") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    TempDir src("clone_slow_src");
    TempDir root("clone_slow_dst");
    fs::path origin = src.path() / "origin";
    fs::create_directories(origin / "data");
    for (int i = 0; i < 400; ++i)
        std::ofstream(origin / "data" / ("file" + std::to_string(i) + ".txt"))
            << "content of file " << i << "\n";
    REQUIRE(make_git_repo(origin));

    MemoryStore store;
    CloneRelay relay(store, root.path(), 1);
    std::vector<CloneEvent> events;
    CloneEvent last = relay.clone_with_progress(origin.string(), [&](const CloneEvent& ev) {
        events.push_back(ev);
        if (ev.type == CloneEventType::PROGRESS)
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
    });
    INFO(last.message);
    REQUIRE(last.type == CloneEventType::COMPLETE);
    REQUIRE_FALSE(events.empty());
    REQUIRE(events.back().type == CloneEventType::COMPLETE);
    size_t terminal = 0;
    for (const auto& ev : events)
        terminal += ev.terminal() ? 1 : 0;
    REQUIRE(terminal == 1);
    REQUIRE(fs::exists(root.path() / "origin" / "data" / "file399.txt"));
    REQUIRE(store.list_repos().size() == 1);
}

TEST_CASE("CloneRelay reports a failed clone") {
    TempDir root("clone_fail");
    MemoryStore store;
    CloneRelay relay(store, root.path());
    std::vector<CloneEvent> events;
    CloneEvent last = relay.clone_with_progress(
        (root.path() / "nowhere" / "missing.git").string(),
        [&](const CloneEvent& ev) { events.push_back(ev); });
    REQUIRE(last.type == CloneEventType::ERR);
    REQUIRE(events.size() == 1);
    REQUIRE(store.list_repos().empty());
}
