#include "test_common.hpp"
#include <regex>
#include <set>
#include <stdexcept>

TEST_CASE("Session status text forms") {
    for (auto status : {SessionStatus::IDLE, SessionStatus::RUNNING, SessionStatus::COMPLETED,
                        SessionStatus::ERR, SessionStatus::CANCELLED}) {
        auto parsed = parse_session_status(to_string(status));
        REQUIRE(parsed);
        REQUIRE(*parsed == status);
    }
    REQUIRE(to_string(SessionStatus::ERR) == "error");
    REQUIRE_FALSE(parse_session_status("Running"));
    REQUIRE_FALSE(parse_session_status(""));
}

TEST_CASE("Only finished statuses are terminal") {
    REQUIRE_FALSE(is_terminal(SessionStatus::IDLE));
    REQUIRE_FALSE(is_terminal(SessionStatus::RUNNING));
    REQUIRE(is_terminal(SessionStatus::COMPLETED));
    REQUIRE(is_terminal(SessionStatus::ERR));
    REQUIRE(is_terminal(SessionStatus::CANCELLED));
}

TEST_CASE("generate_uuid yields distinct version 4 identifiers") {
    const std::regex v4(R"([0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12})");
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string id = generate_uuid();
        REQUIRE(std::regex_match(id, v4));
        seen.insert(id);
    }
    REQUIRE(seen.size() == 100);
}

TEST_CASE("Session JSON keeps an absent name as null") {
    Session s;
    s.id = "s1";
    s.repo_id = "r1";
    s.status = SessionStatus::CANCELLED;
    s.created_at = "2025-01-01T00:00:00.000Z";
    s.updated_at = s.created_at;
    nlohmann::json j = s;
    REQUIRE(j["status"] == "cancelled");
    REQUIRE(j["name"].is_null());

    Session back = j.get<Session>();
    REQUIRE(back.id == "s1");
    REQUIRE(back.status == SessionStatus::CANCELLED);
    REQUIRE_FALSE(back.name);
}

TEST_CASE("Session JSON defaults a missing orchestrator") {
    Session s;
    s.id = "s1";
    s.repo_id = "r1";
    s.orchestrator = "custom";
    nlohmann::json j = s;
    REQUIRE(j["orchestrator"] == "custom");
    REQUIRE(j.get<Session>().orchestrator == "custom");

    j.erase("orchestrator");
    REQUIRE(j.get<Session>().orchestrator == DEFAULT_ORCHESTRATOR);
}

TEST_CASE("Unknown enum text is rejected when reading JSON") {
    nlohmann::json j = {{"id", "s1"},         {"repo_id", "r1"},   {"name", nullptr},
                        {"status", "paused"}, {"created_at", ""}, {"updated_at", ""}};
    REQUIRE_THROWS_AS(j.get<Session>(), std::runtime_error);
}

TEST_CASE("Output record JSON carries stream tag") {
    OutputRecord rec;
    rec.id = 42;
    rec.session_id = "s1";
    rec.stream = OutputStream::STDERR;
    rec.content = "warning: something";
    nlohmann::json j = rec;
    REQUIRE(j["id"] == 42);
    REQUIRE(j["stream"] == "stderr");
    REQUIRE(j.get<OutputRecord>().content == "warning: something");
}
