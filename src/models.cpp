#include "models.hpp"
#include <cstdio>
#include <mutex>
#include <random>
#include <stdexcept>

std::string to_string(SessionStatus status) {
    switch (status) {
    case SessionStatus::IDLE:
        return "idle";
    case SessionStatus::RUNNING:
        return "running";
    case SessionStatus::COMPLETED:
        return "completed";
    case SessionStatus::ERR:
        return "error";
    case SessionStatus::CANCELLED:
        return "cancelled";
    }
    return "idle";
}

std::string to_string(MessageRole role) {
    switch (role) {
    case MessageRole::USER:
        return "user";
    case MessageRole::ASSISTANT:
        return "assistant";
    case MessageRole::SYSTEM:
        return "system";
    }
    return "user";
}

std::string to_string(OutputStream stream) {
    return stream == OutputStream::STDERR ? "stderr" : "stdout";
}

std::optional<SessionStatus> parse_session_status(const std::string& text) {
    if (text == "idle")
        return SessionStatus::IDLE;
    if (text == "running")
        return SessionStatus::RUNNING;
    if (text == "completed")
        return SessionStatus::COMPLETED;
    if (text == "error")
        return SessionStatus::ERR;
    if (text == "cancelled")
        return SessionStatus::CANCELLED;
    return std::nullopt;
}

std::optional<MessageRole> parse_message_role(const std::string& text) {
    if (text == "user")
        return MessageRole::USER;
    if (text == "assistant")
        return MessageRole::ASSISTANT;
    if (text == "system")
        return MessageRole::SYSTEM;
    return std::nullopt;
}

std::optional<OutputStream> parse_output_stream(const std::string& text) {
    if (text == "stdout")
        return OutputStream::STDOUT;
    if (text == "stderr")
        return OutputStream::STDERR;
    return std::nullopt;
}

bool is_terminal(SessionStatus status) {
    return status == SessionStatus::COMPLETED || status == SessionStatus::ERR ||
           status == SessionStatus::CANCELLED;
}

std::string generate_uuid() {
    static std::mutex mtx;
    static std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi;
    uint64_t lo;
    {
        std::lock_guard<std::mutex> lk(mtx);
        hi = rng();
        lo = rng();
    }
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32), static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF), static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

void to_json(nlohmann::json& j, SessionStatus status) { j = to_string(status); }

void from_json(const nlohmann::json& j, SessionStatus& status) {
    auto parsed = parse_session_status(j.get<std::string>());
    if (!parsed)
        throw std::runtime_error("Invalid session status: " + j.get<std::string>());
    status = *parsed;
}

void to_json(nlohmann::json& j, const Repo& repo) {
    j = nlohmann::json{{"id", repo.id},
                       {"path", repo.path},
                       {"name", repo.name},
                       {"created_at", repo.created_at},
                       {"updated_at", repo.updated_at}};
}

void from_json(const nlohmann::json& j, Repo& repo) {
    j.at("id").get_to(repo.id);
    j.at("path").get_to(repo.path);
    j.at("name").get_to(repo.name);
    repo.created_at = j.value("created_at", "");
    repo.updated_at = j.value("updated_at", "");
}

void to_json(nlohmann::json& j, const Session& session) {
    j = nlohmann::json{{"id", session.id},
                       {"repo_id", session.repo_id},
                       {"orchestrator", session.orchestrator},
                       {"status", to_string(session.status)},
                       {"created_at", session.created_at},
                       {"updated_at", session.updated_at}};
    j["name"] = session.name ? nlohmann::json(*session.name) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, Session& session) {
    j.at("id").get_to(session.id);
    j.at("repo_id").get_to(session.repo_id);
    if (j.contains("name") && j["name"].is_string())
        session.name = j["name"].get<std::string>();
    else
        session.name.reset();
    session.orchestrator = j.value("orchestrator", std::string(DEFAULT_ORCHESTRATOR));
    j.at("status").get_to(session.status);
    session.created_at = j.value("created_at", "");
    session.updated_at = j.value("updated_at", "");
}

void to_json(nlohmann::json& j, const Message& message) {
    j = nlohmann::json{{"id", message.id},
                       {"session_id", message.session_id},
                       {"role", to_string(message.role)},
                       {"content", message.content},
                       {"created_at", message.created_at}};
}

void from_json(const nlohmann::json& j, Message& message) {
    j.at("id").get_to(message.id);
    j.at("session_id").get_to(message.session_id);
    auto role = parse_message_role(j.at("role").get<std::string>());
    if (!role)
        throw std::runtime_error("Invalid message role: " + j.at("role").get<std::string>());
    message.role = *role;
    j.at("content").get_to(message.content);
    message.created_at = j.value("created_at", "");
}

void to_json(nlohmann::json& j, const OutputRecord& record) {
    j = nlohmann::json{{"id", record.id},
                       {"session_id", record.session_id},
                       {"stream", to_string(record.stream)},
                       {"content", record.content},
                       {"created_at", record.created_at}};
}

void from_json(const nlohmann::json& j, OutputRecord& record) {
    j.at("id").get_to(record.id);
    j.at("session_id").get_to(record.session_id);
    auto stream = parse_output_stream(j.at("stream").get<std::string>());
    if (!stream)
        throw std::runtime_error("Invalid output stream: " + j.at("stream").get<std::string>());
    record.stream = *stream;
    j.at("content").get_to(record.content);
    record.created_at = j.value("created_at", "");
}
