#ifndef MODELS_HPP
#define MODELS_HPP
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class SessionStatus { IDLE, RUNNING, COMPLETED, ERR, CANCELLED };
enum class MessageRole { USER, ASSISTANT, SYSTEM };
enum class OutputStream { STDOUT, STDERR };

std::string to_string(SessionStatus status);
std::string to_string(MessageRole role);
std::string to_string(OutputStream stream);

/** @brief Parse the lowercase wire form of a status (`idle`, `running`, ...). */
std::optional<SessionStatus> parse_session_status(const std::string& text);
std::optional<MessageRole> parse_message_role(const std::string& text);
std::optional<OutputStream> parse_output_stream(const std::string& text);

/** @brief `true` for Completed, Error and Cancelled. */
bool is_terminal(SessionStatus status);

struct Repo {
    std::string id;
    std::string path;
    std::string name;
    std::string created_at;
    std::string updated_at;
};

/// Orchestrator recorded for sessions created before the field existed.
inline const char* const DEFAULT_ORCHESTRATOR = "ralph";

struct Session {
    std::string id;
    std::string repo_id;
    std::optional<std::string> name;
    std::string orchestrator = DEFAULT_ORCHESTRATOR; ///< agent that drives the session
    SessionStatus status = SessionStatus::IDLE;
    std::string created_at;
    std::string updated_at;
};

struct Message {
    std::string id;
    std::string session_id;
    MessageRole role = MessageRole::USER;
    std::string content;
    std::string created_at;
};

/** One line of process output; ids grow monotonically per store. */
struct OutputRecord {
    int64_t id = 0;
    std::string session_id;
    OutputStream stream = OutputStream::STDOUT;
    std::string content;
    std::string created_at;
};

/** @brief Random RFC 4122 version 4 identifier in canonical text form. */
std::string generate_uuid();

void to_json(nlohmann::json& j, SessionStatus status);
void from_json(const nlohmann::json& j, SessionStatus& status);
void to_json(nlohmann::json& j, const Repo& repo);
void from_json(const nlohmann::json& j, Repo& repo);
void to_json(nlohmann::json& j, const Session& session);
void from_json(const nlohmann::json& j, Session& session);
void to_json(nlohmann::json& j, const Message& message);
void from_json(const nlohmann::json& j, Message& message);
void to_json(nlohmann::json& j, const OutputRecord& record);
void from_json(const nlohmann::json& j, OutputRecord& record);

#endif // MODELS_HPP
