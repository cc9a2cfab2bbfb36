#ifndef BROADCAST_HPP
#define BROADCAST_HPP
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "models.hpp"

/** Live fan-out of session events to subscribers. */
class Broadcaster {
  public:
    virtual ~Broadcaster() = default;
    /** @brief Deliver @p message to everyone subscribed to @p topic. */
    virtual void broadcast(const std::string& topic, const nlohmann::json& message) = 0;
};

/** @brief `{"type":"status","session_id":...,"status":...}` */
nlohmann::json status_message(const std::string& session_id, SessionStatus status);
/** @brief `{"type":"output","session_id":...,"stream":...,"content":...}` */
nlohmann::json output_message(const std::string& session_id, OutputStream stream,
                              const std::string& content);

/**
 * @brief In-process Broadcaster keyed by topic.
 *
 * Subscribing to `*` receives every message. Callbacks run on the thread
 * that calls broadcast(); an exception thrown by one subscriber is logged
 * and the remaining subscribers still receive the message.
 */
class ConnectionHub : public Broadcaster {
  public:
    using Callback = std::function<void(const std::string& topic, const nlohmann::json& message)>;

    static constexpr const char* ALL_TOPICS = "*";

    uint64_t subscribe(const std::string& topic, Callback callback);
    bool unsubscribe(uint64_t id);
    size_t subscriber_count() const;

    void broadcast(const std::string& topic, const nlohmann::json& message) override;

  private:
    struct Subscriber {
        std::string topic;
        Callback callback;
    };

    mutable std::mutex mtx_;
    std::map<uint64_t, Subscriber> subscribers_;
    uint64_t next_id_ = 1;
};

#endif // BROADCAST_HPP
