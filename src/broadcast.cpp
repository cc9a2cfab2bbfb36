#include "broadcast.hpp"
#include <exception>
#include <vector>
#include "logger.hpp"

nlohmann::json status_message(const std::string& session_id, SessionStatus status) {
    return nlohmann::json{{"type", "status"}, {"session_id", session_id}, {"status", to_string(status)}};
}

nlohmann::json output_message(const std::string& session_id, OutputStream stream,
                              const std::string& content) {
    return nlohmann::json{{"type", "output"},
                          {"session_id", session_id},
                          {"stream", to_string(stream)},
                          {"content", content}};
}

uint64_t ConnectionHub::subscribe(const std::string& topic, Callback callback) {
    std::lock_guard<std::mutex> lk(mtx_);
    uint64_t id = next_id_++;
    subscribers_[id] = Subscriber{topic, std::move(callback)};
    return id;
}

bool ConnectionHub::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lk(mtx_);
    return subscribers_.erase(id) > 0;
}

size_t ConnectionHub::subscriber_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return subscribers_.size();
}

void ConnectionHub::broadcast(const std::string& topic, const nlohmann::json& message) {
    // Callbacks are invoked outside the lock so they may (un)subscribe.
    std::vector<Callback> targets;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto& [id, sub] : subscribers_) {
            if (sub.topic == topic || sub.topic == ALL_TOPICS)
                targets.push_back(sub.callback);
        }
    }
    for (const auto& cb : targets) {
        try {
            cb(topic, message);
        } catch (const std::exception& e) {
            log_warning("Subscriber failed", {{"topic", topic}, {"error", e.what()}});
        }
    }
}
