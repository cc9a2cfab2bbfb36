#ifndef WEBHOOK_NOTIFIER_HPP
#define WEBHOOK_NOTIFIER_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "broadcast.hpp"
#include "models.hpp"

class WebhookNotifier {
  public:
    explicit WebhookNotifier(std::string url, std::optional<std::string> secret = std::nullopt);
    /** @brief POST `{session_id, status}` to the configured URL. */
    bool notify(const std::string& session_id, SessionStatus status) const;
    /**
     * @brief Subscribe to @p hub and forward every terminal status message.
     *
     * The notifier must outlive the subscription.
     */
    uint64_t attach(ConnectionHub& hub) const;
    const std::string& url() const { return url_; }

  private:
    std::string url_;
    std::optional<std::string> secret_;
};

#endif // WEBHOOK_NOTIFIER_HPP
