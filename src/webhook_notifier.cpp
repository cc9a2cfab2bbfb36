#include "webhook_notifier.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "logger.hpp"

namespace {
size_t discard_body(char*, size_t size, size_t nmemb, void*) { return size * nmemb; }
} // namespace

WebhookNotifier::WebhookNotifier(std::string url, std::optional<std::string> secret)
    : url_(std::move(url)), secret_(std::move(secret)) {}

bool WebhookNotifier::notify(const std::string& session_id, SessionStatus status) const {
    if (url_.empty())
        return false;
    CURL* curl = curl_easy_init();
    if (!curl) {
        log_error("curl_easy_init failed");
        return false;
    }
    nlohmann::json j{{"session_id", session_id}, {"status", to_string(status)}};
    std::string payload = j.dump();
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (secret_) {
        std::string hdr = "X-Webhook-Secret: " + *secret_;
        headers = curl_slist_append(headers, hdr.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 5L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_body);
    CURLcode rc = curl_easy_perform(curl);
    long http_code = 0;
    if (rc == CURLE_OK)
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    if (rc != CURLE_OK) {
        log_warning("Webhook delivery failed", {{"url", url_}, {"error", curl_easy_strerror(rc)}});
        return false;
    }
    if (http_code >= 400) {
        log_warning("Webhook rejected",
                    {{"url", url_}, {"http_status", std::to_string(http_code)}});
        return false;
    }
    log_debug("Webhook delivered", {{"session", session_id}, {"status", to_string(status)}});
    return true;
}

uint64_t WebhookNotifier::attach(ConnectionHub& hub) const {
    return hub.subscribe(ConnectionHub::ALL_TOPICS,
                         [this](const std::string&, const nlohmann::json& message) {
                             if (message.value("type", "") != "status")
                                 return;
                             auto status = parse_session_status(message.value("status", ""));
                             if (!status || !is_terminal(*status))
                                 return;
                             if (!notify(message.value("session_id", ""), *status))
                                 log_debug("Terminal status not forwarded",
                                           {{"session", message.value("session_id", "")}});
                         });
}
