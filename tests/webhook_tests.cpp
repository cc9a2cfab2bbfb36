#include "test_common.hpp"
#include "broadcast.hpp"
#include "webhook_notifier.hpp"
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

using nlohmann::json;
using ralphtown::test_support::eventually;

namespace {
struct Capture {
    std::mutex mtx;
    std::vector<std::string> bodies;
    std::vector<std::string> requests;
};

// Accepts @p count connections, records each request, answers with @p status.
uint16_t start_server(Capture& cap, std::atomic<int>& served, int count, int status = 200) {
    int srv = socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(srv >= 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    REQUIRE(bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    REQUIRE(listen(srv, 4) == 0);
    socklen_t len = sizeof(addr);
    REQUIRE(getsockname(srv, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    uint16_t port = ntohs(addr.sin_port);
    std::thread([srv, &cap, &served, count, status]() {
        for (int i = 0; i < count; ++i) {
            int cli = accept(srv, nullptr, nullptr);
            if (cli < 0)
                break;
            std::string req;
            char buf[2048];
            // Read until the declared body has arrived.
            for (;;) {
                ssize_t n = read(cli, buf, sizeof(buf));
                if (n <= 0)
                    break;
                req.append(buf, static_cast<size_t>(n));
                auto hdr_end = req.find("\r\n\r\n");
                if (hdr_end == std::string::npos)
                    continue;
                auto cl = req.find("Content-Length: ");
                size_t want = cl == std::string::npos
                                  ? 0
                                  : std::stoul(req.substr(cl + 16, req.find("\r\n", cl) - cl - 16));
                if (req.size() >= hdr_end + 4 + want)
                    break;
            }
            {
                std::lock_guard<std::mutex> lk(cap.mtx);
                cap.requests.push_back(req);
                auto pos = req.find("\r\n\r\n");
                cap.bodies.push_back(pos == std::string::npos ? "" : req.substr(pos + 4));
            }
            std::string resp = "HTTP/1.1 " + std::to_string(status) +
                               " X\r\nContent-Length: 2\r\nConnection: close\r\n\r\nOK";
            if (write(cli, resp.c_str(), resp.size()) < 0)
                WARN("webhook test server write failed");
            close(cli);
            ++served;
        }
        close(srv);
    }).detach();
    return port;
}
} // namespace

TEST_CASE("webhook notifier posts session status") {
    Capture cap;
    std::atomic<int> served{0};
    uint16_t port = start_server(cap, served, 1);
    WebhookNotifier notifier("http://127.0.0.1:" + std::to_string(port), std::string("s3cret"));
    REQUIRE(notifier.notify("session-1", SessionStatus::COMPLETED));
    REQUIRE(eventually([&] { return served.load() == 1; }));
    std::lock_guard<std::mutex> lk(cap.mtx);
    auto j = json::parse(cap.bodies.at(0));
    REQUIRE(j["session_id"] == "session-1");
    REQUIRE(j["status"] == "completed");
    REQUIRE(cap.requests.at(0).find("X-Webhook-Secret: s3cret") != std::string::npos);
}

TEST_CASE("webhook notifier reports HTTP errors") {
    Capture cap;
    std::atomic<int> served{0};
    uint16_t port = start_server(cap, served, 1, 500);
    WebhookNotifier notifier("http://127.0.0.1:" + std::to_string(port));
    REQUIRE_FALSE(notifier.notify("session-2", SessionStatus::ERR));
    REQUIRE(eventually([&] { return served.load() == 1; }));
}

TEST_CASE("webhook notifier without URL does nothing") {
    WebhookNotifier notifier("");
    REQUIRE_FALSE(notifier.notify("session-3", SessionStatus::CANCELLED));
}

TEST_CASE("attached notifier forwards only terminal statuses") {
    Capture cap;
    std::atomic<int> served{0};
    uint16_t port = start_server(cap, served, 1);
    WebhookNotifier notifier("http://127.0.0.1:" + std::to_string(port));
    ConnectionHub hub;
    uint64_t id = notifier.attach(hub);
    hub.broadcast("s4", status_message("s4", SessionStatus::RUNNING));
    hub.broadcast("s4", output_message("s4", OutputStream::STDOUT, "line"));
    hub.broadcast("s4", status_message("s4", SessionStatus::CANCELLED));
    REQUIRE(eventually([&] { return served.load() == 1; }));
    REQUIRE(hub.unsubscribe(id));
    std::lock_guard<std::mutex> lk(cap.mtx);
    REQUIRE(cap.bodies.size() == 1);
    auto j = json::parse(cap.bodies[0]);
    REQUIRE(j["session_id"] == "s4");
    REQUIRE(j["status"] == "cancelled");
}
