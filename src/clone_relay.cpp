#include "clone_relay.hpp"
#include <exception>
#include <future>
#include <memory>
#include <system_error>
#include "bounded_channel.hpp"
#include "logger.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;

std::string CloneEvent::name() const {
    switch (type) {
    case CloneEventType::PROGRESS:
        return "progress";
    case CloneEventType::COMPLETE:
        return "complete";
    case CloneEventType::ERR:
        return "error";
    }
    return "error";
}

CloneEvent CloneEvent::make_progress(const git::CloneProgress& p) {
    CloneEvent ev;
    ev.type = CloneEventType::PROGRESS;
    ev.progress = p;
    return ev;
}

CloneEvent CloneEvent::make_complete(Repo repo, std::string message) {
    CloneEvent ev;
    ev.type = CloneEventType::COMPLETE;
    ev.repo = std::move(repo);
    ev.message = std::move(message);
    return ev;
}

CloneEvent CloneEvent::make_error(std::string message, std::vector<std::string> help_steps) {
    CloneEvent ev;
    ev.type = CloneEventType::ERR;
    ev.message = std::move(message);
    ev.help_steps = std::move(help_steps);
    return ev;
}

void to_json(nlohmann::json& j, const CloneEvent& event) {
    j = nlohmann::json{{"type", event.name()}};
    switch (event.type) {
    case CloneEventType::PROGRESS:
        j["received_objects"] = event.progress.received_objects;
        j["total_objects"] = event.progress.total_objects;
        j["received_bytes"] = event.progress.received_bytes;
        j["indexed_objects"] = event.progress.indexed_objects;
        j["total_deltas"] = event.progress.total_deltas;
        j["indexed_deltas"] = event.progress.indexed_deltas;
        break;
    case CloneEventType::COMPLETE:
        if (event.repo)
            j["repo"] = *event.repo;
        j["message"] = event.message;
        break;
    case CloneEventType::ERR:
        j["message"] = event.message;
        if (!event.help_steps.empty())
            j["help_steps"] = event.help_steps;
        break;
    }
}

std::string format_sse(const CloneEvent& event) {
    nlohmann::json j = event;
    return "event: " + event.name() + "\ndata: " +
           j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n\n";
}

std::optional<std::string> extract_repo_name(const std::string& url) {
    std::string trimmed = url;
    while (!trimmed.empty() && trimmed.back() == '/')
        trimmed.pop_back();
    const std::string suffix = ".git";
    while (trimmed.size() >= suffix.size() &&
           trimmed.compare(trimmed.size() - suffix.size(), suffix.size(), suffix) == 0)
        trimmed.erase(trimmed.size() - suffix.size());

    auto after_last = [&trimmed](char sep) {
        auto pos = trimmed.rfind(sep);
        return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
    };
    std::string name = after_last('/');
    if (name.empty() || name == trimmed)
        name = after_last(':');
    if (name.empty() || name.find('/') != std::string::npos)
        return std::nullopt;
    return name;
}

fs::path default_clone_root() {
    const std::string home = procutil::home_directory();
    if (home.empty())
        return fs::path();
    return fs::path(home) / "ralphtown";
}

CloneRelay::CloneRelay(Store& store, fs::path clone_root, size_t channel_capacity)
    : store_(store), clone_root_(std::move(clone_root)), capacity_(channel_capacity) {}

std::optional<CloneEvent> CloneRelay::prepare(const std::string& url, Target& target) const {
    auto name = extract_repo_name(url);
    if (!name)
        return CloneEvent::make_error("Could not extract repository name from URL");
    if (clone_root_.empty())
        return CloneEvent::make_error("Could not determine home directory");
    target.name = *name;
    target.dest = clone_root_ / *name;
    std::error_code ec;
    if (fs::exists(target.dest, ec))
        return CloneEvent::make_error("Directory already exists: " + target.dest.string());
    fs::create_directories(target.dest.parent_path(), ec);
    if (ec)
        return CloneEvent::make_error("Failed to create directory: " + ec.message());
    return std::nullopt;
}

CloneEvent CloneRelay::finish(const Target& target, const std::optional<git::CloneError>& error) {
    if (!error) {
        try {
            Repo repo = store_.insert_repo(target.dest.string(), target.name);
            log_info("Repository cloned", {{"repo", repo.id}, {"path", repo.path}});
            return CloneEvent::make_complete(std::move(repo), "Cloned to " + target.dest.string());
        } catch (const std::exception& e) {
            log_error("Failed to save cloned repository",
                      {{"path", target.dest.string()}, {"error", e.what()}});
            return CloneEvent::make_error(std::string("Failed to save repo to database: ") + e.what());
        }
    }
    log_warning("Clone failed", {{"dest", target.dest.string()}, {"error", error->message}});
    switch (error->kind) {
    case git::CloneErrorKind::SSH_AUTH_FAILED:
    case git::CloneErrorKind::HTTPS_AUTH_FAILED:
        return CloneEvent::make_error(error->message, error->help_steps);
    case git::CloneErrorKind::NETWORK_ERROR:
        return CloneEvent::make_error("Network error: " + error->message);
    case git::CloneErrorKind::OPERATION_FAILED:
        break;
    }
    return CloneEvent::make_error("Clone failed: " + error->message);
}

CloneEvent CloneRelay::clone_with_progress(const std::string& url, const EventSink& sink) {
    Target target;
    if (auto rejected = prepare(url, target)) {
        sink(*rejected);
        return *rejected;
    }

    auto channel = std::make_shared<BoundedChannel<git::CloneProgress>>(capacity_);
    std::future<std::optional<git::CloneError>> task;
    try {
        task = std::async(std::launch::async, [channel, url, dest = target.dest]() {
            // The channel closes however the clone ends, releasing the reader.
            struct CloseOnExit {
                BoundedChannel<git::CloneProgress>& ch;
                ~CloseOnExit() { ch.close(); }
            } closer{*channel};
            git::GitInitGuard guard;
            git::ProgressCallback relay = [&channel](const git::CloneProgress& p) {
                channel->try_send(p);
            };
            return git::clone_repository(url, dest, relay);
        });
    } catch (const std::system_error& e) {
        CloneEvent ev = CloneEvent::make_error(std::string("Clone task failed: ") + e.what());
        sink(ev);
        return ev;
    }

    while (auto snapshot = channel->recv())
        sink(CloneEvent::make_progress(*snapshot));
    if (channel->dropped() > 0)
        log_debug("Dropped clone progress updates",
                  {{"url", url}, {"count", std::to_string(channel->dropped())}});

    CloneEvent ev;
    try {
        ev = finish(target, task.get());
    } catch (const std::exception& e) {
        ev = CloneEvent::make_error(std::string("Clone task failed: ") + e.what());
    }
    sink(ev);
    return ev;
}

CloneEvent CloneRelay::clone_repository(const std::string& url) {
    Target target;
    if (auto rejected = prepare(url, target))
        return *rejected;
    std::optional<git::CloneError> error;
    {
        git::GitInitGuard guard;
        error = git::clone_repository(url, target.dest);
    }
    return finish(target, error);
}
