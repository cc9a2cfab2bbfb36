#ifndef CLONE_RELAY_HPP
#define CLONE_RELAY_HPP
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "git_utils.hpp"
#include "models.hpp"
#include "store.hpp"

enum class CloneEventType { PROGRESS, COMPLETE, ERR };

/**
 * One event of a clone stream. A stream is zero or more PROGRESS events
 * followed by exactly one COMPLETE or ERR.
 */
struct CloneEvent {
    CloneEventType type = CloneEventType::ERR;
    git::CloneProgress progress;         ///< PROGRESS
    std::optional<Repo> repo;            ///< COMPLETE
    std::string message;                 ///< COMPLETE and ERR
    std::vector<std::string> help_steps; ///< ERR, authentication failures only

    /** @brief `progress`, `complete` or `error`. */
    std::string name() const;
    bool terminal() const { return type != CloneEventType::PROGRESS; }

    static CloneEvent make_progress(const git::CloneProgress& p);
    static CloneEvent make_complete(Repo repo, std::string message);
    static CloneEvent make_error(std::string message, std::vector<std::string> help_steps = {});
};

void to_json(nlohmann::json& j, const CloneEvent& event);

/** @brief Frame @p event for an event stream: `event: <name>\ndata: <json>\n\n`. */
std::string format_sse(const CloneEvent& event);

/**
 * @brief Derive the directory name for a clone from its URL.
 *
 * A trailing `/` and then a trailing `.git` are stripped. The name is the
 * segment after the last `/`, or after the last `:` for scp-style URLs.
 * Returns `std::nullopt` when no usable name remains.
 */
std::optional<std::string> extract_repo_name(const std::string& url);

/** @brief `<home>/ralphtown`, or an empty path when the home directory is unknown. */
std::filesystem::path default_clone_root();

/**
 * @brief Runs clones and records the resulting repositories.
 *
 * clone_with_progress() performs the blocking libgit2 clone on a background
 * thread. Progress snapshots cross to the calling thread through a bounded
 * channel; when it is full, snapshots are dropped rather than slowing the
 * transfer.
 */
class CloneRelay {
  public:
    using EventSink = std::function<void(const CloneEvent&)>;

    static constexpr size_t DEFAULT_CHANNEL_CAPACITY = 32;

    CloneRelay(Store& store, std::filesystem::path clone_root,
               size_t channel_capacity = DEFAULT_CHANNEL_CAPACITY);

    /**
     * @brief Clone @p url, passing every event to @p sink on this thread.
     *
     * Blocks until the clone has finished. @return the terminal event, which
     * has also been passed to @p sink.
     */
    CloneEvent clone_with_progress(const std::string& url, const EventSink& sink);

    /** @brief Clone without progress reporting. @return the terminal event. */
    CloneEvent clone_repository(const std::string& url);

    const std::filesystem::path& clone_root() const { return clone_root_; }

  private:
    struct Target {
        std::string name;
        std::filesystem::path dest;
    };

    std::optional<CloneEvent> prepare(const std::string& url, Target& target) const;
    CloneEvent finish(const Target& target, const std::optional<git::CloneError>& error);

    Store& store_;
    std::filesystem::path clone_root_;
    size_t capacity_;
};

#endif // CLONE_RELAY_HPP
