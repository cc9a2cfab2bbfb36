#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <cstddef>
#include <string>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

// GIT_OPT_SET_SERVER_TIMEOUT is an enumerator, not a macro; it exists from 1.7 on.
#if LIBGIT2_VER_MAJOR > 1 || (LIBGIT2_VER_MAJOR == 1 && LIBGIT2_VER_MINOR >= 7)
#define RALPHTOWN_HAVE_SERVER_TIMEOUT 1
#else
#define RALPHTOWN_HAVE_SERVER_TIMEOUT 0
#endif

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * libgit2 reference-counts init/shutdown, so guards may nest. Keep one alive
 * for as long as any function below may run.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
};

/** @brief Network timeout applied to libgit2 operations, `0` to keep the default. */
void set_libgit_timeout(unsigned int seconds);

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;

/** Counter snapshot from an in-flight clone transfer. */
struct CloneProgress {
    size_t received_objects = 0;
    size_t total_objects = 0;
    size_t received_bytes = 0;
    size_t indexed_objects = 0;
    size_t total_deltas = 0;
    size_t indexed_deltas = 0;
};

enum class CloneErrorKind { SSH_AUTH_FAILED, HTTPS_AUTH_FAILED, NETWORK_ERROR, OPERATION_FAILED };

/**
 * @brief Classified clone failure.
 *
 * help_steps is non-empty only for the two authentication kinds.
 */
struct CloneError {
    CloneErrorKind kind = CloneErrorKind::OPERATION_FAILED;
    std::string message;
    std::vector<std::string> help_steps;
};

/**
 * @brief Map a libgit2 error to a CloneError by its error class.
 *
 * SSH errors become SSH_AUTH_FAILED, HTTP errors HTTPS_AUTH_FAILED, NET errors
 * NETWORK_ERROR and everything else OPERATION_FAILED. A null @p err yields
 * an OPERATION_FAILED with a generic message.
 */
CloneError classify_clone_error(const git_error* err);

using ProgressCallback = std::function<void(const CloneProgress&)>;

/** State shared by the remote callbacks of one libgit2 operation. */
struct RemotePayload {
    int credential_attempts = 0;
    const ProgressCallback* on_progress = nullptr;
};

/**
 * @brief libgit2 credential callback.
 *
 * Tries, in order: the ssh-agent, `GIT_USERNAME`/`GIT_PASSWORD` from the
 * environment, then the default credential helper. Gives up after a few
 * attempts so a rejected credential cannot loop forever. @p payload must
 * be null or point to a RemotePayload.
 */
int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload);

/**
 * @brief Clone @p url into @p dest, blocking until done.
 *
 * @p on_progress, if set, is called from libgit2's transfer callback on the
 * calling thread. It must not block.
 *
 * @return `std::nullopt` on success, otherwise the classified failure.
 *         libgit2 must already be initialised.
 */
std::optional<CloneError> clone_repository(const std::string& url, const fs::path& dest,
                                           const ProgressCallback& on_progress = nullptr);

/** @brief `true` if libgit2 can open @p p as a repository. */
bool is_git_repo(const fs::path& p);

/**
 * @brief Retrieve the currently checked out branch name.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Branch name or `std::nullopt` if it cannot be determined.
 */
std::optional<std::string> get_current_branch(const fs::path& repo, std::string* error = nullptr);

struct FoundRepo {
    std::string path;
    std::string name;
};

/**
 * @brief Find repositories below @p root.
 *
 * Descends at most @p max_depth directory levels, skips hidden directories
 * and does not look inside a repository once found.
 */
std::vector<FoundRepo> scan_for_repos(const fs::path& root, size_t max_depth = 2);

} // namespace git

#endif // GIT_UTILS_HPP
