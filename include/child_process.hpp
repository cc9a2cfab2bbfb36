#ifndef CHILD_PROCESS_HPP
#define CHILD_PROCESS_HPP
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "system_utils.hpp"
#ifndef _WIN32
#include <sys/types.h>
#endif

namespace procutil {

enum class SpawnErrorKind { NOT_FOUND, FAILED };

struct SpawnError {
    SpawnErrorKind kind = SpawnErrorKind::FAILED;
    std::string message;
};

/** Result of waiting for a child process. */
struct ExitOutcome {
    bool exited = false; ///< Terminated through a normal exit.
    int code = -1;       ///< Exit code when @ref exited is true.
    int signal = 0;      ///< Terminating signal, POSIX only.
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exited && code == 0; }
};

/**
 * @brief One running external command with captured output streams.
 *
 * Standard input is connected to the null device; standard output and
 * standard error are pipes. On POSIX the child leads its own process group
 * so stop requests reach the whole subtree.
 *
 * Each stream may be consumed by a separate thread through read_line().
 * wait() may run concurrently with the stop functions; the process id stays
 * reserved until wait() has reaped the child, so a stop request never hits an
 * unrelated process.
 */
class ChildProcess {
  public:
    enum class Stream { STDOUT, STDERR };

    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * @brief Read the next line from @p stream without its line terminator.
     *
     * A final line lacking a newline is still returned. Returns `false` at
     * end of stream.
     */
    bool read_line(Stream stream, std::string& line);

    /**
     * @brief Block until the process exits.
     *
     * Output read from the pipes but not yet returned by read_line() is
     * included in the outcome. Subsequent calls return the same outcome.
     */
    ExitOutcome wait();

    /** @brief Read both streams to the end, then wait for exit. */
    ExitOutcome wait_with_output();

    /** @brief Ask the process group to terminate (SIGTERM). */
    bool request_graceful_stop();
    /** @brief Kill the process group (SIGKILL or TerminateProcess). */
    bool force_stop();

    /**
     * @brief Make pending and future read_line() calls report end of stream.
     *
     * For pipes kept open by descendants that escaped the process group.
     * Safe to call from any thread, repeatedly.
     */
    void abandon_streams();

    bool reaped() const;
    long pid() const;

  private:
    struct StreamState {
#ifdef _WIN32
        UniqueHandle pipe;
#else
        UniqueFd pipe;
#endif
        std::string buffer;
        bool eof = false;
    };

    ChildProcess() = default;

    StreamState& state(Stream stream) { return stream == Stream::STDOUT ? out_ : err_; }
    long read_some(StreamState& s, char* buf, size_t len);
    ExitOutcome wait_for_exit();
    std::string drain(StreamState& s);

    friend std::unique_ptr<ChildProcess> spawn_process(const std::filesystem::path& working_dir,
                                                       const std::vector<std::string>& args,
                                                       SpawnError* error);

    StreamState out_;
    StreamState err_;
    mutable std::mutex mtx_;
    std::mutex wait_mtx_;
    bool reaped_ = false;
    std::atomic<bool> abandoned_{false};
    std::optional<ExitOutcome> outcome_;
#ifdef _WIN32
    UniqueHandle process_;
    unsigned long pid_ = 0;
#else
    pid_t pid_ = -1;
#endif
};

/**
 * @brief Start @p args[0] with the remaining arguments in @p working_dir.
 *
 * The executable is resolved through `PATH`. On failure `nullptr` is
 * returned and @p error (if given) describes why; a missing executable is
 * reported as SpawnErrorKind::NOT_FOUND.
 */
std::unique_ptr<ChildProcess> spawn_process(const std::filesystem::path& working_dir,
                                            const std::vector<std::string>& args,
                                            SpawnError* error = nullptr);

} // namespace procutil

#endif // CHILD_PROCESS_HPP
