#ifndef _WIN32
#include "child_process.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include "logger.hpp"

namespace fs = std::filesystem;

namespace procutil {

namespace {

void report_errno_and_exit(int fd) {
    int err = errno;
    ssize_t rc = write(fd, &err, sizeof(err));
    (void)rc; // nothing left to do in the child if the parent is gone
    _exit(127);
}

void fill_error(SpawnError* error, SpawnErrorKind kind, const std::string& message) {
    if (error) {
        error->kind = kind;
        error->message = message;
    }
}

} // namespace

std::unique_ptr<ChildProcess> spawn_process(const fs::path& working_dir,
                                            const std::vector<std::string>& args,
                                            SpawnError* error) {
    if (args.empty()) {
        fill_error(error, SpawnErrorKind::FAILED, "No command given");
        return nullptr;
    }
    std::error_code ec;
    if (!fs::is_directory(working_dir, ec)) {
        fill_error(error, SpawnErrorKind::FAILED,
                   "Working directory does not exist: " + working_dir.string());
        return nullptr;
    }
    const std::string exe = find_executable(args[0]);
    if (exe.empty()) {
        fill_error(error, SpawnErrorKind::NOT_FOUND, args[0] + " not found in PATH");
        return nullptr;
    }

    UniqueFd out_r, out_w, err_r, err_w, exec_r, exec_w;
    if (!make_pipe(out_r, out_w) || !make_pipe(err_r, err_w) || !make_pipe(exec_r, exec_w)) {
        fill_error(error, SpawnErrorKind::FAILED,
                   std::string("Failed to create pipe: ") + std::strerror(errno));
        return nullptr;
    }
    UniqueFd devnull(open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!devnull) {
        fill_error(error, SpawnErrorKind::FAILED,
                   std::string("Failed to open /dev/null: ") + std::strerror(errno));
        return nullptr;
    }

    // Everything the child touches is prepared before fork; after it only
    // async-signal-safe calls are made.
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    const std::string dir = working_dir.string();

    pid_t pid = fork();
    if (pid < 0) {
        fill_error(error, SpawnErrorKind::FAILED,
                   std::string("fork failed: ") + std::strerror(errno));
        return nullptr;
    }
    if (pid == 0) {
        setpgid(0, 0);
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SIG_DFL;
        sigaction(SIGPIPE, &sa, nullptr);
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        if (chdir(dir.c_str()) != 0)
            report_errno_and_exit(exec_w.get());
        if (dup2(devnull.get(), STDIN_FILENO) < 0 || dup2(out_w.get(), STDOUT_FILENO) < 0 ||
            dup2(err_w.get(), STDERR_FILENO) < 0)
            report_errno_and_exit(exec_w.get());
        execv(exe.c_str(), argv.data());
        report_errno_and_exit(exec_w.get());
    }

    // Mirror the child's setpgid so the group exists before any signal.
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH)
        log_debug("setpgid failed", {{"pid", std::to_string(pid)}, {"error", std::strerror(errno)}});

    out_w.reset();
    err_w.reset();
    exec_w.reset();
    devnull.reset();

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_r.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        if (child_errno == ENOENT)
            fill_error(error, SpawnErrorKind::NOT_FOUND, args[0] + " not found in PATH");
        else
            fill_error(error, SpawnErrorKind::FAILED,
                       "Failed to start " + args[0] + ": " + std::strerror(child_errno));
        return nullptr;
    }

    std::unique_ptr<ChildProcess> child(new ChildProcess());
    child->pid_ = pid;
    child->out_.pipe = std::move(out_r);
    child->err_.pipe = std::move(err_r);
    return child;
}

ChildProcess::~ChildProcess() {
    if (pid_ <= 0)
        return;
    std::lock_guard<std::mutex> lk(mtx_);
    if (reaped_)
        return;
    killpg(pid_, SIGKILL);
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    reaped_ = true;
}

// Polls in short slices so abandon_streams() is noticed while a descendant
// keeps the pipe open without writing.
long ChildProcess::read_some(StreamState& s, char* buf, size_t len) {
    if (!s.pipe)
        return 0;
    pollfd pfd{s.pipe.get(), POLLIN, 0};
    while (true) {
        if (abandoned_)
            return 0;
        int rc = poll(&pfd, 1, 200);
        if (rc < 0 && errno != EINTR)
            return -1;
        if (rc > 0)
            break;
    }
    ssize_t n;
    do {
        n = read(s.pipe.get(), buf, len);
    } while (n < 0 && errno == EINTR);
    return static_cast<long>(n);
}

void ChildProcess::abandon_streams() { abandoned_ = true; }

ExitOutcome ChildProcess::wait_for_exit() {
    ExitOutcome outcome;
    // Wait without reaping: until waitpid below the pid cannot be recycled,
    // so concurrent stop requests still address this child.
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    while (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR)
            break;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    int status = 0;
    pid_t rv;
    do {
        rv = waitpid(pid_, &status, 0);
    } while (rv < 0 && errno == EINTR);
    reaped_ = true;
    if (rv != pid_) {
        log_warning("waitpid failed", {{"pid", std::to_string(pid_)}, {"error", std::strerror(errno)}});
        return outcome;
    }
    if (WIFEXITED(status)) {
        outcome.exited = true;
        outcome.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.signal = WTERMSIG(status);
    }
    return outcome;
}

bool ChildProcess::request_graceful_stop() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (reaped_ || pid_ <= 0)
        return false;
    if (killpg(pid_, SIGTERM) != 0) {
        log_warning("Failed to send SIGTERM to process group",
                    {{"pid", std::to_string(pid_)}, {"error", std::strerror(errno)}});
        return false;
    }
    return true;
}

bool ChildProcess::force_stop() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (reaped_ || pid_ <= 0)
        return false;
    if (killpg(pid_, SIGKILL) != 0) {
        log_warning("Failed to send SIGKILL to process group",
                    {{"pid", std::to_string(pid_)}, {"error", std::strerror(errno)}});
        return false;
    }
    return true;
}

} // namespace procutil
#endif // !_WIN32
