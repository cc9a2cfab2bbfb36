#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <string>
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <io.h>
#else
#include <unistd.h>
#endif

namespace procutil {

/**
 * @brief Locate an executable by name.
 *
 * Names containing a path separator are checked directly. Otherwise each
 * entry of the `PATH` environment variable is searched (and `PATHEXT` on
 * Windows). Returns an empty string when nothing executable is found.
 */
std::string find_executable(const std::string& name);

/** @brief The current user's home directory, or empty if unknown. */
std::string home_directory();

#ifdef _WIN32
/**
 * @brief RAII wrapper around a Windows @c HANDLE.
 *
 * Automatically closes the handle on destruction. Useful for managing handles
 * returned from Windows API calls to ensure resources are released.
 */
class UniqueHandle {
  public:
    UniqueHandle() noexcept : h(INVALID_HANDLE_VALUE) {}
    explicit UniqueHandle(HANDLE handle) noexcept : h(handle) {}
    ~UniqueHandle() { reset(); }

    UniqueHandle(const UniqueHandle&) = delete;
    UniqueHandle& operator=(const UniqueHandle&) = delete;

    UniqueHandle(UniqueHandle&& other) noexcept : h(other.h) { other.h = INVALID_HANDLE_VALUE; }

    UniqueHandle& operator=(UniqueHandle&& other) noexcept {
        if (this != &other) {
            reset();
            h = other.h;
            other.h = INVALID_HANDLE_VALUE;
        }
        return *this;
    }

    HANDLE get() const noexcept { return h; }
    explicit operator bool() const noexcept { return h != nullptr && h != INVALID_HANDLE_VALUE; }

    HANDLE release() noexcept {
        HANDLE tmp = h;
        h = INVALID_HANDLE_VALUE;
        return tmp;
    }

    void reset(HANDLE handle = INVALID_HANDLE_VALUE) noexcept {
        if (h != nullptr && h != INVALID_HANDLE_VALUE)
            CloseHandle(h);
        h = handle;
    }

  private:
    HANDLE h;
};
#endif // _WIN32

/**
 * @brief RAII wrapper for POSIX-style file descriptors.
 *
 * Closes the descriptor when the object goes out of scope. Use to manage
 * ownership of file descriptors returned by open and similar system calls.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int tmp = fd;
        fd = -1;
        return tmp;
    }

    void reset(int f = -1) noexcept {
        if (fd >= 0) {
#ifdef _WIN32
            _close(fd);
#else
            close(fd);
#endif
        }
        fd = f;
    }

  private:
    int fd;
};

#ifndef _WIN32
/**
 * @brief Create a pipe whose ends are closed on exec.
 *
 * @return `false` with errno set if the pipe could not be created.
 */
bool make_pipe(UniqueFd& read_end, UniqueFd& write_end);
#endif

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
