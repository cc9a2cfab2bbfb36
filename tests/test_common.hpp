#pragma once
#include <catch2/catch_test_macros.hpp>
#include "logger.hpp"
#include "models.hpp"
#include "store.hpp"
#include "time_utils.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <system_error>
#include <thread>
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <cstdlib>
// Portable wrappers for environment manipulation in tests
inline int setenv(const char* name, const char* value, int) { return _putenv_s(name, value); }
inline int unsetenv(const char* name) { return _putenv_s(name, ""); }
#define REDIR " > NUL 2>&1"
#endif

#if !defined(REDIR)
#define REDIR " > /dev/null 2>&1"
#endif

static inline bool have_git() { return std::system("git --version " REDIR) == 0; }

namespace fs = std::filesystem;

namespace ralphtown::test_support {

inline void remove_all(const fs::path& target) {
    std::error_code ec;
    fs::remove_all(target, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        INFO("Failed to remove '" << target.string() << "': " << ec.message());
        REQUIRE(false);
    }
}

/** Fresh directory under the temp dir, removed again on scope exit. */
class TempDir {
  public:
    explicit TempDir(const std::string& tag) {
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("ralphtown_" + tag + "_" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    const fs::path& path() const { return path_; }

  private:
    fs::path path_;
};

/** Prepends a directory to PATH and restores the old value on scope exit. */
class PathPrefix {
  public:
    explicit PathPrefix(const fs::path& dir) {
        const char* old = std::getenv("PATH");
        had_old_ = old != nullptr;
        if (old)
            old_ = old;
#ifdef _WIN32
        const char sep = ';';
#else
        const char sep = ':';
#endif
        std::string next = dir.string();
        if (had_old_)
            next += sep + old_;
        setenv("PATH", next.c_str(), 1);
    }
    ~PathPrefix() {
        if (had_old_)
            setenv("PATH", old_.c_str(), 1);
        else
            unsetenv("PATH");
    }

  private:
    std::string old_;
    bool had_old_ = false;
};

#ifndef _WIN32
/**
 * Write an executable shell script named @p name into @p dir.
 * The agent arguments are available as "$@"; the prompt is "$4".
 */
inline fs::path write_script(const fs::path& dir, const std::string& name,
                             const std::string& body) {
    fs::path p = dir / name;
    {
        std::ofstream ofs(p);
        ofs << "#!/bin/sh\n" << body << "\n";
    }
    fs::permissions(p,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace);
    return p;
}
#endif

/** Initialise a git repository with one commit using the git CLI. */
inline bool make_git_repo(const fs::path& dir) {
    fs::create_directories(dir);
    std::ofstream(dir / "README.md") << "hello\n";
    const std::string q = "\"" + dir.string() + "\"";
    const std::string id = " -c user.name=t -c user.email=t@example.com";
    return std::system(("git -C " + q + " init -q" REDIR).c_str()) == 0 &&
           std::system(("git -C " + q + " add ." REDIR).c_str()) == 0 &&
           std::system(("git -C " + q + id + " commit -q -m init" REDIR).c_str()) == 0;
}

/** Poll @p pred until it holds or @p timeout elapses. */
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace ralphtown::test_support

#ifndef FS_REMOVE_ALL
#define FS_REMOVE_ALL(path) ::ralphtown::test_support::remove_all((path))
#endif
