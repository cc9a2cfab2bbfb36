#include "system_utils.hpp"
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <vector>
#ifndef _WIN32
#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#endif

namespace fs = std::filesystem;

namespace procutil {

namespace {

bool is_executable_file(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec))
        return false;
#ifdef _WIN32
    return true;
#else
    return access(p.c_str(), X_OK) == 0;
#endif
}

std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

} // namespace

std::string find_executable(const std::string& name) {
    if (name.empty())
        return "";
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos)
        return is_executable_file(name) ? name : "";
#ifdef _WIN32
    const char sep = ';';
    std::vector<std::string> exts{""};
    std::stringstream es(env_or_empty("PATHEXT").empty() ? std::string(".EXE;.CMD;.BAT")
                                                         : env_or_empty("PATHEXT"));
    std::string ext;
    while (std::getline(es, ext, ';'))
        exts.push_back(ext);
#else
    const char sep = ':';
    const std::string exts[] = {""};
#endif
    std::stringstream ss(env_or_empty("PATH"));
    std::string dir;
    while (std::getline(ss, dir, sep)) {
        if (dir.empty())
            dir = ".";
        for (const auto& e : exts) {
            fs::path candidate = fs::path(dir) / (name + e);
            if (is_executable_file(candidate))
                return candidate.string();
        }
    }
    return "";
}

std::string home_directory() {
#ifdef _WIN32
    std::string home = env_or_empty("USERPROFILE");
    if (home.empty())
        home = env_or_empty("HOMEDRIVE") + env_or_empty("HOMEPATH");
    return home;
#else
    std::string home = env_or_empty("HOME");
    if (!home.empty())
        return home;
    if (const passwd* pw = getpwuid(getuid()))
        if (pw->pw_dir)
            return pw->pw_dir;
    return "";
#endif
}

#ifndef _WIN32
bool make_pipe(UniqueFd& read_end, UniqueFd& write_end) {
    int fds[2];
#ifdef __linux__
    if (pipe2(fds, O_CLOEXEC) != 0)
        return false;
#else
    if (pipe(fds) != 0)
        return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}
#endif

} // namespace procutil
