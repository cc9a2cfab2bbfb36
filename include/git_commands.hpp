#ifndef GIT_COMMANDS_HPP
#define GIT_COMMANDS_HPP
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace git {

/** Captured result of one `git` invocation. */
struct CommandOutput {
    bool success = false;
    std::string stdout_text;
    std::string stderr_text;
};

/** Raised when `git` cannot be started or an argument is rejected. */
class GitCommandError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Run `git <args...>` in @p repo and wait for it.
 *
 * A non-zero exit is reported through CommandOutput::success, not thrown.
 */
CommandOutput run_git_command(const std::filesystem::path& repo,
                              const std::vector<std::string>& args);

CommandOutput pull(const std::filesystem::path& repo);
CommandOutput push(const std::filesystem::path& repo);
CommandOutput commit(const std::filesystem::path& repo, const std::string& message);
CommandOutput reset_hard(const std::filesystem::path& repo);
/**
 * @brief Switch to @p branch.
 *
 * Names containing `..` or NUL, or starting with `-`, are rejected with
 * GitCommandError before git is started.
 */
CommandOutput checkout(const std::filesystem::path& repo, const std::string& branch);
CommandOutput add_all(const std::filesystem::path& repo);

bool valid_branch_name(const std::string& branch);

} // namespace git

#endif // GIT_COMMANDS_HPP
