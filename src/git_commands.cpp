#include "git_commands.hpp"
#include "child_process.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace git {

CommandOutput run_git_command(const fs::path& repo, const std::vector<std::string>& args) {
    std::vector<std::string> argv{"git"};
    argv.insert(argv.end(), args.begin(), args.end());
    procutil::SpawnError error;
    auto child = procutil::spawn_process(repo, argv, &error);
    if (!child)
        throw GitCommandError("Failed to run git: " + error.message);
    procutil::ExitOutcome outcome = child->wait_with_output();
    CommandOutput out;
    out.success = outcome.success();
    out.stdout_text = std::move(outcome.stdout_data);
    out.stderr_text = std::move(outcome.stderr_data);
    if (!out.success)
        log_debug("git command failed", {{"repo", repo.string()},
                                         {"command", args.empty() ? std::string() : args[0]},
                                         {"exit_code", std::to_string(outcome.code)}});
    return out;
}

CommandOutput pull(const fs::path& repo) { return run_git_command(repo, {"pull"}); }

CommandOutput push(const fs::path& repo) { return run_git_command(repo, {"push"}); }

CommandOutput commit(const fs::path& repo, const std::string& message) {
    return run_git_command(repo, {"commit", "-m", message});
}

CommandOutput reset_hard(const fs::path& repo) { return run_git_command(repo, {"reset", "--hard"}); }

bool valid_branch_name(const std::string& branch) {
    return !branch.empty() && branch.find("..") == std::string::npos && branch[0] != '-' &&
           branch.find('\0') == std::string::npos;
}

CommandOutput checkout(const fs::path& repo, const std::string& branch) {
    if (!valid_branch_name(branch))
        throw GitCommandError("Invalid branch name: " + branch);
    return run_git_command(repo, {"checkout", branch});
}

CommandOutput add_all(const fs::path& repo) { return run_git_command(repo, {"add", "-A"}); }

} // namespace git
