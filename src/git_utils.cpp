#include "git_utils.hpp"
#include <cstdlib>
#include <system_error>
#include <cstddef>
#include "logger.hpp"

namespace git {

static unsigned int g_libgit_timeout = 0;

static constexpr int MAX_CREDENTIAL_ATTEMPTS = 3;

static void apply_libgit_timeout() {
#if RALPHTOWN_HAVE_SERVER_TIMEOUT
    if (git_libgit2_opts(GIT_OPT_SET_SERVER_TIMEOUT, static_cast<int>(g_libgit_timeout * 1000)) < 0) {
        const git_error* e = git_error_last();
        log_warning("Failed to set libgit2 server timeout",
                    {{"seconds", std::to_string(g_libgit_timeout)},
                     {"error", std::string(e && e->message ? e->message : "unknown")}});
    }
#else
    if (g_libgit_timeout > 0)
        log_warning("libgit2 " LIBGIT2_VERSION " has no server timeout option; ignoring --git-timeout");
#endif
}

void set_libgit_timeout(unsigned int seconds) {
    g_libgit_timeout = seconds;
    apply_libgit_timeout();
}

GitInitGuard::GitInitGuard() {
    git_libgit2_init();
    if (g_libgit_timeout > 0)
        apply_libgit_timeout();
}

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

static std::optional<std::string> safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) == 0 && buf) {
        std::string v(buf);
        free(buf);
        return v;
    }
    return std::nullopt;
#else
    const char* v = std::getenv(name);
    if (v)
        return std::string(v);
    return std::nullopt;
#endif
}

int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload) {
    auto* state = static_cast<RemotePayload*>(payload);
    if (state && ++state->credential_attempts > MAX_CREDENTIAL_ATTEMPTS) {
        log_debug("Giving up on credentials", {{"url", std::string(url ? url : "")}});
        return GIT_PASSTHROUGH;
    }
    auto env_user = safe_getenv("GIT_USERNAME");
    auto env_pass = safe_getenv("GIT_PASSWORD");
    const char* user = username_from_url ? username_from_url : (env_user ? env_user->c_str() : nullptr);
    if ((allowed_types & GIT_CREDENTIAL_USERNAME) && user) {
        if (git_credential_username_new(out, user) == 0)
            return 0;
    }
    if ((allowed_types & GIT_CREDENTIAL_SSH_KEY) && user) {
        if (git_credential_ssh_key_from_agent(out, user) == 0)
            return 0;
    }
    if ((allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT) && env_user && env_pass)
        return git_credential_userpass_plaintext_new(out, env_user->c_str(), env_pass->c_str());
    if (allowed_types & GIT_CREDENTIAL_DEFAULT)
        return git_credential_default_new(out);
    return GIT_PASSTHROUGH;
}

CloneError classify_clone_error(const git_error* err) {
    CloneError out;
    out.message = (err && err->message) ? err->message : "Unknown libgit2 error";
    const int klass = err ? err->klass : GIT_ERROR_NONE;
    switch (klass) {
    case GIT_ERROR_SSH:
        out.kind = CloneErrorKind::SSH_AUTH_FAILED;
        out.help_steps = {
            "Ensure your SSH key is added to ssh-agent: ssh-add ~/.ssh/id_ed25519",
            "Verify your key is added to GitHub: ssh -T git@github.com",
            "If using a passphrase, the ssh-agent must have the key unlocked"};
        break;
    case GIT_ERROR_HTTP:
        out.kind = CloneErrorKind::HTTPS_AUTH_FAILED;
        out.help_steps = {
            "HTTPS cloning requires a Personal Access Token (PAT)",
            "Create a PAT at GitHub Settings > Developer Settings > Tokens",
            "Use the PAT as password when prompted, or configure git credential helper"};
        break;
    case GIT_ERROR_NET:
        out.kind = CloneErrorKind::NETWORK_ERROR;
        break;
    default:
        out.kind = CloneErrorKind::OPERATION_FAILED;
        break;
    }
    return out;
}

namespace {

int transfer_progress(const git_indexer_progress* stats, void* payload) {
    auto* p = static_cast<RemotePayload*>(payload);
    if (!p || !p->on_progress || !*p->on_progress)
        return 0;
    CloneProgress snap;
    snap.received_objects = stats->received_objects;
    snap.total_objects = stats->total_objects;
    snap.received_bytes = stats->received_bytes;
    snap.indexed_objects = stats->indexed_objects;
    snap.total_deltas = stats->total_deltas;
    snap.indexed_deltas = stats->indexed_deltas;
    (*p->on_progress)(snap);
    return 0; // never abort the transfer
}

} // namespace

std::optional<CloneError> clone_repository(const std::string& url, const fs::path& dest,
                                           const ProgressCallback& on_progress) {
    git_clone_options opts = GIT_CLONE_OPTIONS_INIT;
    RemotePayload payload;
    payload.on_progress = &on_progress;
    opts.fetch_opts.callbacks.transfer_progress = transfer_progress;
    opts.fetch_opts.callbacks.credentials = credential_cb;
    opts.fetch_opts.callbacks.payload = &payload;
    git_repository* raw_repo = nullptr;
    log_debug("Cloning", {{"url", url}, {"dest", dest.string()}});
    int err = git_clone(&raw_repo, url.c_str(), dest.string().c_str(), &opts);
    if (err != 0)
        return classify_clone_error(git_error_last());
    repo_ptr repo(raw_repo);
    return std::nullopt;
}

bool is_git_repo(const fs::path& p) {
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, p.string().c_str(), GIT_REPOSITORY_OPEN_NO_SEARCH, nullptr) != 0)
        return false;
    repo_ptr r(raw);
    return true;
}

std::optional<std::string> get_current_branch(const fs::path& repo, std::string* error) {
    auto set_error = [error]() {
        if (!error)
            return;
        const git_error* e = git_error_last();
        *error = (e && e->message) ? e->message : "Unknown libgit2 error";
    };
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error();
        return std::nullopt;
    }
    repo_ptr r(raw);
    git_reference* head = nullptr;
    if (git_repository_head(&head, r.get()) != 0) {
        set_error();
        return std::nullopt;
    }
    reference_ptr ref(head);
    const char* name = git_reference_shorthand(ref.get());
    std::string branch = name ? name : "";
    if (branch.empty()) {
        set_error();
        return std::nullopt;
    }
    return branch;
}

static void scan_directory(const fs::path& dir, size_t depth, size_t max_depth,
                           std::vector<FoundRepo>& found) {
    if (is_git_repo(dir)) {
        std::string name = dir.filename().string();
        found.push_back({dir.string(), name.empty() ? "unknown" : name});
        return;
    }
    if (depth >= max_depth)
        return;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_directory(type_ec))
            continue;
        const std::string name = it->path().filename().string();
        if (!name.empty() && name[0] == '.')
            continue;
        scan_directory(it->path(), depth + 1, max_depth, found);
    }
}

std::vector<FoundRepo> scan_for_repos(const fs::path& root, size_t max_depth) {
    std::vector<FoundRepo> found;
    std::error_code ec;
    if (fs::is_directory(root, ec))
        scan_directory(root, 0, max_depth, found);
    return found;
}

} // namespace git
