#include "store.hpp"
#include <algorithm>
#include <fstream>
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace {

template <typename T> auto find_by_id(std::vector<T>& items, const std::string& id) {
    return std::find_if(items.begin(), items.end(), [&](const T& item) { return item.id == id; });
}

} // namespace

Repo MemoryStore::insert_repo(const std::string& path, const std::string& name) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& r : repos_) {
        if (r.path == path)
            throw StoreError("Repository already registered: " + path);
    }
    Repo repo;
    repo.id = generate_uuid();
    repo.path = path;
    repo.name = name;
    repo.created_at = rfc3339_now();
    repo.updated_at = repo.created_at;
    repos_.push_back(repo);
    return repo;
}

std::optional<Repo> MemoryStore::get_repo(const std::string& id) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = find_by_id(repos_, id);
    if (it == repos_.end())
        return std::nullopt;
    return *it;
}

std::optional<Repo> MemoryStore::get_repo_by_path(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& r : repos_) {
        if (r.path == path)
            return r;
    }
    return std::nullopt;
}

std::vector<Repo> MemoryStore::list_repos() {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<Repo> out = repos_;
    std::stable_sort(out.begin(), out.end(),
                     [](const Repo& a, const Repo& b) { return a.name < b.name; });
    return out;
}

void MemoryStore::delete_repo(const std::string& id) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = find_by_id(repos_, id);
    if (it == repos_.end())
        throw StoreError("Repository not found: " + id);
    repos_.erase(it);
    std::vector<std::string> doomed;
    for (const auto& s : sessions_) {
        if (s.repo_id == id)
            doomed.push_back(s.id);
    }
    for (const auto& sid : doomed)
        erase_session_locked(sid);
}

Session MemoryStore::insert_session(const std::string& repo_id,
                                    const std::optional<std::string>& name) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (find_by_id(repos_, repo_id) == repos_.end())
        throw StoreError("Repository not found: " + repo_id);
    Session session;
    session.id = generate_uuid();
    session.repo_id = repo_id;
    session.name = name;
    session.created_at = rfc3339_now();
    session.updated_at = session.created_at;
    sessions_.push_back(session);
    return session;
}

std::optional<Session> MemoryStore::get_session(const std::string& id) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = find_by_id(sessions_, id);
    if (it == sessions_.end())
        return std::nullopt;
    return *it;
}

std::vector<Session> MemoryStore::list_sessions() {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<Session> out(sessions_.rbegin(), sessions_.rend());
    std::stable_sort(out.begin(), out.end(), [](const Session& a, const Session& b) {
        return a.updated_at > b.updated_at;
    });
    return out;
}

std::vector<Session> MemoryStore::list_sessions_by_repo(const std::string& repo_id) {
    std::vector<Session> out = list_sessions();
    out.erase(std::remove_if(out.begin(), out.end(),
                             [&](const Session& s) { return s.repo_id != repo_id; }),
              out.end());
    return out;
}

void MemoryStore::update_session_status(const std::string& id, SessionStatus status) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = find_by_id(sessions_, id);
    if (it == sessions_.end())
        throw StoreError("Session not found: " + id);
    it->status = status;
    it->updated_at = rfc3339_now();
}

void MemoryStore::delete_session(const std::string& id) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (find_by_id(sessions_, id) == sessions_.end())
        throw StoreError("Session not found: " + id);
    erase_session_locked(id);
}

void MemoryStore::erase_session_locked(const std::string& id) {
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [&](const Session& s) { return s.id == id; }),
                    sessions_.end());
    messages_.erase(std::remove_if(messages_.begin(), messages_.end(),
                                   [&](const Message& m) { return m.session_id == id; }),
                    messages_.end());
    output_.erase(std::remove_if(output_.begin(), output_.end(),
                                 [&](const OutputRecord& o) { return o.session_id == id; }),
                  output_.end());
}

Message MemoryStore::insert_message(const std::string& session_id, MessageRole role,
                                    const std::string& content) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (find_by_id(sessions_, session_id) == sessions_.end())
        throw StoreError("Session not found: " + session_id);
    Message message;
    message.id = generate_uuid();
    message.session_id = session_id;
    message.role = role;
    message.content = content;
    message.created_at = rfc3339_now();
    messages_.push_back(message);
    return message;
}

std::vector<Message> MemoryStore::list_messages(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<Message> out;
    for (const auto& m : messages_) {
        if (m.session_id == session_id)
            out.push_back(m);
    }
    return out;
}

OutputRecord MemoryStore::insert_output_log(const std::string& session_id, OutputStream stream,
                                            const std::string& content) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (find_by_id(sessions_, session_id) == sessions_.end())
        throw StoreError("Session not found: " + session_id);
    OutputRecord record;
    record.id = next_output_id_++;
    record.session_id = session_id;
    record.stream = stream;
    record.content = content;
    record.created_at = rfc3339_now();
    output_.push_back(record);
    return record;
}

std::vector<OutputRecord> MemoryStore::list_output_logs(const std::string& session_id,
                                                        int64_t after_id, size_t limit) {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<OutputRecord> out;
    for (const auto& o : output_) {
        if (o.session_id != session_id || o.id <= after_id)
            continue;
        out.push_back(o);
        if (limit > 0 && out.size() >= limit)
            break;
    }
    return out;
}

void MemoryStore::delete_output_logs(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    output_.erase(std::remove_if(output_.begin(), output_.end(),
                                 [&](const OutputRecord& o) { return o.session_id == session_id; }),
                  output_.end());
}

std::optional<std::string> MemoryStore::get_config(const std::string& key) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = config_.find(key);
    if (it == config_.end())
        return std::nullopt;
    return it->second;
}

void MemoryStore::set_config(const std::string& key, const std::string& value) {
    if (key.empty())
        throw StoreError("Setting name must not be empty");
    std::lock_guard<std::mutex> lk(mtx_);
    config_[key] = value;
}

void MemoryStore::delete_config(const std::string& key) {
    std::lock_guard<std::mutex> lk(mtx_);
    config_.erase(key);
}

std::map<std::string, std::string> MemoryStore::list_config() {
    std::lock_guard<std::mutex> lk(mtx_);
    return config_;
}

void MemoryStore::load_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec))
        return;
    std::ifstream in(path);
    if (!in.is_open())
        throw StoreError("Failed to open state file: " + path.string());
    try {
        nlohmann::json j;
        in >> j;
        std::vector<Repo> repos = j.value("repos", nlohmann::json::array()).get<std::vector<Repo>>();
        std::vector<Session> sessions =
            j.value("sessions", nlohmann::json::array()).get<std::vector<Session>>();
        std::vector<Message> messages =
            j.value("messages", nlohmann::json::array()).get<std::vector<Message>>();
        std::vector<OutputRecord> output =
            j.value("output_logs", nlohmann::json::array()).get<std::vector<OutputRecord>>();
        auto config = j.value("config", nlohmann::json::object())
                          .get<std::map<std::string, std::string>>();
        int64_t next_id = j.value("next_output_id", static_cast<int64_t>(1));
        for (const auto& o : output)
            next_id = std::max(next_id, o.id + 1);
        std::lock_guard<std::mutex> lk(mtx_);
        repos_ = std::move(repos);
        sessions_ = std::move(sessions);
        messages_ = std::move(messages);
        output_ = std::move(output);
        config_ = std::move(config);
        next_output_id_ = next_id;
    } catch (const nlohmann::json::exception& e) {
        throw StoreError("Invalid state file " + path.string() + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw StoreError("Invalid state file " + path.string() + ": " + e.what());
    }
}

void MemoryStore::save_file(const fs::path& path) const {
    nlohmann::json j;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        j["repos"] = repos_;
        j["sessions"] = sessions_;
        j["messages"] = messages_;
        j["output_logs"] = output_;
        j["config"] = config_;
        j["next_output_id"] = next_output_id_;
    }
    std::error_code ec;
    if (path.has_parent_path())
        fs::create_directories(path.parent_path(), ec);
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open())
            throw StoreError("Failed to write state file: " + tmp.string());
        out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        if (!out)
            throw StoreError("Failed to write state file: " + tmp.string());
    }
    fs::rename(tmp, path, ec);
    if (ec)
        throw StoreError("Failed to replace state file " + path.string() + ": " + ec.message());
}
