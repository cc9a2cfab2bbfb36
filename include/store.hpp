#ifndef STORE_HPP
#define STORE_HPP
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "models.hpp"

/** Raised by Store implementations when a write cannot be carried out. */
class StoreError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Record store for repositories, sessions, messages, output and
 *        application settings.
 *
 * Implementations must be safe for concurrent use. Lookups of absent
 * records return `std::nullopt`; mutations of absent records and constraint
 * violations throw StoreError.
 */
class Store {
  public:
    virtual ~Store() = default;

    /** @brief Add a repository. Fails if @p path is already registered. */
    virtual Repo insert_repo(const std::string& path, const std::string& name) = 0;
    virtual std::optional<Repo> get_repo(const std::string& id) = 0;
    virtual std::optional<Repo> get_repo_by_path(const std::string& path) = 0;
    /** @brief All repositories ordered by name. */
    virtual std::vector<Repo> list_repos() = 0;
    /** @brief Remove a repository with its sessions, messages and output. */
    virtual void delete_repo(const std::string& id) = 0;

    virtual Session insert_session(const std::string& repo_id,
                                   const std::optional<std::string>& name) = 0;
    virtual std::optional<Session> get_session(const std::string& id) = 0;
    /** @brief All sessions, most recently updated first. */
    virtual std::vector<Session> list_sessions() = 0;
    virtual std::vector<Session> list_sessions_by_repo(const std::string& repo_id) = 0;
    virtual void update_session_status(const std::string& id, SessionStatus status) = 0;
    virtual void delete_session(const std::string& id) = 0;

    virtual Message insert_message(const std::string& session_id, MessageRole role,
                                   const std::string& content) = 0;
    virtual std::vector<Message> list_messages(const std::string& session_id) = 0;

    virtual OutputRecord insert_output_log(const std::string& session_id, OutputStream stream,
                                           const std::string& content) = 0;
    /**
     * @brief Output of a session in insertion order.
     *
     * @param after_id Only records with an id greater than this are returned.
     * @param limit    Maximum number of records, `0` for no limit.
     */
    virtual std::vector<OutputRecord> list_output_logs(const std::string& session_id,
                                                       int64_t after_id, size_t limit) = 0;
    virtual void delete_output_logs(const std::string& session_id) = 0;

    /** @name Settings
     *  Free-form key/value pairs; setting an existing key replaces its value.
     *  @{ */
    virtual std::optional<std::string> get_config(const std::string& key) = 0;
    virtual void set_config(const std::string& key, const std::string& value) = 0;
    /** @brief Remove @p key. Removing an absent key is not an error. */
    virtual void delete_config(const std::string& key) = 0;
    /** @brief All settings ordered by key. */
    virtual std::map<std::string, std::string> list_config() = 0;
    /** @} */
};

/**
 * @brief Thread-safe in-memory Store with optional JSON persistence.
 */
class MemoryStore : public Store {
  public:
    MemoryStore() = default;

    Repo insert_repo(const std::string& path, const std::string& name) override;
    std::optional<Repo> get_repo(const std::string& id) override;
    std::optional<Repo> get_repo_by_path(const std::string& path) override;
    std::vector<Repo> list_repos() override;
    void delete_repo(const std::string& id) override;

    Session insert_session(const std::string& repo_id,
                           const std::optional<std::string>& name) override;
    std::optional<Session> get_session(const std::string& id) override;
    std::vector<Session> list_sessions() override;
    std::vector<Session> list_sessions_by_repo(const std::string& repo_id) override;
    void update_session_status(const std::string& id, SessionStatus status) override;
    void delete_session(const std::string& id) override;

    Message insert_message(const std::string& session_id, MessageRole role,
                           const std::string& content) override;
    std::vector<Message> list_messages(const std::string& session_id) override;

    OutputRecord insert_output_log(const std::string& session_id, OutputStream stream,
                                   const std::string& content) override;
    std::vector<OutputRecord> list_output_logs(const std::string& session_id, int64_t after_id,
                                               size_t limit) override;
    void delete_output_logs(const std::string& session_id) override;

    std::optional<std::string> get_config(const std::string& key) override;
    void set_config(const std::string& key, const std::string& value) override;
    void delete_config(const std::string& key) override;
    std::map<std::string, std::string> list_config() override;

    /**
     * @brief Replace the contents with a state file written by save_file().
     *
     * A missing file leaves the store empty. Throws StoreError if the file
     * exists but cannot be parsed.
     */
    void load_file(const std::filesystem::path& path);
    /** @brief Write the whole store as JSON, replacing @p path atomically. */
    void save_file(const std::filesystem::path& path) const;

  private:
    void erase_session_locked(const std::string& id);

    mutable std::mutex mtx_;
    std::vector<Repo> repos_;
    std::vector<Session> sessions_;
    std::vector<Message> messages_;
    std::vector<OutputRecord> output_;
    std::map<std::string, std::string> config_;
    int64_t next_output_id_ = 1;
};

#endif // STORE_HPP
