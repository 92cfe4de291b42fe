#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <sqlite3.h>

namespace zf::storage
{

// Raw row of the append-only sessions table. Decoding the payload is the
// caller's business so a corrupt row never fails the whole load.
struct StoredSession
{
    std::int64_t row_id = 0;
    std::string payload;
};

class Database
{
  public:
    // Path that selects a private, process-local SQLite database.
    static constexpr char const kInMemoryPath[] = ":memory:";

    explicit Database(std::filesystem::path path);
    ~Database();

    Database(Database const &) = delete;
    Database &operator=(Database const &) = delete;

    bool is_valid() const noexcept { return db_ != nullptr; }
    bool is_in_memory() const noexcept;
    std::filesystem::path const &path() const noexcept { return path_; }

    std::optional<std::string> get_value(std::string const &key) const;
    bool set_value(std::string const &key, std::string const &value);
    bool remove_value(std::string const &key);
    bool delete_all_values();

    // BEGIN IMMEDIATE so the write lock is taken up front.
    bool begin_transaction() const;
    // BEGIN DEFERRED: every SELECT until commit or rollback sees the same
    // committed snapshot.
    bool begin_read_transaction() const;
    bool commit_transaction() const;
    bool rollback_transaction() const;

    std::optional<std::int64_t> append_session(std::string const &payload);
    std::vector<StoredSession> load_sessions() const;
    bool delete_sessions();

  private:
    bool ensure_schema();
    bool run_migrations();
    bool ensure_schema_version_row() const;
    std::optional<int> schema_version() const;
    bool set_schema_version(int version) const;
    bool apply_migration_v1() const;
    bool execute(std::string const &sql) const;
    sqlite3_stmt *prepare_cached(std::string const &sql) const;

    std::filesystem::path path_;
    sqlite3 *db_ = nullptr;
    mutable std::recursive_mutex mutex_;
    mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
};

} // namespace zf::storage
