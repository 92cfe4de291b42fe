#include "utils/StateStore.hpp"

#include "utils/Log.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace zf::storage
{

namespace
{

constexpr int kDatabaseBusyTimeoutMs = 5000;

class StatementReset
{
  public:
    explicit StatementReset(sqlite3_stmt *stmt) : stmt_(stmt) {}
    ~StatementReset()
    {
        if (stmt_ != nullptr)
        {
            sqlite3_reset(stmt_);
            sqlite3_clear_bindings(stmt_);
        }
    }

    StatementReset(StatementReset const &) = delete;
    StatementReset &operator=(StatementReset const &) = delete;

  private:
    sqlite3_stmt *stmt_;
};

std::string column_text(sqlite3_stmt *stmt, int index)
{
    auto *text = reinterpret_cast<char const *>(sqlite3_column_text(stmt, index));
    if (text == nullptr)
    {
        return {};
    }
    auto size = sqlite3_column_bytes(stmt, index);
    return std::string(text, static_cast<std::size_t>(size < 0 ? 0 : size));
}

} // namespace

Database::Database(std::filesystem::path path) : path_(std::move(path))
{
    if (path_.empty())
    {
        return;
    }
    if (!is_in_memory())
    {
        auto parent = path_.parent_path();
        if (!parent.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                ZF_LOG_WARN("unable to create store directory {}: {}",
                            parent.string(), ec.message());
            }
        }
    }
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        ZF_LOG_WARN("failed to open sqlite database {}: {}", path_.string(),
                    sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    if (!is_in_memory())
    {
        char *err_msg = nullptr;
        rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                          &err_msg);
        if (rc != SQLITE_OK && err_msg != nullptr)
        {
            ZF_LOG_INFO("failed to enable WAL journal mode: {}", err_msg);
        }
        if (err_msg != nullptr)
        {
            sqlite3_free(err_msg);
        }
    }
    sqlite3_busy_timeout(db_, kDatabaseBusyTimeoutMs);
    if (!ensure_schema())
    {
        ZF_LOG_WARN("schema setup failed for {}", path_.string());
        for (auto &entry : stmt_cache_)
        {
            sqlite3_finalize(entry.second);
        }
        stmt_cache_.clear();
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Database::~Database()
{
    for (auto &entry : stmt_cache_)
    {
        if (entry.second != nullptr)
        {
            sqlite3_finalize(entry.second);
        }
    }
    stmt_cache_.clear();
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::is_in_memory() const noexcept
{
    return path_ == kInMemoryPath;
}

bool Database::ensure_schema()
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *kSchemaVersionSql =
        "CREATE TABLE IF NOT EXISTS schema_version ("
        "id INTEGER PRIMARY KEY CHECK(id = 1),"
        "version INTEGER NOT NULL);";
    if (!execute(kSchemaVersionSql))
    {
        return false;
    }
    return run_migrations();
}

bool Database::execute(std::string const &sql) const
{
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    if (!db_)
    {
        return false;
    }
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        if (err_msg != nullptr)
        {
            ZF_LOG_WARN("sqlite error: {}", err_msg);
            sqlite3_free(err_msg);
        }
        return false;
    }
    return true;
}

bool Database::run_migrations()
{
    if (!ensure_schema_version_row())
    {
        return false;
    }
    auto current = schema_version().value_or(0);
    struct Migration
    {
        int version;
        bool (Database::*apply)() const;
    };
    static constexpr Migration kMigrations[] = {
        {1, &Database::apply_migration_v1},
    };
    for (auto const &migration : kMigrations)
    {
        if (current >= migration.version)
        {
            continue;
        }
        if (!(this->*migration.apply)())
        {
            ZF_LOG_ERROR("schema migration v{} failed", migration.version);
            return false;
        }
        if (!set_schema_version(migration.version))
        {
            return false;
        }
        current = migration.version;
    }
    return true;
}

bool Database::ensure_schema_version_row() const
{
    constexpr char const *sql =
        "INSERT OR IGNORE INTO schema_version (id, version) VALUES (1, 0);";
    return execute(sql);
}

std::optional<int> Database::schema_version() const
{
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    constexpr char const *sql =
        "SELECT version FROM schema_version WHERE id = 1 LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    StatementReset reset(stmt);
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        return static_cast<int>(sqlite3_column_int(stmt, 0));
    }
    return std::nullopt;
}

bool Database::set_schema_version(int version) const
{
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    constexpr char const *sql =
        "INSERT OR REPLACE INTO schema_version (id, version) VALUES (1, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset(stmt);
    sqlite3_bind_int(stmt, 1, version);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::apply_migration_v1() const
{
    constexpr char const *kProgressSql = "CREATE TABLE IF NOT EXISTS progress ("
                                         "key TEXT PRIMARY KEY,"
                                         "value TEXT NOT NULL);";
    constexpr char const *kSessionsSql =
        "CREATE TABLE IF NOT EXISTS sessions ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "payload TEXT NOT NULL);";
    return execute(kProgressSql) && execute(kSessionsSql);
}

sqlite3_stmt *Database::prepare_cached(std::string const &sql) const
{
    if (!db_)
    {
        return nullptr;
    }
    auto it = stmt_cache_.find(sql);
    if (it != stmt_cache_.end())
    {
        sqlite3_reset(it->second);
        sqlite3_clear_bindings(it->second);
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        ZF_LOG_WARN("sqlite prepare failed: {}", sqlite3_errmsg(db_));
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

bool Database::begin_transaction() const
{
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

bool Database::begin_read_transaction() const
{
    return execute("BEGIN DEFERRED TRANSACTION;");
}

bool Database::commit_transaction() const
{
    return execute("COMMIT;");
}

bool Database::rollback_transaction() const
{
    return execute("ROLLBACK;");
}

std::optional<std::string> Database::get_value(std::string const &key) const
{
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    constexpr char const *sql =
        "SELECT value FROM progress WHERE key = ? LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    StatementReset reset(stmt);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        return column_text(stmt, 0);
    }
    return std::nullopt;
}

bool Database::set_value(std::string const &key, std::string const &value)
{
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    constexpr char const *sql =
        "INSERT OR REPLACE INTO progress (key, value) VALUES (?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset(stmt);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::remove_value(std::string const &key)
{
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    constexpr char const *sql = "DELETE FROM progress WHERE key = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset(stmt);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::delete_all_values()
{
    return execute("DELETE FROM progress;");
}

std::optional<std::int64_t> Database::append_session(std::string const &payload)
{
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    constexpr char const *sql = "INSERT INTO sessions (payload) VALUES (?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    StatementReset reset(stmt);
    sqlite3_bind_text(stmt, 1, payload.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_DONE)
    {
        ZF_LOG_WARN("session insert failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
}

std::vector<StoredSession> Database::load_sessions() const
{
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    std::vector<StoredSession> result;
    constexpr char const *sql =
        "SELECT id, payload FROM sessions ORDER BY id ASC;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return result;
    }
    StatementReset reset(stmt);
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        StoredSession entry;
        entry.row_id = sqlite3_column_int64(stmt, 0);
        entry.payload = column_text(stmt, 1);
        result.push_back(std::move(entry));
    }
    return result;
}

bool Database::delete_sessions()
{
    return execute("DELETE FROM sessions;");
}

} // namespace zf::storage
