#include "utils/HashStore.hpp"

#include "utils/Log.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>

namespace sw::storage
{

namespace
{

constexpr int kDatabaseBusyTimeoutMs = 5000;
constexpr std::size_t kSha1HexLength = 40;

std::int64_t now_seconds()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

bool looks_like_hash(unsigned char const *text, int length)
{
    if (text == nullptr || length != static_cast<int>(kSha1HexLength))
    {
        return false;
    }
    for (int i = 0; i < length; ++i)
    {
        auto ch = text[i];
        bool digit = ch >= '0' && ch <= '9';
        bool lower = ch >= 'a' && ch <= 'f';
        if (!digit && !lower)
        {
            return false;
        }
    }
    return true;
}

} // namespace

HashStore::HashStore(std::filesystem::path path) : path_(std::move(path))
{
    if (path_.empty())
    {
        return;
    }
    auto parent = path_.parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            SW_LOG_WARN("failed to create cache directory {}: {}",
                        parent.string(), ec.message());
            return;
        }
    }
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        SW_LOG_WARN("failed to open hash cache {}: {}", path_.string(),
                    sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    if (!execute("PRAGMA journal_mode=WAL;"))
    {
        SW_LOG_DEBUG("hash cache stays in the default journal mode");
    }
    sqlite3_busy_timeout(db_, kDatabaseBusyTimeoutMs);
    if (!create_table())
    {
        SW_LOG_WARN("hash cache table setup failed for {}", path_.string());
        close();
    }
}

HashStore::~HashStore()
{
    close();
}

void HashStore::close()
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

bool HashStore::create_table() const
{
    constexpr char const *kCacheSql =
        "CREATE TABLE IF NOT EXISTS file_cache ("
        "path TEXT PRIMARY KEY,"
        "size INTEGER NOT NULL,"
        "mtime_ns INTEGER NOT NULL,"
        "hash TEXT NOT NULL,"
        "last_accessed INTEGER NOT NULL);";
    return execute(kCacheSql);
}

bool HashStore::execute(std::string const &sql) const
{
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
            SW_LOG_WARN("sqlite error: {}", err_msg);
            sqlite3_free(err_msg);
        }
        return false;
    }
    return true;
}

sqlite3_stmt *HashStore::prepare_cached(std::string const &sql) const
{
    if (!db_)
    {
        return nullptr;
    }
    auto it = stmt_cache_.find(sql);
    if (it != stmt_cache_.end())
    {
        if (it->second != nullptr)
        {
            sqlite3_reset(it->second);
            sqlite3_clear_bindings(it->second);
        }
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        SW_LOG_WARN("sqlite prepare failed: {}", sqlite3_errmsg(db_));
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

std::optional<std::string> HashStore::get(std::string const &path,
                                          std::uint64_t size,
                                          std::int64_t mtime_ns)
{
    constexpr char const *sql =
        "SELECT size, mtime_ns, hash FROM file_cache WHERE path = ? LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW)
    {
        if (rc != SQLITE_DONE)
        {
            SW_LOG_WARN("hash cache lookup failed for {}: {}", path,
                        sqlite3_errmsg(db_));
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        return std::nullopt;
    }
    auto stored_size = sqlite3_column_int64(stmt, 0);
    auto stored_mtime = sqlite3_column_int64(stmt, 1);
    auto const *text = sqlite3_column_text(stmt, 2);
    int text_length = sqlite3_column_bytes(stmt, 2);
    bool fresh = static_cast<std::uint64_t>(stored_size) == size &&
                 stored_mtime == mtime_ns;
    bool readable = looks_like_hash(text, text_length);
    std::optional<std::string> result;
    if (fresh && readable)
    {
        result.emplace(reinterpret_cast<char const *>(text),
                       static_cast<std::size_t>(text_length));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);

    if (!result)
    {
        if (!readable)
        {
            SW_LOG_DEBUG("hash cache row for {} is unreadable, dropping it",
                         path);
        }
        if (!remove(path))
        {
            SW_LOG_DEBUG("stale hash cache row for {} was not removed", path);
        }
        return std::nullopt;
    }

    constexpr char const *touch_sql =
        "UPDATE file_cache SET last_accessed = ? WHERE path = ?;";
    if (auto *touch = prepare_cached(touch_sql); touch != nullptr)
    {
        sqlite3_bind_int64(touch, 1, now_seconds());
        sqlite3_bind_text(touch, 2, path.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(touch) != SQLITE_DONE)
        {
            SW_LOG_DEBUG("hash cache touch failed for {}: {}", path,
                         sqlite3_errmsg(db_));
        }
        sqlite3_reset(touch);
        sqlite3_clear_bindings(touch);
    }
    return result;
}

bool HashStore::put(std::string const &path, std::uint64_t size,
                    std::int64_t mtime_ns, std::string const &hash)
{
    constexpr char const *sql =
        "INSERT INTO file_cache (path, size, mtime_ns, hash, last_accessed) "
        "VALUES (?, ?, ?, ?, ?) "
        "ON CONFLICT(path) DO UPDATE SET "
        "size = excluded.size, mtime_ns = excluded.mtime_ns, "
        "hash = excluded.hash, last_accessed = excluded.last_accessed;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(size));
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(mtime_ns));
    sqlite3_bind_text(stmt, 4, hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, now_seconds());
    bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    if (!ok)
    {
        SW_LOG_WARN("hash cache write failed for {}: {}", path,
                    sqlite3_errmsg(db_));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return ok;
}

bool HashStore::remove(std::string const &path)
{
    constexpr char const *sql = "DELETE FROM file_cache WHERE path = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return ok;
}

bool HashStore::clear()
{
    if (!execute("DELETE FROM file_cache;"))
    {
        return false;
    }
    // Give the freed pages back to the filesystem.
    return execute("VACUUM;");
}

HashStoreStats HashStore::stats() const
{
    HashStoreStats result;
    constexpr char const *sql = "SELECT COUNT(*) FROM file_cache;";
    if (auto *stmt = prepare_cached(sql); stmt != nullptr)
    {
        if (sqlite3_step(stmt) == SQLITE_ROW)
        {
            result.total_entries =
                static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 0));
        }
        sqlite3_reset(stmt);
    }
    std::error_code ec;
    auto size = std::filesystem::file_size(path_, ec);
    if (!ec)
    {
        result.db_size_bytes = static_cast<std::uint64_t>(size);
    }
    return result;
}

} // namespace sw::storage
