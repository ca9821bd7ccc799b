#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

#include <sqlite3.h>

namespace sw::storage {

struct HashStoreStats {
  std::uint64_t total_entries = 0;
  std::uint64_t db_size_bytes = 0;
};

// Persistent content-hash cache keyed by path. A row is only returned while
// the caller's (size, mtime) still match the stored ones; a mismatching row
// is dropped so the hash gets recomputed.
class HashStore {
public:
  explicit HashStore(std::filesystem::path path);
  ~HashStore();

  HashStore(HashStore const &) = delete;
  HashStore &operator=(HashStore const &) = delete;

  bool is_valid() const noexcept { return db_ != nullptr; }
  std::filesystem::path const &path() const noexcept { return path_; }

  std::optional<std::string> get(std::string const &path, std::uint64_t size,
                                 std::int64_t mtime_ns);
  bool put(std::string const &path, std::uint64_t size, std::int64_t mtime_ns,
           std::string const &hash);
  bool remove(std::string const &path);
  bool clear();
  HashStoreStats stats() const;

private:
  bool create_table() const;
  void close();
  bool execute(std::string const &sql) const;
  sqlite3_stmt *prepare_cached(std::string const &sql) const;

  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
};

} // namespace sw::storage
