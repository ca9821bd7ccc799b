#pragma once

#include "utils/FS.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace sw::storage
{
class HashStore;
}

namespace sw::engine
{

// Content hashes through the persistent cache. The cache is optional; a
// null or invalid store means every lookup computes.
class ContentHasher
{
  public:
    ContentHasher(utils::IFileSystem const &fs, storage::HashStore *cache);

    // stat must describe the file as it is now; it is the cache key.
    std::optional<std::string> hash(std::filesystem::path const &path,
                                    utils::FileStat const &stat,
                                    std::error_code &ec);

    std::size_t cache_hits() const noexcept
    {
        return hits_;
    }
    std::size_t cache_misses() const noexcept
    {
        return misses_;
    }

  private:
    utils::IFileSystem const &fs_;
    storage::HashStore *cache_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};

} // namespace sw::engine
