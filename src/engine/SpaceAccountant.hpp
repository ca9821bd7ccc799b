#pragma once

#include "utils/FS.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace sw::engine
{

// Estimates the bytes a set of deletions really frees. An inode only frees
// its size once every one of its links has been handed in, across all calls
// made during a run.
class SpaceAccountant
{
  public:
    using InodeKey = std::pair<std::uint64_t, std::uint64_t>;

    struct ClaimedFile
    {
        std::string path;
        InodeKey key;
        std::uint64_t size = 0;
        std::uint64_t link_count = 0;
    };
    // Files stat'ed ahead of a deletion that may still fail.
    using Claim = std::vector<ClaimedFile>;

    explicit SpaceAccountant(utils::IFileSystem const &fs);

    // Bytes freed by the paths of this call; missing files count nothing.
    std::uint64_t estimate_freed(std::vector<std::filesystem::path> const &paths);

    // Stats paths without counting them. Nothing is recorded until the claim
    // is committed, so a dropped claim leaves the run totals untouched.
    Claim claim(std::vector<std::filesystem::path> const &paths) const;
    std::uint64_t commit(Claim const &claim);

  private:

    utils::IFileSystem const &fs_;
    std::set<std::string> seen_paths_;
    std::map<InodeKey, std::uint64_t> pending_links_;
    std::set<InodeKey> freed_;
};

} // namespace sw::engine
