#pragma once

#include "utils/FS.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sw::engine
{

struct LibraryFile
{
    std::filesystem::path path;
    utils::FileStat stat;
};

// Snapshot of the media library taken once per run: every regular file
// below the root, indexed by inode identity and by size.
class MediaLibraryIndex
{
  public:
    MediaLibraryIndex() = default;

    static MediaLibraryIndex build(utils::IFileSystem const &fs,
                                   std::filesystem::path const &root,
                                   std::error_code &ec);

    void add(std::filesystem::path path, utils::FileStat const &stat);

    bool contains_inode(std::uint64_t device, std::uint64_t inode) const;

    // Library files with exactly this size, or an empty list.
    std::vector<LibraryFile> const &files_with_size(std::uint64_t size) const;

    // Device of the library root, when it could be stat'ed.
    std::optional<std::uint64_t> device() const noexcept
    {
        return device_;
    }
    void set_device(std::uint64_t device) noexcept
    {
        device_ = device;
    }

    std::size_t size() const noexcept
    {
        return file_count_;
    }
    std::size_t errors() const noexcept
    {
        return error_count_;
    }

  private:
    std::set<std::pair<std::uint64_t, std::uint64_t>> inodes_;
    std::unordered_map<std::uint64_t, std::vector<LibraryFile>> by_size_;
    std::optional<std::uint64_t> device_;
    std::size_t file_count_ = 0;
    std::size_t error_count_ = 0;
};

} // namespace sw::engine
