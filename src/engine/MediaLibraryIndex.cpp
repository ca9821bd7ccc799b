#include "engine/MediaLibraryIndex.hpp"

#include "utils/Log.hpp"

namespace sw::engine
{

MediaLibraryIndex MediaLibraryIndex::build(utils::IFileSystem const &fs,
                                           std::filesystem::path const &root,
                                           std::error_code &ec)
{
    MediaLibraryIndex index;
    auto root_stat = fs.stat(root, ec);
    if (!root_stat)
    {
        return index;
    }
    index.device_ = root_stat->device;
    auto files = fs.walk_files(root, ec);
    if (ec)
    {
        SW_LOG_WARN("media library walk of {} stopped early: {}",
                    root.string(), ec.message());
    }
    for (auto &path : files)
    {
        std::error_code stat_ec;
        auto info = fs.stat(path, stat_ec);
        if (!info)
        {
            SW_LOG_DEBUG("skipping library file {}: {}", path.string(),
                         stat_ec.message());
            ++index.error_count_;
            continue;
        }
        if (!info->is_regular)
        {
            continue;
        }
        index.add(std::move(path), *info);
    }
    SW_LOG_INFO("media library index: {} files, {} errors", index.file_count_,
                index.error_count_);
    return index;
}

void MediaLibraryIndex::add(std::filesystem::path path,
                            utils::FileStat const &stat)
{
    inodes_.emplace(stat.device, stat.inode);
    by_size_[stat.size].push_back(LibraryFile{std::move(path), stat});
    ++file_count_;
}

bool MediaLibraryIndex::contains_inode(std::uint64_t device,
                                       std::uint64_t inode) const
{
    return inodes_.count({device, inode}) > 0;
}

std::vector<LibraryFile> const &
MediaLibraryIndex::files_with_size(std::uint64_t size) const
{
    static std::vector<LibraryFile> const kNone;
    auto it = by_size_.find(size);
    return it == by_size_.end() ? kNone : it->second;
}

} // namespace sw::engine
