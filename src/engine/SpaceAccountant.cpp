#include "engine/SpaceAccountant.hpp"

namespace sw::engine
{

SpaceAccountant::SpaceAccountant(utils::IFileSystem const &fs) : fs_(fs)
{
}

std::uint64_t
SpaceAccountant::estimate_freed(std::vector<std::filesystem::path> const &paths)
{
    return commit(claim(paths));
}

SpaceAccountant::Claim
SpaceAccountant::claim(std::vector<std::filesystem::path> const &paths) const
{
    Claim result;
    result.reserve(paths.size());
    for (auto const &path : paths)
    {
        std::error_code ec;
        auto info = fs_.stat(path, ec);
        if (!info)
        {
            continue;
        }
        ClaimedFile file;
        file.path = path.lexically_normal().string();
        file.key = InodeKey{info->device, info->inode};
        file.size = info->size;
        file.link_count = info->link_count;
        result.push_back(std::move(file));
    }
    return result;
}

std::uint64_t SpaceAccountant::commit(Claim const &claim)
{
    std::uint64_t freed = 0;
    for (auto const &file : claim)
    {
        if (!seen_paths_.insert(file.path).second)
        {
            continue;
        }
        if (freed_.count(file.key) > 0)
        {
            continue;
        }
        auto pending = ++pending_links_[file.key];
        if (pending >= file.link_count)
        {
            freed_.insert(file.key);
            freed += file.size;
        }
    }
    return freed;
}

} // namespace sw::engine
