#include "engine/LinkGrouper.hpp"

#include "engine/ContentHasher.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <map>
#include <numeric>
#include <utility>

namespace sw::engine
{

DisjointSet::DisjointSet(std::size_t count) : parent_(count), size_(count, 1)
{
    std::iota(parent_.begin(), parent_.end(), std::size_t{0});
}

std::size_t DisjointSet::find(std::size_t item)
{
    auto root = item;
    while (parent_[root] != root)
    {
        root = parent_[root];
    }
    while (parent_[item] != root)
    {
        auto next = parent_[item];
        parent_[item] = root;
        item = next;
    }
    return root;
}

bool DisjointSet::unite(std::size_t a, std::size_t b)
{
    auto root_a = find(a);
    auto root_b = find(b);
    if (root_a == root_b)
    {
        return false;
    }
    if (size_[root_a] < size_[root_b])
    {
        std::swap(root_a, root_b);
    }
    parent_[root_b] = root_a;
    size_[root_a] += size_[root_b];
    return true;
}

std::size_t DisjointSet::component_size(std::size_t item)
{
    return size_[find(item)];
}

LinkGrouper::LinkGrouper(MediaLibraryIndex const &library,
                         std::filesystem::path torrent_dir,
                         ContentHasher *hasher)
    : library_(library), torrent_dir_(std::move(torrent_dir)), hasher_(hasher)
{
}

bool LinkGrouper::eligible(FileRef const &file) const
{
    return file.is_media && file.identity.has_value() &&
           utils::is_within(file.path, torrent_dir_);
}

LinkGrouping LinkGrouper::build(std::vector<TorrentRecord> const &torrents) const
{
    DisjointSet sets(torrents.size());
    std::map<std::pair<std::uint64_t, std::uint64_t>, std::size_t> first_owner;
    for (std::size_t i = 0; i < torrents.size(); ++i)
    {
        for (auto const &file : torrents[i].files)
        {
            if (!eligible(file))
            {
                continue;
            }
            auto key = std::make_pair(file.identity->device, file.identity->inode);
            auto [it, inserted] = first_owner.emplace(key, i);
            if (!inserted && sets.unite(it->second, i))
            {
                SW_LOG_DEBUG("'{}' shares {} with '{}'", torrents[i].name,
                             file.path.filename().string(),
                             torrents[it->second].name);
            }
        }
    }

    LinkGrouping grouping;
    grouping.group_of.assign(torrents.size(), 0);
    grouping.linked_to_library.assign(torrents.size(), false);
    std::map<std::size_t, std::size_t> group_for_root;
    for (std::size_t i = 0; i < torrents.size(); ++i)
    {
        auto root = sets.find(i);
        auto [it, inserted] = group_for_root.emplace(root, grouping.groups.size());
        if (inserted)
        {
            LinkGroup group;
            group.id = grouping.groups.size();
            grouping.groups.push_back(std::move(group));
        }
        grouping.groups[it->second].members.push_back(i);
        grouping.group_of[i] = it->second;
        grouping.linked_to_library[i] = is_linked_to_library(torrents[i]);
    }
    return grouping;
}

bool LinkGrouper::is_linked_to_library(TorrentRecord const &torrent) const
{
    for (auto const &file : torrent.files)
    {
        if (!eligible(file))
        {
            continue;
        }
        auto const &identity = *file.identity;
        if (library_.contains_inode(identity.device, identity.inode))
        {
            return true;
        }
        auto library_device = library_.device();
        if (library_device && *library_device != identity.device &&
            content_in_library(file))
        {
            return true;
        }
    }
    return false;
}

// Cross-device: a hardlink is impossible, so identical content in the
// library is the best available signal that the file was imported.
bool LinkGrouper::content_in_library(FileRef const &file) const
{
    if (hasher_ == nullptr || file.size == 0)
    {
        return false;
    }
    auto const &candidates = library_.files_with_size(file.size);
    if (candidates.empty())
    {
        return false;
    }
    utils::FileStat stat;
    stat.size = file.size;
    stat.mtime_ns = file.identity->mtime_ns;
    stat.device = file.identity->device;
    stat.inode = file.identity->inode;
    stat.link_count = file.identity->link_count;
    stat.is_regular = true;
    std::error_code ec;
    auto own_hash = hasher_->hash(file.path, stat, ec);
    if (!own_hash)
    {
        return false;
    }
    for (auto const &candidate : candidates)
    {
        std::error_code candidate_ec;
        auto candidate_hash =
            hasher_->hash(candidate.path, candidate.stat, candidate_ec);
        if (candidate_hash && *candidate_hash == *own_hash)
        {
            SW_LOG_DEBUG("{} matches library file {} by content",
                         file.path.string(), candidate.path.string());
            return true;
        }
    }
    return false;
}

} // namespace sw::engine
