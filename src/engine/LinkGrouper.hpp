#pragma once

#include "engine/MediaLibraryIndex.hpp"
#include "engine/Types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace sw::engine
{

class ContentHasher;

// Index based disjoint-set forest with path compression and union by size.
class DisjointSet
{
  public:
    explicit DisjointSet(std::size_t count);

    std::size_t find(std::size_t item);
    // False when both items already share a root.
    bool unite(std::size_t a, std::size_t b);
    std::size_t component_size(std::size_t item);

  private:
    std::vector<std::size_t> parent_;
    std::vector<std::size_t> size_;
};

struct LinkGroup
{
    std::size_t id = 0;
    // Indices into the snapshot the grouping was built from.
    std::vector<std::size_t> members;
    std::chrono::seconds max_seeding_duration{0};
    double sum_ratio = 0.0;
    bool any_linked_to_library = false;
};

struct LinkGrouping
{
    std::vector<LinkGroup> groups;
    // Per torrent: index into groups.
    std::vector<std::size_t> group_of;
    // Per torrent: a media file already shares content with the library.
    std::vector<bool> linked_to_library;

    LinkGroup const &group_for(std::size_t torrent) const
    {
        return groups.at(group_of.at(torrent));
    }
};

class LinkGrouper
{
  public:
    // hasher may be null, which disables the cross-device content check.
    LinkGrouper(MediaLibraryIndex const &library,
                std::filesystem::path torrent_dir, ContentHasher *hasher);

    // Groups torrents whose media files share a (device, inode) below the
    // torrent directory. Group ids follow the order of first appearance.
    LinkGrouping build(std::vector<TorrentRecord> const &torrents) const;

    bool is_linked_to_library(TorrentRecord const &torrent) const;

  private:
    bool eligible(FileRef const &file) const;
    bool content_in_library(FileRef const &file) const;

    MediaLibraryIndex const &library_;
    std::filesystem::path torrent_dir_;
    ContentHasher *hasher_;
};

} // namespace sw::engine
