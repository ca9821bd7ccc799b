#pragma once

#include "engine/ContentHasher.hpp"
#include "engine/MediaLibraryIndex.hpp"
#include "engine/Types.hpp"
#include "utils/FS.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sw::rpc
{
class ITorrentClient;
}

namespace sw::engine
{

struct FixResult
{
    std::size_t torrent = 0;
    std::filesystem::path file;
    std::filesystem::path media_file;
    HardlinkAction action = HardlinkAction::NoMatch;
    std::string message;
};

struct FixReport
{
    std::vector<FixResult> results;
    // Per torrent: a media file was linked (or would be, in dry-run).
    std::vector<bool> linked_media;
    std::size_t orphaned_files = 0;
    std::size_t attempted = 0;
    std::size_t fixed = 0;
    std::size_t failed = 0;
    std::uint64_t bytes_saved = 0;
};

// Replaces orphaned torrent files (a single link) with hardlinks to
// identical files in the media library. Every file is handled on its own;
// failures are recorded and never stop the pass.
class HardlinkFixer
{
  public:
    // client may be null; otherwise torrents are paused while their files
    // are relinked.
    HardlinkFixer(utils::IFileSystem &fs, ContentHasher &hasher,
                  MediaLibraryIndex const &library,
                  rpc::ITorrentClient *client, bool dry_run);

    FixReport run(std::vector<TorrentRecord> const &torrents,
                  std::filesystem::path const &torrent_dir);

    // Relinks one file against the library candidates of equal size.
    FixResult fix_file(FileRef const &file);

  private:
    std::vector<LibraryFile const *> candidates_for(FileRef const &file) const;

    utils::IFileSystem &fs_;
    ContentHasher &hasher_;
    MediaLibraryIndex const &library_;
    rpc::ITorrentClient *client_;
    bool dry_run_;
};

} // namespace sw::engine
