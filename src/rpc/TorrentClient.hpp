#pragma once

#include "engine/Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sw::rpc
{

// One entry of a torrent's file list, relative to the torrent's save path.
struct TorrentFileEntry
{
    std::string name;
    std::uint64_t size = 0;
};

// The BitTorrent client as the retention pass sees it. Failed calls return
// nullopt/false and leave a description in last_error().
class ITorrentClient
{
  public:
    virtual ~ITorrentClient() noexcept = default;

    // Records come back without files; trackers may be empty until
    // list_trackers is called.
    virtual std::optional<std::vector<engine::TorrentRecord>> list_torrents() = 0;
    virtual std::optional<std::vector<TorrentFileEntry>>
    list_files(std::string const &id) = 0;
    virtual std::optional<std::vector<engine::TrackerRef>>
    list_trackers(std::string const &id) = 0;
    virtual bool remove_torrent(std::string const &id, bool delete_files) = 0;
    virtual bool pause(std::string const &id) = 0;
    virtual bool resume(std::string const &id) = 0;

    virtual std::string last_error() const = 0;
};

} // namespace sw::rpc
