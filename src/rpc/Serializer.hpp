#pragma once

#include "engine/Types.hpp"
#include "rpc/TorrentClient.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sw::rpc
{

// qBittorrent Web API v2 payloads. nullopt when the payload is not the
// expected JSON array; malformed entries inside a valid array are skipped.
std::optional<std::vector<engine::TorrentRecord>>
parse_torrent_list(std::string_view payload);
std::optional<std::vector<TorrentFileEntry>>
parse_file_list(std::string_view payload);
std::optional<std::vector<engine::TrackerRef>>
parse_tracker_list(std::string_view payload);

// Discord webhook bodies. timestamp is ISO 8601 and shown by Discord in the
// embed footer.
std::string serialize_summary_embed(engine::RunSummary const &summary,
                                    std::string const &timestamp);
std::string serialize_error_embed(std::string const &message,
                                  std::string const &timestamp);

// "1.50 GB" style sizes used in notifications and the console summary.
std::string format_gigabytes(std::uint64_t bytes);

} // namespace sw::rpc
