#pragma once

#include "engine/Types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sw::engine
{

// qBittorrent lists peer sources as pseudo trackers: "** [DHT] **",
// "** [PeX] **" and "** [LSD] **". Everything else is a real tracker.
TrackerTier classify_tracker_url(std::string_view url);

// Comma separated, trimmed, lower-cased. Empty items are dropped.
std::vector<std::string> parse_message_list(std::string_view text);

struct TrackerHealth
{
    std::size_t real_trackers = 0;
    std::size_t dead_trackers = 0;
    bool dead = false;
};

// Dead when enabled, at least one real tracker exists and every real
// tracker's message equals (case-insensitively) one of dead_messages.
// dead_messages are expected lower-case, as parse_message_list returns them.
TrackerHealth evaluate_trackers(std::vector<TrackerRef> const &trackers,
                                std::vector<std::string> const &dead_messages,
                                bool enabled);

inline bool is_dead(std::vector<TrackerRef> const &trackers,
                    std::vector<std::string> const &dead_messages, bool enabled)
{
    return evaluate_trackers(trackers, dead_messages, enabled).dead;
}

} // namespace sw::engine
