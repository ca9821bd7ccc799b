#include "engine/TrackerHealth.hpp"

#include <algorithm>
#include <cctype>

namespace sw::engine
{

namespace
{

std::string to_lower_trimmed(std::string_view value)
{
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    while (!value.empty() && is_space(value.front()))
    {
        value.remove_prefix(1);
    }
    while (!value.empty() && is_space(value.back()))
    {
        value.remove_suffix(1);
    }
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char ch) { return std::tolower(ch); });
    return result;
}

} // namespace

TrackerTier classify_tracker_url(std::string_view url)
{
    if (url == "** [DHT] **")
    {
        return TrackerTier::DHT;
    }
    if (url == "** [PeX] **")
    {
        return TrackerTier::PeX;
    }
    if (url == "** [LSD] **")
    {
        return TrackerTier::LSD;
    }
    return TrackerTier::Real;
}

std::vector<std::string> parse_message_list(std::string_view text)
{
    std::vector<std::string> result;
    std::size_t start = 0;
    while (start <= text.size())
    {
        auto comma = text.find(',', start);
        auto item = text.substr(start, comma == std::string_view::npos
                                           ? std::string_view::npos
                                           : comma - start);
        auto normalized = to_lower_trimmed(item);
        if (!normalized.empty())
        {
            result.push_back(std::move(normalized));
        }
        if (comma == std::string_view::npos)
        {
            break;
        }
        start = comma + 1;
    }
    return result;
}

TrackerHealth evaluate_trackers(std::vector<TrackerRef> const &trackers,
                                std::vector<std::string> const &dead_messages,
                                bool enabled)
{
    TrackerHealth health;
    for (auto const &tracker : trackers)
    {
        if (tracker.tier != TrackerTier::Real)
        {
            continue;
        }
        ++health.real_trackers;
        auto message = to_lower_trimmed(tracker.message);
        if (std::find(dead_messages.begin(), dead_messages.end(), message) !=
            dead_messages.end())
        {
            ++health.dead_trackers;
        }
    }
    health.dead = enabled && health.real_trackers > 0 &&
                  health.dead_trackers == health.real_trackers;
    return health;
}

} // namespace sw::engine
