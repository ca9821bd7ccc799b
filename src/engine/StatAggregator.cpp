#include "engine/StatAggregator.hpp"

#include "engine/TorrentUtils.hpp"
#include "utils/Log.hpp"

#include <algorithm>

namespace sw::engine
{

void aggregate_groups(LinkGrouping &grouping,
                      std::vector<TorrentRecord> const &torrents,
                      std::vector<bool> const &linked_this_run)
{
    for (auto &group : grouping.groups)
    {
        group.max_seeding_duration = std::chrono::seconds(0);
        group.sum_ratio = 0.0;
        group.any_linked_to_library = false;
        for (auto index : group.members)
        {
            auto const &torrent = torrents.at(index);
            group.max_seeding_duration =
                std::max(group.max_seeding_duration, torrent.seeding_time);
            group.sum_ratio += torrent.ratio;
            bool const fixed =
                index < linked_this_run.size() && linked_this_run[index];
            bool const linked = index < grouping.linked_to_library.size() &&
                                grouping.linked_to_library[index];
            if (fixed || linked)
            {
                group.any_linked_to_library = true;
            }
        }
        if (group.members.size() > 1)
        {
            SW_LOG_INFO("group {} of {} torrents: seeding {}, ratio {:.2f}{}",
                        group.id, group.members.size(),
                        format_duration(group.max_seeding_duration),
                        group.sum_ratio,
                        group.any_linked_to_library ? ", in library" : "");
        }
    }
}

} // namespace sw::engine
