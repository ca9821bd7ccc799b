#include "engine/DecisionEngine.hpp"

#include "engine/TorrentUtils.hpp"
#include "engine/TrackerHealth.hpp"

#include <format>
#include <utility>

namespace sw::engine
{

DecisionEngine::DecisionEngine(DecisionPolicy policy) : policy_(std::move(policy))
{
}

Decision DecisionEngine::decide(TorrentRecord const &torrent,
                                LinkGroup const &group) const
{
    Decision decision;
    decision.torrent_id = torrent.id;
    decision.group_id = group.id;

    auto health = evaluate_trackers(torrent.trackers,
                                    policy_.dead_tracker_messages,
                                    policy_.delete_dead_trackers);
    if (health.dead)
    {
        decision.action = Action::Delete;
        decision.reason = Reason::DeadTracker;
        decision.explanation.push_back(
            std::format("all {} tracker(s) report the torrent as unregistered",
                        health.real_trackers));
        return decision;
    }
    if (group.any_linked_to_library)
    {
        decision.action = Action::Keep;
        decision.reason = Reason::HardlinkPreserved;
        decision.explanation.push_back("media file(s) hardlinked to the library");
        return decision;
    }
    if (group.max_seeding_duration.count() == 0)
    {
        decision.action = Action::Keep;
        decision.reason = Reason::NotCompleted;
        decision.explanation.push_back("torrent not completed yet");
        return decision;
    }
    if (group.members.size() > 1)
    {
        decision.explanation.push_back(
            std::format("group of {} torrents: seeding {}, ratio {:.2f}",
                        group.members.size(),
                        format_duration(group.max_seeding_duration),
                        group.sum_ratio));
    }
    auto result = policy_.criteria.explain(group.max_seeding_duration,
                                           group.sum_ratio);
    if (policy_.criteria.empty())
    {
        decision.explanation.push_back("no deletion criteria configured");
    }
    for (auto &line : result.lines)
    {
        decision.explanation.push_back(std::move(line));
    }
    decision.action = result.matched ? Action::Delete : Action::Keep;
    decision.reason =
        result.matched ? Reason::CriteriaMatched : Reason::CriteriaNotMet;
    return decision;
}

std::vector<Decision>
DecisionEngine::decide_all(std::vector<TorrentRecord> const &torrents,
                           LinkGrouping const &grouping) const
{
    std::vector<Decision> decisions;
    decisions.reserve(torrents.size());
    for (std::size_t i = 0; i < torrents.size(); ++i)
    {
        decisions.push_back(decide(torrents[i], grouping.group_for(i)));
    }
    return decisions;
}

} // namespace sw::engine
