#pragma once

#include "engine/Criteria.hpp"
#include "engine/LinkGrouper.hpp"
#include "engine/Types.hpp"

#include <string>
#include <vector>

namespace sw::engine
{

struct DecisionPolicy
{
    CriteriaSet criteria;
    std::vector<std::string> dead_tracker_messages;
    bool delete_dead_trackers = false;
};

// Order of precedence: dead tracker, library link, not completed, criteria.
class DecisionEngine
{
  public:
    explicit DecisionEngine(DecisionPolicy policy);

    Decision decide(TorrentRecord const &torrent, LinkGroup const &group) const;
    std::vector<Decision> decide_all(std::vector<TorrentRecord> const &torrents,
                                     LinkGrouping const &grouping) const;

    DecisionPolicy const &policy() const noexcept
    {
        return policy_;
    }

  private:
    DecisionPolicy policy_;
};

} // namespace sw::engine
