#pragma once

#include "engine/LinkGrouper.hpp"
#include "engine/Types.hpp"

#include <vector>

namespace sw::engine
{

// Fills max seeding duration, summed ratio and the library flag of every
// group. linked_this_run marks torrents the hardlink fixer linked (or would
// link, in dry-run) during this pass; it may be shorter than torrents.
void aggregate_groups(LinkGrouping &grouping,
                      std::vector<TorrentRecord> const &torrents,
                      std::vector<bool> const &linked_this_run);

} // namespace sw::engine
