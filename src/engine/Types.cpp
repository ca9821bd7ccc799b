#include "engine/Types.hpp"

namespace sw::engine
{

char const *to_string(Action action) noexcept
{
    switch (action)
    {
    case Action::Delete:
        return "delete";
    case Action::Keep:
    default:
        return "keep";
    }
}

char const *to_string(Reason reason) noexcept
{
    switch (reason)
    {
    case Reason::DeadTracker:
        return "dead-tracker";
    case Reason::HardlinkPreserved:
        return "hardlink-preserved";
    case Reason::NotCompleted:
        return "not-completed";
    case Reason::CriteriaMatched:
        return "criteria-matched";
    case Reason::CriteriaNotMet:
    default:
        return "criteria-not-met";
    }
}

char const *to_string(HardlinkAction action) noexcept
{
    switch (action)
    {
    case HardlinkAction::Fixed:
        return "fixed";
    case HardlinkAction::DryRun:
        return "dry-run";
    case HardlinkAction::AlreadyLinked:
        return "already-linked";
    case HardlinkAction::NoMatch:
        return "no-match";
    case HardlinkAction::HashMismatch:
        return "hash-mismatch";
    case HardlinkAction::CrossDevice:
        return "cross-device";
    case HardlinkAction::StatFailed:
        return "stat-failed";
    case HardlinkAction::LinkFailed:
    default:
        return "link-failed";
    }
}

char const *to_string(TrackerTier tier) noexcept
{
    switch (tier)
    {
    case TrackerTier::DHT:
        return "DHT";
    case TrackerTier::PeX:
        return "PeX";
    case TrackerTier::LSD:
        return "LSD";
    case TrackerTier::Real:
    default:
        return "tracker";
    }
}

} // namespace sw::engine
