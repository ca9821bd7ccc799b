#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sw::engine
{

enum class TrackerTier
{
    Real = 0,
    DHT = 1,
    PeX = 2,
    LSD = 3,
};

// Physical identity of a file that exists on disk.
struct FileIdentity
{
    std::uint64_t device = 0;
    std::uint64_t inode = 0;
    std::uint64_t link_count = 0;
    std::int64_t mtime_ns = 0;

    bool same_inode(FileIdentity const &other) const noexcept
    {
        return device == other.device && inode == other.inode;
    }
};

struct FileRef
{
    std::filesystem::path path;
    std::uint64_t size = 0;
    std::optional<FileIdentity> identity;
    bool is_media = false;
};

struct TrackerRef
{
    std::string url;
    std::string message;
    TrackerTier tier = TrackerTier::Real;
};

struct TorrentRecord
{
    std::string id;
    std::string name;
    std::filesystem::path save_path;
    std::vector<FileRef> files;
    double ratio = 0.0;
    std::chrono::seconds seeding_time{0};
    std::uint64_t total_size = 0;
    std::vector<TrackerRef> trackers;
};

enum class Action
{
    Keep,
    Delete,
};

enum class Reason
{
    DeadTracker,
    HardlinkPreserved,
    NotCompleted,
    CriteriaMatched,
    CriteriaNotMet,
};

struct Decision
{
    std::string torrent_id;
    Action action = Action::Keep;
    Reason reason = Reason::CriteriaNotMet;
    std::size_t group_id = 0;
    std::vector<std::string> explanation;
};

enum class HardlinkAction
{
    Fixed,
    DryRun,
    AlreadyLinked,
    NoMatch,
    HashMismatch,
    CrossDevice,
    StatFailed,
    LinkFailed,
};

struct HardlinkFailure
{
    std::string torrent;
    std::filesystem::path file;
    std::filesystem::path media_file;
    HardlinkAction action = HardlinkAction::LinkFailed;
    std::string message;
};

struct RunSummary
{
    bool dry_run = true;
    std::size_t torrents_processed = 0;
    std::size_t torrents_skipped = 0;
    std::size_t torrents_kept = 0;
    std::size_t torrents_kept_criteria_not_met = 0;
    std::size_t torrents_kept_hardlink_preserved = 0;
    std::size_t torrents_kept_not_completed = 0;
    std::size_t torrents_deleted = 0;
    std::size_t torrents_deleted_dead_tracker = 0;
    std::size_t torrents_deleted_criteria = 0;
    std::uint64_t space_freed_dead_tracker_bytes = 0;
    std::uint64_t space_freed_criteria_bytes = 0;
    std::uint64_t space_saved_hardlinks_bytes = 0;
    std::size_t hardlinks_attempted = 0;
    std::size_t hardlinks_fixed = 0;
    std::size_t hardlinks_failed = 0;
    std::size_t orphaned_files_found = 0;
    std::vector<std::string> deleted_torrents;
    std::map<std::string, std::size_t> deletion_reasons;
    std::vector<HardlinkFailure> hardlink_failures;
    std::vector<std::string> errors;
};

char const *to_string(Action action) noexcept;
char const *to_string(Reason reason) noexcept;
char const *to_string(HardlinkAction action) noexcept;
char const *to_string(TrackerTier tier) noexcept;

} // namespace sw::engine
