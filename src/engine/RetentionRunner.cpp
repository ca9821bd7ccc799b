#include "engine/RetentionRunner.hpp"

#include "engine/ContentHasher.hpp"
#include "engine/HardlinkFixer.hpp"
#include "engine/LinkGrouper.hpp"
#include "engine/MediaLibraryIndex.hpp"
#include "engine/SpaceAccountant.hpp"
#include "engine/StatAggregator.hpp"
#include "engine/TorrentUtils.hpp"
#include "rpc/TorrentClient.hpp"
#include "utils/Log.hpp"

#include <format>
#include <utility>

namespace sw::engine
{

namespace
{

std::optional<FileIdentity> identity_of(utils::IFileSystem const &fs,
                                        std::filesystem::path const &path)
{
    std::error_code ec;
    auto info = fs.stat(path, ec);
    if (!info || !info->is_regular)
    {
        return std::nullopt;
    }
    FileIdentity identity;
    identity.device = info->device;
    identity.inode = info->inode;
    identity.link_count = info->link_count;
    identity.mtime_ns = info->mtime_ns;
    return identity;
}

} // namespace

RetentionRunner::RetentionRunner(RetentionSettings const &settings,
                                 rpc::ITorrentClient &client,
                                 utils::IFileSystem &fs,
                                 storage::HashStore *cache)
    : settings_(settings), client_(client), fs_(fs), cache_(cache)
{
}

std::vector<TorrentRecord> RetentionRunner::take_snapshot(RunSummary &summary)
{
    auto listed = client_.list_torrents();
    if (!listed)
    {
        throw RunAbortedError(std::format("failed to list torrents: {}",
                                          client_.last_error()));
    }
    SW_LOG_INFO("retrieved {} torrents", listed->size());

    std::vector<TorrentRecord> torrents;
    torrents.reserve(listed->size());
    for (auto &record : *listed)
    {
        auto id = normalize_torrent_id(record.id);
        if (!id)
        {
            auto message =
                std::format("'{}': invalid torrent id '{}'", record.name, record.id);
            SW_LOG_WARN("skipping {}", message);
            summary.errors.push_back(std::move(message));
            ++summary.torrents_skipped;
            continue;
        }
        // The client expects the id the way it reported it.
        auto files = client_.list_files(record.id);
        if (!files)
        {
            auto message = std::format("'{}': could not list files: {}",
                                       record.name, client_.last_error());
            SW_LOG_WARN("skipping {}", message);
            summary.errors.push_back(std::move(message));
            ++summary.torrents_skipped;
            continue;
        }
        auto trackers = client_.list_trackers(record.id);
        if (!trackers)
        {
            auto message = std::format("'{}': could not list trackers: {}",
                                       record.name, client_.last_error());
            SW_LOG_WARN("skipping {}", message);
            summary.errors.push_back(std::move(message));
            ++summary.torrents_skipped;
            continue;
        }
        record.trackers = std::move(*trackers);
        record.files.clear();
        record.files.reserve(files->size());
        for (auto const &entry : *files)
        {
            FileRef file;
            file.path = (record.save_path / entry.name).lexically_normal();
            file.size = entry.size;
            file.is_media = settings_.is_media_file(file.path);
            file.identity = identity_of(fs_, file.path);
            if (!file.identity)
            {
                SW_LOG_DEBUG("'{}': {} is not on disk", record.name,
                             file.path.string());
            }
            record.files.push_back(std::move(file));
        }
        torrents.push_back(std::move(record));
    }
    return torrents;
}

void RetentionRunner::refresh_identities(TorrentRecord &torrent)
{
    for (auto &file : torrent.files)
    {
        file.identity = identity_of(fs_, file.path);
    }
}

RunSummary RetentionRunner::run()
{
    RunSummary summary;
    summary.dry_run = settings_.dry_run;
    decisions_.clear();
    snapshot_ = take_snapshot(summary);

    std::error_code ec;
    auto library =
        MediaLibraryIndex::build(fs_, settings_.media_library_dir, ec);
    if (ec)
    {
        summary.errors.push_back(std::format("media library {}: {}",
                                             settings_.media_library_dir.string(),
                                             ec.message()));
    }

    ContentHasher hasher(fs_, cache_);

    std::vector<bool> linked_this_run(snapshot_.size(), false);
    if (settings_.fix_hardlinks)
    {
        HardlinkFixer fixer(fs_, hasher, library, &client_, settings_.dry_run);
        auto report = fixer.run(snapshot_, settings_.torrent_dir);
        summary.orphaned_files_found = report.orphaned_files;
        summary.hardlinks_attempted = report.attempted;
        summary.hardlinks_fixed = report.fixed;
        summary.hardlinks_failed = report.failed;
        summary.space_saved_hardlinks_bytes = report.bytes_saved;
        linked_this_run = report.linked_media;

        bool relinked = false;
        for (auto const &result : report.results)
        {
            relinked = relinked || result.action == HardlinkAction::Fixed;
            if (result.action != HardlinkAction::LinkFailed &&
                result.action != HardlinkAction::StatFailed)
            {
                continue;
            }
            HardlinkFailure failure;
            failure.torrent = snapshot_[result.torrent].name;
            failure.file = result.file;
            failure.media_file = result.media_file;
            failure.action = result.action;
            failure.message = result.message;
            summary.hardlink_failures.push_back(std::move(failure));
        }
        // Another torrent may list a relinked path, so every identity is
        // taken again before grouping.
        if (relinked)
        {
            for (auto &torrent : snapshot_)
            {
                refresh_identities(torrent);
            }
        }
    }
    else
    {
        for (auto const &torrent : snapshot_)
        {
            for (auto const &file : torrent.files)
            {
                if (file.identity && file.identity->link_count == 1)
                {
                    ++summary.orphaned_files_found;
                }
            }
        }
    }

    LinkGrouper grouper(library, settings_.torrent_dir, &hasher);
    auto grouping = grouper.build(snapshot_);
    aggregate_groups(grouping, snapshot_, linked_this_run);

    DecisionPolicy policy;
    policy.criteria = settings_.deletion_criteria;
    policy.dead_tracker_messages = settings_.dead_tracker_messages;
    policy.delete_dead_trackers = settings_.delete_dead_trackers;
    DecisionEngine engine(std::move(policy));
    decisions_ = engine.decide_all(snapshot_, grouping);

    apply_decisions(summary);
    SW_LOG_DEBUG("hash cache: {} hits, {} misses", hasher.cache_hits(),
                 hasher.cache_misses());
    return summary;
}

void RetentionRunner::apply_decisions(RunSummary &summary)
{
    SpaceAccountant accountant(fs_);
    for (std::size_t i = 0; i < decisions_.size(); ++i)
    {
        auto const &decision = decisions_[i];
        auto const &torrent = snapshot_[i];
        ++summary.torrents_processed;
        SW_LOG_INFO("[{}/{}] '{}': {} ({})", i + 1, decisions_.size(),
                    torrent.name, to_string(decision.action),
                    to_string(decision.reason));
        for (auto const &line : decision.explanation)
        {
            SW_LOG_INFO("    {}", line);
        }

        if (decision.action == Action::Keep)
        {
            ++summary.torrents_kept;
            switch (decision.reason)
            {
            case Reason::HardlinkPreserved:
                ++summary.torrents_kept_hardlink_preserved;
                break;
            case Reason::NotCompleted:
                ++summary.torrents_kept_not_completed;
                break;
            default:
                ++summary.torrents_kept_criteria_not_met;
                break;
            }
            continue;
        }

        std::vector<std::filesystem::path> paths;
        paths.reserve(torrent.files.size());
        for (auto const &file : torrent.files)
        {
            paths.push_back(file.path);
        }
        // Stat'ed before removal since the client deletes the files itself;
        // counted only once the removal went through.
        auto claim = accountant.claim(paths);

        if (settings_.dry_run)
        {
            SW_LOG_INFO("[dry-run] would delete '{}'", torrent.name);
        }
        else if (!client_.remove_torrent(torrent.id, true))
        {
            auto message = std::format("'{}': delete failed: {}", torrent.name,
                                       client_.last_error());
            SW_LOG_ERROR("{}", message);
            summary.errors.push_back(std::move(message));
            continue;
        }
        else
        {
            SW_LOG_INFO("deleted '{}'", torrent.name);
        }
        auto freed = accountant.commit(claim);
        SW_LOG_DEBUG("'{}' frees {} bytes", torrent.name, freed);

        ++summary.torrents_deleted;
        summary.deleted_torrents.push_back(torrent.name);
        ++summary.deletion_reasons[to_string(decision.reason)];
        if (decision.reason == Reason::DeadTracker)
        {
            ++summary.torrents_deleted_dead_tracker;
            summary.space_freed_dead_tracker_bytes += freed;
        }
        else
        {
            ++summary.torrents_deleted_criteria;
            summary.space_freed_criteria_bytes += freed;
        }
    }
}

} // namespace sw::engine
