#include "engine/HardlinkFixer.hpp"

#include "rpc/TorrentClient.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <format>
#include <set>

namespace sw::engine
{

namespace
{

bool is_orphan(FileRef const &file, std::filesystem::path const &torrent_dir)
{
    return file.identity.has_value() && file.identity->link_count == 1 &&
           file.size > 0 && utils::is_within(file.path, torrent_dir);
}

bool is_failure(HardlinkAction action)
{
    return action == HardlinkAction::LinkFailed ||
           action == HardlinkAction::StatFailed;
}

} // namespace

HardlinkFixer::HardlinkFixer(utils::IFileSystem &fs, ContentHasher &hasher,
                             MediaLibraryIndex const &library,
                             rpc::ITorrentClient *client, bool dry_run)
    : fs_(fs), hasher_(hasher), library_(library), client_(client),
      dry_run_(dry_run)
{
}

std::vector<LibraryFile const *>
HardlinkFixer::candidates_for(FileRef const &file) const
{
    std::vector<LibraryFile const *> result;
    for (auto const &candidate : library_.files_with_size(file.size))
    {
        result.push_back(&candidate);
    }
    // Same file name first; media managers usually keep it on import.
    auto const name = file.path.filename();
    std::stable_partition(result.begin(), result.end(),
                          [&name](LibraryFile const *candidate) {
                              return candidate->path.filename() == name;
                          });
    return result;
}

FixResult HardlinkFixer::fix_file(FileRef const &file)
{
    FixResult result;
    result.file = file.path;

    std::error_code ec;
    auto current = fs_.stat(file.path, ec);
    if (!current)
    {
        result.action = HardlinkAction::StatFailed;
        result.message = std::format("stat failed: {}", ec.message());
        return result;
    }
    if (library_.contains_inode(current->device, current->inode))
    {
        result.action = HardlinkAction::AlreadyLinked;
        return result;
    }

    auto candidates = candidates_for(file);
    if (candidates.empty())
    {
        result.action = HardlinkAction::NoMatch;
        return result;
    }

    std::optional<std::string> own_hash;
    bool saw_same_device = false;
    bool saw_mismatch = false;
    for (auto const *candidate : candidates)
    {
        if (candidate->stat.device != current->device)
        {
            continue;
        }
        saw_same_device = true;
        if (!own_hash)
        {
            own_hash = hasher_.hash(file.path, *current, ec);
            if (!own_hash)
            {
                result.action = HardlinkAction::StatFailed;
                result.message = std::format("hashing failed: {}", ec.message());
                return result;
            }
        }
        std::error_code candidate_ec;
        auto candidate_hash =
            hasher_.hash(candidate->path, candidate->stat, candidate_ec);
        if (!candidate_hash || *candidate_hash != *own_hash)
        {
            saw_mismatch = saw_mismatch || candidate_hash.has_value();
            continue;
        }

        result.media_file = candidate->path;
        if (dry_run_)
        {
            result.action = HardlinkAction::DryRun;
            result.message =
                std::format("would link to {}", candidate->path.string());
            SW_LOG_INFO("[dry-run] would relink {} -> {}", file.path.string(),
                        candidate->path.string());
            return result;
        }
        auto link_ec = fs_.create_hardlink(candidate->path, file.path);
        if (link_ec)
        {
            result.action = HardlinkAction::LinkFailed;
            result.message = link_ec.message();
            SW_LOG_WARN("failed to relink {} -> {}: {}", file.path.string(),
                        candidate->path.string(), result.message);
            return result;
        }
        result.action = HardlinkAction::Fixed;
        result.message = std::format("linked to {}", candidate->path.string());
        SW_LOG_INFO("relinked {} -> {}", file.path.string(),
                    candidate->path.string());
        return result;
    }

    if (!saw_same_device)
    {
        result.action = HardlinkAction::CrossDevice;
        result.message = "library copy is on another filesystem";
    }
    else if (saw_mismatch)
    {
        result.action = HardlinkAction::HashMismatch;
        result.message = "same size but different content";
    }
    else
    {
        result.action = HardlinkAction::NoMatch;
    }
    return result;
}

FixReport HardlinkFixer::run(std::vector<TorrentRecord> const &torrents,
                             std::filesystem::path const &torrent_dir)
{
    FixReport report;
    report.linked_media.assign(torrents.size(), false);
    // Paths linked (or would be) earlier in this pass. Cross-seeds may list
    // the very same path.
    std::set<std::filesystem::path> linked_paths;
    for (std::size_t i = 0; i < torrents.size(); ++i)
    {
        auto const &torrent = torrents[i];
        std::vector<FileRef const *> work;
        for (auto const &file : torrent.files)
        {
            if (!is_orphan(file, torrent_dir))
            {
                continue;
            }
            ++report.orphaned_files;
            if (!library_.files_with_size(file.size).empty())
            {
                work.push_back(&file);
            }
        }
        if (work.empty())
        {
            continue;
        }

        bool paused = false;
        if (!dry_run_ && client_ != nullptr)
        {
            paused = client_->pause(torrent.id);
            if (!paused)
            {
                SW_LOG_WARN("could not pause '{}' before relinking: {}",
                            torrent.name, client_->last_error());
            }
        }
        for (auto const *file : work)
        {
            if (linked_paths.count(file->path) > 0)
            {
                report.linked_media[i] = report.linked_media[i] || file->is_media;
                continue;
            }
            auto result = fix_file(*file);
            result.torrent = i;
            if (result.action == HardlinkAction::AlreadyLinked)
            {
                report.linked_media[i] = report.linked_media[i] || file->is_media;
                continue;
            }
            ++report.attempted;
            if (result.action == HardlinkAction::Fixed ||
                result.action == HardlinkAction::DryRun)
            {
                linked_paths.insert(file->path);
                ++report.fixed;
                report.bytes_saved += file->size;
                if (file->is_media)
                {
                    report.linked_media[i] = true;
                }
            }
            else if (is_failure(result.action))
            {
                ++report.failed;
            }
            else
            {
                SW_LOG_DEBUG("no library copy for {}: {}", file->path.string(),
                             to_string(result.action));
            }
            report.results.push_back(std::move(result));
        }
        if (paused && !client_->resume(torrent.id))
        {
            SW_LOG_ERROR("could not resume '{}' after relinking: {}",
                         torrent.name, client_->last_error());
        }
    }
    SW_LOG_INFO("hardlink fixer: {} orphaned, {} attempted, {} fixed, {} failed",
                report.orphaned_files, report.attempted, report.fixed,
                report.failed);
    return report;
}

} // namespace sw::engine
