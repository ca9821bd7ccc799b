#include "app/RetentionMain.hpp"

#include "engine/RetentionRunner.hpp"
#include "engine/RetentionSettings.hpp"
#include "rpc/DiscordNotifier.hpp"
#include "rpc/QBittorrentClient.hpp"
#include "rpc/Serializer.hpp"
#include "utils/FS.hpp"
#include "utils/HashStore.hpp"
#include "utils/Http.hpp"
#include "utils/Log.hpp"
#include "utils/RunLock.hpp"
#include "utils/Version.hpp"

#include <chrono>
#include <cstdio>
#include <exception>
#include <format>
#include <memory>
#include <string_view>
#include <utility>

namespace sw::app
{

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitLocked = 2;
constexpr auto kNotifierTimeout = std::chrono::seconds(10);

std::unique_ptr<rpc::DiscordNotifier> make_notifier(std::string const &url)
{
    std::unique_ptr<http::IHttpTransport> transport;
    if (!url.empty())
    {
        transport = std::make_unique<http::CurlSession>(kNotifierTimeout);
    }
    return std::make_unique<rpc::DiscordNotifier>(url, std::move(transport));
}

// Used when configuration could not be loaded; the webhook may still work.
void report_fatal(std::string const &message)
{
    SW_LOG_ERROR("{}", message);
    auto url = engine::read_process_env("DISCORD_WEBHOOK_URL").value_or("");
    try
    {
        auto notifier = make_notifier(url);
        if (!notifier->send_error(message))
        {
            SW_LOG_WARN("error notification was not delivered");
        }
    }
    catch (std::exception const &ex)
    {
        SW_LOG_WARN("error notification failed: {}", ex.what());
    }
}

void log_summary(engine::RunSummary const &summary)
{
    SW_LOG_INFO("{}", std::string(60, '='));
    SW_LOG_INFO("{}Run summary", summary.dry_run ? "[DRY RUN] " : "");
    SW_LOG_INFO("torrents processed: {} (skipped {})", summary.torrents_processed,
                summary.torrents_skipped);
    SW_LOG_INFO("torrents deleted: {} (dead tracker {}, criteria {})",
                summary.torrents_deleted, summary.torrents_deleted_dead_tracker,
                summary.torrents_deleted_criteria);
    SW_LOG_INFO("torrents kept: {}", summary.torrents_kept);
    SW_LOG_INFO("  criteria not met: {}", summary.torrents_kept_criteria_not_met);
    SW_LOG_INFO("  hardlink preserved: {}",
                summary.torrents_kept_hardlink_preserved);
    SW_LOG_INFO("  not completed: {}", summary.torrents_kept_not_completed);
    SW_LOG_INFO("hardlinks attempted/fixed/failed: {}/{}/{}",
                summary.hardlinks_attempted, summary.hardlinks_fixed,
                summary.hardlinks_failed);
    SW_LOG_INFO("orphaned files found: {}", summary.orphaned_files_found);
    SW_LOG_INFO("space freed: {} (dead trackers {}, criteria {}), saved by "
                "hardlinks: {}",
                rpc::format_gigabytes(summary.space_freed_dead_tracker_bytes +
                                      summary.space_freed_criteria_bytes),
                rpc::format_gigabytes(summary.space_freed_dead_tracker_bytes),
                rpc::format_gigabytes(summary.space_freed_criteria_bytes),
                rpc::format_gigabytes(summary.space_saved_hardlinks_bytes));
    for (auto const &name : summary.deleted_torrents)
    {
        SW_LOG_INFO("  - {}", name);
    }
    for (auto const &failure : summary.hardlink_failures)
    {
        SW_LOG_WARN("hardlink failure in '{}': {} ({}) {}", failure.torrent,
                    failure.file.string(), engine::to_string(failure.action),
                    failure.message);
    }
    for (auto const &error : summary.errors)
    {
        SW_LOG_WARN("error: {}", error);
    }
    SW_LOG_INFO("{}", std::string(60, '='));
}

int run_cache_command(CliOptions const &options,
                      engine::RetentionSettings const &settings)
{
    storage::HashStore cache(settings.cache_db_path);
    if (!cache.is_valid())
    {
        SW_LOG_ERROR("hash cache {} could not be opened",
                     settings.cache_db_path.string());
        return kExitFailure;
    }
    if (options.clear_cache)
    {
        if (!cache.clear())
        {
            SW_LOG_ERROR("failed to clear hash cache");
            return kExitFailure;
        }
        log::print_status("Hash cache cleared: {}", settings.cache_db_path.string());
    }
    if (options.cache_stats)
    {
        auto stats = cache.stats();
        log::print_status("Hash cache: {}", settings.cache_db_path.string());
        log::print_status("  entries: {}", stats.total_entries);
        log::print_status("  size: {:.2f} MB",
                          static_cast<double>(stats.db_size_bytes) /
                              (1024.0 * 1024.0));
    }
    return kExitOk;
}

} // namespace

std::optional<CliOptions> parse_cli(int argc, char *argv[], std::string &error)
{
    CliOptions options;
    for (int index = 1; index < argc; ++index)
    {
        if (argv[index] == nullptr)
        {
            continue;
        }
        std::string_view arg = argv[index];
        if (arg == "--dry-run")
        {
            options.dry_run = true;
        }
        else if (arg == "--clear-cache")
        {
            options.clear_cache = true;
        }
        else if (arg == "--cache-stats")
        {
            options.cache_stats = true;
        }
        else if (arg == "--version" || arg == "-V")
        {
            options.show_version = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            options.show_help = true;
        }
        else
        {
            error = std::format("unknown argument: {}", arg);
            return std::nullopt;
        }
    }
    return options;
}

std::string usage_text()
{
    return "Usage: seedwarden [--dry-run] [--clear-cache] [--cache-stats] "
           "[--version] [--help]\n"
           "\n"
           "Runs one retention pass against qBittorrent. Configuration is read "
           "from the environment.\n"
           "  --dry-run      report decisions without deleting or linking\n"
           "  --clear-cache  empty the file hash cache and exit\n"
           "  --cache-stats  print hash cache statistics and exit\n"
           "  --version      print the version and exit\n"
           "  --help         print this text and exit";
}

int retention_main(int argc, char *argv[])
{
    std::string cli_error;
    auto options = parse_cli(argc, argv, cli_error);
    if (!options)
    {
        std::fprintf(stderr, "%s\n%s\n", cli_error.c_str(), usage_text().c_str());
        return kExitFailure;
    }
    if (options->show_help)
    {
        log::print_status("{}", usage_text());
        return kExitOk;
    }
    if (options->show_version)
    {
        log::print_status("{}", version::kDisplayVersion);
        return kExitOk;
    }

    engine::RetentionSettings settings;
    try
    {
        settings = engine::load_settings(&engine::read_process_env);
        if (options->dry_run)
        {
            settings.dry_run = true;
        }
        log::set_level(settings.log_level);
        if (auto rotated = log::rotate_log_file(settings.log_file,
                                                settings.log_max_files))
        {
            SW_LOG_DEBUG("previous log rotated to {}", rotated->string());
        }
        log::set_log_file(settings.log_file);
        engine::validate_directories(settings);
    }
    catch (engine::InvalidCriteriaError const &ex)
    {
        report_fatal(std::format("Invalid DELETION_CRITERIA: {}", ex.what()));
        return kExitFailure;
    }
    catch (engine::ConfigError const &ex)
    {
        report_fatal(std::format("Configuration error: {}", ex.what()));
        return kExitFailure;
    }

    utils::RunLock lock;
    std::error_code lock_ec;
    switch (lock.acquire(settings.lock_file, lock_ec))
    {
    case utils::RunLock::Status::HeldElsewhere:
        SW_LOG_WARN("another run holds {}, exiting", settings.lock_file.string());
        return kExitLocked;
    case utils::RunLock::Status::Failed:
        report_fatal(std::format("cannot lock {}: {}",
                                 settings.lock_file.string(), lock_ec.message()));
        return kExitFailure;
    case utils::RunLock::Status::Acquired:
        break;
    }

    if (options->clear_cache || options->cache_stats)
    {
        return run_cache_command(*options, settings);
    }

    SW_LOG_INFO("{} starting", version::kDisplayVersion);
    for (auto const &line : engine::describe_settings(settings))
    {
        SW_LOG_INFO("  {}", line);
    }
    if (settings.dry_run)
    {
        SW_LOG_WARN("running in DRY RUN mode, no changes will be made");
    }

    try
    {
        std::unique_ptr<storage::HashStore> cache;
        if (settings.enable_cache)
        {
            cache = std::make_unique<storage::HashStore>(settings.cache_db_path);
            if (!cache->is_valid())
            {
                SW_LOG_WARN("hash cache unavailable, hashing without it");
                cache.reset();
            }
        }

        auto session = std::make_unique<http::CurlSession>();
        auto const base_url = settings.qbt_base_url();
        session->add_header("Referer: " + base_url);
        rpc::QBittorrentOptions client_options;
        client_options.base_url = base_url;
        client_options.username = settings.qbt_username;
        client_options.password = settings.qbt_password;
        client_options.max_retries = settings.api_max_retries;
        client_options.retry_delay = settings.api_retry_delay;
        rpc::QBittorrentClient client(std::move(client_options),
                                      std::move(session));

        utils::LocalFileSystem fs;
        engine::RetentionRunner runner(settings, client, fs, cache.get());
        auto summary = runner.run();
        log_summary(summary);

        auto notifier = make_notifier(settings.discord_webhook_url);
        if (!notifier->send_summary(summary))
        {
            SW_LOG_WARN("run summary notification was not delivered");
        }
    }
    catch (engine::RunAbortedError const &ex)
    {
        report_fatal(std::format("Run aborted: {}", ex.what()));
        return kExitFailure;
    }
    catch (std::exception const &ex)
    {
        report_fatal(std::format("Fatal error: {}", ex.what()));
        return kExitFailure;
    }
    SW_LOG_INFO("finished");
    return kExitOk;
}

} // namespace sw::app
