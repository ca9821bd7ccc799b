#include "app/RetentionMain.hpp"
#include "engine/Criteria.hpp"
#include "engine/RetentionSettings.hpp"

#include "TestUtils.hpp"

#include <map>
#include <string>

#include <doctest/doctest.h>

using sw::engine::ConfigError;
using sw::engine::load_settings;

namespace
{

using Env = std::map<std::string, std::string>;

sw::engine::EnvLookup lookup_in(Env const &env)
{
    return [env](char const *key) -> std::optional<std::string>
    {
        auto it = env.find(key);
        if (it == env.end())
        {
            return std::nullopt;
        }
        return it->second;
    };
}

Env minimal_env()
{
    return Env{{"QBITTORRENT_HOST", "qbittorrent"},
               {"QBITTORRENT_USERNAME", "admin"},
               {"QBITTORRENT_PASSWORD", "secret"}};
}

} // namespace

TEST_CASE("settings fall back to defaults")
{
    auto settings = load_settings(lookup_in(minimal_env()));
    CHECK(settings.qbt_host == "qbittorrent");
    CHECK(settings.qbt_port == 8080);
    CHECK(settings.qbt_base_url() == "http://qbittorrent:8080");
    CHECK(settings.torrent_dir == std::filesystem::path("/data/torrents"));
    CHECK(settings.media_library_dir == std::filesystem::path("/data/media"));
    CHECK(settings.dry_run);
    CHECK(settings.fix_hardlinks);
    CHECK_FALSE(settings.delete_dead_trackers);
    CHECK(settings.enable_cache);
    CHECK(settings.deletion_criteria.rules.size() == 1);
    CHECK(sw::engine::describe(settings.deletion_criteria) == "[30d AND 2.0]");
    CHECK(settings.dead_tracker_messages.size() == 3);
    CHECK(settings.cache_db_path ==
          settings.data_dir / "cache" / "file_cache.db");
    CHECK(settings.log_level == sw::log::Level::Info);
    CHECK(settings.is_media_file("/x/Movie.MKV"));
    CHECK_FALSE(settings.is_media_file("/x/movie.nfo"));
    CHECK_FALSE(settings.is_media_file("/x/README"));
}

TEST_CASE("missing credentials are reported by name")
{
    for (auto const *key :
         {"QBITTORRENT_HOST", "QBITTORRENT_USERNAME", "QBITTORRENT_PASSWORD"})
    {
        auto env = minimal_env();
        env.erase(key);
        try
        {
            load_settings(lookup_in(env));
            FAIL("expected ConfigError for " << key);
        }
        catch (ConfigError const &error)
        {
            CHECK(std::string(error.what()).find(key) != std::string::npos);
        }
    }

    auto blank = minimal_env();
    blank["QBITTORRENT_PASSWORD"] = "   ";
    CHECK_THROWS_AS(load_settings(lookup_in(blank)), ConfigError);
}

TEST_CASE("environment values override defaults")
{
    auto env = minimal_env();
    env["QBITTORRENT_PORT"] = "9091";
    env["TORRENT_DIR"] = "/srv/torrents";
    env["MEDIA_LIBRARY_DIR"] = "/srv/media";
    env["DELETION_CRITERIA"] = "60d 1.0 | 1y";
    env["DRY_RUN"] = "False";
    env["FIX_HARDLINKS"] = "no";
    env["DELETE_DEAD_TRACKERS"] = "YES";
    env["DEAD_TRACKER_MESSAGES"] = "Gone Forever";
    env["MEDIA_EXTENSIONS"] = "mkv, .MP4";
    env["DATA_DIR"] = "/var/lib/seedwarden";
    env["ENABLE_CACHE"] = "0";
    env["LOG_LEVEL"] = "debug";
    env["LOG_MAX_FILES"] = "2";
    env["API_MAX_RETRIES"] = "5";
    env["API_RETRY_DELAY_MS"] = "250";

    auto settings = load_settings(lookup_in(env));
    CHECK(settings.qbt_base_url() == "http://qbittorrent:9091");
    CHECK(settings.torrent_dir == std::filesystem::path("/srv/torrents"));
    CHECK(settings.deletion_criteria.rules.size() == 2);
    CHECK_FALSE(settings.dry_run);
    CHECK_FALSE(settings.fix_hardlinks);
    CHECK(settings.delete_dead_trackers);
    REQUIRE(settings.dead_tracker_messages.size() == 1);
    CHECK(settings.dead_tracker_messages[0] == "gone forever");
    CHECK(settings.is_media_file("a.mp4"));
    CHECK_FALSE(settings.is_media_file("a.avi"));
    CHECK_FALSE(settings.enable_cache);
    CHECK(settings.lock_file ==
          std::filesystem::path("/var/lib/seedwarden/seedwarden.lock"));
    CHECK(settings.log_level == sw::log::Level::Debug);
    CHECK(settings.log_max_files == 2);
    CHECK(settings.api_max_retries == 5);
    CHECK(settings.api_retry_delay == std::chrono::milliseconds(250));
}

TEST_CASE("empty deletion criteria disable criteria deletion")
{
    auto env = minimal_env();
    env["DELETION_CRITERIA"] = "";
    auto settings = load_settings(lookup_in(env));
    CHECK(settings.deletion_criteria.empty());
}

TEST_CASE("malformed values are rejected")
{
    auto env = minimal_env();

    SUBCASE("port out of range")
    {
        env["QBITTORRENT_PORT"] = "70000";
        CHECK_THROWS_AS(load_settings(lookup_in(env)), ConfigError);
    }
    SUBCASE("port not a number")
    {
        env["QBITTORRENT_PORT"] = "80a";
        CHECK_THROWS_AS(load_settings(lookup_in(env)), ConfigError);
    }
    SUBCASE("unknown log level")
    {
        env["LOG_LEVEL"] = "verbose";
        CHECK_THROWS_AS(load_settings(lookup_in(env)), ConfigError);
    }
    SUBCASE("bad criteria token")
    {
        env["DELETION_CRITERIA"] = "30x";
        CHECK_THROWS_AS(load_settings(lookup_in(env)),
                        sw::engine::InvalidCriteriaError);
    }
}

TEST_CASE("base url keeps an explicit scheme and port")
{
    sw::engine::RetentionSettings settings;
    settings.qbt_port = 8080;

    settings.qbt_host = "https://qb.example.com/";
    CHECK(settings.qbt_base_url() == "https://qb.example.com:8080");
    settings.qbt_host = "http://10.0.0.2:8090";
    CHECK(settings.qbt_base_url() == "http://10.0.0.2:8090");
    settings.qbt_host = "[::1]";
    CHECK(settings.qbt_base_url() == "http://[::1]:8080");
    settings.qbt_host = "https://qb.example.com/qbt";
    CHECK(settings.qbt_base_url() == "https://qb.example.com:8080/qbt");
}

TEST_CASE("directory validation")
{
    sw::tests::TempRoot root("swtest-settings-dirs");
    auto settings = load_settings(lookup_in(minimal_env()));
    settings.torrent_dir = root / "torrents";
    settings.media_library_dir = root / "media";
    settings.data_dir = root / "data";

    CHECK_THROWS_AS(sw::engine::validate_directories(settings), ConfigError);

    std::filesystem::create_directories(settings.torrent_dir);
    std::filesystem::create_directories(settings.media_library_dir);
    CHECK_NOTHROW(sw::engine::validate_directories(settings));
    CHECK(std::filesystem::is_directory(settings.data_dir));
}

TEST_CASE("described settings never show the password")
{
    auto settings = load_settings(lookup_in(minimal_env()));
    for (auto const &line : sw::engine::describe_settings(settings))
    {
        CHECK(line.find("secret") == std::string::npos);
    }
}

TEST_CASE("command line flags")
{
    char prog[] = "seedwarden";
    char dry[] = "--dry-run";
    char stats[] = "--cache-stats";
    char bogus[] = "--frobnicate";
    char help[] = "-h";

    std::string error;
    char *good_args[] = {prog, dry, stats};
    auto options = sw::app::parse_cli(3, good_args, error);
    REQUIRE(options);
    CHECK(options->dry_run);
    CHECK(options->cache_stats);
    CHECK_FALSE(options->clear_cache);

    char *bad_args[] = {prog, bogus};
    CHECK_FALSE(sw::app::parse_cli(2, bad_args, error));
    CHECK(error == "unknown argument: --frobnicate");
    CHECK(sw::app::retention_main(2, bad_args) == 1);

    char *help_args[] = {prog, help};
    CHECK(sw::app::retention_main(2, help_args) == 0);
    CHECK(sw::app::usage_text().find("--clear-cache") != std::string::npos);
}
