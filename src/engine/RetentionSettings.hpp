#pragma once

#include "engine/Criteria.hpp"
#include "utils/Log.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sw::engine
{

class ConfigError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

struct RetentionSettings
{
    std::string qbt_host;
    int qbt_port = 8080;
    std::string qbt_username;
    std::string qbt_password;

    std::filesystem::path torrent_dir = "/data/torrents";
    std::filesystem::path media_library_dir = "/data/media";

    std::string deletion_criteria_text = "30d 2.0";
    CriteriaSet deletion_criteria;

    bool dry_run = true;
    bool fix_hardlinks = true;
    bool delete_dead_trackers = false;
    std::vector<std::string> dead_tracker_messages;
    // Lower-case, with the leading dot.
    std::set<std::string> media_extensions;

    std::filesystem::path data_dir = "/app/data/seedwarden";
    bool enable_cache = true;
    std::filesystem::path cache_db_path;

    std::string discord_webhook_url;

    log::Level log_level = log::Level::Info;
    std::filesystem::path log_file;
    int log_max_files = 5;

    std::filesystem::path lock_file;

    int api_max_retries = 3;
    std::chrono::milliseconds api_retry_delay{1000};

    // "http://host:port" unless the host already carries a scheme or port.
    std::string qbt_base_url() const;
    bool is_media_file(std::filesystem::path const &path) const;
};

using EnvLookup = std::function<std::optional<std::string>(char const *)>;

std::optional<std::string> read_process_env(char const *key);

// true, 1 and yes (any case) are true; everything else is false.
bool parse_bool(std::string_view value);

// Reads every setting through lookup. Throws ConfigError for missing or
// malformed values and InvalidCriteriaError for a bad DELETION_CRITERIA.
RetentionSettings load_settings(EnvLookup const &lookup);

// Checks the directories the pass works on and creates the data directory.
// Throws ConfigError.
void validate_directories(RetentionSettings const &settings);

// One line per setting, credentials masked.
std::vector<std::string> describe_settings(RetentionSettings const &settings);

} // namespace sw::engine
