#include "engine/RetentionSettings.hpp"

#include "engine/TrackerHealth.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <format>
#include <system_error>

#include <unistd.h>

namespace sw::engine
{

namespace
{

constexpr char const *kDefaultDeadTrackerMessages =
    "unregistered torrent,torrent not registered with this tracker,"
    "torrent not found";
constexpr char const *kDefaultMediaExtensions =
    ".mkv,.mp4,.avi,.mov,.m4v,.wmv,.flv,.webm,.ts,.m2ts";

std::string trim_whitespace(std::string_view value)
{
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
    {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(begin, end - begin + 1));
}

std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return std::tolower(ch); });
    return value;
}

int parse_int_setting(char const *key, std::string const &value, int min_value,
                      int max_value)
{
    auto text = trim_whitespace(value);
    int parsed = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     parsed);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size())
    {
        throw ConfigError(
            std::format("{} must be an integer, got: '{}'", key, value));
    }
    if (parsed < min_value || parsed > max_value)
    {
        throw ConfigError(std::format("{} must be between {} and {}, got: {}",
                                      key, min_value, max_value, parsed));
    }
    return parsed;
}

std::set<std::string> parse_extension_list(std::string_view text)
{
    std::set<std::string> result;
    for (auto &item : parse_message_list(text))
    {
        if (item.front() != '.')
        {
            item.insert(item.begin(), '.');
        }
        result.insert(std::move(item));
    }
    return result;
}

std::filesystem::path path_or(std::optional<std::string> const &value,
                              std::filesystem::path fallback)
{
    if (!value)
    {
        return fallback;
    }
    return std::filesystem::path(trim_whitespace(*value));
}

bool is_writable(std::filesystem::path const &path)
{
    return ::access(path.c_str(), W_OK) == 0;
}

} // namespace

std::optional<std::string> read_process_env(char const *key)
{
    auto value = std::getenv(key);
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string(value);
}

bool parse_bool(std::string_view value)
{
    auto content = to_lower(trim_whitespace(value));
    return content == "true" || content == "1" || content == "yes";
}

std::string RetentionSettings::qbt_base_url() const
{
    auto host = trim_whitespace(qbt_host);
    while (!host.empty() && host.back() == '/')
    {
        host.pop_back();
    }
    auto scheme = host.find("://");
    if (scheme == std::string::npos)
    {
        host = "http://" + host;
        scheme = 4;
    }
    auto authority_start = scheme + 3;
    auto authority_end = host.find('/', authority_start);
    auto authority = host.substr(authority_start, authority_end == std::string::npos
                                                      ? std::string::npos
                                                      : authority_end - authority_start);
    bool has_port = false;
    if (!authority.empty() && authority.front() == '[')
    {
        has_port = authority.find("]:") != std::string::npos;
    }
    else
    {
        has_port = authority.find(':') != std::string::npos;
    }
    if (has_port)
    {
        return host;
    }
    auto with_port = authority + ":" + std::to_string(qbt_port);
    return host.substr(0, authority_start) + with_port +
           (authority_end == std::string::npos ? std::string()
                                               : host.substr(authority_end));
}

bool RetentionSettings::is_media_file(std::filesystem::path const &path) const
{
    auto extension = to_lower(path.extension().string());
    return !extension.empty() && media_extensions.count(extension) > 0;
}

RetentionSettings load_settings(EnvLookup const &lookup)
{
    RetentionSettings settings;

    auto read = [&lookup](char const *key) -> std::optional<std::string>
    {
        auto value = lookup(key);
        if (!value || trim_whitespace(*value).empty())
        {
            return std::nullopt;
        }
        return value;
    };
    auto required = [&read](char const *key) -> std::string
    {
        auto value = read(key);
        if (!value)
        {
            throw ConfigError(
                std::format("Required environment variable not set: {}", key));
        }
        return *value;
    };

    settings.qbt_host = trim_whitespace(required("QBITTORRENT_HOST"));
    if (auto value = read("QBITTORRENT_PORT"))
    {
        settings.qbt_port = parse_int_setting("QBITTORRENT_PORT", *value, 1, 65535);
    }
    settings.qbt_username = required("QBITTORRENT_USERNAME");
    settings.qbt_password = required("QBITTORRENT_PASSWORD");

    if (auto value = read("TORRENT_DIR"))
    {
        settings.torrent_dir = trim_whitespace(*value);
    }
    if (auto value = read("MEDIA_LIBRARY_DIR"))
    {
        settings.media_library_dir = trim_whitespace(*value);
    }

    // An explicitly empty DELETION_CRITERIA disables criteria deletion, so
    // the raw lookup is used here instead of read().
    if (auto value = lookup("DELETION_CRITERIA"))
    {
        settings.deletion_criteria_text = trim_whitespace(*value);
    }
    settings.deletion_criteria = parse_criteria(settings.deletion_criteria_text);

    settings.dry_run = parse_bool(read("DRY_RUN").value_or("true"));
    settings.fix_hardlinks = parse_bool(read("FIX_HARDLINKS").value_or("true"));
    settings.delete_dead_trackers =
        parse_bool(read("DELETE_DEAD_TRACKERS").value_or("false"));
    settings.dead_tracker_messages = parse_message_list(
        read("DEAD_TRACKER_MESSAGES").value_or(kDefaultDeadTrackerMessages));
    settings.media_extensions = parse_extension_list(
        read("MEDIA_EXTENSIONS").value_or(kDefaultMediaExtensions));

    if (auto value = read("DATA_DIR"))
    {
        settings.data_dir = trim_whitespace(*value);
    }
    settings.enable_cache = parse_bool(read("ENABLE_CACHE").value_or("true"));
    settings.cache_db_path = path_or(read("CACHE_DB_PATH"),
                                     settings.data_dir / "cache" / "file_cache.db");

    settings.discord_webhook_url =
        trim_whitespace(read("DISCORD_WEBHOOK_URL").value_or(""));

    if (auto value = read("LOG_LEVEL"))
    {
        auto level = log::parse_level(trim_whitespace(*value));
        if (!level)
        {
            throw ConfigError(std::format(
                "LOG_LEVEL must be DEBUG, INFO, WARNING or ERROR, got: '{}'",
                *value));
        }
        settings.log_level = *level;
    }
    settings.log_file = path_or(read("LOG_FILE"),
                                settings.data_dir / "logs" / "seedwarden.log");
    if (auto value = read("LOG_MAX_FILES"))
    {
        settings.log_max_files =
            parse_int_setting("LOG_MAX_FILES", *value, 0, 10000);
    }

    settings.lock_file =
        path_or(read("LOCK_FILE"), settings.data_dir / "seedwarden.lock");

    if (auto value = read("API_MAX_RETRIES"))
    {
        settings.api_max_retries =
            parse_int_setting("API_MAX_RETRIES", *value, 0, 100);
    }
    if (auto value = read("API_RETRY_DELAY_MS"))
    {
        settings.api_retry_delay = std::chrono::milliseconds(
            parse_int_setting("API_RETRY_DELAY_MS", *value, 0, 600000));
    }
    return settings;
}

void validate_directories(RetentionSettings const &settings)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(settings.torrent_dir, ec))
    {
        throw ConfigError(std::format("Torrent directory does not exist: {}",
                                      settings.torrent_dir.string()));
    }
    if (!std::filesystem::is_directory(settings.media_library_dir, ec))
    {
        throw ConfigError(std::format("Media library directory does not exist: {}",
                                      settings.media_library_dir.string()));
    }
    if (!settings.dry_run && !is_writable(settings.torrent_dir))
    {
        throw ConfigError(std::format("Torrent directory is not writable: {}",
                                      settings.torrent_dir.string()));
    }
    std::filesystem::create_directories(settings.data_dir, ec);
    if (ec)
    {
        throw ConfigError(std::format("Cannot create data directory {}: {}",
                                      settings.data_dir.string(), ec.message()));
    }
    if (!is_writable(settings.data_dir))
    {
        throw ConfigError(std::format("Data directory is not writable: {}",
                                      settings.data_dir.string()));
    }
}

std::vector<std::string> describe_settings(RetentionSettings const &settings)
{
    std::vector<std::string> lines;
    lines.push_back(std::format("qbittorrent: {} (user {})",
                                settings.qbt_base_url(), settings.qbt_username));
    lines.push_back(std::format("torrent dir: {}", settings.torrent_dir.string()));
    lines.push_back(
        std::format("media library: {}", settings.media_library_dir.string()));
    lines.push_back(std::format("deletion criteria: {}",
                                describe(settings.deletion_criteria)));
    lines.push_back(std::format("dry run: {}, fix hardlinks: {}",
                                settings.dry_run, settings.fix_hardlinks));
    lines.push_back(std::format("delete dead trackers: {} ({} messages)",
                                settings.delete_dead_trackers,
                                settings.dead_tracker_messages.size()));
    lines.push_back(std::format("media extensions: {}",
                                settings.media_extensions.size()));
    lines.push_back(std::format(
        "hash cache: {}", settings.enable_cache
                              ? settings.cache_db_path.string()
                              : std::string("disabled")));
    lines.push_back(std::format("discord webhook: {}",
                                settings.discord_webhook_url.empty()
                                    ? "not configured"
                                    : "configured"));
    return lines;
}

} // namespace sw::engine
