#include "rpc/QBittorrentClient.hpp"

#include "rpc/Serializer.hpp"
#include "utils/Log.hpp"

#include <format>
#include <thread>
#include <utility>

namespace sw::rpc
{

namespace
{

constexpr long kStatusForbidden = 403;
constexpr long kStatusNotFound = 404;

bool is_retryable(http::HttpResponse const &response)
{
    return !response.transport_ok() || response.status >= 500;
}

std::string describe_failure(http::HttpResponse const &response)
{
    if (!response.transport_ok())
    {
        return response.error;
    }
    return std::format("HTTP {}", response.status);
}

} // namespace

QBittorrentClient::QBittorrentClient(
    QBittorrentOptions options, std::unique_ptr<http::IHttpTransport> transport,
    Sleeper sleeper)
    : options_(std::move(options)), transport_(std::move(transport)),
      sleeper_(std::move(sleeper))
{
    if (!sleeper_)
    {
        sleeper_ = [](std::chrono::milliseconds delay)
        { std::this_thread::sleep_for(delay); };
    }
    while (!options_.base_url.empty() && options_.base_url.back() == '/')
    {
        options_.base_url.pop_back();
    }
}

bool QBittorrentClient::login()
{
    auto delay = options_.retry_delay;
    for (int attempt = 0; attempt <= options_.max_retries; ++attempt)
    {
        if (attempt > 0)
        {
            sleeper_(delay);
            delay *= 2;
        }
        auto response = transport_->post_form(
            options_.base_url + "/api/v2/auth/login",
            {{"username", options_.username}, {"password", options_.password}});
        if (is_retryable(response))
        {
            last_error_ =
                std::format("login failed: {}", describe_failure(response));
            SW_LOG_WARN("qBittorrent {} (attempt {}/{})", last_error_,
                        attempt + 1, options_.max_retries + 1);
            continue;
        }
        // qBittorrent answers 200 "Fails." for bad credentials.
        if (!response.ok() || response.body.rfind("Ok.", 0) != 0)
        {
            last_error_ = response.status == kStatusForbidden
                              ? std::string("login refused: IP is banned")
                              : std::string("login failed: bad credentials");
            SW_LOG_ERROR("qBittorrent {}", last_error_);
            logged_in_ = false;
            return false;
        }
        logged_in_ = true;
        SW_LOG_INFO("connected to qBittorrent at {}", options_.base_url);
        return true;
    }
    logged_in_ = false;
    return false;
}

http::HttpResponse QBittorrentClient::send(Method method,
                                           std::string const &url,
                                           http::FormFields const &fields)
{
    if (method == Method::Get)
    {
        return transport_->get(url);
    }
    return transport_->post_form(url, fields);
}

std::optional<http::HttpResponse>
QBittorrentClient::call(Method method, std::string const &path,
                        http::FormFields const &fields)
{
    if (!logged_in_ && !login())
    {
        return std::nullopt;
    }
    auto const url = options_.base_url + path;
    bool relogged = false;
    auto delay = options_.retry_delay;
    int attempt = 0;
    while (attempt <= options_.max_retries)
    {
        auto response = send(method, url, fields);
        if (response.ok())
        {
            return response;
        }
        if (response.transport_ok() && response.status == kStatusForbidden &&
            !relogged)
        {
            SW_LOG_INFO("qBittorrent session expired, logging in again");
            relogged = true;
            logged_in_ = false;
            if (!login())
            {
                return std::nullopt;
            }
            continue;
        }
        last_error_ = std::format("{} failed: {}", path, describe_failure(response));
        if (!is_retryable(response))
        {
            return response;
        }
        ++attempt;
        if (attempt > options_.max_retries)
        {
            break;
        }
        SW_LOG_WARN("qBittorrent {} (retry {}/{} in {}ms)", last_error_, attempt,
                    options_.max_retries, delay.count());
        sleeper_(delay);
        delay *= 2;
    }
    SW_LOG_ERROR("qBittorrent {} after {} attempt(s)", last_error_,
                 options_.max_retries + 1);
    return std::nullopt;
}

std::optional<std::vector<engine::TorrentRecord>>
QBittorrentClient::list_torrents()
{
    auto response = call(Method::Get, "/api/v2/torrents/info");
    if (!response || !response->ok())
    {
        return std::nullopt;
    }
    auto torrents = parse_torrent_list(response->body);
    if (!torrents)
    {
        last_error_ = "torrents/info returned malformed JSON";
        return std::nullopt;
    }
    SW_LOG_DEBUG("retrieved {} torrents from qBittorrent", torrents->size());
    return torrents;
}

std::optional<std::vector<TorrentFileEntry>>
QBittorrentClient::list_files(std::string const &id)
{
    auto response = call(Method::Get, "/api/v2/torrents/files?hash=" + id);
    if (!response || !response->ok())
    {
        return std::nullopt;
    }
    auto files = parse_file_list(response->body);
    if (!files)
    {
        last_error_ = std::format("torrents/files for {} returned malformed JSON", id);
    }
    return files;
}

std::optional<std::vector<engine::TrackerRef>>
QBittorrentClient::list_trackers(std::string const &id)
{
    auto response = call(Method::Get, "/api/v2/torrents/trackers?hash=" + id);
    if (!response || !response->ok())
    {
        return std::nullopt;
    }
    auto trackers = parse_tracker_list(response->body);
    if (!trackers)
    {
        last_error_ =
            std::format("torrents/trackers for {} returned malformed JSON", id);
    }
    return trackers;
}

bool QBittorrentClient::remove_torrent(std::string const &id, bool delete_files)
{
    auto response = call(Method::PostForm, "/api/v2/torrents/delete",
                         {{"hashes", id},
                          {"deleteFiles", delete_files ? "true" : "false"}});
    return response && response->ok();
}

bool QBittorrentClient::post_with_fallback(std::string const &primary,
                                           std::string const &fallback,
                                           std::string const &id)
{
    auto response = call(Method::PostForm, primary, {{"hashes", id}});
    if (response && response->ok())
    {
        return true;
    }
    if (!response || response->status != kStatusNotFound)
    {
        return false;
    }
    response = call(Method::PostForm, fallback, {{"hashes", id}});
    return response && response->ok();
}

bool QBittorrentClient::pause(std::string const &id)
{
    return post_with_fallback("/api/v2/torrents/pause", "/api/v2/torrents/stop",
                              id);
}

bool QBittorrentClient::resume(std::string const &id)
{
    return post_with_fallback("/api/v2/torrents/resume",
                              "/api/v2/torrents/start", id);
}

} // namespace sw::rpc
