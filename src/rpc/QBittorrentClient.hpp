#pragma once

#include "rpc/TorrentClient.hpp"
#include "utils/Http.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sw::rpc
{

struct QBittorrentOptions
{
    std::string base_url;
    std::string username;
    std::string password;
    int max_retries = 3;
    std::chrono::milliseconds retry_delay{1000};
};

// qBittorrent Web API v2 over a cookie session. Every call logs in lazily,
// retries transport failures and 5xx answers with doubling delays, and logs
// in again once when the session expires (HTTP 403).
class QBittorrentClient final : public ITorrentClient
{
  public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    QBittorrentClient(QBittorrentOptions options,
                      std::unique_ptr<http::IHttpTransport> transport,
                      Sleeper sleeper = {});

    bool login();

    std::optional<std::vector<engine::TorrentRecord>> list_torrents() override;
    std::optional<std::vector<TorrentFileEntry>>
    list_files(std::string const &id) override;
    std::optional<std::vector<engine::TrackerRef>>
    list_trackers(std::string const &id) override;
    bool remove_torrent(std::string const &id, bool delete_files) override;
    bool pause(std::string const &id) override;
    bool resume(std::string const &id) override;

    std::string last_error() const override
    {
        return last_error_;
    }

  private:
    enum class Method
    {
        Get,
        PostForm,
    };

    std::optional<http::HttpResponse> call(Method method,
                                           std::string const &path,
                                           http::FormFields const &fields = {});
    http::HttpResponse send(Method method, std::string const &url,
                            http::FormFields const &fields);
    // Tries primary, then fallback when the server does not know primary
    // (qBittorrent 5 renamed pause/resume to stop/start).
    bool post_with_fallback(std::string const &primary,
                            std::string const &fallback, std::string const &id);

    QBittorrentOptions options_;
    std::unique_ptr<http::IHttpTransport> transport_;
    Sleeper sleeper_;
    bool logged_in_ = false;
    std::string last_error_;
};

} // namespace sw::rpc
