#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include <curl/curl.h>

namespace sw::http
{

struct HttpResponse
{
    long status = 0;
    std::string body;
    // Transport failure (DNS, connect, timeout). Empty when a response
    // arrived, whatever its status.
    std::string error;

    bool transport_ok() const noexcept
    {
        return error.empty();
    }
    bool ok() const noexcept
    {
        return error.empty() && status >= 200 && status < 300;
    }
};

using FormFields = std::vector<std::pair<std::string, std::string>>;

class IHttpTransport
{
  public:
    virtual ~IHttpTransport() noexcept = default;

    virtual HttpResponse get(std::string const &url) = 0;
    virtual HttpResponse post_form(std::string const &url,
                                   FormFields const &fields) = 0;
    virtual HttpResponse post_json(std::string const &url,
                                   std::string const &body) = 0;
};

// libcurl easy handle that lives as long as the session so cookies set by
// one request (the qBittorrent SID) are sent with the following ones.
class CurlSession final : public IHttpTransport
{
  public:
    explicit CurlSession(std::chrono::seconds timeout = std::chrono::seconds(30));
    ~CurlSession() override;

    CurlSession(CurlSession const &) = delete;
    CurlSession &operator=(CurlSession const &) = delete;

    HttpResponse get(std::string const &url) override;
    HttpResponse post_form(std::string const &url,
                           FormFields const &fields) override;
    HttpResponse post_json(std::string const &url,
                           std::string const &body) override;

    // Extra request header sent with every request, e.g. "Referer: ...".
    void add_header(std::string header);

  private:
    std::string encode_form(FormFields const &fields) const;
    HttpResponse perform(std::string const &url, std::string const *body,
                         char const *content_type);

    CURL *handle_ = nullptr;
    std::chrono::seconds timeout_;
    std::vector<std::string> headers_;
};

} // namespace sw::http
