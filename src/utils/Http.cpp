#include "utils/Http.hpp"

#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <mutex>
#include <stdexcept>

namespace sw::http
{

namespace
{

std::once_flag g_curl_init_once;

void ensure_curl_global()
{
    std::call_once(g_curl_init_once, [] {
        auto rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK)
        {
            SW_LOG_ERROR("curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

std::size_t write_body(char *data, std::size_t size, std::size_t count,
                       void *user)
{
    auto *buffer = static_cast<std::string *>(user);
    buffer->append(data, size * count);
    return size * count;
}

class HeaderList
{
  public:
    HeaderList() = default;
    HeaderList(HeaderList const &) = delete;
    HeaderList &operator=(HeaderList const &) = delete;
    ~HeaderList()
    {
        curl_slist_free_all(head_);
    }

    void add(std::string const &value)
    {
        head_ = curl_slist_append(head_, value.c_str());
    }
    curl_slist *get() const noexcept
    {
        return head_;
    }

  private:
    curl_slist *head_ = nullptr;
};

} // namespace

CurlSession::CurlSession(std::chrono::seconds timeout) : timeout_(timeout)
{
    ensure_curl_global();
    handle_ = curl_easy_init();
    if (handle_ == nullptr)
    {
        throw std::runtime_error("curl_easy_init failed");
    }
    // An empty cookie file enables the in-memory cookie engine.
    curl_easy_setopt(handle_, CURLOPT_COOKIEFILE, "");
    curl_easy_setopt(handle_, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle_, CURLOPT_USERAGENT, sw::version::kUserAgentVersion);
}

CurlSession::~CurlSession()
{
    if (handle_ != nullptr)
    {
        curl_easy_cleanup(handle_);
        handle_ = nullptr;
    }
}

void CurlSession::add_header(std::string header)
{
    headers_.push_back(std::move(header));
}

std::string CurlSession::encode_form(FormFields const &fields) const
{
    std::string result;
    for (auto const &[key, value] : fields)
    {
        if (!result.empty())
        {
            result.push_back('&');
        }
        char *escaped_key =
            curl_easy_escape(handle_, key.c_str(), static_cast<int>(key.size()));
        char *escaped_value = curl_easy_escape(handle_, value.c_str(),
                                               static_cast<int>(value.size()));
        if (escaped_key != nullptr)
        {
            result += escaped_key;
        }
        result.push_back('=');
        if (escaped_value != nullptr)
        {
            result += escaped_value;
        }
        curl_free(escaped_key);
        curl_free(escaped_value);
    }
    return result;
}

HttpResponse CurlSession::get(std::string const &url)
{
    return perform(url, nullptr, nullptr);
}

HttpResponse CurlSession::post_form(std::string const &url,
                                    FormFields const &fields)
{
    auto body = encode_form(fields);
    return perform(url, &body, "Content-Type: application/x-www-form-urlencoded");
}

HttpResponse CurlSession::post_json(std::string const &url,
                                    std::string const &body)
{
    return perform(url, &body, "Content-Type: application/json");
}

HttpResponse CurlSession::perform(std::string const &url,
                                  std::string const *body,
                                  char const *content_type)
{
    HttpResponse response;
    std::string buffer;
    HeaderList headers;
    for (auto const &header : headers_)
    {
        headers.add(header);
    }
    if (content_type != nullptr)
    {
        headers.add(content_type);
    }

    curl_easy_setopt(handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_, CURLOPT_TIMEOUT,
                     static_cast<long>(timeout_.count()));
    curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, &write_body);
    curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, headers.get());
    if (body != nullptr)
    {
        curl_easy_setopt(handle_, CURLOPT_POST, 1L);
        curl_easy_setopt(handle_, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(handle_, CURLOPT_POSTFIELDSIZE,
                         static_cast<long>(body->size()));
    }
    else
    {
        curl_easy_setopt(handle_, CURLOPT_HTTPGET, 1L);
    }

    auto rc = curl_easy_perform(handle_);
    // The header list dies with this call.
    curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, nullptr);
    if (rc != CURLE_OK)
    {
        response.error = curl_easy_strerror(rc);
        SW_LOG_DEBUG("http request to {} failed: {}", url, response.error);
        return response;
    }
    curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &response.status);
    response.body = std::move(buffer);
    return response;
}

} // namespace sw::http
