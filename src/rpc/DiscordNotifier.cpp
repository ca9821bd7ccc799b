#include "rpc/DiscordNotifier.hpp"

#include "rpc/Serializer.hpp"
#include "utils/Log.hpp"

#include <chrono>
#include <ctime>
#include <format>
#include <utility>

namespace sw::rpc
{

namespace
{

std::string iso8601_utc_now()
{
    auto const now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buffer[32]{};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

} // namespace

DiscordNotifier::DiscordNotifier(std::string webhook_url,
                                 std::unique_ptr<http::IHttpTransport> transport)
    : webhook_url_(std::move(webhook_url)), transport_(std::move(transport)),
      enabled_(!webhook_url_.empty() && transport_ != nullptr)
{
    if (!enabled_)
    {
        SW_LOG_INFO("Discord notifications disabled (no webhook URL)");
    }
}

bool DiscordNotifier::post(std::string const &payload, char const *what)
{
    auto response = transport_->post_json(webhook_url_, payload);
    if (!response.ok())
    {
        SW_LOG_ERROR("failed to send Discord {}: {}", what,
                     response.transport_ok()
                         ? std::format("HTTP {}", response.status)
                         : response.error);
        return false;
    }
    SW_LOG_INFO("Discord {} sent", what);
    return true;
}

bool DiscordNotifier::send_summary(engine::RunSummary const &summary)
{
    if (!enabled_)
    {
        return true;
    }
    return post(serialize_summary_embed(summary, iso8601_utc_now()), "summary");
}

bool DiscordNotifier::send_error(std::string const &message)
{
    if (!enabled_)
    {
        return true;
    }
    return post(serialize_error_embed(message, iso8601_utc_now()),
                "error notification");
}

} // namespace sw::rpc
