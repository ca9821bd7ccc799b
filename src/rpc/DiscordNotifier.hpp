#pragma once

#include "rpc/Notifier.hpp"
#include "utils/Http.hpp"

#include <memory>
#include <string>

namespace sw::rpc
{

// Posts run summaries and fatal errors to a Discord webhook as embeds.
// Without a webhook URL the notifier is disabled and reports success.
class DiscordNotifier final : public INotifier
{
  public:
    DiscordNotifier(std::string webhook_url,
                    std::unique_ptr<http::IHttpTransport> transport);

    bool enabled() const noexcept
    {
        return enabled_;
    }

    bool send_summary(engine::RunSummary const &summary) override;
    bool send_error(std::string const &message) override;

  private:
    bool post(std::string const &payload, char const *what);

    std::string webhook_url_;
    std::unique_ptr<http::IHttpTransport> transport_;
    bool enabled_ = false;
};

} // namespace sw::rpc
