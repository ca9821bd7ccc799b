#include "rpc/DiscordNotifier.hpp"
#include "rpc/QBittorrentClient.hpp"

#include "TestUtils.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <doctest/doctest.h>

using sw::tests::FakeTransport;
using namespace std::chrono_literals;

namespace
{

struct ClientFixture
{
    std::shared_ptr<FakeTransport::State> state =
        std::make_shared<FakeTransport::State>();
    std::vector<std::chrono::milliseconds> sleeps;
    sw::rpc::QBittorrentClient client;

    explicit ClientFixture(int max_retries = 3)
        : client(options(max_retries), std::make_unique<FakeTransport>(state),
                 [this](std::chrono::milliseconds delay)
                 { sleeps.push_back(delay); })
    {
    }

    static sw::rpc::QBittorrentOptions options(int max_retries)
    {
        sw::rpc::QBittorrentOptions result;
        result.base_url = "http://qb:8080/";
        result.username = "admin";
        result.password = "secret";
        result.max_retries = max_retries;
        result.retry_delay = 100ms;
        return result;
    }
};

} // namespace

TEST_CASE("login posts credentials and requires Ok.")
{
    ClientFixture fixture;
    fixture.state->push(200, "Ok.");
    CHECK(fixture.client.login());
    REQUIRE(fixture.state->requests.size() == 1);
    auto const &request = fixture.state->requests[0];
    CHECK(request.url == "http://qb:8080/api/v2/auth/login");
    REQUIRE(request.fields.size() == 2);
    CHECK(request.fields[0].second == "admin");
    CHECK(request.fields[1].second == "secret");

    ClientFixture refused;
    refused.state->push(200, "Fails.");
    CHECK_FALSE(refused.client.login());
    CHECK(refused.client.last_error() == "login failed: bad credentials");
    CHECK(refused.sleeps.empty());

    ClientFixture banned;
    banned.state->push(403, "Forbidden");
    CHECK_FALSE(banned.client.login());
    CHECK(banned.client.last_error() == "login refused: IP is banned");
}

TEST_CASE("transport failures are retried with doubling delays")
{
    ClientFixture fixture;
    fixture.state->push(200, "Ok.");
    fixture.state->push_transport_error("Couldn't connect to server");
    fixture.state->push(502);
    fixture.state->push(200, R"([{"hash": "aa", "name": "A"}])");

    auto torrents = fixture.client.list_torrents();
    REQUIRE(torrents);
    CHECK(torrents->size() == 1);
    CHECK((fixture.sleeps == std::vector<std::chrono::milliseconds>{100ms, 200ms}));
    CHECK(fixture.state->count("/torrents/info") == 3);
}

TEST_CASE("retries give up after the configured attempts")
{
    ClientFixture fixture(2);
    fixture.state->push(200, "Ok.");
    for (int i = 0; i < 3; ++i)
    {
        fixture.state->push(500);
    }
    CHECK_FALSE(fixture.client.list_torrents());
    CHECK(fixture.state->count("/torrents/info") == 3);
    CHECK(fixture.sleeps.size() == 2);
    CHECK(fixture.client.last_error().find("HTTP 500") != std::string::npos);
}

TEST_CASE("client errors are not retried")
{
    ClientFixture fixture;
    fixture.state->push(200, "Ok.");
    fixture.state->push(409, "Conflict");
    CHECK_FALSE(fixture.client.remove_torrent("aa", true));
    CHECK(fixture.state->count("/torrents/delete") == 1);
    CHECK(fixture.sleeps.empty());
}

TEST_CASE("expired session logs in again once")
{
    ClientFixture fixture;
    fixture.state->push(200, "Ok.");
    fixture.state->push(403);
    fixture.state->push(200, "Ok.");
    fixture.state->push(200, R"([{"url": "** [DHT] **", "msg": ""}])");

    auto trackers = fixture.client.list_trackers("aa");
    REQUIRE(trackers);
    CHECK(trackers->size() == 1);
    CHECK(fixture.state->count("/auth/login") == 2);
    CHECK(fixture.state->requests.back().url ==
          "http://qb:8080/api/v2/torrents/trackers?hash=aa");

    ClientFixture forbidden;
    forbidden.state->push(200, "Ok.");
    forbidden.state->push(403);
    forbidden.state->push(200, "Ok.");
    forbidden.state->push(403);
    CHECK_FALSE(forbidden.client.list_files("aa"));
    CHECK(forbidden.state->count("/auth/login") == 2);
}

TEST_CASE("delete sends hashes and the delete files flag")
{
    ClientFixture fixture;
    fixture.state->push(200, "Ok.");
    CHECK(fixture.client.remove_torrent("abc", true));
    auto const &request = fixture.state->requests.back();
    CHECK(request.url == "http://qb:8080/api/v2/torrents/delete");
    REQUIRE(request.fields.size() == 2);
    CHECK(request.fields[0] == std::make_pair(std::string("hashes"),
                                              std::string("abc")));
    CHECK(request.fields[1].second == "true");
}

TEST_CASE("pause falls back to stop on newer servers")
{
    ClientFixture fixture;
    fixture.state->push(200, "Ok.");
    fixture.state->route = [](sw::tests::RecordedRequest const &request)
        -> std::optional<sw::http::HttpResponse>
    {
        if (request.url.find("/torrents/pause") != std::string::npos ||
            request.url.find("/torrents/resume") != std::string::npos)
        {
            sw::http::HttpResponse missing;
            missing.status = 404;
            return missing;
        }
        return std::nullopt;
    };
    CHECK(fixture.client.pause("aa"));
    CHECK(fixture.client.resume("aa"));
    CHECK(fixture.state->count("/torrents/stop") == 1);
    CHECK(fixture.state->count("/torrents/start") == 1);
}

TEST_CASE("discord notifier posts embeds to the webhook")
{
    auto state = std::make_shared<FakeTransport::State>();
    sw::rpc::DiscordNotifier notifier("https://discord.example/hook",
                                      std::make_unique<FakeTransport>(state));
    CHECK(notifier.enabled());

    sw::engine::RunSummary summary;
    summary.torrents_processed = 2;
    state->push(204);
    CHECK(notifier.send_summary(summary));
    REQUIRE(state->requests.size() == 1);
    CHECK(state->requests[0].url == "https://discord.example/hook");
    sw::tests::PayloadView view(state->requests[0].body);
    CHECK(sw::tests::embed_field(view.embed(), "Torrents Processed") == "2");

    state->push(429);
    CHECK_FALSE(notifier.send_error("boom"));

    sw::rpc::DiscordNotifier disabled("", std::make_unique<FakeTransport>(state));
    CHECK_FALSE(disabled.enabled());
    CHECK(disabled.send_summary(summary));
    CHECK(state->requests.size() == 2);
}
