#include "rpc/Serializer.hpp"

#include "TestUtils.hpp"

#include <string>

#include <doctest/doctest.h>

using sw::tests::embed_field;
using sw::tests::PayloadView;
using sw::tests::to_view;

TEST_CASE("torrent list payload becomes torrent records")
{
    constexpr char const *payload = R"([
        {"hash": "8c212779b4abde7c6bc608063a0d008b7e40ce32",
         "name": "Show S01", "save_path": "/data/torrents/tv",
         "ratio": 1.25, "seeding_time": 86400, "total_size": 4096},
        {"hash": "1111111111111111111111111111111111111111",
         "ratio": -1, "seeding_time": -5, "size": 10},
        {"name": "no hash"},
        42
    ])";
    auto torrents = sw::rpc::parse_torrent_list(payload);
    REQUIRE(torrents);
    REQUIRE(torrents->size() == 2);

    auto const &first = (*torrents)[0];
    CHECK(first.id == "8c212779b4abde7c6bc608063a0d008b7e40ce32");
    CHECK(first.name == "Show S01");
    CHECK(first.save_path == std::filesystem::path("/data/torrents/tv"));
    CHECK(first.ratio == doctest::Approx(1.25));
    CHECK(first.seeding_time == std::chrono::seconds(86400));
    CHECK(first.total_size == 4096);

    auto const &second = (*torrents)[1];
    CHECK(second.name == second.id);
    CHECK(second.ratio == doctest::Approx(0.0));
    CHECK(second.seeding_time == std::chrono::seconds(0));
    CHECK(second.total_size == 10);
}

TEST_CASE("payloads that are not arrays are rejected")
{
    CHECK_FALSE(sw::rpc::parse_torrent_list("{}"));
    CHECK_FALSE(sw::rpc::parse_torrent_list("not json"));
    CHECK_FALSE(sw::rpc::parse_file_list("Forbidden"));
    CHECK_FALSE(sw::rpc::parse_tracker_list(""));
    auto empty = sw::rpc::parse_torrent_list("[]");
    REQUIRE(empty);
    CHECK(empty->empty());
}

TEST_CASE("file and tracker lists")
{
    auto files = sw::rpc::parse_file_list(
        R"([{"name": "Show/e01.mkv", "size": 100}, {"name": ""}, {"size": 3}])");
    REQUIRE(files);
    REQUIRE(files->size() == 1);
    CHECK((*files)[0].name == "Show/e01.mkv");
    CHECK((*files)[0].size == 100);

    auto trackers = sw::rpc::parse_tracker_list(R"([
        {"url": "** [DHT] **", "msg": ""},
        {"url": "https://t.example/announce", "msg": "Unregistered torrent"},
        {"msg": "no url"}
    ])");
    REQUIRE(trackers);
    REQUIRE(trackers->size() == 2);
    CHECK((*trackers)[0].tier == sw::engine::TrackerTier::DHT);
    CHECK((*trackers)[1].tier == sw::engine::TrackerTier::Real);
    CHECK((*trackers)[1].message == "Unregistered torrent");
}

TEST_CASE("summary embed lists counters and previews")
{
    sw::engine::RunSummary summary;
    summary.dry_run = false;
    summary.torrents_processed = 10;
    summary.torrents_deleted = 7;
    summary.torrents_kept = 3;
    summary.hardlinks_attempted = 2;
    summary.hardlinks_fixed = 1;
    summary.hardlinks_failed = 1;
    summary.space_freed_criteria_bytes = 1024ull * 1024 * 1024;
    summary.space_saved_hardlinks_bytes = 512ull * 1024 * 1024;
    summary.deletion_reasons["criteria-matched"] = 7;
    for (int i = 0; i < 7; ++i)
    {
        summary.deleted_torrents.push_back("torrent " + std::to_string(i));
    }
    summary.errors.push_back("failed to delete 'x': HTTP 500");

    PayloadView view(
        sw::rpc::serialize_summary_embed(summary, "2026-01-01T00:00:00Z"));
    auto *embed = view.embed();
    CHECK(to_view(yyjson_obj_get(embed, "title")) == "SeedWarden Summary");
    CHECK(yyjson_get_uint(yyjson_obj_get(embed, "color")) == 0xFF0000);
    CHECK(to_view(yyjson_obj_get(embed, "timestamp")) == "2026-01-01T00:00:00Z");
    CHECK(to_view(yyjson_obj_get(yyjson_obj_get(embed, "footer"), "text")) ==
          "SeedWarden");

    CHECK(embed_field(embed, "Torrents Processed") == "10");
    CHECK(embed_field(embed, "Torrents Deleted") == "7");
    CHECK(embed_field(embed, "Torrents Kept") == "3");
    CHECK(embed_field(embed, "Hardlinks Fixed") == "1");
    CHECK(embed_field(embed, "Hardlinks Failed") == "1");
    CHECK(embed_field(embed, "Space Saved") ==
          "1.50 GB\n(Criteria: 1.00 GB, Hardlinks: 0.50 GB)");
    CHECK(embed_field(embed, "Deletion Reasons") == "• criteria-matched: 7");

    auto deleted = embed_field(embed, "Deleted Torrents");
    REQUIRE(deleted);
    CHECK(deleted->find("torrent 4") != std::string::npos);
    CHECK(deleted->find("torrent 5") == std::string::npos);
    CHECK(deleted->find("... and 2 more") != std::string::npos);
    CHECK(embed_field(embed, "Errors") == "• failed to delete 'x': HTTP 500");
}

TEST_CASE("quiet dry run embed")
{
    sw::engine::RunSummary summary;
    summary.dry_run = true;
    summary.torrents_processed = 4;
    summary.torrents_kept = 4;

    PayloadView view(sw::rpc::serialize_summary_embed(summary, "t"));
    auto *embed = view.embed();
    CHECK(to_view(yyjson_obj_get(embed, "title")) ==
          "[DRY RUN] SeedWarden Summary");
    CHECK(yyjson_get_uint(yyjson_obj_get(embed, "color")) == 0x00FF00);
    CHECK_FALSE(embed_field(embed, "Hardlinks Fixed"));
    CHECK_FALSE(embed_field(embed, "Space Saved"));
    CHECK_FALSE(embed_field(embed, "Errors"));

    summary.torrents_deleted = 1;
    PayloadView deleting(sw::rpc::serialize_summary_embed(summary, "t"));
    CHECK(yyjson_get_uint(yyjson_obj_get(deleting.embed(), "color")) ==
          0xFFFF00);
}

TEST_CASE("error embed carries the message")
{
    PayloadView view(sw::rpc::serialize_error_embed("lock file busy", "t"));
    auto *embed = view.embed();
    CHECK(to_view(yyjson_obj_get(embed, "title")) == "SeedWarden Error");
    CHECK(to_view(yyjson_obj_get(embed, "description")) == "lock file busy");
}

TEST_CASE("gigabyte formatting")
{
    CHECK(sw::rpc::format_gigabytes(0) == "0.00 GB");
    CHECK(sw::rpc::format_gigabytes(3ull * 1024 * 1024 * 1024 / 2) == "1.50 GB");
}
