#include "engine/DecisionEngine.hpp"
#include "engine/TrackerHealth.hpp"

#include "TestUtils.hpp"

#include <string>
#include <vector>

#include <doctest/doctest.h>

using sw::engine::Action;
using sw::engine::Reason;
using sw::tests::days;
using sw::tests::record;
using sw::tests::tracker;

namespace
{

sw::engine::DecisionPolicy policy(std::string const &criteria,
                                  bool delete_dead = false)
{
    sw::engine::DecisionPolicy result;
    result.criteria = sw::engine::parse_criteria(criteria);
    result.dead_tracker_messages =
        sw::engine::parse_message_list("unregistered torrent");
    result.delete_dead_trackers = delete_dead;
    return result;
}

sw::engine::LinkGroup group_of(std::vector<std::size_t> members,
                               std::chrono::seconds seeding, double ratio,
                               bool in_library = false)
{
    sw::engine::LinkGroup group;
    group.members = std::move(members);
    group.max_seeding_duration = seeding;
    group.sum_ratio = ratio;
    group.any_linked_to_library = in_library;
    return group;
}

// Two torrents sharing one inode: A seeded 8 days at 0.3, B 4 days at 0.4.
struct SharedPair
{
    std::vector<sw::engine::TorrentRecord> torrents{
        record("a", "A", days(8), 0.3), record("b", "B", days(4), 0.4)};
    sw::engine::LinkGrouping grouping;

    SharedPair()
    {
        grouping.groups.push_back(group_of({0, 1}, days(8), 0.7));
        grouping.group_of = {0, 0};
        grouping.linked_to_library = {false, false};
    }
};

} // namespace

TEST_CASE("group aggregates decide for every member")
{
    SharedPair pair;

    sw::engine::DecisionEngine strict(policy("10d 0.5"));
    auto kept = strict.decide_all(pair.torrents, pair.grouping);
    REQUIRE(kept.size() == 2);
    CHECK(kept[0].action == Action::Keep);
    CHECK(kept[1].action == Action::Keep);
    CHECK(kept[0].reason == Reason::CriteriaNotMet);

    // Neither torrent reaches 0.5 alone, but the group ratio does.
    sw::engine::DecisionEngine lenient(policy("5d 0.5"));
    auto deleted = lenient.decide_all(pair.torrents, pair.grouping);
    CHECK(deleted[0].action == Action::Delete);
    CHECK(deleted[1].action == Action::Delete);
    CHECK(deleted[1].reason == Reason::CriteriaMatched);
    CHECK(deleted[0].group_id == deleted[1].group_id);
}

TEST_CASE("dead tracker deletes even a library linked torrent")
{
    auto torrent = record("a", "A", days(1), 0.0);
    torrent.trackers = {tracker("https://t.example/announce",
                                "Unregistered torrent"),
                        tracker("** [DHT] **", "")};
    auto group = group_of({0}, days(1), 0.0, true);

    sw::engine::DecisionEngine enabled(policy("30d 2.0", true));
    auto decision = enabled.decide(torrent, group);
    CHECK(decision.action == Action::Delete);
    CHECK(decision.reason == Reason::DeadTracker);

    sw::engine::DecisionEngine disabled(policy("30d 2.0", false));
    auto kept = disabled.decide(torrent, group);
    CHECK(kept.action == Action::Keep);
    CHECK(kept.reason == Reason::HardlinkPreserved);
}

TEST_CASE("library link beats matching criteria")
{
    auto torrent = record("a", "A", days(400), 10.0);
    sw::engine::DecisionEngine engine(policy("1d"));
    auto decision = engine.decide(torrent, group_of({0}, days(400), 10.0, true));
    CHECK(decision.action == Action::Keep);
    CHECK(decision.reason == Reason::HardlinkPreserved);
}

TEST_CASE("group that never seeded is kept as not completed")
{
    auto torrent = record("a", "A", days(0), 3.0);
    sw::engine::DecisionEngine engine(policy("0d"));
    auto decision = engine.decide(torrent, group_of({0}, days(0), 3.0));
    CHECK(decision.action == Action::Keep);
    CHECK(decision.reason == Reason::NotCompleted);
}

TEST_CASE("empty criteria keep everything alive")
{
    auto torrent = record("a", "A", days(3650), 100.0);
    sw::engine::DecisionEngine engine(policy(""));
    auto decision = engine.decide(torrent, group_of({0}, days(3650), 100.0));
    CHECK(decision.action == Action::Keep);
    CHECK(decision.reason == Reason::CriteriaNotMet);
    REQUIRE_FALSE(decision.explanation.empty());
    CHECK(decision.explanation.front() == "no deletion criteria configured");
}

TEST_CASE("explanation names the rule that passed")
{
    auto torrent = record("a", "A", days(40), 1.0);
    sw::engine::DecisionEngine engine(policy("30d 2.0 | 10d 0.5"));
    auto decision = engine.decide(torrent, group_of({0}, days(40), 1.0));
    CHECK(decision.action == Action::Delete);
    REQUIRE(decision.explanation.size() == 2);
    CHECK(decision.explanation[1].find("PASS") != std::string::npos);
    CHECK(std::string(sw::engine::to_string(decision.reason)) ==
          "criteria-matched");
}
