#include "test_common.hpp"
#include "progress.hpp"

using namespace gitsight;

TEST_CASE("ProgressChannel delivers events in order") {
    ProgressChannel channel;
    std::vector<std::size_t> seen;
    std::thread consumer([&] {
        while (auto ev = channel.receive())
            seen.push_back(ev->current);
    });
    for (std::size_t i = 1; i <= 100; ++i)
        channel.publish(ProgressEvent{ProgressStage::Receiving, i, 100, ""});
    channel.close();
    consumer.join();
    REQUIRE(seen.size() == 100);
    for (std::size_t i = 0; i < seen.size(); ++i)
        REQUIRE(seen[i] == i + 1);
}

TEST_CASE("ProgressChannel drains queued events after close") {
    ProgressChannel channel;
    channel.publish(ProgressEvent{ProgressStage::Message, 0, 0, "one"});
    channel.publish(ProgressEvent{ProgressStage::Message, 0, 0, "two"});
    channel.close();
    REQUIRE(channel.closed());
    channel.publish(ProgressEvent{ProgressStage::Message, 0, 0, "dropped"});

    auto first = channel.receive();
    auto second = channel.receive();
    REQUIRE(first);
    REQUIRE(first->message == "one");
    REQUIRE(second);
    REQUIRE(second->message == "two");
    REQUIRE_FALSE(channel.receive());
}

TEST_CASE("parse_sideband recognizes remote counters") {
    auto ev = parse_sideband("Counting objects:  45% (9/20)\r");
    REQUIRE(ev);
    REQUIRE(ev->stage == ProgressStage::Counting);
    REQUIRE(ev->current == 9);
    REQUIRE(ev->total == 20);

    auto comp = parse_sideband("Compressing objects: 100% (3/3), done.\n");
    REQUIRE(comp);
    REQUIRE(comp->stage == ProgressStage::Compressing);
    REQUIRE(comp->current == 3);

    REQUIRE_FALSE(parse_sideband("Total 3 (delta 0), reused 0 (delta 0)"));
}

TEST_CASE("parse_sideband reads oversized counters as zero") {
    std::optional<ProgressEvent> ev;
    REQUIRE_NOTHROW(ev = parse_sideband(
                        "Counting objects: 100% (99999999999999999999999/99999999999999999999999)"));
    REQUIRE(ev);
    REQUIRE(ev->stage == ProgressStage::Counting);
    REQUIRE(ev->current == 0);
    REQUIRE(ev->total == 0);
    REQUIRE(describe(*ev) == "Counting objects: (0/0)");

    auto mixed = parse_sideband("Resolving deltas:  50% (7/99999999999999999999999)");
    REQUIRE(mixed);
    REQUIRE(mixed->current == 7);
    REQUIRE(mixed->total == 0);
}

TEST_CASE("describe formats counters and passes messages through") {
    REQUIRE(describe(ProgressEvent{ProgressStage::Receiving, 5, 10, ""}) ==
            "Receiving objects: 50% (5/10)");
    REQUIRE(describe(ProgressEvent{ProgressStage::Pushing, 0, 0, ""}) == "Writing objects: (0/0)");
    REQUIRE(describe(ProgressEvent{ProgressStage::Message, 0, 0, "hello"}) == "hello");
}
