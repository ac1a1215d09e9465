#include <catch2/catch_test_macros.hpp>

#include "mocks.hpp"
#include "output/delivery_transaction.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using Events = std::vector<std::string>;

TEST_CASE("DeliveryTransaction", "[delivery]") {
    Journal journal;
    MockClipboard clipboard(journal, "previous");
    MockKeystrokes keys(journal);
    std::vector<std::chrono::milliseconds> sleeps;

    DeliveryTransaction delivery(clipboard, keys, {.settle = 50ms, .restore = 200ms},
                                 [&](std::chrono::milliseconds d) { sleeps.push_back(d); });

    SECTION("PastesAndRestores") {
        REQUIRE(delivery.deliver(std::string("hello world")));
        REQUIRE(journal.events == Events{"read", "write:hello world", "paste", "write:previous"});
        REQUIRE(clipboard.contents == "previous");
        REQUIRE(sleeps == std::vector<std::chrono::milliseconds>{50ms, 200ms});
    }

    SECTION("BlankTextDoesNothing") {
        REQUIRE(delivery.deliver(std::string("  \n ")));
        REQUIRE(journal.events.empty());
    }

    SECTION("RestoresEvenWhenPasteFails") {
        keys.fail_paste = true;
        auto r = delivery.deliver(std::string("hello"));
        REQUIRE_FALSE(r);
        REQUIRE(std::holds_alternative<ConfigurationError>(r.error()));
        REQUIRE(journal.events.back() == "write:previous");
        REQUIRE(clipboard.contents == "previous");
    }

    SECTION("RestoresEvenWhenWriteFails") {
        clipboard.fail_write_of = "hello";
        REQUIRE_FALSE(delivery.deliver(std::string("hello")));
        REQUIRE(journal.events == Events{"read", "write:hello", "write:previous"});
    }

    SECTION("UnreadableClipboardRestoresEmpty") {
        clipboard.fail_read = true;
        REQUIRE(delivery.deliver(std::string("hello")));
        REQUIRE(journal.events.back() == "write:");
    }

    SECTION("SegmentsShareOneSnapshot") {
        std::vector<Segment> segs = {
            Segment::text("Hello "),
            Segment::command("newline"),
            Segment::text("world"),
        };
        REQUIRE(delivery.deliver(segs));
        REQUIRE(journal.events == Events{
            "read",
            "write:Hello ", "paste",
            "key:newline",
            "write:world", "paste",
            "write:previous",
        });
    }

    SECTION("SegmentsSkipBlankText") {
        std::vector<Segment> segs = {Segment::text(" "), Segment::command("tab")};
        REQUIRE(delivery.deliver(segs));
        REQUIRE(journal.events == Events{"read", "key:tab", "write:previous"});
    }

    SECTION("NothingToDeliver") {
        std::vector<Segment> segs = {Segment::text("  ")};
        REQUIRE(delivery.deliver(segs));
        REQUIRE(delivery.deliver(std::vector<Segment>{}));
        REQUIRE(journal.events.empty());
    }

    SECTION("StopsAtFirstFailureButRestores") {
        keys.fail_paste = true;
        std::vector<Segment> segs = {Segment::text("a"), Segment::command("newline")};
        REQUIRE_FALSE(delivery.deliver(segs));
        REQUIRE(journal.events == Events{"read", "write:a", "paste", "write:previous"});
    }
}
