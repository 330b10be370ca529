// Catch2 tests for PickerEngine selection, windowing and incremental paging

#include <catch2/catch.hpp>

#include <navpick/tui/picker_engine.hpp>

#include "manual_paged_source.h"

#include <boost/asio/io_context.hpp>

#include <cstdio>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace navpick;
using namespace navpick::tui;
using navpick::test::ManualPagedSource;

namespace {

std::vector<std::string> nameKey(const std::string& s) {
    return {s};
}

std::vector<std::string> numbered(const std::string& prefix, int first, int count) {
    std::vector<std::string> out;
    for (int i = first; i < first + count; ++i) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%s-%02d", prefix.c_str(), i);
        out.emplace_back(buf);
    }
    return out;
}

config::SelectionOptions visible(int n) {
    config::SelectionOptions opts;
    opts.maxVisibleItems = n;
    return opts;
}

void checkInvariants(const PickerEngine<std::string>& e) {
    const auto window = e.visibleWindow();
    if (e.filtered().empty()) {
        CHECK(e.index() == -1);
        CHECK(window.empty());
        return;
    }
    CHECK(e.index() >= 0);
    CHECK(e.index() < static_cast<int>(e.filtered().size()));
    CHECK(window.contains(e.index()));
    CHECK(window.size() <= static_cast<std::size_t>(e.maxVisibleItems()));
    CHECK(window.end <= e.filtered().size());
}

} // namespace

TEST_CASE("PickerEngine windowed navigation", "[tui][picker][catch2]") {
    PickerEngine<std::string> engine(visible(5), nameKey, numbered("acct", 0, 30));
    REQUIRE(engine.filtered().size() == 30);
    CHECK(engine.index() == 0);
    CHECK(engine.visibleWindow().start == 0);
    CHECK(engine.visibleWindow().end == 5);

    SECTION("Six moves down scroll the window by the overflow") {
        for (int i = 0; i < 6; ++i) {
            engine.moveDown();
        }
        CHECK(engine.index() == 6);
        CHECK(engine.visibleWindow().start == 2);
        CHECK(engine.visibleWindow().end == 7);
        checkInvariants(engine);

        engine.moveUp();
        engine.moveUp();
        engine.moveUp();
        engine.moveUp();
        engine.moveUp();
        CHECK(engine.index() == 1);
        CHECK(engine.visibleWindow().start == 1);
    }

    SECTION("Bottom and top") {
        engine.bottom();
        CHECK(engine.index() == 29);
        CHECK(engine.visibleWindow().start == 25);
        CHECK(engine.visibleWindow().end == 30);
        engine.top();
        CHECK(engine.index() == 0);
        CHECK(engine.visibleWindow().start == 0);
    }

    SECTION("No wraparound") {
        engine.moveUp();
        CHECK(engine.index() == 0);
        engine.bottom();
        engine.moveDown();
        CHECK(engine.index() == 29);
    }

    SECTION("Paging moves by the visible height") {
        engine.pageDown();
        CHECK(engine.index() == 5);
        CHECK(engine.visibleWindow().start == 1);
        engine.pageDown();
        engine.pageDown();
        engine.pageDown();
        engine.pageDown();
        engine.pageDown();
        CHECK(engine.index() == 29);
        engine.pageUp();
        CHECK(engine.index() == 24);
        checkInvariants(engine);
    }

    SECTION("Current candidate follows the cursor") {
        engine.moveDown();
        REQUIRE(engine.current() != nullptr);
        CHECK(engine.current()->item == "acct-01");
    }
}

TEST_CASE("PickerEngine cursor stays inside the window", "[tui][picker][catch2]") {
    PickerEngine<std::string> engine(visible(5), nameKey, numbered("acct", 0, 30));
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> pick(0, 5);
    for (int step = 0; step < 500; ++step) {
        switch (pick(rng)) {
            case 0:
                engine.moveDown();
                break;
            case 1:
                engine.moveUp();
                break;
            case 2:
                engine.pageDown();
                break;
            case 3:
                engine.pageUp();
                break;
            case 4:
                engine.top();
                break;
            default:
                engine.bottom();
                break;
        }
        checkInvariants(engine);
    }
}

TEST_CASE("PickerEngine visible height floor", "[tui][picker][catch2]") {
    PickerEngine<std::string> engine(visible(2), nameKey, numbered("acct", 0, 10));
    CHECK(engine.maxVisibleItems() == 5);
    CHECK(engine.visibleWindow().size() == 5);

    PickerEngine<std::string> small(visible(5), nameKey, numbered("acct", 0, 3));
    CHECK(small.visibleWindow().size() == 3);
}

TEST_CASE("PickerEngine filtering", "[tui][picker][filter][catch2]") {
    std::vector<std::string> items{"strgacct", "mystorage", "s-t-r-g-a-c-c-t", "prodlogs"};
    int renders = 0;
    PickerEngine<std::string> engine(visible(5), nameKey, items,
                                     [&renders](const PickerEngine<std::string>&) { ++renders; });

    SECTION("Typing ranks and resets the cursor") {
        engine.moveDown();
        engine.moveDown();
        for (char c : std::string("stor")) {
            engine.typeChar(c);
        }
        CHECK(engine.query() == "stor");
        REQUIRE_FALSE(engine.filtered().empty());
        CHECK(engine.filtered().front().item == "mystorage");
        CHECK(engine.index() == 0);
        CHECK(engine.visibleWindow().start == 0);
        CHECK(renders == 6);
    }

    SECTION("Backspace widens the result again") {
        engine.typeChar('x');
        engine.typeChar('q');
        CHECK(engine.filtered().empty());
        CHECK(engine.index() == -1);
        CHECK(engine.visibleWindow().empty());
        engine.backspace();
        engine.backspace();
        CHECK(engine.query().empty());
        CHECK(engine.filtered().size() == items.size());
        CHECK(engine.index() == 0);

        const int before = renders;
        engine.backspace();
        CHECK(renders == before);
    }

    SECTION("Backspace removes a whole multi-byte character") {
        engine.typeChar('s');
        for (char c : std::string("\xC3\xA9")) {
            engine.typeChar(c);
        }
        for (char c : std::string("\xE2\x82\xAC")) {
            engine.typeChar(c);
        }
        CHECK(engine.query() == "s\xC3\xA9\xE2\x82\xAC");
        engine.backspace();
        CHECK(engine.query() == "s\xC3\xA9");
        engine.backspace();
        CHECK(engine.query() == "s");
        engine.backspace();
        CHECK(engine.query().empty());
    }

    SECTION("Control characters are ignored") {
        engine.typeChar('\t');
        engine.typeChar('\x7f');
        CHECK(engine.query().empty());
        CHECK(renders == 0);
    }

    SECTION("Confirm on an empty list keeps the session open") {
        engine.typeChar('z');
        engine.typeChar('z');
        CHECK_FALSE(engine.confirm().has_value());
        CHECK_FALSE(engine.closed());
        engine.backspace();
        engine.backspace();
        CHECK(engine.confirm() == std::optional<std::string>("strgacct"));
    }
}

TEST_CASE("PickerEngine with fuzzy search disabled", "[tui][picker][filter][catch2]") {
    auto opts = visible(5);
    opts.enableFuzzySearch = false;
    PickerEngine<std::string> engine(opts, nameKey, {"b", "a", "c"});
    engine.typeChar('a');
    engine.backspace();
    CHECK(engine.query().empty());
    REQUIRE(engine.filtered().size() == 3);
    CHECK(engine.filtered()[0].item == "b");
    engine.moveDown();
    CHECK(engine.confirm() == std::optional<std::string>("a"));
}

TEST_CASE("PickerEngine session close", "[tui][picker][catch2]") {
    PickerEngine<std::string> engine(visible(5), nameKey, numbered("acct", 0, 10));

    SECTION("Confirm returns the highlighted item and closes") {
        engine.moveDown();
        auto chosen = engine.confirm();
        REQUIRE(chosen.has_value());
        CHECK(*chosen == "acct-01");
        CHECK(engine.closed());
        CHECK(engine.outcome().status == SelectionStatus::Confirmed);
        REQUIRE(engine.outcome().item.has_value());
        CHECK(*engine.outcome().item == "acct-01");

        engine.moveDown();
        engine.typeChar('x');
        CHECK(engine.index() == 1);
        CHECK(engine.query().empty());
        CHECK_FALSE(engine.confirm().has_value());
    }

    SECTION("Cancel ends the session without a selection") {
        engine.cancel();
        CHECK(engine.closed());
        CHECK(engine.outcome().status == SelectionStatus::Cancelled);
        CHECK_FALSE(engine.outcome().item.has_value());
        engine.bottom();
        CHECK(engine.index() == 0);
        CHECK_FALSE(engine.confirm().has_value());
    }

    SECTION("Cancel records the reason") {
        engine.cancel(SelectionStatus::TimedOut);
        CHECK(engine.outcome().status == SelectionStatus::TimedOut);
    }
}

namespace {
struct PagedEngineFixture {
    explicit PagedEngineFixture(config::SelectionOptions opts = visible(5)) {
        engine = std::make_unique<PickerEngine<std::string>>(
            opts, nameKey, std::vector<std::string>{},
            [this](const PickerEngine<std::string>&) { ++renders; });
        REQUIRE(engine->attachSource(io.get_executor(), source));
    }

    void drain() {
        io.restart();
        io.run();
    }

    boost::asio::io_context io;
    std::shared_ptr<ManualPagedSource<std::string>> source =
        std::make_shared<ManualPagedSource<std::string>>();
    std::unique_ptr<PickerEngine<std::string>> engine;
    int renders = 0;
};
} // namespace

TEST_CASE("PickerEngine incremental paging", "[tui][picker][paging][catch2]") {
    PagedEngineFixture f;

    REQUIRE(f.engine->start());
    REQUIRE(f.source->calls.size() == 1);
    CHECK(f.engine->loading());
    CHECK(f.engine->index() == -1);

    f.source->completeWith(0, numbered("acct", 0, 20), "page2");
    f.drain();
    CHECK(f.engine->candidateCount() == 20);
    CHECK(f.engine->index() == 0);
    CHECK_FALSE(f.engine->loading());
    CHECK(f.engine->hasMore());

    SECTION("Nothing is fetched while far from the end") {
        f.engine->moveDown();
        f.engine->pageDown();
        CHECK(f.source->calls.size() == 1);
    }

    SECTION("Reaching the boundary fetches the next page once") {
        f.engine->bottom();
        REQUIRE(f.source->calls.size() == 2);
        CHECK(f.source->calls[1].request.continuationToken == std::optional<std::string>("page2"));
        f.engine->moveUp();
        f.engine->bottom();
        CHECK(f.source->calls.size() == 2);

        f.source->completeWith(1, numbered("acct", 20, 5));
        f.drain();
        CHECK(f.engine->candidateCount() == 25);
        CHECK(f.engine->index() == 19);
        REQUIRE(f.engine->current() != nullptr);
        CHECK(f.engine->current()->item == "acct-19");
        CHECK_FALSE(f.engine->hasMore());
        checkInvariants(*f.engine);

        f.engine->bottom();
        CHECK(f.engine->index() == 24);
        CHECK(f.source->calls.size() == 2);
    }

    SECTION("Cancelling mid-flight leaves the candidates untouched") {
        f.engine->bottom();
        REQUIRE(f.source->calls.size() == 2);
        const int index = f.engine->index();
        const auto count = f.engine->candidateCount();

        f.engine->cancel();
        CHECK(f.source->calls[1].token.stop_requested());
        f.source->completeWith(1, numbered("late", 0, 5));
        f.drain();

        CHECK(f.engine->candidateCount() == count);
        CHECK(f.engine->filtered().size() == count);
        CHECK(f.engine->index() == index);
    }

    SECTION("A failed fetch keeps the session usable and can be retried") {
        f.engine->bottom();
        const int rendersBefore = f.renders;
        f.source->failWith(1, Error{ErrorCode::NetworkError, "throttled"});
        f.drain();

        CHECK(f.renders == rendersBefore + 1);
        REQUIRE(f.engine->lastFetchError().has_value());
        CHECK(f.engine->lastFetchError()->code == ErrorCode::NetworkError);
        CHECK_FALSE(f.engine->loading());

        f.engine->moveUp();
        CHECK(f.engine->index() == 18);
        CHECK(f.source->calls.size() == 2);

        REQUIRE(f.engine->retryFetch());
        REQUIRE(f.source->calls.size() == 3);
        CHECK(f.source->calls[2].request.continuationToken == std::optional<std::string>("page2"));

        f.source->completeWith(2, numbered("acct", 20, 3));
        f.drain();
        CHECK(f.engine->candidateCount() == 23);
        CHECK_FALSE(f.engine->lastFetchError().has_value());
    }
}

TEST_CASE("PickerEngine merges pages into an active filter", "[tui][picker][paging][catch2]") {
    PagedEngineFixture f;
    REQUIRE(f.engine->start());
    f.source->completeWith(0, {"alpha", "beta", "bravo"}, "p2");
    f.drain();

    // Three rows are within the prefetch distance: the next page is already requested
    REQUIRE(f.source->calls.size() == 2);

    f.engine->typeChar('b');
    REQUIRE(f.engine->filtered().size() == 2);
    CHECK(f.engine->filtered()[0].item == "beta");
    f.engine->moveDown();
    REQUIRE(f.engine->current() != nullptr);
    CHECK(f.engine->current()->item == "bravo");

    f.source->completeWith(1, {"b", "zeta", "bz"});
    f.drain();

    REQUIRE(f.engine->filtered().size() == 4);
    CHECK(f.engine->filtered()[0].item == "b");
    CHECK(f.engine->filtered()[1].item == "bz");
    CHECK(f.engine->filtered()[2].item == "beta");
    CHECK(f.engine->filtered()[3].item == "bravo");
    CHECK(f.engine->index() == 3);
    CHECK(f.engine->current()->item == "bravo");
    CHECK(f.engine->candidateCount() == 6);
    checkInvariants(*f.engine);

    f.engine->backspace();
    CHECK(f.engine->filtered().size() == 6);
    CHECK(f.engine->filtered()[3].item == "b");
}

TEST_CASE("PickerEngine source attachment", "[tui][picker][paging][catch2]") {
    boost::asio::io_context io;
    auto source = std::make_shared<ManualPagedSource<std::string>>();

    SECTION("Invalid page size is rejected") {
        auto opts = visible(5);
        opts.pageSize = 0;
        PickerEngine<std::string> engine(opts, nameKey);
        auto r = engine.attachSource(io.get_executor(), source);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Only one source per session") {
        PickerEngine<std::string> engine(visible(5), nameKey);
        REQUIRE(engine.attachSource(io.get_executor(), source));
        auto again = engine.attachSource(io.get_executor(), source);
        REQUIRE_FALSE(again);
        CHECK(again.error().code == ErrorCode::InvalidState);
    }

    SECTION("retryFetch without a source") {
        PickerEngine<std::string> engine(visible(5), nameKey);
        CHECK_FALSE(engine.retryFetch());
    }
}
