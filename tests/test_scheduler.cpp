/*
 * File: tests/test_scheduler.cpp
 * Project: Battle Relay
 * Purpose: Poll cycle reconciliation and failure handling
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include <chrono>
#include <deque>
#include <mutex>
#include <thread>
#include "relay_scheduler.hpp"

static const std::string kSwords = "\xE2\x9A\x94";

// Replays scripted snapshots; an empty optional throws FetchError.
class ScriptedSource : public EventSource
{
    std::mutex m_;
    std::deque<std::optional<Snapshot>> script_;

public:
    int polls = 0;

    void push(std::optional<Snapshot> s)
    {
        std::scoped_lock lk(m_);
        script_.push_back(std::move(s));
    }

    Snapshot poll() override
    {
        std::scoped_lock lk(m_);
        ++polls;
        if (script_.empty())
            return {};
        auto next = std::move(script_.front());
        script_.pop_front();
        if (!next)
            throw FetchError("HTTP error: 503");
        return *next;
    }
};

static CellObservation marked(const char *br, const char *tr) { return {kSwords + " Battle", br, tr}; }
static CellObservation quiet(const char *br, const char *tr) { return {"Empty", br, tr}; }

TEST_CASE("marked cell produces one event across consecutive cycles")
{
    ScriptedSource src;
    DedupCache cache;
    Broadcaster bus;
    Scheduler s{src, cache, bus};

    src.push(Snapshot{marked("X1", "Y2"), quiet("X3", "Y4")});
    src.push(Snapshot{marked("X1", "Y2"), quiet("X3", "Y4")});

    auto first = s.run_once();
    REQUIRE(first.size() == 1);
    REQUIRE(first[0].location.key() == "X1Y2");
    REQUIRE(cache.contains(*Location::make("X1", "Y2")));
    REQUIRE_FALSE(cache.contains(*Location::make("X3", "Y4")));

    REQUIRE(s.run_once().empty());
}

TEST_CASE("active, inactive, active yields two events")
{
    ScriptedSource src;
    DedupCache cache;
    Broadcaster bus;
    Scheduler s{src, cache, bus};

    src.push(Snapshot{marked("A", "1")});
    src.push(Snapshot{quiet("A", "1")});
    src.push(Snapshot{marked("A", "1")});

    int events = 0;
    for (int i = 0; i < 3; ++i)
        events += static_cast<int>(s.run_once().size());
    REQUIRE(events == 2);
}

TEST_CASE("cells missing from a snapshot keep their state")
{
    ScriptedSource src;
    DedupCache cache;
    Broadcaster bus;
    Scheduler s{src, cache, bus};

    src.push(Snapshot{marked("A", "1")});
    src.push(Snapshot{});
    src.push(Snapshot{marked("A", "1")});
    REQUIRE(s.run_once().size() == 1);
    REQUIRE(s.run_once().empty());
    REQUIRE(cache.contains(*Location::make("A", "1")));
    REQUIRE(s.run_once().empty());
}

TEST_CASE("coordinates are sanitized and empty ones skipped")
{
    ScriptedSource src;
    DedupCache cache;
    Broadcaster bus;
    Scheduler s{src, cache, bus};

    src.push(Snapshot{marked("<b>X1</b>", "Y'2"), marked("", "Y9"), marked("!!", "Y8")});
    auto ev = s.run_once();
    REQUIRE(ev.size() == 1);
    REQUIRE(ev[0].location.key() == "bX1bY2");
    REQUIRE(cache.size() == 1);
}

TEST_CASE("source failure skips the cycle without touching the cache")
{
    ScriptedSource src;
    DedupCache cache;
    Broadcaster bus;
    Scheduler s{src, cache, bus};

    src.push(Snapshot{marked("A", "1")});
    src.push(std::nullopt);
    src.push(Snapshot{marked("B", "2")});

    REQUIRE(s.run_once().size() == 1);
    REQUIRE(s.run_once().empty());
    REQUIRE(s.failures() == 1);
    REQUIRE(cache.size() == 1);
    REQUIRE(s.run_once().size() == 1);
    REQUIRE(s.cycles() == 3);
}

TEST_CASE("new events are published to current subscribers")
{
    ScriptedSource src;
    DedupCache cache;
    Broadcaster bus;
    Scheduler s{src, cache, bus};
    auto sub = bus.subscribe();

    src.push(Snapshot{marked("A", "1"), marked("B", "2")});
    s.run_once();
    auto a = sub->try_recv();
    auto b = sub->try_recv();
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(a->location.key() == "A1");
    REQUIRE(b->location.key() == "B2");
    REQUIRE_FALSE(sub->try_recv());
}

TEST_CASE("background loop polls and stops promptly")
{
    ScriptedSource src;
    DedupCache cache;
    Broadcaster bus;
    Scheduler s{src, cache, bus, std::chrono::seconds(3600)};
    auto sub = bus.subscribe();
    src.push(Snapshot{marked("A", "1")});

    s.start();
    for (int i = 0; i < 200 && sub->pending() == 0; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    auto t0 = std::chrono::steady_clock::now();
    s.stop();
    REQUIRE(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(5));
    REQUIRE(sub->pending() == 1);
    REQUIRE(s.cycles() == 1);
}
