/*
 * File: src/relay_scheduler.hpp
 * Project: Battle Relay
 * Purpose: Background poll loop: source -> dedup cache -> broadcaster
 * Notes:
 *  - Source failures are logged and the cycle skipped; the loop never exits
 *    on its own
 *  - Fixed sleep between cycles, no backoff
 * Last updated: 2026-10-18
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

#include "common/location.hpp"
#include "common/log.hpp"
#include "relay_broadcast.hpp"
#include "relay_dedup.hpp"
#include "relay_source.hpp"

class Scheduler
{
    EventSource &source_;
    DedupCache &cache_;
    Broadcaster &broadcaster_;
    std::chrono::seconds interval_;

    std::thread thread_;
    std::mutex m_;
    std::condition_variable cv_;
    bool stop_ = false;

    std::atomic<std::uint64_t> cycles_{0};
    std::atomic<std::uint64_t> failures_{0};

    void loop()
    {
        log_debug("scheduler", "started, interval ", interval_.count(), "s");
        std::unique_lock lk(m_);
        while (!stop_)
        {
            lk.unlock();
            log_info("scheduler", "checking for new entries...");
            run_once();
            lk.lock();
            cv_.wait_for(lk, interval_, [this]
                         { return stop_; });
        }
        log_debug("scheduler", "stopped");
    }

public:
    Scheduler(EventSource &source, DedupCache &cache, Broadcaster &broadcaster,
              std::chrono::seconds interval = std::chrono::seconds(60))
        : source_(source), cache_(cache), broadcaster_(broadcaster), interval_(interval) {}

    ~Scheduler() { stop(); }

    Scheduler(const Scheduler &) = delete;
    Scheduler &operator=(const Scheduler &) = delete;

    // Applies one snapshot to the cache and returns the newly active cells.
    std::vector<MarkerEvent> reconcile(const Snapshot &snapshot)
    {
        std::vector<MarkerEvent> events;
        for (const auto &cell : snapshot)
        {
            auto loc = Location::from_raw(cell.bottom_right, cell.top_right);
            if (!loc)
            {
                log_debug("scheduler", "skipping cell with empty coordinates");
                continue;
            }
            if (contains_marker(sanitize(cell.marker_text)))
            {
                if (cache_.mark_active(*loc))
                {
                    log_info("scheduler", "new ", kMarkerGlyph, " detected at location: ", loc->key());
                    events.push_back(MarkerEvent{*loc});
                }
                else
                {
                    log_trace("scheduler", "battle at ", loc->key(), " already recorded");
                }
            }
            else if (cache_.mark_inactive(*loc))
            {
                log_debug("scheduler", "removed expired battle at ", loc->key());
            }
        }
        return events;
    }

    // One full cycle without the sleep. Returns the events handed to the
    // broadcaster.
    std::vector<MarkerEvent> run_once()
    {
        ++cycles_;
        Snapshot snapshot;
        try
        {
            snapshot = source_.poll();
        }
        catch (const std::exception &e)
        {
            ++failures_;
            log_error("scheduler", "error checking entries: ", e.what());
            return {};
        }

        auto events = reconcile(snapshot);
        if (events.empty())
        {
            log_debug("scheduler", "no new events found");
            return events;
        }
        log_debug("scheduler", "broadcasting ", events.size(), " events");
        for (const auto &ev : events)
            broadcaster_.publish(ev);
        return events;
    }

    void start()
    {
        {
            std::scoped_lock lk(m_);
            if (thread_.joinable())
                return;
            stop_ = false;
        }
        thread_ = std::thread([this]
                              { loop(); });
    }

    // Wakes the sleep and joins. Safe to call more than once.
    void stop()
    {
        {
            std::scoped_lock lk(m_);
            stop_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable())
            thread_.join();
    }

    std::uint64_t cycles() const { return cycles_.load(); }
    std::uint64_t failures() const { return failures_.load(); }
};
