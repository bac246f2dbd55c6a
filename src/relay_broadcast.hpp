/*
 * File: src/relay_broadcast.hpp
 * Project: Battle Relay
 * Purpose: Fan-out of marker events to every live subscriber
 * Notes:
 *  - Each subscriber owns a bounded FIFO; when full the oldest entry is
 *    dropped and counted as lag, publish never waits on a reader
 *  - Events published with no subscriber are lost
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "common/location.hpp"
#include "common/log.hpp"

class Subscription
{
    friend class Broadcaster;

    std::mutex m_;
    std::deque<MarkerEvent> queue_;
    std::size_t capacity_;
    std::uint64_t lagged_{0};
    std::function<void()> on_ready_;

    void push(const MarkerEvent &ev)
    {
        std::function<void()> notify;
        {
            std::scoped_lock lk(m_);
            if (queue_.size() >= capacity_)
            {
                queue_.pop_front();
                ++lagged_;
            }
            queue_.push_back(ev);
            notify = on_ready_;
        }
        if (notify)
            notify();
    }

public:
    explicit Subscription(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

    // Invoked from the publishing thread after each push. Must not block.
    void set_notify(std::function<void()> cb)
    {
        std::scoped_lock lk(m_);
        on_ready_ = std::move(cb);
    }

    std::optional<MarkerEvent> try_recv()
    {
        std::scoped_lock lk(m_);
        if (queue_.empty())
            return std::nullopt;
        MarkerEvent ev = std::move(queue_.front());
        queue_.pop_front();
        return ev;
    }

    // Number of events dropped since the last call.
    std::uint64_t take_lagged()
    {
        std::scoped_lock lk(m_);
        return std::exchange(lagged_, 0);
    }

    std::size_t pending()
    {
        std::scoped_lock lk(m_);
        return queue_.size();
    }
};

class Broadcaster
{
    std::mutex m_;
    std::vector<std::weak_ptr<Subscription>> subs_;

    std::vector<std::shared_ptr<Subscription>> live_locked()
    {
        std::vector<std::shared_ptr<Subscription>> live;
        live.reserve(subs_.size());
        auto it = subs_.begin();
        while (it != subs_.end())
        {
            if (auto sp = it->lock())
            {
                live.push_back(std::move(sp));
                ++it;
            }
            else
            {
                it = subs_.erase(it);
            }
        }
        return live;
    }

    void prune_locked()
    {
        subs_.erase(std::remove_if(subs_.begin(), subs_.end(), [](const std::weak_ptr<Subscription> &w)
                                   { return w.expired(); }),
                    subs_.end());
    }

public:
    static constexpr std::size_t kDefaultCapacity = 100;

    // Dropping the returned pointer unsubscribes.
    std::shared_ptr<Subscription> subscribe(std::size_t capacity = kDefaultCapacity)
    {
        auto sub = std::make_shared<Subscription>(capacity);
        std::scoped_lock lk(m_);
        prune_locked();
        subs_.push_back(sub);
        return sub;
    }

    // Returns the number of subscribers the event was queued for.
    std::size_t publish(const MarkerEvent &ev)
    {
        std::vector<std::shared_ptr<Subscription>> targets;
        {
            std::scoped_lock lk(m_);
            targets = live_locked();
        }
        if (targets.empty())
        {
            log_debug("broadcast", "no subscribers, dropping event for ", ev.location.key());
            return 0;
        }
        for (auto &sub : targets)
            sub->push(ev);
        log_trace("broadcast", "event ", ev.location.key(), " queued for ", targets.size(), " subscribers");
        return targets.size();
    }

    // Entries held, including subscriptions dropped since the last prune.
    std::size_t slot_count()
    {
        std::scoped_lock lk(m_);
        return subs_.size();
    }

    std::size_t subscriber_count()
    {
        std::scoped_lock lk(m_);
        return live_locked().size();
    }
};
