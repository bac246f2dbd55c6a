/*
 * File: src/relay_governor.hpp
 * Project: Battle Relay
 * Purpose: Global admission control for inbound HTTP requests
 * Notes:
 *  - One token bucket for the whole process (burst 100, 1 token/s)
 *  - Denied requests get 429 from relay_http.hpp
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <cmath>
#include <mutex>

class RequestGovernor
{
public:
    using Clock = std::chrono::steady_clock;

private:
    std::mutex m_;
    double capacity_;
    double per_second_;
    double tokens_;
    Clock::time_point last_;

    void refill_locked(Clock::time_point now)
    {
        if (now > last_)
        {
            double elapsed = std::chrono::duration<double>(now - last_).count();
            tokens_ = std::min(capacity_, tokens_ + elapsed * per_second_);
            last_ = now;
        }
    }

public:
    RequestGovernor(double burst = 100.0, double per_second = 1.0, Clock::time_point now = Clock::now())
        : capacity_(burst), per_second_(per_second), tokens_(burst), last_(now) {}

    bool try_acquire(Clock::time_point now = Clock::now())
    {
        std::scoped_lock lk(m_);
        refill_locked(now);
        if (tokens_ < 1.0)
            return false;
        tokens_ -= 1.0;
        return true;
    }

    // Whole seconds until the next token, at least 1.
    long retry_after_s(Clock::time_point now = Clock::now())
    {
        std::scoped_lock lk(m_);
        refill_locked(now);
        if (tokens_ >= 1.0 || per_second_ <= 0.0)
            return 1;
        return std::max(1L, static_cast<long>(std::ceil((1.0 - tokens_) / per_second_)));
    }

    long remaining()
    {
        std::scoped_lock lk(m_);
        refill_locked(Clock::now());
        return static_cast<long>(tokens_);
    }

    long limit() const { return static_cast<long>(capacity_); }
};
