/*
 * File: src/relay_registry.hpp
 * Project: Battle Relay
 * Purpose: Live WebSocket session records and per-session inbound quota
 * Notes:
 *  - Fixed window: 100 messages per 15 minutes, hard reset once elapsed
 *  - RegistrationGuard removes the record on every session exit path
 * Last updated: 2026-10-18
 */

#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

struct RateLimitPolicy
{
    std::chrono::steady_clock::duration window = std::chrono::minutes(15);
    std::uint32_t max_requests = 100;
};

struct SessionRecord
{
    std::chrono::steady_clock::time_point window_start;
    std::uint32_t request_count{0};
};

class ConnectionRegistry
{
public:
    using Clock = std::chrono::steady_clock;

private:
    static constexpr std::size_t kShards = 16;

    struct Shard
    {
        std::mutex m;
        std::unordered_map<std::string, SessionRecord> records;
    };
    std::array<Shard, kShards> shards_;
    RateLimitPolicy policy_;

    Shard &shard_for(const std::string &id) { return shards_[std::hash<std::string>{}(id) % kShards]; }

public:
    explicit ConnectionRegistry(RateLimitPolicy policy = {}) : policy_(policy) {}

    const RateLimitPolicy &policy() const { return policy_; }

    // Starts a fresh window. Re-registering an id resets it.
    void register_session(const std::string &id, Clock::time_point now = Clock::now())
    {
        auto &s = shard_for(id);
        std::scoped_lock lk(s.m);
        s.records[id] = SessionRecord{now, 0};
    }

    bool unregister(const std::string &id)
    {
        auto &s = shard_for(id);
        std::scoped_lock lk(s.m);
        return s.records.erase(id) > 0;
    }

    // Records one inbound message. Returns true when the session is over its
    // quota; the rejected message is not counted. Unknown ids are never limited.
    bool check_and_record(const std::string &id, Clock::time_point now = Clock::now())
    {
        auto &s = shard_for(id);
        std::scoped_lock lk(s.m);
        auto it = s.records.find(id);
        if (it == s.records.end())
            return false;
        auto &rec = it->second;
        if (now - rec.window_start >= policy_.window)
        {
            rec.window_start = now;
            rec.request_count = 0;
        }
        if (rec.request_count >= policy_.max_requests)
            return true;
        ++rec.request_count;
        return false;
    }

    bool contains(const std::string &id)
    {
        auto &s = shard_for(id);
        std::scoped_lock lk(s.m);
        return s.records.count(id) > 0;
    }

    std::size_t size()
    {
        std::size_t n = 0;
        for (auto &s : shards_)
        {
            std::scoped_lock lk(s.m);
            n += s.records.size();
        }
        return n;
    }
};

// Owns one registry entry; unregisters exactly once.
class RegistrationGuard
{
    ConnectionRegistry *registry_ = nullptr;
    std::string id_;

public:
    RegistrationGuard() = default;
    RegistrationGuard(ConnectionRegistry &registry, std::string id, ConnectionRegistry::Clock::time_point now = ConnectionRegistry::Clock::now())
        : registry_(&registry), id_(std::move(id))
    {
        registry_->register_session(id_, now);
    }
    ~RegistrationGuard() { release(); }

    RegistrationGuard(const RegistrationGuard &) = delete;
    RegistrationGuard &operator=(const RegistrationGuard &) = delete;
    RegistrationGuard(RegistrationGuard &&o) noexcept : registry_(std::exchange(o.registry_, nullptr)), id_(std::move(o.id_)) {}
    RegistrationGuard &operator=(RegistrationGuard &&o) noexcept
    {
        if (this != &o)
        {
            release();
            registry_ = std::exchange(o.registry_, nullptr);
            id_ = std::move(o.id_);
        }
        return *this;
    }

    void release()
    {
        if (registry_)
        {
            registry_->unregister(id_);
            registry_ = nullptr;
        }
    }

    bool active() const { return registry_ != nullptr; }
    const std::string &id() const { return id_; }
};
