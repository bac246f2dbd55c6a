/*
 * File: src/relay_dedup.hpp
 * Project: Battle Relay
 * Purpose: Set of locations currently seen as marked
 * Notes:
 *  - Sharded by key hash; no operation needs more than one shard lock
 *  - Only explicit marked / unmarked observations change membership
 * Last updated: 2026-10-18
 */

#pragma once
#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>

#include "common/location.hpp"

class DedupCache
{
    static constexpr std::size_t kShards = 16;

    struct Shard
    {
        std::mutex m;
        std::unordered_set<std::string> keys;
    };
    std::array<Shard, kShards> shards_;

    Shard &shard_for(const std::string &key) { return shards_[std::hash<std::string>{}(key) % kShards]; }

public:
    // True iff the location was not active before (inactive -> active edge).
    bool mark_active(const Location &loc)
    {
        auto key = loc.key();
        auto &s = shard_for(key);
        std::scoped_lock lk(s.m);
        return s.keys.insert(std::move(key)).second;
    }

    // True iff the location was active.
    bool mark_inactive(const Location &loc)
    {
        auto key = loc.key();
        auto &s = shard_for(key);
        std::scoped_lock lk(s.m);
        return s.keys.erase(key) > 0;
    }

    bool contains(const Location &loc)
    {
        auto key = loc.key();
        auto &s = shard_for(key);
        std::scoped_lock lk(s.m);
        return s.keys.count(key) > 0;
    }

    std::size_t size()
    {
        std::size_t n = 0;
        for (auto &s : shards_)
        {
            std::scoped_lock lk(s.m);
            n += s.keys.size();
        }
        return n;
    }

    void clear()
    {
        for (auto &s : shards_)
        {
            std::scoped_lock lk(s.m);
            s.keys.clear();
        }
    }
};
