/*
 * File: src/relay_state.hpp
 * Project: Battle Relay
 * Purpose: Process-wide shared objects handed to the servers and the poller
 * Notes:
 *  - Constructed once in relay_main.cpp; tests build their own
 *  - Members are internally synchronized
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <string>
#include <utility>

#include "relay_auth.hpp"
#include "relay_broadcast.hpp"
#include "relay_dedup.hpp"
#include "relay_governor.hpp"
#include "relay_registry.hpp"

class Scheduler;

struct RelayState
{
    explicit RelayState(std::string secret, RateLimitPolicy policy = {})
        : auth(std::move(secret)), clients(policy) {}

    Authenticator auth;
    DedupCache markers;
    ConnectionRegistry clients;
    Broadcaster events;
    RequestGovernor governor;
    Scheduler *scheduler = nullptr; // optional, for /v1/status
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
};
