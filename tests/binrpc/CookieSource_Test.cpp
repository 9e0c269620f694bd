// SPDX-License-Identifier: GPL-2.0-only
/*
 * Kamailio BinRPC Client - Test Suite
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 binrpc Authors
 *
 */
#include "Defines.h"
#include "binrpc/CookieSource.h"
#include "common/Log.h"

using namespace binrpc;

#include <catch2/catch_test_macros.hpp>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

TEST_CASE("CookieSource", "[Random Test]") {
    SECTION("Seeded_Repeatable") {
        RandomCookieSource a(42U);
        RandomCookieSource b(42U);

        for (int i = 0; i < 16; i++) {
            REQUIRE(a.next() == b.next());
        }
    }

    SECTION("Repeats_Unlikely") {
        RandomCookieSource cookies;

        std::set<uint32_t> seen;
        for (int i = 0; i < 1000; i++) {
            seen.insert(cookies.next());
        }

        ::LogDebug("T", "distinct cookies = %u", (uint32_t)seen.size());

        // the birthday bound for 1000 draws from 2^32 is ~1.2e-4
        REQUIRE(seen.size() >= 999U);
    }

    SECTION("Shared_Concurrent") {
        std::mutex lock;
        std::vector<uint32_t> drawn;

        std::vector<std::thread> threads;
        for (int t = 0; t < 4; t++) {
            threads.push_back(std::thread([&]() {
                std::vector<uint32_t> local;
                for (int i = 0; i < 250; i++) {
                    local.push_back(RandomCookieSource::instance().next());
                }

                std::lock_guard<std::mutex> guard(lock);
                drawn.insert(drawn.end(), local.begin(), local.end());
            }));
        }

        for (std::thread& thread : threads) {
            thread.join();
        }

        std::set<uint32_t> seen(drawn.begin(), drawn.end());
        REQUIRE(drawn.size() == 1000U);
        REQUIRE(seen.size() >= 999U);
    }
}
