// SPDX-License-Identifier: GPL-2.0-only
/*
 * Kamailio BinRPC Client - BinRPC Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 binrpc Authors
 *
 */
#include "common/Defines.h"
#include "binrpc/CookieSource.h"

using namespace binrpc;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the RandomCookieSource class. */

RandomCookieSource::RandomCookieSource() :
    m_random(),
    m_lock()
{
    std::random_device rd;
    std::mt19937 mt(rd());
    m_random = mt;
}

/* Initializes a new instance of the RandomCookieSource class. */

RandomCookieSource::RandomCookieSource(uint32_t seed) :
    m_random(seed),
    m_lock()
{
    /* stub */
}

/* Gets the next cookie. */

uint32_t RandomCookieSource::next()
{
    std::lock_guard<std::mutex> lock(m_lock);

    std::uniform_int_distribution<uint32_t> dist(0U, UINT32_MAX);
    return dist(m_random);
}

/* Gets the shared process-wide cookie source. */

RandomCookieSource& RandomCookieSource::instance()
{
    static RandomCookieSource source;
    return source;
}
