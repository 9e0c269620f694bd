// SPDX-License-Identifier: GPL-2.0-only
/*
 * Kamailio BinRPC Client - BinRPC Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 binrpc Authors
 *
 */
/**
 * @file CookieSource.h
 * @ingroup binrpc
 * @file CookieSource.cpp
 * @ingroup binrpc
 */
#if !defined(__BINRPC_COOKIE_SOURCE_H__)
#define __BINRPC_COOKIE_SOURCE_H__

#include "common/Defines.h"

#include <mutex>
#include <random>

namespace binrpc
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Interface to a generator of per-packet correlation cookies.
     * @ingroup binrpc
     */
    class BINRPC_API CookieSource {
    public:
        /**
         * @brief Finalizes a instance of the CookieSource class.
         */
        virtual ~CookieSource() = default;

        /**
         * @brief Gets the next cookie.
         * @returns uint32_t Cookie.
         */
        virtual uint32_t next() = 0;
    };

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements a thread-safe pseudorandom cookie generator.
     * @ingroup binrpc
     */
    class BINRPC_API RandomCookieSource : public CookieSource {
    public:
        /**
         * @brief Initializes a new instance of the RandomCookieSource class, seeded from the system entropy source.
         */
        RandomCookieSource();
        /**
         * @brief Initializes a new instance of the RandomCookieSource class.
         * @param seed Generator seed.
         */
        explicit RandomCookieSource(uint32_t seed);

        /**
         * @brief Gets the next cookie.
         * @returns uint32_t Cookie.
         */
        uint32_t next() override;

        /**
         * @brief Gets the shared process-wide cookie source.
         * @returns RandomCookieSource& 
         */
        static RandomCookieSource& instance();

    private:
        std::mt19937 m_random;
        std::mutex m_lock;
    };
} // namespace binrpc

#endif // __BINRPC_COOKIE_SOURCE_H__
