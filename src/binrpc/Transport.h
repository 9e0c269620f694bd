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
 * @file Transport.h
 * @ingroup binrpc
 */
#if !defined(__BINRPC_TRANSPORT_H__)
#define __BINRPC_TRANSPORT_H__

#include "common/Defines.h"

#include <sys/types.h>

namespace binrpc
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Interface to a duplex datagram transport carrying binrpc packets.
     * @ingroup binrpc
     */
    class BINRPC_API Transport {
    public:
        /**
         * @brief Finalizes a instance of the Transport class.
         */
        virtual ~Transport() = default;

        /**
         * @brief Opens the transport.
         * @returns bool True, if the transport was opened, otherwise false.
         */
        virtual bool open() = 0;
        /**
         * @brief Closes the transport.
         */
        virtual void close() = 0;

        /**
         * @brief Writes a single datagram.
         * @param[in] data Buffer containing the datagram.
         * @param length Length of buffer.
         * @returns bool True, if the whole datagram was written, otherwise false.
         */
        virtual bool write(const uint8_t* data, uint32_t length) = 0;
        /**
         * @brief Reads a single datagram.
         * @param[out] data Buffer to read into.
         * @param length Length of buffer.
         * @param timeout Read timeout in milliseconds.
         * @returns ssize_t Number of bytes read, zero on timeout, or -1 on error.
         */
        virtual ssize_t read(uint8_t* data, uint32_t length, int timeout) = 0;
    };
} // namespace binrpc

#endif // __BINRPC_TRANSPORT_H__
