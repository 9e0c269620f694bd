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
 * @file PacketAssembler.h
 * @ingroup binrpc
 * @file PacketAssembler.cpp
 * @ingroup binrpc
 */
#if !defined(__BINRPC_PACKET_ASSEMBLER_H__)
#define __BINRPC_PACKET_ASSEMBLER_H__

#include "common/Defines.h"
#include "binrpc/BinRPCDefines.h"
#include "binrpc/CookieSource.h"
#include "binrpc/Transport.h"
#include "binrpc/Value.h"
#include "binrpc/frame/PacketHeader.h"

namespace binrpc
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Assembles binrpc packets and writes them to a transport.
     *  The payload is always built first; the header is built afterwards from the measured payload length
     *  and a fresh cookie, and the finished packet is handed to the transport in a single write.
     * @ingroup binrpc
     */
    class BINRPC_API PacketAssembler {
    public:
        /**
         * @brief Initializes a new instance of the PacketAssembler class.
         * @param transport Transport packets are written to.
         * @param cookies Source of per-packet cookies.
         * @param debug Flag indicating whether debug is enabled.
         */
        PacketAssembler(Transport* transport, CookieSource& cookies, bool debug = false);
        /**
         * @brief Finalizes a instance of the PacketAssembler class.
         */
        ~PacketAssembler();

        /**
         * @brief Assembles a complete binrpc packet carrying the given value.
         * @param value Value to carry.
         * @param[out] packet Buffer holding the assembled packet.
         * @param[out] length Length of the assembled packet.
         * @returns BRPC_STATUS BRPC_OK, if the packet was assembled, otherwise BRPC_ERR_ENCODING.
         */
        defines::BRPC_STATUS assemble(const Value& value, UInt8Array& packet, uint32_t& length);
        /**
         * @brief Assembles a complete binrpc packet carrying the given value and writes it to the transport.
         * @param value Value to carry.
         * @returns BRPC_STATUS BRPC_OK, if the packet was written, otherwise error status.
         */
        defines::BRPC_STATUS write(const Value& value);

        /**
         * @brief Splits a received binrpc packet into its header and first value.
         * @param[in] data Buffer containing the packet.
         * @param length Length of buffer.
         * @param[out] header Decoded packet header.
         * @param[out] value Decoded value.
         * @returns BRPC_STATUS BRPC_OK, if the packet was decoded, otherwise error status.
         */
        static defines::BRPC_STATUS disassemble(const uint8_t* data, uint32_t length, frame::PacketHeader& header, Value& value);

    public:
        /**
         * @brief Cookie of the last assembled packet.
         */
        DECLARE_RO_PROPERTY(uint32_t, lastCookie, LastCookie);
        /**
         * @brief Flag indicating whether debug is enabled.
         */
        DECLARE_PROPERTY(bool, debug, Debug);

    private:
        Transport* m_transport;
        CookieSource& m_cookies;
    };
} // namespace binrpc

#endif // __BINRPC_PACKET_ASSEMBLER_H__
