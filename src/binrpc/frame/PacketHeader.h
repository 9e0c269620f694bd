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
 * @file PacketHeader.h
 * @ingroup binrpc
 * @file PacketHeader.cpp
 * @ingroup binrpc
 */
#if !defined(__BINRPC_FRAME__PACKET_HEADER_H__)
#define __BINRPC_FRAME__PACKET_HEADER_H__

#include "common/Defines.h"
#include "binrpc/BinRPCDefines.h"

namespace binrpc
{
    namespace frame
    {
        // ---------------------------------------------------------------------------
        //  Class Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief Represents the binrpc packet header.
         * \code{.unparsed}
         * Byte 0               1               2 ...
         * Bit  7 6 5 4 3 2 1 0 7 6 5 4 3 2 1 0 
         *     +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
         *     | Magic | Ver   | Flags |LL |CL | Payload Length (LL + 1 bytes)|
         *     +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
         *     | Cookie (CL + 1 bytes)                                         |
         *     +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
         * 4 - 10 bytes
         * \endcode
         * 
         *  The payload length is written big-endian over the smallest number of bytes that holds it; the
         *  cookie is always written over 4 bytes (CL = 3).
         */
        class BINRPC_API PacketHeader {
        public:
            /**
             * @brief Initializes a new instance of the PacketHeader class.
             */
            PacketHeader();
            /**
             * @brief Finalizes a instance of the PacketHeader class.
             */
            ~PacketHeader();

            /**
             * @brief Decode a binrpc packet header.
             * @param[in] data Buffer containing binrpc packet header to decode.
             * @param length Length of buffer.
             * @returns bool True, if header was decoded, otherwise false.
             */
            bool decode(const uint8_t* data, uint32_t length);
            /**
             * @brief Encode a binrpc packet header.
             * @param[out] data Buffer to encode a binrpc packet header (at least getLength() bytes).
             */
            void encode(uint8_t* data) const;

            /**
             * @brief Gets the encoded length of this header.
             * @returns uint32_t Length of header in bytes.
             */
            uint32_t getLength() const;

            /**
             * @brief Gets the length of the payload following the header.
             * @returns uint32_t Payload length in bytes.
             */
            uint32_t getPayloadLength() const { return m_payloadLength; }
            /**
             * @brief Sets the length of the payload following the header.
             *  The length field width is recalculated to the minimal big-endian width holding the length.
             * @param length Payload length in bytes.
             */
            void setPayloadLength(uint32_t length);

        public:
            /**
             * @brief Header flags.
             */
            DECLARE_PROPERTY(uint8_t, flags, Flags);
            /**
             * @brief Request/Response correlation cookie.
             */
            DECLARE_PROPERTY(uint32_t, cookie, Cookie);
            /**
             * @brief Width of the payload length field in bytes.
             */
            DECLARE_RO_PROPERTY(uint8_t, lengthWidth, LengthWidth);
            /**
             * @brief Width of the cookie field in bytes.
             */
            DECLARE_RO_PROPERTY(uint8_t, cookieWidth, CookieWidth);

        private:
            uint32_t m_payloadLength;
        };
    } // namespace frame
} // namespace binrpc

#endif // __BINRPC_FRAME__PACKET_HEADER_H__
