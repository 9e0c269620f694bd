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
 * @defgroup binrpc Kamailio BinRPC
 * @brief Implementation of the Kamailio binrpc wire protocol (ctl module).
 * @ingroup common
 * 
 * @file BinRPCDefines.h
 * @ingroup binrpc
 */
#if !defined(__BINRPC_DEFINES_H__)
#define  __BINRPC_DEFINES_H__

#include "common/Defines.h"

// Shorthand macro to binrpc::defines -- keeps source code that doesn't use "using" concise
#if !defined(BRPCDEF)
#define BRPCDEF binrpc::defines
#endif // BRPCDEF
namespace binrpc
{
    namespace defines
    {
        // ---------------------------------------------------------------------------
        //  Constants
        // ---------------------------------------------------------------------------

        /**
         * @addtogroup binrpc
         * @{
         */

        /** @name Packet Header */
        const uint8_t   BINRPC_MAGIC = 0x0AU;
        const uint8_t   BINRPC_VERSION = 0x01U;
        const uint8_t   BINRPC_MAGIC_VERSION = (BINRPC_MAGIC << 4) | BINRPC_VERSION;
        const uint8_t   BINRPC_FLAGS_NONE = 0x00U;

        const uint32_t  BINRPC_COOKIE_LENGTH_BYTES = 4U;
        /** @brief Header with a 1 byte length field and 1 byte cookie */
        const uint32_t  BINRPC_MIN_HEADER_LENGTH_BYTES = 4U;
        /** @brief Header with a 4 byte length field and 4 byte cookie */
        const uint32_t  BINRPC_MAX_HEADER_LENGTH_BYTES = 10U;
        /** @} */

        /** @name Payload Record */
        /** @brief Largest value length carried directly in the 3-bit size subfield */
        const uint32_t  BINRPC_INLINE_SIZE_MAX = 8U;
        const uint8_t   BINRPC_SIZE_FLAG = 0x80U;
        const uint8_t   BINRPC_SIZE_MASK = 0x70U;
        const uint8_t   BINRPC_TYPE_MASK = 0x0FU;

        /** @brief Kamailio carries doubles as integers scaled by this factor */
        const int32_t   BINRPC_DOUBLE_SCALE = 1000;
        /** @} */

        /** @brief Largest datagram the encoder will produce */
        const uint32_t  BINRPC_MAX_PACKET_LENGTH_BYTES = 65535U;

        /** @brief Record Value Types */
        namespace RecordType {
            /** @brief Record Value Types */
            enum E : uint8_t {
                INT = 0x00U,                            //! 32-bit Signed Integer
                STRING = 0x01U,                         //! NUL-terminated String
                DOUBLE = 0x02U,                         //! Double (scaled Integer)
                STRUCT = 0x03U,                         //! Structure
                ARRAY = 0x04U,                          //! Array
                AVP = 0x05U,                            //! Attribute-Value Pair
                BYTES = 0x06U,                          //! Byte Array (no terminator)

                ALL = 0x0FU                             //! Wildcard (match any record)
            };
        }

        /** @brief Encoder/Transport Status */
        enum BRPC_STATUS {
            BRPC_OK = 0,                                //! Success
            BRPC_ERR_ENCODING = 1,                      //! Value or length field could not be encoded/decoded
            BRPC_ERR_IO = 2,                            //! Transport lookup, open or write failure
            BRPC_ERR_UNSUPPORTED = 3                    //! Operation not supported
        };

        /** @} */

        // ---------------------------------------------------------------------------
        //  Inlines
        // ---------------------------------------------------------------------------

        /**
         * @brief Helper to determine the minimal number of big-endian bytes needed to represent a value.
         * @ingroup binrpc
         * @param value Value to measure.
         * @returns uint8_t Byte width (1 - 4); zero is one byte wide.
         */
        inline uint8_t byteWidth(uint32_t value) 
        {
            uint8_t width = 1U;
            while (width < 4U && (value >> (width * 8U)) != 0U)
                width++;
            return width;
        }

        /**
         * @brief Helper to write a value big-endian over the given number of bytes.
         * @ingroup binrpc
         * @param value Value to write.
         * @param data Buffer to write to.
         * @param offset Offset within buffer.
         * @param width Number of bytes to write (1 - 4).
         */
        inline void setUIntBE(uint32_t value, uint8_t* data, uint32_t offset, uint8_t width)
        {
            for (uint8_t i = 0U; i < width; i++)
                data[offset + i] = (value >> ((width - 1U - i) * 8U)) & 0xFFU;
        }

        /**
         * @brief Helper to read a big-endian value spanning the given number of bytes.
         * @ingroup binrpc
         * @param data Buffer to read from.
         * @param offset Offset within buffer.
         * @param width Number of bytes to read (1 - 4).
         * @returns uint32_t Value.
         */
        inline uint32_t getUIntBE(const uint8_t* data, uint32_t offset, uint8_t width)
        {
            uint32_t value = 0U;
            for (uint8_t i = 0U; i < width; i++)
                value = (value << 8) | data[offset + i];
            return value;
        }

        /**
         * @brief Helper to convert a status to a printable string.
         * @ingroup binrpc
         * @param status Status.
         * @returns const char* Status text.
         */
        inline const char* statusToString(BRPC_STATUS status)
        {
            switch (status) {
            case BRPC_OK:
                return "ok";
            case BRPC_ERR_ENCODING:
                return "encoding error";
            case BRPC_ERR_IO:
                return "I/O error";
            case BRPC_ERR_UNSUPPORTED:
                return "unsupported";
            default:
                return "unknown";
            }
        }
    } // namespace defines
} // namespace binrpc

#endif // __BINRPC_DEFINES_H__
