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
 * @file Record.h
 * @ingroup binrpc
 * @file Record.cpp
 * @ingroup binrpc
 */
#if !defined(__BINRPC_FRAME__RECORD_H__)
#define __BINRPC_FRAME__RECORD_H__

#include "common/Defines.h"
#include "binrpc/BinRPCDefines.h"
#include "binrpc/Value.h"

#include <vector>

namespace binrpc
{
    namespace frame
    {
        // ---------------------------------------------------------------------------
        //  Class Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief Represents a single binrpc payload record.
         * \code{.unparsed}
         * Byte 0               1 ...
         * Bit  7 6 5 4 3 2 1 0 
         *     +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
         *     |F| Size| Type  | Value Length (Size bytes, only if F = 1)    |
         *     +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
         *     | Value (big-endian)                                            |
         *     +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
         * \endcode
         * 
         *  Values up to 8 bytes long carry their length directly in the size subfield; longer values set the
         *  size flag (F), and the size subfield then holds the width of the explicit length field. An 8 byte
         *  value does not fit the 3-bit size subfield and spills into the size flag, reading back as F = 1
         *  with a size of 0.
         */
        class BINRPC_API Record {
        public:
            /**
             * @brief Initializes a new instance of the Record class.
             */
            Record();
            /**
             * @brief Finalizes a instance of the Record class.
             */
            ~Record();

            /**
             * @brief Sets the value carried by this record.
             * @param value Value.
             * @returns BRPC_STATUS BRPC_OK, if the value was framed, otherwise BRPC_ERR_ENCODING.
             */
            defines::BRPC_STATUS setValue(const Value& value);
            /**
             * @brief Gets the value carried by this record.
             * @param[out] value Value.
             * @returns BRPC_STATUS BRPC_OK, if the value was decoded, otherwise error status.
             */
            defines::BRPC_STATUS getValue(Value& value) const;

            /**
             * @brief Decode a binrpc payload record.
             * @param[in] data Buffer containing binrpc payload record to decode.
             * @param length Length of buffer.
             * @returns BRPC_STATUS BRPC_OK, if the record was decoded, otherwise BRPC_ERR_ENCODING.
             */
            defines::BRPC_STATUS decode(const uint8_t* data, uint32_t length);
            /**
             * @brief Encode a binrpc payload record.
             * @param[out] data Vector the encoded record is appended to.
             */
            void encode(std::vector<uint8_t>& data) const;

            /**
             * @brief Gets the encoded length of this record.
             * @returns uint32_t Length of record in bytes.
             */
            uint32_t getLength() const;

            /**
             * @brief Gets the raw value bytes.
             * @returns const std::vector<uint8_t>& Value bytes.
             */
            const std::vector<uint8_t>& getData() const { return m_data; }

        public:
            /**
             * @brief Record value type.
             */
            DECLARE_RO_PROPERTY(defines::RecordType::E, type, Type);
            /**
             * @brief Flag indicating an explicit length field follows the first byte.
             */
            DECLARE_RO_PROPERTY(bool, sizeFlag, SizeFlag);
            /**
             * @brief Size subfield (value length, or width of the explicit length field).
             */
            DECLARE_RO_PROPERTY(uint8_t, size, Size);

        private:
            std::vector<uint8_t> m_data;
        };
    } // namespace frame
} // namespace binrpc

#endif // __BINRPC_FRAME__RECORD_H__
