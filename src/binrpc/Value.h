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
 * @file Value.h
 * @ingroup binrpc
 * @file Value.cpp
 * @ingroup binrpc
 */
#if !defined(__BINRPC_VALUE_H__)
#define __BINRPC_VALUE_H__

#include "common/Defines.h"
#include "binrpc/BinRPCDefines.h"

#include <string>
#include <vector>

namespace binrpc
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Represents a single scalar binrpc value.
     *  A value is one of the scalar record types (Integer, String, Double or Bytes); the type tag selects
     *  which member holds the data. Structured types (Struct, Array, AVP) are not carried.
     * @ingroup binrpc
     */
    class BINRPC_API Value {
    public:
        /**
         * @brief Initializes a new instance of the Value class (Integer 0).
         */
        Value();

        /**
         * @brief Creates an Integer value.
         * @param value 32-bit signed integer.
         * @returns Value 
         */
        static Value fromInt(int32_t value);
        /**
         * @brief Creates a String value.
         * @param value Text; a NUL terminator is added on the wire.
         * @returns Value 
         */
        static Value fromString(const std::string& value);
        /**
         * @brief Creates a Double value.
         * @param value Floating point value; carried on the wire as value * 1000.
         * @returns Value 
         */
        static Value fromDouble(double value);
        /**
         * @brief Creates a Bytes value.
         * @param data Buffer containing the bytes.
         * @param length Length of buffer.
         * @returns Value 
         */
        static Value fromBytes(const uint8_t* data, uint32_t length);

        /**
         * @brief Gets the record type of this value.
         * @returns RecordType::E 
         */
        defines::RecordType::E getType() const { return m_type; }

        /** @brief Gets the Integer contents. */
        int32_t getInt() const { return m_int; }
        /** @brief Gets the Double contents. */
        double getDouble() const { return m_double; }
        /** @brief Gets the String contents. */
        const std::string& getString() const { return m_string; }
        /** @brief Gets the Bytes contents. */
        const std::vector<uint8_t>& getBytes() const { return m_bytes; }

        /**
         * @brief Serializes the value into its wire representation.
         * @param[out] data Vector the big-endian value bytes are appended to.
         * @returns BRPC_STATUS BRPC_OK, if the value was serialized, otherwise BRPC_ERR_ENCODING.
         */
        defines::BRPC_STATUS serialize(std::vector<uint8_t>& data) const;
        /**
         * @brief Deserializes a value from its wire representation.
         * @param type Record type.
         * @param[in] data Buffer containing the value bytes.
         * @param length Number of value bytes.
         * @param[out] value Decoded value.
         * @returns BRPC_STATUS BRPC_OK, if the value was decoded, BRPC_ERR_UNSUPPORTED for structured types,
         *  otherwise BRPC_ERR_ENCODING.
         */
        static defines::BRPC_STATUS deserialize(defines::RecordType::E type, const uint8_t* data, uint32_t length, Value& value);

        /**
         * @brief Helper to return a printable representation of the value.
         * @returns std::string 
         */
        std::string toString() const;

        /**
         * @brief Equality operator.
         * @param value Value to compare.
         */
        bool operator==(const Value& value) const;
        /**
         * @brief Inequality operator.
         * @param value Value to compare.
         */
        bool operator!=(const Value& value) const { return !(*this == value); }

    private:
        defines::RecordType::E m_type;

        int32_t m_int;
        double m_double;
        std::string m_string;
        std::vector<uint8_t> m_bytes;
    };
} // namespace binrpc

#endif // __BINRPC_VALUE_H__
