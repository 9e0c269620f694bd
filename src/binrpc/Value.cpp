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
#include "binrpc/Value.h"
#include "common/Log.h"
#include "common/Utils.h"

using namespace binrpc;
using namespace binrpc::defines;

#include <cassert>
#include <cmath>
#include <cstdio>
#include <limits>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Value class. */

Value::Value() :
    m_type(RecordType::INT),
    m_int(0),
    m_double(0.0),
    m_string(),
    m_bytes()
{
    /* stub */
}

/* Creates an Integer value. */

Value Value::fromInt(int32_t value)
{
    Value v;
    v.m_type = RecordType::INT;
    v.m_int = value;
    return v;
}

/* Creates a String value. */

Value Value::fromString(const std::string& value)
{
    Value v;
    v.m_type = RecordType::STRING;
    v.m_string = value;
    return v;
}

/* Creates a Double value. */

Value Value::fromDouble(double value)
{
    Value v;
    v.m_type = RecordType::DOUBLE;
    v.m_double = value;
    return v;
}

/* Creates a Bytes value. */

Value Value::fromBytes(const uint8_t* data, uint32_t length)
{
    Value v;
    v.m_type = RecordType::BYTES;
    if (data != nullptr && length > 0U)
        v.m_bytes.assign(data, data + length);
    return v;
}

/* Serializes the value into its wire representation. */

BRPC_STATUS Value::serialize(std::vector<uint8_t>& data) const
{
    switch (m_type) {
    case RecordType::INT:
    {
        uint8_t buffer[4U];
        uint32_t value = (uint32_t)m_int;
        SET_UINT32(value, buffer, 0U);
        data.insert(data.end(), buffer, buffer + 4U);
    }
    return BRPC_OK;

    case RecordType::DOUBLE:
    {
        double scaled = std::round(m_double * BINRPC_DOUBLE_SCALE);
        if (std::isnan(scaled) || scaled < (double)std::numeric_limits<int32_t>::min() || 
            scaled > (double)std::numeric_limits<int32_t>::max()) {
            LogError(LOG_BINRPC, "double value %f does not fit a scaled 32-bit integer", m_double);
            return BRPC_ERR_ENCODING;
        }

        uint8_t buffer[4U];
        uint32_t value = (uint32_t)(int32_t)scaled;
        SET_UINT32(value, buffer, 0U);
        data.insert(data.end(), buffer, buffer + 4U);
    }
    return BRPC_OK;

    case RecordType::STRING:
    {
        // strings are NUL-terminated on the wire; an embedded NUL would silently truncate the value
        if (m_string.find('\0') != std::string::npos) {
            LogError(LOG_BINRPC, "string value contains an embedded NUL");
            return BRPC_ERR_ENCODING;
        }

        data.insert(data.end(), m_string.begin(), m_string.end());
        data.push_back(0x00U);
    }
    return BRPC_OK;

    case RecordType::BYTES:
        data.insert(data.end(), m_bytes.begin(), m_bytes.end());
        return BRPC_OK;

    default:
        LogError(LOG_BINRPC, "cannot serialize value of type $%02X", m_type);
        return BRPC_ERR_ENCODING;
    }
}

/* Deserializes a value from its wire representation. */

BRPC_STATUS Value::deserialize(RecordType::E type, const uint8_t* data, uint32_t length, Value& value)
{
    assert(data != nullptr || length == 0U);

    switch (type) {
    case RecordType::INT:
    case RecordType::DOUBLE:
    {
        if (length > 4U) {
            LogError(LOG_BINRPC, "integer record too long, len = %u", length);
            return BRPC_ERR_ENCODING;
        }

        int32_t raw = (length > 0U) ? (int32_t)getUIntBE(data, 0U, (uint8_t)length) : 0;
        if (type == RecordType::INT)
            value = Value::fromInt(raw);
        else
            value = Value::fromDouble((double)raw / BINRPC_DOUBLE_SCALE);
    }
    return BRPC_OK;

    case RecordType::STRING:
    {
        // read up to the terminator, tolerate a missing one
        uint32_t len = 0U;
        while (len < length && data[len] != 0x00U)
            len++;

        value = Value::fromString(std::string((const char*)data, len));
    }
    return BRPC_OK;

    case RecordType::BYTES:
        value = Value::fromBytes(data, length);
        return BRPC_OK;

    case RecordType::STRUCT:
    case RecordType::ARRAY:
    case RecordType::AVP:
        LogWarning(LOG_BINRPC, "structured record type $%02X is not supported", type);
        return BRPC_ERR_UNSUPPORTED;

    default:
        LogError(LOG_BINRPC, "invalid record type $%02X", type);
        return BRPC_ERR_ENCODING;
    }
}

/* Helper to return a printable representation of the value. */

std::string Value::toString() const
{
    switch (m_type) {
    case RecordType::INT:
        return std::to_string(m_int);
    case RecordType::DOUBLE:
    {
        char buffer[32U];
        ::snprintf(buffer, sizeof(buffer), "%.3f", m_double);
        return std::string(buffer);
    }
    case RecordType::STRING:
        return "\"" + m_string + "\"";
    case RecordType::BYTES:
        if (m_bytes.empty())
            return "<>";
        return "<" + Utils::hex(m_bytes.data(), (uint32_t)m_bytes.size()) + ">";
    default:
        return "?";
    }
}

/* Equality operator. */

bool Value::operator==(const Value& value) const
{
    if (m_type != value.m_type)
        return false;

    switch (m_type) {
    case RecordType::INT:
        return m_int == value.m_int;
    case RecordType::DOUBLE:
        return m_double == value.m_double;
    case RecordType::STRING:
        return m_string == value.m_string;
    case RecordType::BYTES:
        return m_bytes == value.m_bytes;
    default:
        return false;
    }
}
