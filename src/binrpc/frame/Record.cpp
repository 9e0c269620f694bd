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
#include "binrpc/frame/Record.h"
#include "common/Log.h"

using namespace binrpc;
using namespace binrpc::defines;
using namespace binrpc::frame;

#include <cassert>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Record class. */

Record::Record() :
    m_type(RecordType::INT),
    m_sizeFlag(false),
    m_size(0U),
    m_data()
{
    /* stub */
}

/* Finalizes a instance of the Record class. */

Record::~Record() = default;

/* Sets the value carried by this record. */

BRPC_STATUS Record::setValue(const Value& value)
{
    std::vector<uint8_t> data;
    BRPC_STATUS ret = value.serialize(data);
    if (ret != BRPC_OK)
        return ret;

    // record byte + widest length field + value must fit a single datagram
    if (data.size() > BINRPC_MAX_PACKET_LENGTH_BYTES - BINRPC_MAX_HEADER_LENGTH_BYTES - 5U) {
        LogError(LOG_BINRPC, "Record::setValue(), value too large, len = %u", (uint32_t)data.size());
        return BRPC_ERR_ENCODING;
    }

    uint32_t len = (uint32_t)data.size();

    m_type = value.getType();
    if (len > BINRPC_INLINE_SIZE_MAX) {
        m_sizeFlag = true;
        m_size = byteWidth(len);
    }
    else {
        m_sizeFlag = false;
        m_size = (uint8_t)len;
    }

    m_data = std::move(data);
    return BRPC_OK;
}

/* Gets the value carried by this record. */

BRPC_STATUS Record::getValue(Value& value) const
{
    return Value::deserialize(m_type, m_data.data(), (uint32_t)m_data.size(), value);
}

/* Decode a binrpc payload record. */

BRPC_STATUS Record::decode(const uint8_t* data, uint32_t length)
{
    assert(data != nullptr);

    if (length < 1U) {
        LogError(LOG_BINRPC, "Record::decode(), record too short, len = %u", length);
        return BRPC_ERR_ENCODING;
    }

    m_sizeFlag = (data[0U] & BINRPC_SIZE_FLAG) == BINRPC_SIZE_FLAG;             // Size Flag
    m_size = (data[0U] & BINRPC_SIZE_MASK) >> 4;                                // Size
    m_type = (RecordType::E)(data[0U] & BINRPC_TYPE_MASK);                      // Type

    uint32_t offset = 1U;
    uint32_t valueLen = m_size;
    if (m_sizeFlag) {
        if (m_size == 0U) {
            // 8 byte value spilled into the size flag
            valueLen = BINRPC_INLINE_SIZE_MAX;
        }
        else {
            if (m_size > 4U) {
                LogError(LOG_BINRPC, "Record::decode(), invalid length field width, width = %u", m_size);
                return BRPC_ERR_ENCODING;
            }

            if (length < offset + m_size) {
                LogError(LOG_BINRPC, "Record::decode(), truncated length field, len = %u", length);
                return BRPC_ERR_ENCODING;
            }

            valueLen = getUIntBE(data, offset, m_size);                         // Value Length
            offset += m_size;
        }
    }

    if (length - offset < valueLen) {
        LogError(LOG_BINRPC, "Record::decode(), truncated value, len = %u, expected = %u", length - offset, valueLen);
        return BRPC_ERR_ENCODING;
    }

    m_data.assign(data + offset, data + offset + valueLen);
    return BRPC_OK;
}

/* Encode a binrpc payload record. */

void Record::encode(std::vector<uint8_t>& data) const
{
    uint32_t len = (uint32_t)m_data.size();
    if (m_sizeFlag) {
        data.push_back(BINRPC_SIZE_FLAG | ((m_size << 4) & BINRPC_SIZE_MASK) | (m_type & BINRPC_TYPE_MASK));

        uint8_t buffer[4U];
        setUIntBE(len, buffer, 0U, m_size);
        data.insert(data.end(), buffer, buffer + m_size);
    }
    else {
        // an 8 byte length overflows the size subfield into the size flag
        data.push_back((uint8_t)((len << 4) | (m_type & BINRPC_TYPE_MASK)));
    }

    data.insert(data.end(), m_data.begin(), m_data.end());
}

/* Gets the encoded length of this record. */

uint32_t Record::getLength() const
{
    return 1U + (m_sizeFlag ? m_size : 0U) + (uint32_t)m_data.size();
}
