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
#include "binrpc/frame/PacketHeader.h"
#include "common/Log.h"

using namespace binrpc;
using namespace binrpc::defines;
using namespace binrpc::frame;

#include <cassert>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the PacketHeader class. */

PacketHeader::PacketHeader() :
    m_flags(BINRPC_FLAGS_NONE),
    m_cookie(0U),
    m_lengthWidth(1U),
    m_cookieWidth(BINRPC_COOKIE_LENGTH_BYTES),
    m_payloadLength(0U)
{
    /* stub */
}

/* Finalizes a instance of the PacketHeader class. */

PacketHeader::~PacketHeader() = default;

/* Decode a binrpc packet header. */

bool PacketHeader::decode(const uint8_t* data, uint32_t length)
{
    assert(data != nullptr);

    if (length < BINRPC_MIN_HEADER_LENGTH_BYTES) {
        LogError(LOG_BINRPC, "PacketHeader::decode(), header too short, len = %u", length);
        return false;
    }

    if (data[0U] != BINRPC_MAGIC_VERSION) {
        LogError(LOG_BINRPC, "PacketHeader::decode(), invalid magic/version $%02X", data[0U]);
        return false;
    }

    m_flags = (data[1U] >> 4) & 0x0FU;                                          // Flags
    m_lengthWidth = ((data[1U] >> 2) & 0x03U) + 1U;                             // Length Field Width
    m_cookieWidth = (data[1U] & 0x03U) + 1U;                                    // Cookie Field Width

    if (length < getLength()) {
        LogError(LOG_BINRPC, "PacketHeader::decode(), header too short, len = %u, expected = %u", length, getLength());
        return false;
    }

    m_payloadLength = getUIntBE(data, 2U, m_lengthWidth);                       // Payload Length
    m_cookie = getUIntBE(data, 2U + m_lengthWidth, m_cookieWidth);              // Cookie

    return true;
}

/* Encode a binrpc packet header. */

void PacketHeader::encode(uint8_t* data) const
{
    assert(data != nullptr);

    data[0U] = BINRPC_MAGIC_VERSION;                                            // Magic/Version
    data[1U] = ((m_flags & 0x0FU) << 4) |                                       // Flags
        (((m_lengthWidth - 1U) & 0x03U) << 2) |                                 // Length Field Width
        ((m_cookieWidth - 1U) & 0x03U);                                         // Cookie Field Width

    setUIntBE(m_payloadLength, data, 2U, m_lengthWidth);                        // Payload Length
    setUIntBE(m_cookie, data, 2U + m_lengthWidth, m_cookieWidth);               // Cookie
}

/* Gets the encoded length of this header. */

uint32_t PacketHeader::getLength() const
{
    return 2U + m_lengthWidth + m_cookieWidth;
}

/* Sets the length of the payload following the header. */

void PacketHeader::setPayloadLength(uint32_t length)
{
    m_payloadLength = length;
    m_lengthWidth = byteWidth(length);
}
