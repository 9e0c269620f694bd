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
#include "binrpc/PacketAssembler.h"
#include "binrpc/frame/Record.h"
#include "common/Log.h"
#include "common/Utils.h"

using namespace binrpc;
using namespace binrpc::defines;
using namespace binrpc::frame;

#include <cassert>
#include <cstring>
#include <vector>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the PacketAssembler class. */

PacketAssembler::PacketAssembler(Transport* transport, CookieSource& cookies, bool debug) :
    m_lastCookie(0U),
    m_debug(debug),
    m_transport(transport),
    m_cookies(cookies)
{
    /* stub */
}

/* Finalizes a instance of the PacketAssembler class. */

PacketAssembler::~PacketAssembler() = default;

/* Assembles a complete binrpc packet carrying the given value. */

BRPC_STATUS PacketAssembler::assemble(const Value& value, UInt8Array& packet, uint32_t& length)
{
    // generate payload
    Record record = Record();
    BRPC_STATUS ret = record.setValue(value);
    if (ret != BRPC_OK) {
        LogError(LOG_BINRPC, "failed to construct payload, %s", statusToString(ret));
        return ret;
    }

    std::vector<uint8_t> payload;
    record.encode(payload);

    // generate header from the finished payload
    PacketHeader header = PacketHeader();
    header.setPayloadLength((uint32_t)payload.size());
    header.setCookie(m_cookies.next());

    length = header.getLength() + (uint32_t)payload.size();
    if (length > BINRPC_MAX_PACKET_LENGTH_BYTES) {
        LogError(LOG_BINRPC, "failed to construct header, packet too large, len = %u", length);
        return BRPC_ERR_ENCODING;
    }

    m_lastCookie = header.getCookie();
    if (m_debug) {
        LogDebugEx(LOG_BINRPC, "PacketAssembler::assemble()", "type = $%02X, payloadLength = %u, cookie = $%08X", 
            value.getType(), header.getPayloadLength(), header.getCookie());
    }

    // generate packet
    packet = std::make_unique<uint8_t[]>(length);
    uint8_t* buffer = packet.get();

    header.encode(buffer);
    ::memcpy(buffer + header.getLength(), payload.data(), payload.size());

    return BRPC_OK;
}

/* Assembles a complete binrpc packet carrying the given value and writes it to the transport. */

BRPC_STATUS PacketAssembler::write(const Value& value)
{
    assert(m_transport != nullptr);

    UInt8Array packet = nullptr;
    uint32_t length = 0U;
    BRPC_STATUS ret = assemble(value, packet, length);
    if (ret != BRPC_OK)
        return ret;

    if (m_debug)
        Utils::dump(1U, "binrpc Packet", packet.get(), length);

    if (!m_transport->write(packet.get(), length)) {
        LogError(LOG_BINRPC, "failed to write packet, len = %u", length);
        return BRPC_ERR_IO;
    }

    return BRPC_OK;
}

/* Splits a received binrpc packet into its header and first value. */

BRPC_STATUS PacketAssembler::disassemble(const uint8_t* data, uint32_t length, PacketHeader& header, Value& value)
{
    assert(data != nullptr);

    if (!header.decode(data, length))
        return BRPC_ERR_ENCODING;

    uint32_t offset = header.getLength();
    if (length - offset < header.getPayloadLength()) {
        LogError(LOG_BINRPC, "truncated payload, len = %u, expected = %u", length - offset, header.getPayloadLength());
        return BRPC_ERR_ENCODING;
    }

    Record record = Record();
    BRPC_STATUS ret = record.decode(data + offset, header.getPayloadLength());
    if (ret != BRPC_OK)
        return ret;

    return record.getValue(value);
}
