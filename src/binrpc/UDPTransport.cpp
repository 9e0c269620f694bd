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
#include "binrpc/UDPTransport.h"
#include "common/Log.h"

using namespace binrpc;
using namespace network::udp;

#include <cassert>
#include <cstring>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the UDPTransport class. */

UDPTransport::UDPTransport(const std::string& address, uint16_t port) :
    m_address(address),
    m_port(port),
    m_socket(),
    m_addr(),
    m_addrLen(0U),
    m_resolved(false)
{
    ::memset(&m_addr, 0x00U, sizeof(m_addr));
}

/* Finalizes a instance of the UDPTransport class. */

UDPTransport::~UDPTransport()
{
    close();
}

/* Resolves the remote endpoint. */

bool UDPTransport::lookup()
{
    m_resolved = false;
    if (Socket::lookup(m_address, m_port, m_addr, m_addrLen) != 0) {
        LogError(LOG_NET, "Could not lookup the address of %s:%u", m_address.c_str(), m_port);
        return false;
    }

    m_resolved = true;
    return true;
}

/* Opens the UDP socket, resolving the remote endpoint first if necessary. */

bool UDPTransport::open()
{
    if (!m_resolved && !lookup())
        return false;

    if (!m_socket.open(m_addr)) {
        LogError(LOG_NET, "Could not open the UDP socket for %s:%u", m_address.c_str(), m_port);
        return false;
    }

    return true;
}

/* Closes the UDP socket. */

void UDPTransport::close()
{
    m_socket.close();
}

/* Writes a single datagram to the remote endpoint. */

bool UDPTransport::write(const uint8_t* data, uint32_t length)
{
    assert(data != nullptr);

    ssize_t written = 0;
    if (!m_socket.write(data, length, m_addr, m_addrLen, &written)) {
        LogError(LOG_NET, "Failed to write %u bytes to %s:%u", length, m_address.c_str(), m_port);
        return false;
    }

    return true;
}

/* Reads a single datagram. */

ssize_t UDPTransport::read(uint8_t* data, uint32_t length, int timeout)
{
    assert(data != nullptr);

    sockaddr_storage address;
    uint32_t addrLen = 0U;
    return m_socket.read(data, length, address, addrLen, timeout);
}
