// SPDX-License-Identifier: GPL-2.0-only
/*
 * Kamailio BinRPC Client - Remote Command Client
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 binrpc Authors
 *
 */
#include "common/Defines.h"
#include "binrpc/RequestCodec.h"
#include "binrpc/UDPTransport.h"
#include "remote/BinRPCClient.h"
#include "common/Log.h"

using namespace binrpc;
using namespace binrpc::defines;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the BinRPCClient class. */

BinRPCClient::BinRPCClient(const std::string& address, uint16_t port, bool debug) :
    m_lastCookie(0U),
    m_failedStage(ClientStage::NONE),
    m_address(address),
    m_port(port),
    m_debug(debug),
    m_cookies(&RandomCookieSource::instance())
{
    /* stub */
}

/* Finalizes a instance of the BinRPCClient class. */

BinRPCClient::~BinRPCClient() = default;

/* Sends a binrpc request invoking the given method. */

BRPC_STATUS BinRPCClient::invoke(const std::string& method)
{
    if (m_debug) {
        LogDebugEx(LOG_HOST, "BinRPCClient::invoke()", "sending binrpc request, %s:%u, method = %s", 
            m_address.c_str(), m_port, method.c_str());
    }

    m_failedStage = ClientStage::NONE;

    // the transport closes its socket on every return path
    UDPTransport transport(m_address, m_port);
    if (!transport.lookup()) {
        LogError(LOG_HOST, "failed to connect to binrpc server %s:%u", m_address.c_str(), m_port);
        m_failedStage = ClientStage::LOOKUP;
        return BRPC_ERR_IO;
    }

    if (!transport.open()) {
        LogError(LOG_HOST, "failed to connect to binrpc server %s:%u", m_address.c_str(), m_port);
        m_failedStage = ClientStage::SOCKET;
        return BRPC_ERR_IO;
    }

    RequestCodec codec(&transport, *m_cookies, m_debug);
    BRPC_STATUS ret = codec.writeRequest(method);
    m_lastCookie = codec.assembler().getLastCookie();
    if (ret != BRPC_OK) {
        m_failedStage = (ret == BRPC_ERR_IO) ? ClientStage::SEND : ClientStage::ENCODE;
        LogError(LOG_HOST, "failed to invoke binrpc method %s, %s", method.c_str(), statusToString(ret));
        return ret;
    }

    LogMessage(LOG_HOST, "invoked binrpc method %s on %s:%u, cookie = $%08X", method.c_str(), m_address.c_str(), m_port, m_lastCookie);
    return BRPC_OK;
}

/* Sends a binrpc request invoking the given method. */

BRPC_STATUS BinRPCClient::invoke(const std::string& method, const std::string& address, uint16_t port, bool debug)
{
    BinRPCClient client(address, port, debug);
    return client.invoke(method);
}
