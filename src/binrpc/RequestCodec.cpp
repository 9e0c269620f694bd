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
#include "binrpc/RequestCodec.h"
#include "common/Log.h"

using namespace binrpc;
using namespace binrpc::defines;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the RequestCodec class. */

RequestCodec::RequestCodec(Transport* transport, CookieSource& cookies, bool debug) :
    m_assembler(transport, cookies, debug)
{
    /* stub */
}

/* Writes a request invoking the named method. */

BRPC_STATUS RequestCodec::writeRequest(const std::string& method)
{
    if (m_assembler.getDebug()) {
        LogDebugEx(LOG_BINRPC, "RequestCodec::writeRequest()", "method = %s", method.c_str());
    }

    return m_assembler.write(Value::fromString(method));
}

/* Reads the response to a request. */

BRPC_STATUS RequestCodec::readResponse(Value& value)
{
    (void)value;
    LogWarning(LOG_BINRPC, "reading binrpc responses is not supported");
    return BRPC_ERR_UNSUPPORTED;
}
