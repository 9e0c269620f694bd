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
 * @file RequestCodec.h
 * @ingroup binrpc
 * @file RequestCodec.cpp
 * @ingroup binrpc
 */
#if !defined(__BINRPC_REQUEST_CODEC_H__)
#define __BINRPC_REQUEST_CODEC_H__

#include "common/Defines.h"
#include "binrpc/BinRPCDefines.h"
#include "binrpc/PacketAssembler.h"
#include "binrpc/Value.h"

#include <string>

namespace binrpc
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Encodes binrpc requests onto a transport.
     * @ingroup binrpc
     */
    class BINRPC_API RequestCodec {
    public:
        /**
         * @brief Initializes a new instance of the RequestCodec class.
         * @param transport Transport requests are written to.
         * @param cookies Source of per-packet cookies.
         * @param debug Flag indicating whether debug is enabled.
         */
        RequestCodec(Transport* transport, CookieSource& cookies, bool debug = false);

        /**
         * @brief Writes a request invoking the named method.
         * @param method RPC method name (i.e. "core.version").
         * @returns BRPC_STATUS BRPC_OK, if the request was written, otherwise error status.
         */
        defines::BRPC_STATUS writeRequest(const std::string& method);
        /**
         * @brief Reads the response to a request.
         *  Responses are not interpreted; this always returns BRPC_ERR_UNSUPPORTED.
         * @param[out] value Response value.
         * @returns BRPC_STATUS BRPC_ERR_UNSUPPORTED.
         */
        defines::BRPC_STATUS readResponse(Value& value);

        /**
         * @brief Gets the packet assembler used by this codec.
         * @returns PacketAssembler& 
         */
        PacketAssembler& assembler() { return m_assembler; }

    private:
        PacketAssembler m_assembler;
    };
} // namespace binrpc

#endif // __BINRPC_REQUEST_CODEC_H__
