// SPDX-License-Identifier: GPL-2.0-only
/*
 * Kamailio BinRPC Client - Remote Command Client
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 binrpc Authors
 *
 */
/**
 * @defgroup remote Remote Command Client
 * @brief Implementation for the binrpc remote command client.
 * @ingroup remote
 * 
 * @file BinRPCClient.h
 * @ingroup remote
 * @file BinRPCClient.cpp
 * @ingroup remote
 */
#if !defined(__BINRPC_CLIENT_H__)
#define __BINRPC_CLIENT_H__

#include "common/Defines.h"
#include "binrpc/BinRPCDefines.h"
#include "binrpc/CookieSource.h"

#include <string>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

/**
 * @brief Request Stages
 * @ingroup remote
 */
namespace ClientStage {
    /** @brief Request Stages */
    enum E : uint8_t {
        NONE = 0U,                                      //! No Failure
        LOOKUP = 1U,                                    //! Remote Address Lookup
        SOCKET = 2U,                                    //! Socket Open
        ENCODE = 3U,                                    //! Request Encoding
        SEND = 4U                                       //! Request Write
    };
}

// ---------------------------------------------------------------------------
//  Class Declaration
// ---------------------------------------------------------------------------

/**
 * @brief This class implements the binrpc remote command client logic.
 * @ingroup remote
 */
class BINRPC_API BinRPCClient
{
public:
    /**
     * @brief Initializes a new instance of the BinRPCClient class.
     * @param address Network Hostname/IP address to connect to.
     * @param port Network port number.
     * @param debug Flag indicating whether debug is enabled.
     */
    BinRPCClient(const std::string& address, uint16_t port, bool debug);
    /**
     * @brief Finalizes a instance of the BinRPCClient class.
     */
    ~BinRPCClient();

    /**
     * @brief Sends a binrpc request invoking the given method.
     *  The request is fire-and-forget; no reply is awaited.
     * @param method RPC method name.
     * @returns BRPC_STATUS BRPC_OK, if the request was sent, otherwise error status.
     */
    binrpc::defines::BRPC_STATUS invoke(const std::string& method);

    /**
     * @brief Sends a binrpc request invoking the given method.
     * @param method RPC method name.
     * @param address Network Hostname/IP address to connect to.
     * @param port Network port number.
     * @param debug Flag indicating whether debug is enabled.
     * @returns BRPC_STATUS BRPC_OK, if the request was sent, otherwise error status.
     */
    static binrpc::defines::BRPC_STATUS invoke(const std::string& method, const std::string& address, uint16_t port, bool debug = false);

    /**
     * @brief Sets the cookie source used for requests.
     * @param cookies Cookie source.
     */
    void setCookieSource(binrpc::CookieSource& cookies) { m_cookies = &cookies; }

    /**
     * @brief Cookie of the last sent request.
     */
    DECLARE_RO_PROPERTY(uint32_t, lastCookie, LastCookie);
    /**
     * @brief Stage at which the last request failed.
     */
    DECLARE_RO_PROPERTY(ClientStage::E, failedStage, FailedStage);

private:
    std::string m_address;
    uint16_t m_port;
    bool m_debug;

    binrpc::CookieSource* m_cookies;
};

#endif // __BINRPC_CLIENT_H__
