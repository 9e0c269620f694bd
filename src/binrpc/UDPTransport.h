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
 * @file UDPTransport.h
 * @ingroup binrpc
 * @file UDPTransport.cpp
 * @ingroup binrpc
 */
#if !defined(__BINRPC_UDP_TRANSPORT_H__)
#define __BINRPC_UDP_TRANSPORT_H__

#include "common/Defines.h"
#include "common/network/udp/Socket.h"
#include "binrpc/Transport.h"

#include <string>

namespace binrpc
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements a connectionless UDP transport to a single remote endpoint.
     *  The socket is released when the transport is closed or destroyed.
     * @ingroup binrpc
     */
    class BINRPC_API UDPTransport : public Transport {
    public:
        /**
         * @brief Initializes a new instance of the UDPTransport class.
         * @param address Remote hostname or IP address.
         * @param port Remote port.
         */
        UDPTransport(const std::string& address, uint16_t port);
        /**
         * @brief Finalizes a instance of the UDPTransport class.
         */
        ~UDPTransport() override;

        /**
         * @brief Resolves the remote endpoint.
         * @returns bool True, if the remote endpoint was resolved, otherwise false.
         */
        bool lookup();
        /**
         * @brief Opens the UDP socket, resolving the remote endpoint first if necessary.
         * @returns bool True, if the transport was opened, otherwise false.
         */
        bool open() override;
        /**
         * @brief Closes the UDP socket.
         */
        void close() override;

        /**
         * @brief Writes a single datagram to the remote endpoint.
         * @param[in] data Buffer containing the datagram.
         * @param length Length of buffer.
         * @returns bool True, if the whole datagram was written, otherwise false.
         */
        bool write(const uint8_t* data, uint32_t length) override;
        /**
         * @brief Reads a single datagram.
         * @param[out] data Buffer to read into.
         * @param length Length of buffer.
         * @param timeout Read timeout in milliseconds.
         * @returns ssize_t Number of bytes read, zero on timeout, or -1 on error.
         */
        ssize_t read(uint8_t* data, uint32_t length, int timeout) override;

        /**
         * @brief Gets a flag indicating whether the transport is open.
         * @returns bool True, if the transport is open, otherwise false.
         */
        bool isOpen() const { return m_socket.isOpen(); }

    public:
        /**
         * @brief Remote hostname or IP address.
         */
        DECLARE_RO_PROPERTY(std::string, address, Address);
        /**
         * @brief Remote port.
         */
        DECLARE_RO_PROPERTY(uint16_t, port, Port);

    private:
        network::udp::Socket m_socket;

        sockaddr_storage m_addr;
        uint32_t m_addrLen;
        bool m_resolved;
    };
} // namespace binrpc

#endif // __BINRPC_UDP_TRANSPORT_H__
