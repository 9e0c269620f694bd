// SPDX-License-Identifier: GPL-2.0-only
/*
 * Kamailio BinRPC Client - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2006-2016,2020 Jonathan Naylor, G4KLX
 *  Copyright (C) 2017-2024 Bryan Biedenkapp, N2PLL
 *  Copyright (C) 2026 binrpc Authors
 *
 */
#include "common/Defines.h"
#include "common/network/udp/Socket.h"
#include "common/Log.h"

using namespace network;
using namespace network::udp;

#include <cassert>
#include <cerrno>
#include <cstring>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Socket class. */

Socket::Socket(const std::string& address, uint16_t port) :
    m_localAddress(address),
    m_localPort(port),
    m_af(AF_UNSPEC),
    m_fd(-1)
{
    /* stub */
}

/* Initializes a new instance of the Socket class. */

Socket::Socket(uint16_t port) :
    m_localAddress(),
    m_localPort(port),
    m_af(AF_UNSPEC),
    m_fd(-1)
{
    /* stub */
}

/* Finalizes a instance of the Socket class. */

Socket::~Socket()
{
    close();
}

/* Opens UDP socket connection. */

bool Socket::open(const sockaddr_storage& address) noexcept
{
    return open(address.ss_family);
}

/* Opens UDP socket connection. */

bool Socket::open(uint32_t af) noexcept
{
    return open(af, m_localAddress, m_localPort);
}

/* Opens UDP socket connection. */

bool Socket::open(const uint32_t af, const std::string& address, const uint16_t port) noexcept
{
    sockaddr_storage addr;
    uint32_t addrlen;
    struct addrinfo hints;

    ::memset(&hints, 0, sizeof(hints));
    hints.ai_flags = AI_PASSIVE;
    hints.ai_family = af;

    /* to determine protocol family, call lookup() first. */
    int err = lookup(address, port, addr, addrlen, hints);
    if (err != 0) {
        LogError(LOG_NET, "The local address is invalid - %s", address.c_str());
        return false;
    }

    close();

    if (!initSocket(addr.ss_family, SOCK_DGRAM, 0))
        return false;

    if (port > 0U) {
        int reuse = 1;
        if (::setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, (char*)& reuse, sizeof(reuse)) == -1) {
            LogError(LOG_NET, "Cannot set the UDP socket option, err: %d", errno);
            close();
            return false;
        }

        if (!bind(address, port)) {
            close();
            return false;
        }

        LogInfoEx(LOG_NET, "Opening UDP port on %u", port);
    }

    return true;
}

/* Closes the UDP socket connection. */

void Socket::close()
{
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

/* Read data from the UDP socket. */

ssize_t Socket::read(uint8_t* buffer, uint32_t length, sockaddr_storage& address, uint32_t& addrLen, int timeout) noexcept
{
    assert(buffer != nullptr);
    assert(length > 0U);

    if (m_fd < 0)
        return -1;

    // check that the readfrom() won't block
    struct pollfd pfd;
    pfd.fd = m_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ret = ::poll(&pfd, 1, timeout);
    if (ret < 0) {
        LogError(LOG_NET, "Error returned from UDP poll, err: %d", errno);
        return -1;
    }

    if ((pfd.revents & POLLIN) == 0)
        return 0;

    socklen_t size = sizeof(sockaddr_storage);
    ssize_t len = ::recvfrom(pfd.fd, (char*)buffer, length, 0, (sockaddr*)& address, &size);
    if (len <= 0) {
        LogError(LOG_NET, "Error returned from recvfrom, err: %d", errno);
        return -1;
    }

    addrLen = size;
    return len;
}

/* Write data to the UDP socket. */

bool Socket::write(const uint8_t* buffer, uint32_t length, const sockaddr_storage& address, uint32_t addrLen, ssize_t* lenWritten) noexcept
{
    assert(buffer != nullptr);
    assert(length > 0U);

    if (m_fd < 0) {
        if (lenWritten != nullptr) {
            *lenWritten = -1;
        }

        LogError(LOG_NET, "tried to write datagram with no file descriptor");
        return false;
    }

    bool result = false;

    ssize_t sent = ::sendto(m_fd, (const char*)buffer, length, 0, (const sockaddr*)& address, addrLen);
    if (sent < 0) {
        LogError(LOG_NET, "Error returned from sendto, err: %d", errno);

        if (lenWritten != nullptr) {
            *lenWritten = -1;
        }
    }
    else {
        if (sent == ssize_t(length))
            result = true;
        else
            LogError(LOG_NET, "Short datagram write, %zd of %u bytes", sent, length);

        if (lenWritten != nullptr) {
            *lenWritten = sent;
        }
    }

    return result;
}

/* Helper to lookup a hostname and resolve it to an IP address. */

int Socket::lookup(const std::string& hostname, uint16_t port, sockaddr_storage& address, uint32_t& addrLen)
{
    struct addrinfo hints;
    ::memset(&hints, 0, sizeof(hints));

    return lookup(hostname, port, address, addrLen, hints);
}

/* Helper to lookup a hostname and resolve it to an IP address. */

int Socket::lookup(const std::string& hostname, uint16_t port, sockaddr_storage& address, uint32_t& addrLen, struct addrinfo& hints)
{
    std::string portstr = std::to_string(port);
    struct addrinfo* res;

    // port is always digits, no needs to lookup service
    hints.ai_flags |= AI_NUMERICSERV;
    hints.ai_socktype = SOCK_DGRAM;

    int err = getaddrinfo(hostname.empty() ? NULL : hostname.c_str(), portstr.c_str(), &hints, &res);
    if (err != 0) {
        sockaddr_in* paddr = (sockaddr_in*)& address;
        ::memset(paddr, 0x00U, addrLen = sizeof(sockaddr_in));
        paddr->sin_family = AF_INET;
        paddr->sin_port = htons(port);
        paddr->sin_addr.s_addr = htonl(INADDR_NONE);
        LogError(LOG_NET, "Cannot find address for host %s, %s", hostname.c_str(), gai_strerror(err));
        return err;
    }

    ::memcpy(&address, res->ai_addr, addrLen = res->ai_addrlen);

    freeaddrinfo(res);

    return 0;
}

/* Gets the string representation of an address from a sockaddr_storage socket address structure. */

std::string Socket::address(const sockaddr_storage& addr)
{
    std::string address = std::string();
    char str[INET6_ADDRSTRLEN];

    switch (addr.ss_family) {
    case AF_INET:
    {
        struct sockaddr_in* in;
        in = (struct sockaddr_in*)& addr;
        inet_ntop(AF_INET, &(in->sin_addr), str, INET6_ADDRSTRLEN);
        address = std::string(str);
    }
    break;
    case AF_INET6:
    {
        struct sockaddr_in6* in6;
        in6 = (struct sockaddr_in6*)& addr;
        inet_ntop(AF_INET6, &(in6->sin6_addr), str, INET6_ADDRSTRLEN);
        address = std::string(str);
    }
    break;
    default:
        break;
    }

    return address;
}

/* Gets the port from a sockaddr_storage socket address structure. */

uint16_t Socket::port(const sockaddr_storage& addr)
{
    uint16_t port = 0U;

    switch (addr.ss_family) {
    case AF_INET:
    {
        struct sockaddr_in* in;
        in = (struct sockaddr_in*)& addr;
        port = ntohs(in->sin_port);
    }
    break;
    case AF_INET6:
    {
        struct sockaddr_in6* in6;
        in6 = (struct sockaddr_in6*)& addr;
        port = ntohs(in6->sin6_port);
    }
    break;
    default:
        break;
    }

    return port;
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Internal helper to initialize the socket. */

bool Socket::initSocket(const int domain, const int type, const int protocol)
{
    m_fd = ::socket(domain, type, protocol);
    if (m_fd < 0) {
        LogError(LOG_NET, "Cannot create the UDP socket, err: %d", errno);
        return false;
    }

    m_af = domain;
    return true;
}

/* Internal helper to bind to a address and port. */

bool Socket::bind(const std::string& ipAddr, const uint16_t port)
{
    m_localAddress = std::string(ipAddr);
    m_localPort = port;

    sockaddr_in addr = {};
    if (!initAddr(ipAddr, port, addr)) {
        LogError(LOG_NET, "Failed to parse IP address - %s", ipAddr.c_str());
        return false;
    }

    socklen_t length = sizeof(addr);
    bool retval = true;
    if (::bind(m_fd, reinterpret_cast<sockaddr*>(&addr), length) < 0) {
        LogError(LOG_NET, "Cannot bind the UDP address, err: %d", errno);
        retval = false;
    }

    return retval;
}

/* Initialize the sockaddr_in structure with the provided IP and port */

bool Socket::initAddr(const std::string& ipAddr, const int port, sockaddr_in& addr)
{
    addr.sin_family = AF_INET;
    if (ipAddr.empty() || ipAddr == "0.0.0.0")
        addr.sin_addr.s_addr = INADDR_ANY;
    else
    {
        if (::inet_pton(AF_INET, ipAddr.c_str(), &addr.sin_addr) <= 0)
            return false;
    }

    addr.sin_port = htons(port);
    return true;
}
