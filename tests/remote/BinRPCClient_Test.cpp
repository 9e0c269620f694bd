// SPDX-License-Identifier: GPL-2.0-only
/*
 * Kamailio BinRPC Client - Test Suite
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 binrpc Authors
 *
 */
#include "Defines.h"
#include "binrpc/PacketAssembler.h"
#include "binrpc/UDPTransport.h"
#include "common/network/udp/Socket.h"
#include "common/Log.h"
#include "common/Utils.h"
#include "remote/BinRPCClient.h"

using namespace binrpc;
using namespace binrpc::defines;
using namespace binrpc::frame;
using namespace network::udp;

#include <catch2/catch_test_macros.hpp>

/** @brief Cookie source that always hands out the same cookie. */
class StaticCookieSource : public CookieSource {
public:
    uint32_t next() override { return 0xDEADBEEFU; }
};

TEST_CASE("BinRPCClient", "[Invoke Test]") {
    SECTION("DispatcherList_Capture") {
        Socket listener("127.0.0.1", TEST_CAPTURE_PORT);
        REQUIRE(listener.open(AF_INET) == true);

        REQUIRE(BinRPCClient::invoke("dispatcher.list", "127.0.0.1", TEST_CAPTURE_PORT) == BRPC_OK);

        uint8_t buffer[512U];
        sockaddr_storage address;
        uint32_t addrLen = 0U;
        ssize_t len = listener.read(buffer, 512U, address, addrLen, 1000);
        REQUIRE(len == 25);
        REQUIRE(Socket::address(address) == "127.0.0.1");
        REQUIRE(Socket::port(address) != TEST_CAPTURE_PORT);

        Utils::dump(2U, "DispatcherList_Capture", buffer, (uint32_t)len);

        // header
        REQUIRE(buffer[0U] == 0xA1U);
        REQUIRE(((buffer[1U] >> 2) & 0x03U) == 0U);                     // LL
        REQUIRE((buffer[1U] & 0x03U) == 3U);                            // CL
        REQUIRE(buffer[2U] == 18U);

        // payload
        REQUIRE((buffer[7U] & BINRPC_TYPE_MASK) == RecordType::STRING);
        REQUIRE((buffer[7U] & BINRPC_SIZE_FLAG) == BINRPC_SIZE_FLAG);
        REQUIRE(buffer[8U] == 16U);
        REQUIRE(::memcmp(buffer + 9U, "dispatcher.list", 16U) == 0);

        listener.close();
    }

    SECTION("InjectedCookie") {
        Socket listener("127.0.0.1", TEST_CAPTURE_PORT);
        REQUIRE(listener.open(AF_INET) == true);

        StaticCookieSource cookies;
        BinRPCClient client("127.0.0.1", TEST_CAPTURE_PORT, true);
        client.setCookieSource(cookies);
        REQUIRE(client.invoke("core.uptime") == BRPC_OK);
        REQUIRE(client.getLastCookie() == 0xDEADBEEFU);
        REQUIRE(client.getFailedStage() == ClientStage::NONE);

        uint8_t buffer[512U];
        sockaddr_storage address;
        uint32_t addrLen = 0U;
        ssize_t len = listener.read(buffer, 512U, address, addrLen, 1000);
        REQUIRE(len > 0);

        PacketHeader header = PacketHeader();
        Value value;
        REQUIRE(PacketAssembler::disassemble(buffer, (uint32_t)len, header, value) == BRPC_OK);
        REQUIRE(header.getCookie() == 0xDEADBEEFU);
        REQUIRE(value.getString() == "core.uptime");

        listener.close();
    }

    SECTION("LookupFailure") {
        BinRPCClient client("host.invalid", TEST_CAPTURE_PORT, false);
        REQUIRE(client.invoke("core.uptime") == BRPC_ERR_IO);
        REQUIRE(client.getFailedStage() == ClientStage::LOOKUP);
    }

    SECTION("EncodingFailure") {
        std::string method(BINRPC_MAX_PACKET_LENGTH_BYTES, 'm');

        BinRPCClient client("127.0.0.1", TEST_CAPTURE_PORT, false);
        REQUIRE(client.invoke(method) == BRPC_ERR_ENCODING);
        REQUIRE(client.getFailedStage() == ClientStage::ENCODE);
    }
}

TEST_CASE("UDPTransport", "[Transport Test]") {
    SECTION("CloseOnScopeExit") {
        UDPTransport transport("127.0.0.1", TEST_CAPTURE_PORT);
        REQUIRE(transport.isOpen() == false);
        REQUIRE(transport.open() == true);
        REQUIRE(transport.isOpen() == true);

        transport.close();
        REQUIRE(transport.isOpen() == false);

        const uint8_t data[1U] = { 0x00U };
        REQUIRE(transport.write(data, 1U) == false);
    }

    SECTION("ReadTimeout") {
        UDPTransport transport("127.0.0.1", TEST_CAPTURE_PORT);
        REQUIRE(transport.open() == true);

        uint8_t buffer[16U];
        REQUIRE(transport.read(buffer, 16U, 10) == 0);
    }
}
