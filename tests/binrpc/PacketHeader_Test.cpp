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
#include "binrpc/frame/PacketHeader.h"
#include "common/Log.h"
#include "common/Utils.h"

using namespace binrpc;
using namespace binrpc::defines;
using namespace binrpc::frame;

#include <catch2/catch_test_macros.hpp>

TEST_CASE("PacketHeader", "[Encode Test]") {
    SECTION("SingleByteLength") {
        bool failed = false;

        PacketHeader header = PacketHeader();
        header.setPayloadLength(18U);
        header.setCookie(0x11223344U);

        uint8_t data[BINRPC_MAX_HEADER_LENGTH_BYTES];
        ::memset(data, 0x00U, BINRPC_MAX_HEADER_LENGTH_BYTES);
        header.encode(data);

        Utils::dump(2U, "SingleByteLength", data, header.getLength());

        const uint8_t expected[7U] = { 0xA1U, 0x03U, 0x12U, 0x11U, 0x22U, 0x33U, 0x44U };
        if (header.getLength() != 7U || ::memcmp(data, expected, 7U) != 0) {
            ::LogDebug("T", "SingleByteLength, header mismatch");
            failed = true;
        }

        REQUIRE(failed==false);
    }

    SECTION("FullRange_LengthByte") {
        // every payload length up to 255 fits a single length byte
        for (uint32_t len = 0U; len <= 255U; len++) {
            PacketHeader header = PacketHeader();
            header.setPayloadLength(len);

            uint8_t data[BINRPC_MAX_HEADER_LENGTH_BYTES];
            header.encode(data);

            REQUIRE(data[0U] == BINRPC_MAGIC_VERSION);
            REQUIRE(data[1U] == 0x03U);
            REQUIRE(data[2U] == len);
            REQUIRE(header.getLength() == 7U);
        }
    }

    SECTION("TwoByteLength") {
        PacketHeader header = PacketHeader();
        header.setPayloadLength(300U);
        header.setCookie(0xCAFEBABEU);

        uint8_t data[BINRPC_MAX_HEADER_LENGTH_BYTES];
        header.encode(data);

        const uint8_t expected[8U] = { 0xA1U, 0x07U, 0x01U, 0x2CU, 0xCAU, 0xFEU, 0xBAU, 0xBEU };
        REQUIRE(header.getLength() == 8U);
        REQUIRE(::memcmp(data, expected, 8U) == 0);
    }

    SECTION("ThreeByteLength") {
        PacketHeader header = PacketHeader();
        header.setPayloadLength(70000U);

        uint8_t data[BINRPC_MAX_HEADER_LENGTH_BYTES];
        header.encode(data);

        // 70000 = $011170
        REQUIRE(header.getLength() == 9U);
        REQUIRE(data[1U] == 0x0BU);
        REQUIRE(data[2U] == 0x01U);
        REQUIRE(data[3U] == 0x11U);
        REQUIRE(data[4U] == 0x70U);
    }
}

TEST_CASE("PacketHeader", "[Decode Test]") {
    SECTION("Valid") {
        const uint8_t data[8U] = { 0xA1U, 0x07U, 0x01U, 0x2CU, 0xCAU, 0xFEU, 0xBAU, 0xBEU };

        PacketHeader header = PacketHeader();
        REQUIRE(header.decode(data, 8U) == true);
        REQUIRE(header.getFlags() == BINRPC_FLAGS_NONE);
        REQUIRE(header.getLengthWidth() == 2U);
        REQUIRE(header.getCookieWidth() == 4U);
        REQUIRE(header.getPayloadLength() == 300U);
        REQUIRE(header.getCookie() == 0xCAFEBABEU);
        REQUIRE(header.getLength() == 8U);
    }

    SECTION("ShortCookie") {
        const uint8_t data[4U] = { 0xA1U, 0x00U, 0x05U, 0x7FU };

        PacketHeader header = PacketHeader();
        REQUIRE(header.decode(data, 4U) == true);
        REQUIRE(header.getPayloadLength() == 5U);
        REQUIRE(header.getCookie() == 0x7FU);
        REQUIRE(header.getLength() == 4U);
    }

    SECTION("BadMagic") {
        const uint8_t data[7U] = { 0xB1U, 0x03U, 0x12U, 0x11U, 0x22U, 0x33U, 0x44U };

        PacketHeader header = PacketHeader();
        REQUIRE(header.decode(data, 7U) == false);
    }

    SECTION("BadVersion") {
        const uint8_t data[7U] = { 0xA2U, 0x03U, 0x12U, 0x11U, 0x22U, 0x33U, 0x44U };

        PacketHeader header = PacketHeader();
        REQUIRE(header.decode(data, 7U) == false);
    }

    SECTION("Truncated") {
        const uint8_t data[6U] = { 0xA1U, 0x03U, 0x12U, 0x11U, 0x22U, 0x33U };

        PacketHeader header = PacketHeader();
        REQUIRE(header.decode(data, 6U) == false);
        REQUIRE(header.decode(data, 2U) == false);
    }
}
