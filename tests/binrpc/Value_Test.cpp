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
#include "binrpc/Value.h"
#include "common/Log.h"
#include "common/Utils.h"

using namespace binrpc;
using namespace binrpc::defines;

#include <catch2/catch_test_macros.hpp>
#include <vector>

TEST_CASE("Value", "[Serialize Test]") {
    SECTION("Integer_BigEndian") {
        std::vector<uint8_t> data;
        REQUIRE(Value::fromInt(0x01020304).serialize(data) == BRPC_OK);

        std::vector<uint8_t> expected = { 0x01U, 0x02U, 0x03U, 0x04U };
        REQUIRE(data == expected);
    }

    SECTION("Integer_Negative") {
        std::vector<uint8_t> data;
        REQUIRE(Value::fromInt(-2).serialize(data) == BRPC_OK);

        std::vector<uint8_t> expected = { 0xFFU, 0xFFU, 0xFFU, 0xFEU };
        REQUIRE(data == expected);
    }

    SECTION("String_Terminated") {
        std::vector<uint8_t> data;
        REQUIRE(Value::fromString("core").serialize(data) == BRPC_OK);

        std::vector<uint8_t> expected = { 'c', 'o', 'r', 'e', 0x00U };
        REQUIRE(data == expected);
    }

    SECTION("String_Empty") {
        std::vector<uint8_t> data;
        REQUIRE(Value::fromString("").serialize(data) == BRPC_OK);
        REQUIRE(data.size() == 1U);
        REQUIRE(data[0U] == 0x00U);
    }

    SECTION("String_EmbeddedNUL") {
        std::vector<uint8_t> data;
        std::string str("ab\0cd", 5U);
        REQUIRE(Value::fromString(str).serialize(data) == BRPC_ERR_ENCODING);
        REQUIRE(data.empty());
    }

    SECTION("Double_Scaled") {
        std::vector<uint8_t> data;
        REQUIRE(Value::fromDouble(1.5).serialize(data) == BRPC_OK);

        // 1.5 * 1000 = 1500 = $05DC
        std::vector<uint8_t> expected = { 0x00U, 0x00U, 0x05U, 0xDCU };
        REQUIRE(data == expected);
    }

    SECTION("Double_OutOfRange") {
        std::vector<uint8_t> data;
        REQUIRE(Value::fromDouble(3.0e6).serialize(data) == BRPC_ERR_ENCODING);
    }

    SECTION("Bytes_Raw") {
        const uint8_t raw[3U] = { 0x01U, 0x00U, 0xFFU };

        std::vector<uint8_t> data;
        REQUIRE(Value::fromBytes(raw, 3U).serialize(data) == BRPC_OK);

        std::vector<uint8_t> expected = { 0x01U, 0x00U, 0xFFU };
        REQUIRE(data == expected);
    }
}

TEST_CASE("Value", "[Deserialize Test]") {
    SECTION("Integer_ShortForm") {
        const uint8_t data[2U] = { 0x01U, 0x00U };

        Value value;
        REQUIRE(Value::deserialize(RecordType::INT, data, 2U, value) == BRPC_OK);
        REQUIRE(value.getType() == RecordType::INT);
        REQUIRE(value.getInt() == 256);
    }

    SECTION("Integer_TooLong") {
        const uint8_t data[5U] = { 0x00U, 0x00U, 0x00U, 0x00U, 0x01U };

        Value value;
        REQUIRE(Value::deserialize(RecordType::INT, data, 5U, value) == BRPC_ERR_ENCODING);
    }

    SECTION("String_StopsAtTerminator") {
        const uint8_t data[6U] = { 'u', 'p', 't', 0x00U, 'x', 'x' };

        Value value;
        REQUIRE(Value::deserialize(RecordType::STRING, data, 6U, value) == BRPC_OK);
        REQUIRE(value.getString() == "upt");
    }

    SECTION("Double_Scaled") {
        const uint8_t data[4U] = { 0xFFU, 0xFFU, 0xFEU, 0x0CU };     // -500

        Value value;
        REQUIRE(Value::deserialize(RecordType::DOUBLE, data, 4U, value) == BRPC_OK);
        REQUIRE(value == Value::fromDouble(-0.5));
    }

    SECTION("Structured_Unsupported") {
        const uint8_t data[1U] = { 0x00U };

        Value value;
        REQUIRE(Value::deserialize(RecordType::STRUCT, data, 1U, value) == BRPC_ERR_UNSUPPORTED);
        REQUIRE(Value::deserialize(RecordType::ARRAY, data, 1U, value) == BRPC_ERR_UNSUPPORTED);
        REQUIRE(Value::deserialize(RecordType::AVP, data, 1U, value) == BRPC_ERR_UNSUPPORTED);
    }

    SECTION("ToString") {
        const uint8_t raw[2U] = { 0xDEU, 0xADU };

        REQUIRE(Value::fromInt(42).toString() == "42");
        REQUIRE(Value::fromString("ps").toString() == "\"ps\"");
        REQUIRE(Value::fromDouble(2.25).toString() == "2.250");
        REQUIRE(Value::fromBytes(raw, 2U).toString() == "<dead>");
    }
}
