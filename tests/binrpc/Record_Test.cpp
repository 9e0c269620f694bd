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
#include "binrpc/frame/Record.h"
#include "common/Log.h"
#include "common/Utils.h"

using namespace binrpc;
using namespace binrpc::defines;
using namespace binrpc::frame;

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

static std::vector<uint8_t> encodeRecord(const Value& value)
{
    Record record = Record();
    REQUIRE(record.setValue(value) == BRPC_OK);

    std::vector<uint8_t> data;
    record.encode(data);
    REQUIRE(data.size() == record.getLength());

    Utils::dump(2U, "Record", data.data(), (uint32_t)data.size());
    return data;
}

TEST_CASE("Record", "[Encode Test]") {
    SECTION("Integer_Inline") {
        std::vector<uint8_t> data = encodeRecord(Value::fromInt(0x7F000001));

        // sizeFlag = 0, size = 4, type = INT
        std::vector<uint8_t> expected = { 0x40U, 0x7FU, 0x00U, 0x00U, 0x01U };
        REQUIRE(data == expected);
    }

    SECTION("String_Empty") {
        std::vector<uint8_t> data = encodeRecord(Value::fromString(""));

        // NUL only, size = 1
        std::vector<uint8_t> expected = { 0x11U, 0x00U };
        REQUIRE(data == expected);
    }

    SECTION("String_Inline") {
        std::vector<uint8_t> data = encodeRecord(Value::fromString("ps"));

        std::vector<uint8_t> expected = { 0x31U, 'p', 's', 0x00U };
        REQUIRE(data == expected);
    }

    SECTION("String_EightBytes") {
        // 7 characters + NUL = 8 bytes, still inline; the length spills into the size flag
        std::vector<uint8_t> data = encodeRecord(Value::fromString("tm.list"));

        REQUIRE(data.size() == 9U);
        REQUIRE(data[0U] == 0x81U);
        REQUIRE(data[8U] == 0x00U);
        REQUIRE(::memcmp(data.data() + 1U, "tm.list", 7U) == 0);
    }

    SECTION("String_NineBytes") {
        // 9 characters + NUL = 10 bytes, explicit 1 byte length
        std::vector<uint8_t> data = encodeRecord(Value::fromString("123456789"));

        REQUIRE(data.size() == 12U);
        REQUIRE(data[0U] == 0x91U);
        REQUIRE(data[1U] == 0x0AU);
        REQUIRE(::memcmp(data.data() + 2U, "123456789", 10U) == 0);
    }

    SECTION("String_TwoByteLength") {
        std::string str(299U, 'x');
        std::vector<uint8_t> data = encodeRecord(Value::fromString(str));

        // 300 = $012C, explicit 2 byte length
        REQUIRE(data.size() == 303U);
        REQUIRE(data[0U] == 0xA1U);
        REQUIRE(data[1U] == 0x01U);
        REQUIRE(data[2U] == 0x2CU);
        REQUIRE(data[302U] == 0x00U);
    }

    SECTION("Double") {
        std::vector<uint8_t> data = encodeRecord(Value::fromDouble(0.001));

        std::vector<uint8_t> expected = { 0x42U, 0x00U, 0x00U, 0x00U, 0x01U };
        REQUIRE(data == expected);
    }

    SECTION("Bytes") {
        const uint8_t raw[3U] = { 0x01U, 0x02U, 0x03U };
        std::vector<uint8_t> data = encodeRecord(Value::fromBytes(raw, 3U));

        std::vector<uint8_t> expected = { 0x36U, 0x01U, 0x02U, 0x03U };
        REQUIRE(data == expected);
    }

    SECTION("Value_TooLarge") {
        std::string str(BINRPC_MAX_PACKET_LENGTH_BYTES, 'x');

        Record record = Record();
        REQUIRE(record.setValue(Value::fromString(str)) == BRPC_ERR_ENCODING);
    }
}

TEST_CASE("Record", "[Decode Test]") {
    SECTION("Integer_Inline") {
        const uint8_t data[5U] = { 0x40U, 0x00U, 0x00U, 0x01U, 0x00U };

        Record record = Record();
        REQUIRE(record.decode(data, 5U) == BRPC_OK);
        REQUIRE(record.getType() == RecordType::INT);
        REQUIRE(record.getSizeFlag() == false);
        REQUIRE(record.getSize() == 4U);
        REQUIRE(record.getLength() == 5U);

        Value value;
        REQUIRE(record.getValue(value) == BRPC_OK);
        REQUIRE(value.getInt() == 256);
    }

    SECTION("String_EightBytes") {
        const uint8_t data[9U] = { 0x81U, 't', 'm', '.', 'l', 'i', 's', 't', 0x00U };

        Record record = Record();
        REQUIRE(record.decode(data, 9U) == BRPC_OK);
        REQUIRE(record.getSizeFlag() == true);
        REQUIRE(record.getSize() == 0U);
        REQUIRE(record.getData().size() == 8U);

        Value value;
        REQUIRE(record.getValue(value) == BRPC_OK);
        REQUIRE(value.getString() == "tm.list");
    }

    SECTION("String_ExplicitLength") {
        const uint8_t data[12U] = { 0x91U, 0x0AU, '1', '2', '3', '4', '5', '6', '7', '8', '9', 0x00U };

        Record record = Record();
        REQUIRE(record.decode(data, 12U) == BRPC_OK);
        REQUIRE(record.getSize() == 1U);
        REQUIRE(record.getLength() == 12U);

        Value value;
        REQUIRE(record.getValue(value) == BRPC_OK);
        REQUIRE(value.getString() == "123456789");
    }

    SECTION("Truncated_Value") {
        const uint8_t data[3U] = { 0x40U, 0x00U, 0x00U };

        Record record = Record();
        REQUIRE(record.decode(data, 3U) == BRPC_ERR_ENCODING);
    }

    SECTION("Truncated_Length") {
        const uint8_t data[2U] = { 0xA1U, 0x01U };

        Record record = Record();
        REQUIRE(record.decode(data, 2U) == BRPC_ERR_ENCODING);
    }

    SECTION("Invalid_LengthWidth") {
        // size flag with a 5 byte length field
        const uint8_t data[8U] = { 0xD1U, 0x00U, 0x00U, 0x00U, 0x00U, 0x01U, 0x00U, 0x00U };

        Record record = Record();
        REQUIRE(record.decode(data, 8U) == BRPC_ERR_ENCODING);
    }
}
