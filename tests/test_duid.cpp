/**
 * @file test_duid.cpp
 * @brief Unit tests for DUID decoding and encoding.
 */

#include <catch2/catch_test_macros.hpp>
#include <duidkit/duidkit.hpp>

#include <string>
#include <vector>

using namespace duidkit;

using Bytes = std::vector<std::uint8_t>;

TEST_CASE("parse DUID-LLT", "[duid][llt]") {
    Bytes data = {0x00, 0x01, 0x00, 0x01, 0x2C, 0x3D, 0x4E, 0x5F,
                  0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF};
    Duid duid;

    REQUIRE(parse_duid(data.data(), data.size(), duid) == Error::Ok);
    REQUIRE(duid_type_code(duid) == 1);

    const auto* llt = std::get_if<DuidLlt>(&duid);
    REQUIRE(llt != nullptr);
    REQUIRE(llt->hw_type == 0x0001);
    REQUIRE(llt->time == 0x2C3D4E5FU);
    REQUIRE(llt->link_layer_address == Bytes{0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF});
}

TEST_CASE("parse DUID-EN", "[duid][en]") {
    Bytes data = {0x00, 0x02, 0x00, 0x00, 0x00, 0x09, 0x01, 0x02, 0x03};
    Duid duid;

    REQUIRE(parse_duid(data.data(), data.size(), duid) == Error::Ok);

    const auto* en = std::get_if<DuidEn>(&duid);
    REQUIRE(en != nullptr);
    REQUIRE(en->enterprise_number == 9);
    REQUIRE(en->identifier == Bytes{0x01, 0x02, 0x03});
}

TEST_CASE("parse DUID-LL", "[duid][ll]") {
    Bytes data = {0x00, 0x03, 0x00, 0x06, 0x01, 0x02};
    Duid duid;

    REQUIRE(parse_duid(data.data(), data.size(), duid) == Error::Ok);

    const auto* ll = std::get_if<DuidLl>(&duid);
    REQUIRE(ll != nullptr);
    REQUIRE(ll->hw_type == 6);
    REQUIRE(ll->link_layer_address == Bytes{0x01, 0x02});
}

TEST_CASE("parse DUID-UUID", "[duid][uuid]") {
    Bytes data = {0x00, 0x04};
    for (std::uint8_t i = 0; i < 16; ++i) {
        data.push_back(i);
    }
    Duid duid;

    SECTION("exactly 16 UUID bytes") {
        REQUIRE(parse_duid(data.data(), data.size(), duid) == Error::Ok);
        const auto* uuid = std::get_if<DuidUuid>(&duid);
        REQUIRE(uuid != nullptr);
        REQUIRE(uuid->uuid[0] == 0x00);
        REQUIRE(uuid->uuid[15] == 0x0F);
    }

    SECTION("fewer than 16 bytes is malformed") {
        data.pop_back();
        REQUIRE(parse_duid(data.data(), data.size(), duid) == Error::MalformedDuid);
    }

    SECTION("more than 16 bytes is malformed") {
        data.push_back(0x10);
        REQUIRE(parse_duid(data.data(), data.size(), duid) == Error::MalformedDuid);
    }
}

TEST_CASE("parse unknown DUID type", "[duid][unknown]") {
    Duid duid;

    SECTION("payload kept verbatim") {
        Bytes data = {0x00, 0x05, 0xDE, 0xAD};
        REQUIRE(parse_duid(data.data(), data.size(), duid) == Error::Ok);
        const auto* unknown = std::get_if<DuidUnknown>(&duid);
        REQUIRE(unknown != nullptr);
        REQUIRE(unknown->type == 5);
        REQUIRE(unknown->data == Bytes{0xDE, 0xAD});
    }

    SECTION("type zero with no payload") {
        Bytes data = {0x00, 0x00};
        REQUIRE(parse_duid(data.data(), data.size(), duid) == Error::Ok);
        REQUIRE(duid_type_code(duid) == 0);
        REQUIRE(std::get<DuidUnknown>(duid).data.empty());
    }

    SECTION("high type code") {
        Bytes data = {0xFF, 0xFF, 0x01};
        REQUIRE(parse_duid(data.data(), data.size(), duid) == Error::Ok);
        REQUIRE(duid_type_code(duid) == 0xFFFF);
    }
}

TEST_CASE("parse rejects malformed input", "[duid][error]") {
    Duid duid = DuidEn{42, {0x01}};

    SECTION("empty") {
        REQUIRE(parse_duid(nullptr, 0, duid) == Error::MalformedDuid);
    }

    SECTION("single byte") {
        Bytes data = {0x00};
        REQUIRE(parse_duid(data.data(), data.size(), duid) == Error::MalformedDuid);
    }

    SECTION("LLT without time") {
        Bytes data = {0x00, 0x01, 0x00, 0x01, 0x2C, 0x3D, 0x4E};
        REQUIRE(parse_duid(data.data(), data.size(), duid) == Error::MalformedDuid);
    }

    SECTION("EN without full enterprise number") {
        Bytes data = {0x00, 0x02, 0x00, 0x00, 0x00};
        REQUIRE(parse_duid(data.data(), data.size(), duid) == Error::MalformedDuid);
    }

    SECTION("LL without hardware type") {
        Bytes data = {0x00, 0x03, 0x00};
        REQUIRE(parse_duid(data.data(), data.size(), duid) == Error::MalformedDuid);
    }

    SECTION("output untouched on failure") {
        Bytes data = {0x00, 0x04, 0x01};
        parse_duid(data.data(), data.size(), duid);
        REQUIRE(std::get<DuidEn>(duid) == DuidEn{42, {0x01}});
    }
}

TEST_CASE("parse names the defect without exceptions", "[duid][error]") {
    Duid duid;
    const char* reason = nullptr;

    SECTION("short UUID") {
        Bytes data = {0x00, 0x04, 0x01, 0x02};
        REQUIRE(parse_duid(data.data(), data.size(), duid, reason) == Error::MalformedDuid);
        REQUIRE(std::string(reason) == "DUID-UUID must be exactly 18 bytes long");
    }

    SECTION("empty") {
        REQUIRE(parse_duid(nullptr, 0, duid, reason) == Error::MalformedDuid);
        REQUIRE(std::string(reason) == "DUID is empty");
    }

    SECTION("LLT without time") {
        Bytes data = {0x00, 0x01, 0x00, 0x01};
        REQUIRE(parse_duid(data.data(), data.size(), duid, reason) == Error::MalformedDuid);
        REQUIRE(std::string(reason) == "DUID-LLT is too short for fixed fields");
    }

    SECTION("success leaves a non-null reason") {
        Bytes data = {0x00, 0x03, 0x00, 0x01};
        REQUIRE(parse_duid(data.data(), data.size(), duid, reason) == Error::Ok);
        REQUIRE(reason != nullptr);
        REQUIRE(std::holds_alternative<DuidLl>(duid));
    }
}

TEST_CASE("parse throwing overload", "[duid][error]") {
    SECTION("valid input") {
        Duid duid = parse_duid(Bytes{0x00, 0x03, 0x00, 0x01});
        REQUIRE(std::holds_alternative<DuidLl>(duid));
    }

    SECTION("malformed input throws with code") {
        REQUIRE_THROWS_AS(parse_duid(Bytes{0x00, 0x01, 0x00}), MalformedDuidException);

        try {
            parse_duid(Bytes{});
            FAIL("expected MalformedDuidException");
        } catch (const DuidException& e) {
            REQUIRE(e.code() == Error::MalformedDuid);
        }
    }
}

TEST_CASE("encode DUIDs", "[duid][encode]") {
    Bytes out;

    SECTION("LLT") {
        DuidLlt llt{1, 0x2C3D4E5FU, {0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF}};
        REQUIRE(encode_duid(llt, out) == Error::Ok);
        REQUIRE(out == Bytes{0x00, 0x01, 0x00, 0x01, 0x2C, 0x3D, 0x4E, 0x5F,
                             0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF});
    }

    SECTION("EN") {
        DuidEn en{9, {0x01, 0x02, 0x03}};
        REQUIRE(encode_duid(en, out) == Error::Ok);
        REQUIRE(out == Bytes{0x00, 0x02, 0x00, 0x00, 0x00, 0x09, 0x01, 0x02, 0x03});
    }

    SECTION("UUID is always 18 bytes") {
        REQUIRE(encode_duid(DuidUuid{}, out) == Error::Ok);
        REQUIRE(out.size() == DUID_UUID_BYTES);
        REQUIRE(out[1] == 0x04);
    }

    SECTION("unknown keeps its own type code") {
        REQUIRE(encode_duid(DuidUnknown{0x1234, {0x99}}, out) == Error::Ok);
        REQUIRE(out == Bytes{0x12, 0x34, 0x99});
    }

    SECTION("oversized DUID overflows") {
        out = {0x01};
        DuidEn en{1, Bytes(MAX_DUID_BYTES - DUID_EN_MIN_BYTES + 1, 0x00)};
        REQUIRE(encode_duid(en, out) == Error::Overflow);
        REQUIRE(out == Bytes{0x01});
    }
}

TEST_CASE("encoded DUIDs decode to identical values", "[duid][roundtrip]") {
    const Duid cases[] = {
        DuidLlt{1, 0, {0x00, 0x11, 0x22, 0x33, 0x44, 0x55}},
        DuidLlt{32, 0xFFFFFFFFU, Bytes(20, 0xA5)},
        DuidEn{311, {}},
        DuidLl{6, {0x01}},
        DuidUuid{{0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC, 0xDE, 0xF0, 0x0F, 0xED, 0xCB, 0xA9, 0x87,
                  0x65, 0x43, 0x21}},
        DuidUnknown{7, Bytes(MAX_DUID_BYTES - DUID_TYPE_BYTES, 0x3C)},
    };

    for (const auto& original : cases) {
        Bytes wire;
        REQUIRE(encode_duid(original, wire) == Error::Ok);

        Duid decoded;
        REQUIRE(parse_duid(wire.data(), wire.size(), decoded) == Error::Ok);
        REQUIRE(decoded == original);
    }
}

TEST_CASE("decode_hex", "[duid][hex]") {
    Duid duid;

    REQUIRE(decode_hex("00:02:00:00:00:09:01:02:03", duid) == Error::Ok);
    REQUIRE(std::get<DuidEn>(duid).enterprise_number == 9);

    REQUIRE(decode_hex("00:0", duid) == Error::InvalidHexEncoding);
    REQUIRE(decode_hex("", duid) == Error::MalformedDuid);
    REQUIRE(decode_hex("00:04:01:02", duid) == Error::MalformedDuid);

    REQUIRE(std::holds_alternative<DuidLl>(decode_hex("0003000102")));
    REQUIRE_THROWS_AS(decode_hex("q"), InvalidHexException);
    REQUIRE_THROWS_AS(decode_hex("0004"), MalformedDuidException);
}
