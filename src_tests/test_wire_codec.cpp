/**
 * @file test_wire_codec.cpp
 * @brief Unit tests for batch input encoding and framed CSV decoding
 *
 * @author Golden Bridge contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Golden Bridge contributors

#include <catch2/catch_test_macros.hpp>

#include "golden_bridge/errors.hpp"
#include "golden_bridge/request.hpp"
#include "golden_bridge/result_table.hpp"
#include "golden_bridge/wire_codec.hpp"

#include <string>
#include <vector>

using golden::bridge::ProtocolError;
using golden::bridge::RawTable;
using golden::bridge::Request;
using golden::bridge::RequestSet;
namespace wire = golden::bridge::wire;

/* ========================================================================== */
/* ENCODING                                                                   */
/* ========================================================================== */

TEST_CASE("Batch input is one canonical wire line per unique request", "[wire]") {
    RequestSet requests;
    requests.insert(Request::build("XRayTransition", {{"trans", "1"}, {"Z", "26"}}));
    requests.insert(Request::build("Element", {{"Z", "79"}}));
    requests.insert(Request::build("XRayTransition", {{"Z", "26"}, {"trans", "1"}}));

    REQUIRE(wire::encode_batch(requests) == "Element Z=79\nXRayTransition Z=26 trans=1\n");
}

TEST_CASE("Empty request set encodes to empty input", "[wire]") {
    REQUIRE(wire::encode_batch(RequestSet{}).empty());
}

TEST_CASE("Frames carry the canonical wire line", "[wire]") {
    const auto request = Request::build("Element", {{"Z", "26"}});
    const RawTable table{{"Z", "symbol"}, {{"26", "Fe"}}};

    REQUIRE(wire::encode_frame(request, table) == "#BEGIN dump=Element Z=26\nZ,symbol\n26,Fe\n#END\n");
}

/* ========================================================================== */
/* DECODING                                                                   */
/* ========================================================================== */

TEST_CASE("Decoded frames are keyed by canonical request", "[wire]") {
    const std::string output =
        "#BEGIN dump=XRayTransition trans=1 Z=26\n"
        "Z,transition_index,energy_eV\n"
        "26,1,6.392000000000e+03\n"
        "#END\n"
        "\n"
        "#BEGIN dump=Element Z=79\n"
        "Z,symbol\n"
        "79,Au\n"
        "#END\n";

    const auto tables = wire::decode_batch(output);
    REQUIRE(tables.size() == 2);

    const auto& xray = tables.at(Request::build("XRayTransition", {{"Z", "26"}, {"trans", "1"}}));
    REQUIRE(xray.columns == std::vector<std::string>{"Z", "transition_index", "energy_eV"});
    REQUIRE(xray.rows.size() == 1);
    REQUIRE(xray.rows[0][2] == "6.392000000000e+03");

    const auto& element = tables.at(Request::build("Element", {{"Z", "79"}}));
    REQUIRE(element.row_map(0).at("symbol") == "Au");
}

TEST_CASE("Header-only frame decodes to an empty table", "[wire]") {
    const auto tables = wire::decode_batch("#BEGIN dump=XRayTransition Z=6 trans=0\nZ,energy_eV\n#END\n");
    const auto& table = tables.at(Request::build("XRayTransition", {{"Z", "6"}, {"trans", "0"}}));

    REQUIRE(table.empty());
    REQUIRE(table.columns.size() == 2);
}

TEST_CASE("Empty fields survive decoding", "[wire]") {
    const auto tables = wire::decode_batch("#BEGIN dump=Element Z=37\nZ,ionization_energy,name\n37,,Rubidium\n#END\n");
    const auto& table = tables.at(Request::build("Element", {{"Z", "37"}}));

    REQUIRE(table.rows.at(0) == std::vector<std::string>{"37", "", "Rubidium"});
}

TEST_CASE("Blank lines inside a frame are not rows", "[wire]") {
    SECTION("Multi-column frame") {
        const auto tables = wire::decode_batch("#BEGIN dump=M k=1\na,b\n1,2\n\n3,4\n#END\n");
        const auto& table = tables.at(Request::build("M", {{"k", "1"}}));
        REQUIRE(table.rows.size() == 2);
        REQUIRE(table.rows[1] == std::vector<std::string>{"3", "4"});
    }

    SECTION("Single-column frame") {
        const auto tables = wire::decode_batch("#BEGIN dump=M k=1\na\n1\n\n3\n  \n#END\n");
        const auto& table = tables.at(Request::build("M", {{"k", "1"}}));
        REQUIRE(table.rows.size() == 2);
        REQUIRE(table.rows[0] == std::vector<std::string>{"1"});
        REQUIRE(table.rows[1] == std::vector<std::string>{"3"});
    }

    SECTION("Blank line before the header") {
        const auto tables = wire::decode_batch("#BEGIN dump=M k=1\n\na\n1\n#END\n");
        REQUIRE(tables.at(Request::build("M", {{"k", "1"}})).columns == std::vector<std::string>{"a"});
        REQUIRE_THROWS_AS(wire::decode_batch("#BEGIN dump=M k=1\n\n#END\n"), ProtocolError);
    }

    SECTION("Single mode") {
        const auto table = wire::decode_single("\na\n1\n\n3\n");
        REQUIRE(table.columns == std::vector<std::string>{"a"});
        REQUIRE(table.rows.size() == 2);
    }
}

TEST_CASE("Round trip through encode_frame and decode_batch", "[wire]") {
    const auto a = Request::build("Element", {{"Z", "26"}});
    const auto b = Request::build("Element", {{"Z", "1"}});
    const RawTable table_a{{"Z", "symbol"}, {{"26", "Fe"}}};
    const RawTable table_b{{"Z", "symbol"}, {}};

    const auto tables = wire::decode_batch(wire::encode_frame(a, table_a) + wire::encode_frame(b, table_b));

    REQUIRE(tables.size() == 2);
    REQUIRE(tables.at(a) == table_a);
    REQUIRE(tables.at(b) == table_b);
}

TEST_CASE("CRLF line endings and trailing whitespace are tolerated", "[wire]") {
    const auto tables = wire::decode_batch("#BEGIN dump=Element Z=26  \r\nZ,symbol\r\n26,Fe\r\n#END\r\n");
    REQUIRE(tables.at(Request::build("Element", {{"Z", "26"}})).rows.at(0).at(1) == "Fe");
}

TEST_CASE("Lines outside frames are reported but ignored", "[wire]") {
    std::string diag;
    const auto tables =
        wire::decode_batch("JVM warming up\n#BEGIN dump=Element Z=26\nZ\n26\n#END\ntrailing noise\n", diag);

    REQUIRE(tables.size() == 1);
    REQUIRE(diag.find("JVM warming up") != std::string::npos);
    REQUIRE(diag.find("trailing noise") != std::string::npos);
}

TEST_CASE("Empty output decodes to no frames", "[wire]") {
    REQUIRE(wire::decode_batch("").empty());
    REQUIRE(wire::decode_batch("\n\n").empty());
}

/* ========================================================================== */
/* PROTOCOL ERRORS                                                            */
/* ========================================================================== */

TEST_CASE("Framing violations raise ProtocolError", "[wire][errors]") {
    SECTION("Unterminated frame") {
        REQUIRE_THROWS_AS(wire::decode_batch("#BEGIN dump=Element Z=26\nZ\n26\n"), ProtocolError);
    }

    SECTION("Nested #BEGIN") {
        REQUIRE_THROWS_AS(wire::decode_batch("#BEGIN dump=Element Z=26\nZ\n#BEGIN dump=Element Z=27\nZ\n#END\n"),
                          ProtocolError);
    }

    SECTION("#END without #BEGIN") {
        REQUIRE_THROWS_AS(wire::decode_batch("#END\n"), ProtocolError);
    }

    SECTION("Frame without header") {
        REQUIRE_THROWS_AS(wire::decode_batch("#BEGIN dump=Element Z=26\n#END\n"), ProtocolError);
    }

    SECTION("Malformed marker") {
        REQUIRE_THROWS_AS(wire::decode_batch("#BEGIN Element Z=26\nZ\n#END\n"), ProtocolError);
        REQUIRE_THROWS_AS(wire::decode_batch("#BEGIN dump=\nZ\n#END\n"), ProtocolError);
    }

    SECTION("Duplicate frame for one request") {
        REQUIRE_THROWS_AS(
            wire::decode_batch("#BEGIN dump=Element Z=26\nZ\n26\n#END\n#BEGIN dump=Element Z=26\nZ\n26\n#END\n"),
            ProtocolError);
    }
}

TEST_CASE("Row width mismatches raise ProtocolError with the line number", "[wire][errors]") {
    try {
        (void)wire::decode_batch("#BEGIN dump=Element Z=26\nZ,symbol\n26,Fe,extra\n#END\n");
        FAIL("expected ProtocolError");
    } catch (const ProtocolError& ex) {
        REQUIRE(ex.line_no() == 3);
        REQUIRE(ex.category() == golden::bridge::ErrorCategory::infrastructure);
    }
}

TEST_CASE("Duplicate header columns raise ProtocolError", "[wire][errors]") {
    REQUIRE_THROWS_AS(wire::decode_batch("#BEGIN dump=Element Z=26\nZ,Z\n26,26\n#END\n"), ProtocolError);
}

/* ========================================================================== */
/* SINGLE MODE                                                                */
/* ========================================================================== */

TEST_CASE("Single-mode output is one unframed table", "[wire][single]") {
    const auto table = wire::decode_single("Z,symbol\n26,Fe\n\n");
    REQUIRE(table.columns == std::vector<std::string>{"Z", "symbol"});
    REQUIRE(table.rows.size() == 1);

    REQUIRE(wire::decode_single("Z,symbol\n").empty());
    REQUIRE_THROWS_AS(wire::decode_single(""), ProtocolError);
    REQUIRE_THROWS_AS(wire::decode_single("Z,symbol\n26\n"), ProtocolError);
}
