/**
 * @file test_schema_validator.cpp
 * @brief Unit tests for schemas, the schema registry and typed record validation
 *
 * @author Golden Bridge contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Golden Bridge contributors

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "golden_bridge/errors.hpp"
#include "golden_bridge/schema.hpp"
#include "golden_bridge/schema_validator.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using golden::bridge::Column;
using golden::bridge::ColumnType;
using golden::bridge::RawTable;
using golden::bridge::Schema;
using golden::bridge::SchemaRegistry;
using golden::bridge::SchemaViolationError;

namespace {

std::shared_ptr<const Schema> element_schema() {
    return std::make_shared<const Schema>(
        "Element", std::vector<Column>{{"Z", ColumnType::integer, false},
                                       {"symbol", ColumnType::string, false},
                                       {"atomic_weight", ColumnType::real, false},
                                       {"ionization_energy", ColumnType::real, true},
                                       {"radioactive", ColumnType::boolean, false}});
}

}  // namespace

/* ========================================================================== */
/* SCHEMA                                                                     */
/* ========================================================================== */

TEST_CASE("Schema construction checks column names", "[schema]") {
    REQUIRE_THROWS_AS(Schema("", {{"Z", ColumnType::integer, false}}), std::invalid_argument);
    REQUIRE_THROWS_AS(Schema("M", {{"", ColumnType::integer, false}}), std::invalid_argument);
    REQUIRE_THROWS_AS(Schema("M", {{"Z", ColumnType::integer, false}, {"Z", ColumnType::real, false}}),
                      std::invalid_argument);

    const auto schema = element_schema();
    REQUIRE(schema->index_of("symbol") == std::optional<std::size_t>{1});
    REQUIRE_FALSE(schema->index_of("missing").has_value());
}

TEST_CASE("Column type names", "[schema]") {
    REQUIRE(std::string(golden::bridge::to_string(ColumnType::real)) == "DOUBLE");
    REQUIRE(golden::bridge::column_type_from_string("int") == ColumnType::integer);
    REQUIRE(golden::bridge::column_type_from_string("Bool") == ColumnType::boolean);
    REQUIRE_FALSE(golden::bridge::column_type_from_string("float").has_value());
}

/* ========================================================================== */
/* VALIDATION                                                                 */
/* ========================================================================== */

TEST_CASE("Rows are promoted to typed records", "[schema][validator]") {
    const RawTable table{{"radioactive", "ionization_energy", "atomic_weight", "symbol", "Z"},
                         {{"false", " 1.266000000000e-18 ", "5.584500000000e+01", "Fe", "26"},
                          {"TRUE", "", "2.380289100000e+02", "U", "92"}}};

    const auto records = golden::bridge::validate(table, element_schema());
    REQUIRE(records.size() == 2);

    const auto& iron = records[0];
    REQUIRE(iron.get<std::int64_t>("Z") == 26);
    REQUIRE(iron.get<std::string>("symbol") == "Fe");
    REQUIRE(iron.get<double>("atomic_weight") == Catch::Approx(55.845));
    REQUIRE(iron.optional<double>("ionization_energy").value() == Catch::Approx(1.266e-18));
    REQUIRE_FALSE(iron.get<bool>("radioactive"));

    SECTION("Fields are exposed in schema order") {
        REQUIRE(std::holds_alternative<std::int64_t>(iron.values().front()));
        REQUIRE(std::holds_alternative<bool>(iron.values().back()));
    }

    SECTION("Null in a nullable column") {
        const auto& uranium = records[1];
        REQUIRE(uranium.is_null("ionization_energy"));
        REQUIRE_FALSE(uranium.optional<double>("ionization_energy").has_value());
        REQUIRE_THROWS_AS(uranium.get<double>("ionization_energy"), SchemaViolationError);
        REQUIRE(uranium.get<bool>("radioactive"));
    }

    SECTION("Accessor misuse") {
        REQUIRE_THROWS_AS(iron.at("density"), SchemaViolationError);
        REQUIRE_THROWS_AS(iron.get<std::string>("Z"), SchemaViolationError);
    }
}

TEST_CASE("Empty table validates to no records", "[schema][validator]") {
    const RawTable table{{"Z", "symbol", "atomic_weight", "ionization_energy", "radioactive"}, {}};
    REQUIRE(golden::bridge::validate(table, element_schema()).empty());
}

TEST_CASE("Literal null is accepted for non-string columns only", "[schema][validator]") {
    const RawTable table{{"Z", "symbol", "atomic_weight", "ionization_energy", "radioactive"},
                         {{"1", "null", "1.0", "null", "false"}}};
    const auto records = golden::bridge::validate(table, element_schema());
    REQUIRE(records[0].is_null("ionization_energy"));
    REQUIRE(records[0].get<std::string>("symbol") == "null");
}

TEST_CASE("Schema violations name the offending column", "[schema][validator][errors]") {
    const auto schema = element_schema();

    SECTION("Missing column") {
        const RawTable table{{"Z", "symbol", "atomic_weight", "radioactive"}, {}};
        try {
            (void)golden::bridge::validate(table, schema);
            FAIL("expected SchemaViolationError");
        } catch (const SchemaViolationError& ex) {
            REQUIRE(ex.column() == "ionization_energy");
            REQUIRE(ex.category() == golden::bridge::ErrorCategory::data);
        }
    }

    SECTION("Unexpected column") {
        const RawTable table{{"Z", "symbol", "atomic_weight", "ionization_energy", "radioactive", "density"}, {}};
        try {
            (void)golden::bridge::validate(table, schema);
            FAIL("expected SchemaViolationError");
        } catch (const SchemaViolationError& ex) {
            REQUIRE(ex.column() == "density");
        }
    }

    SECTION("Non-numeric DOUBLE") {
        const RawTable table{{"Z", "symbol", "atomic_weight", "ionization_energy", "radioactive"},
                             {{"26", "Fe", "heavy", "", "false"}}};
        try {
            (void)golden::bridge::validate(table, schema);
            FAIL("expected SchemaViolationError");
        } catch (const SchemaViolationError& ex) {
            REQUIRE(ex.column() == "atomic_weight");
            REQUIRE(std::string(ex.what()).find("row 0") != std::string::npos);
        }
    }

    SECTION("Null in a required column") {
        const RawTable table{{"Z", "symbol", "atomic_weight", "ionization_energy", "radioactive"},
                             {{"", "Fe", "55.845", "", "false"}}};
        REQUIRE_THROWS_AS(golden::bridge::validate(table, schema), SchemaViolationError);
    }

    SECTION("Malformed INT and BOOL") {
        const RawTable bad_int{{"Z", "symbol", "atomic_weight", "ionization_energy", "radioactive"},
                               {{"26.5", "Fe", "55.845", "", "false"}}};
        REQUIRE_THROWS_AS(golden::bridge::validate(bad_int, schema), SchemaViolationError);

        const RawTable bad_bool{{"Z", "symbol", "atomic_weight", "ionization_energy", "radioactive"},
                                {{"26", "Fe", "55.845", "", "yes"}}};
        REQUIRE_THROWS_AS(golden::bridge::validate(bad_bool, schema), SchemaViolationError);
    }
}

/* ========================================================================== */
/* REGISTRY                                                                   */
/* ========================================================================== */

TEST_CASE("Reference schemas cover the reference dumps", "[schema][registry]") {
    const auto registry = SchemaRegistry::reference_schemas();

    REQUIRE(registry.contains("Element"));
    REQUIRE(registry.contains("XRayTransition"));
    REQUIRE(registry.contains("AtomicShell"));

    const auto xray = registry.at("XRayTransition");
    REQUIRE(xray->index_of("energy_eV").has_value());
    REQUIRE(xray->columns()[*xray->index_of("exists")].nullable);
    REQUIRE_FALSE(xray->columns()[*xray->index_of("Z")].nullable);

    REQUIRE_THROWS_AS(registry.at("Bremsstrahlung"), SchemaViolationError);
}

TEST_CASE("Registry rejects duplicate modules", "[schema][registry]") {
    SchemaRegistry registry;
    registry.add(Schema("M", {{"a", ColumnType::string, false}}));
    REQUIRE_THROWS_AS(registry.add(Schema("M", {{"b", ColumnType::string, false}})), std::invalid_argument);
    REQUIRE(registry.size() == 1);
}

TEST_CASE("Registry loads from JSON", "[schema][registry][json]") {
    const auto registry = SchemaRegistry::parse_json(R"({
        "modules": {
            "Element": [
                {"name": "Z", "type": "INT"},
                {"name": "ionization_energy", "type": "double", "nullable": true}
            ]
        }
    })");

    REQUIRE(registry.modules() == std::vector<std::string>{"Element"});
    const auto schema = registry.at("Element");
    REQUIRE(schema->columns().size() == 2);
    REQUIRE(schema->columns()[1].type == ColumnType::real);
    REQUIRE(schema->columns()[1].nullable);

    SECTION("Malformed documents") {
        REQUIRE_THROWS_AS(SchemaRegistry::parse_json("{"), std::runtime_error);
        REQUIRE_THROWS_AS(SchemaRegistry::parse_json(R"({"tables": {}})"), std::runtime_error);
        REQUIRE_THROWS_AS(SchemaRegistry::parse_json(R"({"modules": {"M": [{"name": "a", "type": "FLOAT"}]}})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(SchemaRegistry::parse_json(R"({"modules": {"M": [{"name": "a"}]}})"), std::runtime_error);
    }

    SECTION("From a file") {
        const auto path = std::filesystem::temp_directory_path() / "golden_bridge_schema_test.json";
        {
            std::ofstream out(path);
            out << R"({"modules": {"Shell": [{"name": "Z", "type": "INT"}]}})";
        }
        const auto loaded = SchemaRegistry::load_json(path);
        std::filesystem::remove(path);
        REQUIRE(loaded.contains("Shell"));

        REQUIRE_THROWS_AS(SchemaRegistry::load_json(path), std::runtime_error);
    }
}
