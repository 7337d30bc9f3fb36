/**
 * @file test_golden_element.cpp
 * @brief End-to-end golden tests against the Element dump module
 *
 * @author Golden Bridge contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Golden Bridge contributors

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_range.hpp>

#include "golden_bridge/declaration.hpp"
#include "golden_bridge/errors.hpp"
#include "golden_session.hpp"

#include <cstdint>
#include <string>

using golden::bridge::ParameterGrid;
using golden::bridge::to_wire_value;
using golden::suite::GoldenSession;

GOLDEN_ORACLE_TEST_CASE("Element symbols match the reference", "[golden][element]", "Element",
                        ParameterGrid{}.axis("Z", {26, 79})) {
    const auto [z, symbol, name] = GENERATE(table<int, std::string, std::string>({
        {26, "Fe", "Iron"},
        {79, "Au", "Gold"},
    }));

    const auto& session = GoldenSession::instance();
    const auto rows = session.records({{"Z", to_wire_value(z)}});
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].get<std::int64_t>("Z") == z);
    REQUIRE(rows[0].get<std::string>("symbol") == symbol);
    REQUIRE(rows[0].get<std::string>("name") == name);
    REQUIRE(session.oracle_invocations() == 1);
}

GOLDEN_ORACLE_TEST_CASE("Light element masses", "[golden][element]", "Element",
                        ParameterGrid{}.range("Z", 1, 10)) {
    const auto z = GENERATE(range(1, 11));

    const auto rows = GoldenSession::instance().records({{"Z", to_wire_value(z)}});
    REQUIRE(rows.size() == 1);
    const auto weight = rows[0].get<double>("atomic_weight");
    REQUIRE(weight > 0.0);
    REQUIRE(rows[0].get<double>("mass_in_kg") == Catch::Approx(weight * 1.66053906660e-27));
    REQUIRE_FALSE(rows[0].is_null("ionization_energy"));
}

GOLDEN_ORACLE_TEST_CASE("Undeclared parameter values miss the cache", "[golden][element]", "Element",
                        ParameterGrid{}.axis("Z", {26})) {
    const auto& session = GoldenSession::instance();
    REQUIRE(session.records({{"Z", "26"}}).size() == 1);
    REQUIRE_THROWS_AS(session.records({{"Z", "27"}}), golden::bridge::CacheMissError);
}
