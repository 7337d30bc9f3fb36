/**
 * @file golden_session.hpp
 * @brief Catch2 host integration of the golden reference bridge
 *
 * Tests declare their oracle dependency next to the TEST_CASE; the custom main collects the
 * declarations of the selected tests, runs the reference oracle once and only then lets
 * Catch2 execute test bodies, which read their rows through GoldenSession::records().
 *
 * @author Golden Bridge contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Golden Bridge contributors

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "golden_bridge/declaration.hpp"
#include "golden_bridge/orchestrator.hpp"
#include "golden_bridge/process_oracle.hpp"
#include "golden_bridge/result_cache.hpp"
#include "golden_bridge/schema.hpp"
#include "golden_bridge/schema_validator.hpp"

namespace golden::suite {

/**
 * \brief Process-wide golden session: declarations, cache, oracle and orchestrator.
 */
class GoldenSession {
public:
    static GoldenSession& instance();

    GoldenSession(const GoldenSession&) = delete;
    GoldenSession& operator=(const GoldenSession&) = delete;

    void declare(bridge::OracleDeclaration declaration);

    [[nodiscard]] const bridge::DeclarationRegistry& declarations() const noexcept { return registry_; }

    /**
     * Runs collection for the declarations of \a selected_tests (tests without one are
     * ignored). Must be called once, before Catch::Session::run().
     */
    bridge::Orchestrator::State collect(const std::vector<std::string>& selected_tests,
                                        bridge::ProcessOracle::Config oracle_config);

    /// Typed reference rows for the running test and its concrete parameter values.
    [[nodiscard]] std::vector<bridge::Record> records(const bridge::ArgumentList& arguments) const;

    /// Cached table of the running test (no schema validation).
    [[nodiscard]] const bridge::RawTable& raw_table(const bridge::ArgumentList& arguments) const;

    /// Throws OrchestratorStateError before collect().
    [[nodiscard]] const bridge::Orchestrator& orchestrator() const;

    [[nodiscard]] std::size_t oracle_invocations() const noexcept;

    /// Adapter diagnostics (command lines, exit codes, oracle stderr); empty before collect().
    [[nodiscard]] std::string oracle_diagnostics() const;

private:
    GoldenSession();

    [[nodiscard]] const bridge::OracleDeclaration& current_declaration() const;

    bridge::DeclarationRegistry registry_;
    bridge::SchemaRegistry schemas_;
    bridge::ResultCache cache_;
    std::unique_ptr<bridge::ProcessOracle> oracle_;
    std::unique_ptr<bridge::Orchestrator> orchestrator_;
};

/// Last \a max_lines lines of \a diagnostics.
[[nodiscard]] std::string diagnostics_tail(const std::string& diagnostics, std::size_t max_lines);

/// Registers one declaration during static initialization.
struct OracleRegistrar {
    OracleRegistrar(std::string test_name, std::string module, bridge::ParameterGrid grid);
};

}  // namespace golden::suite

#define GOLDEN_SUITE_CONCAT_IMPL(a, b) a##b
#define GOLDEN_SUITE_CONCAT(a, b) GOLDEN_SUITE_CONCAT_IMPL(a, b)

/**
 * TEST_CASE whose invocations read reference rows of \a module for every combination of
 * the grid (a golden::bridge::ParameterGrid expression).
 */
#define GOLDEN_ORACLE_TEST_CASE(name, tags, module, ...)                                                   \
    static const ::golden::suite::OracleRegistrar GOLDEN_SUITE_CONCAT(golden_oracle_registrar_, __LINE__){ \
        name, module, __VA_ARGS__};                                                                      \
    TEST_CASE(name, tags)
