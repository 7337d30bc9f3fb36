/**
 * @file golden_session.cpp
 * @brief Catch2 host integration of the golden reference bridge
 *
 * @author Golden Bridge contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Golden Bridge contributors

#include "golden_session.hpp"

#include <catch2/catch_message.hpp>
#include <catch2/interfaces/catch_interfaces_capture.hpp>

#include "golden_bridge/errors.hpp"

#include <iostream>
#include <utility>

namespace golden::suite {

namespace {

constexpr std::size_t kDiagnosticsTailLines = 20;

}  // namespace

std::string diagnostics_tail(const std::string& diagnostics, std::size_t max_lines) {
    if (max_lines == 0) {
        return {};
    }
    std::size_t end = diagnostics.size();
    if (end > 0 && diagnostics[end - 1] == '\n') {
        --end;
    }
    std::size_t begin = end;
    std::size_t lines = 0;
    while (begin > 0) {
        const auto newline = diagnostics.rfind('\n', begin - 1);
        if (newline == std::string::npos) {
            begin = 0;
            break;
        }
        if (++lines == max_lines) {
            begin = newline + 1;
            break;
        }
        begin = newline;
    }
    return diagnostics.substr(begin, end - begin);
}

GoldenSession& GoldenSession::instance() {
    static GoldenSession session;
    return session;
}

GoldenSession::GoldenSession() : schemas_{bridge::SchemaRegistry::reference_schemas()} {}

void GoldenSession::declare(bridge::OracleDeclaration declaration) {
    (void)registry_.add(std::move(declaration));
}

bridge::Orchestrator::State GoldenSession::collect(const std::vector<std::string>& selected_tests,
                                                   bridge::ProcessOracle::Config oracle_config) {
    if (orchestrator_) {
        throw bridge::OrchestratorStateError("Golden session already collected");
    }

    std::vector<const bridge::OracleDeclaration*> selected;
    for (const auto& name : selected_tests) {
        if (const auto* declaration = registry_.find(name)) {
            selected.push_back(declaration);
        }
    }

    oracle_ = std::make_unique<bridge::ProcessOracle>(std::move(oracle_config));
    orchestrator_ = std::make_unique<bridge::Orchestrator>(*oracle_, cache_, schemas_,
                                                           bridge::Orchestrator::Config{.log = &std::cerr});
    return orchestrator_->collect(selected);
}

const bridge::Orchestrator& GoldenSession::orchestrator() const {
    if (!orchestrator_) {
        throw bridge::OrchestratorStateError("Reference data requested before collection");
    }
    return *orchestrator_;
}

std::size_t GoldenSession::oracle_invocations() const noexcept {
    return oracle_ ? oracle_->invocations() : 0;
}

std::string GoldenSession::oracle_diagnostics() const {
    return oracle_ ? oracle_->diagnostics() : std::string{};
}

const bridge::OracleDeclaration& GoldenSession::current_declaration() const {
    const std::string test_name = Catch::getResultCapture().getCurrentTestName();
    const auto* declaration = registry_.find(test_name);
    if (declaration == nullptr) {
        throw bridge::MissingDeclarationError(test_name);
    }
    return *declaration;
}

std::vector<bridge::Record> GoldenSession::records(const bridge::ArgumentList& arguments) const {
    const auto& declaration = current_declaration();
    try {
        return orchestrator().records(declaration, arguments);
    } catch (const bridge::CacheMissError&) {
        UNSCOPED_INFO("oracle diagnostics:\n" << diagnostics_tail(oracle_diagnostics(), kDiagnosticsTailLines));
        throw;
    }
}

const bridge::RawTable& GoldenSession::raw_table(const bridge::ArgumentList& arguments) const {
    const auto& declaration = current_declaration();
    try {
        return orchestrator().raw_table(declaration, arguments);
    } catch (const bridge::CacheMissError&) {
        UNSCOPED_INFO("oracle diagnostics:\n" << diagnostics_tail(oracle_diagnostics(), kDiagnosticsTailLines));
        throw;
    }
}

OracleRegistrar::OracleRegistrar(std::string test_name, std::string module, bridge::ParameterGrid grid) {
    GoldenSession::instance().declare(
        bridge::OracleDeclaration{std::move(test_name), std::move(module), std::move(grid)});
}

}  // namespace golden::suite
