/**
 * @file golden_main.cpp
 * @brief Catch2 entry point that collects reference data before any test body runs
 *
 * @author Golden Bridge contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Golden Bridge contributors

#include <catch2/catch_session.hpp>
#include <catch2/catch_test_case_info.hpp>
#include <catch2/internal/catch_test_case_registry_impl.hpp>

#include "golden_bridge/errors.hpp"
#include "golden_session.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#ifndef GOLDEN_BRIDGE_REFDUMP_PATH
#error "GOLDEN_BRIDGE_REFDUMP_PATH must point at the golden_refdump executable"
#endif

namespace {

// Names of the tests Catch2 is about to run, after the command-line filters.
std::vector<std::string> selected_test_names(const Catch::Config& config) {
    const auto tests = Catch::filterTests(Catch::getAllTestCasesSorted(config), config.testSpec(), config);
    std::vector<std::string> names;
    names.reserve(tests.size());
    for (const auto& test : tests) {
        names.push_back(test.getTestCaseInfo().name);
    }
    return names;
}

bool is_listing_only(Catch::Session& session) {
    const auto& config = session.config();
    return session.configData().showHelp || config.listTests() || config.listTags() || config.listReporters() ||
           config.listListeners();
}

void print_oracle_diagnostics() {
    const auto diagnostics = golden::suite::GoldenSession::instance().oracle_diagnostics();
    if (!diagnostics.empty()) {
        std::cerr << "[golden] oracle diagnostics:\n" << golden::suite::diagnostics_tail(diagnostics, 40) << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    Catch::Session session;

    std::string oracle_path = GOLDEN_BRIDGE_REFDUMP_PATH;
    std::string artifact_dir;
    int timeout_ms = 60000;

    using namespace Catch::Clara;
    session.cli(session.cli() |
                Opt(oracle_path, "path")["--oracle"]("reference oracle executable") |
                Opt(artifact_dir, "dir")["--oracle-artifacts"]("write oracle input, output and diagnostics here") |
                Opt(timeout_ms, "ms")["--oracle-timeout"]("kill the oracle after this many milliseconds"));

    if (const int rc = session.applyCommandLine(argc, argv); rc != 0) {
        return rc;
    }
    if (is_listing_only(session)) {
        return session.run();
    }

    golden::bridge::ProcessOracle::Config oracle_config;
    oracle_config.executable = oracle_path;
    oracle_config.timeout = std::chrono::milliseconds(timeout_ms);
    oracle_config.artifact_dir = artifact_dir;

    try {
        const auto state =
            golden::suite::GoldenSession::instance().collect(selected_test_names(session.config()), oracle_config);
        std::cerr << "[golden] collection finished: " << golden::bridge::to_string(state) << "\n";
    } catch (const golden::bridge::BridgeError& ex) {
        std::cerr << "[golden] collection aborted [" << golden::bridge::to_string(ex.category())
                  << "]: " << ex.what() << "\n";
        print_oracle_diagnostics();
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "[golden] collection aborted: " << ex.what() << "\n";
        print_oracle_diagnostics();
        return 2;
    }

    return session.run();
}
