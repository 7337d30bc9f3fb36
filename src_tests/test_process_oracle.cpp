/**
 * @file test_process_oracle.cpp
 * @brief Integration tests for the subprocess oracle adapter
 *
 * Runs the bundled golden_refdump oracle and small shell scripts emulating misbehaving
 * oracles.
 *
 * @author Golden Bridge contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Golden Bridge contributors

#include <catch2/catch_test_macros.hpp>

#include "golden_bridge/errors.hpp"
#include "golden_bridge/process_oracle.hpp"
#include "golden_bridge/result_cache.hpp"
#include "golden_bridge/schema.hpp"
#include "golden_bridge/schema_validator.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#ifndef GOLDEN_BRIDGE_REFDUMP_PATH
#error "GOLDEN_BRIDGE_REFDUMP_PATH must point at the golden_refdump executable"
#endif

using golden::bridge::CacheMissError;
using golden::bridge::OracleProcessError;
using golden::bridge::OracleUnavailableError;
using golden::bridge::ProcessOracle;
using golden::bridge::ProtocolError;
using golden::bridge::Request;
using golden::bridge::RequestSet;
using golden::bridge::ResultCache;
using golden::bridge::SchemaRegistry;

namespace {

ProcessOracle::Config refdump_config() {
    ProcessOracle::Config cfg;
    cfg.executable = GOLDEN_BRIDGE_REFDUMP_PATH;
    cfg.timeout = std::chrono::milliseconds(30000);
    return cfg;
}

std::filesystem::path scratch_dir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

std::filesystem::path write_script(const std::filesystem::path& dir, const std::string& name, const std::string& body) {
    const auto path = dir / name;
    {
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body;
    }
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
                                     std::filesystem::perms::group_exec);
    return path;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

}  // namespace

/* ========================================================================== */
/* REFERENCE ORACLE                                                           */
/* ========================================================================== */

TEST_CASE("Batch run resolves every request in one process", "[process][refdump]") {
    ProcessOracle oracle(refdump_config());

    RequestSet requests;
    requests.insert(Request::build("Element", {{"Z", "26"}}));
    requests.insert(Request::build("Element", {{"Z", "79"}}));
    requests.insert(Request::build("XRayTransition", {{"trans", "0"}, {"Z", "26"}}));

    const auto tables = oracle.run_batch(requests);
    REQUIRE(oracle.invocations() == 1);
    REQUIRE(tables.size() == 3);

    const auto schemas = SchemaRegistry::reference_schemas();
    const auto iron = golden::bridge::validate(tables.at(Request::build("Element", {{"Z", "26"}})),
                                               schemas.at("Element"));
    REQUIRE(iron.size() == 1);
    REQUIRE(iron[0].get<std::string>("symbol") == "Fe");

    const auto gold = golden::bridge::validate(tables.at(Request::build("Element", {{"Z", "79"}})),
                                               schemas.at("Element"));
    REQUIRE(gold[0].get<std::string>("symbol") == "Au");
    REQUIRE(gold[0].get<std::int64_t>("Z") == 79);

    REQUIRE(oracle.diagnostics().find("[batch] rc=0") != std::string::npos);
}

TEST_CASE("Large batches do not stall on pipe buffers", "[process][refdump]") {
    ProcessOracle oracle(refdump_config());

    RequestSet requests;
    for (int z = 1; z <= 109; ++z) {
        requests.insert(Request::build("Element", {{"Z", std::to_string(z)}}));
        for (int trans = 0; trans < 12; ++trans) {
            requests.insert(Request::build("XRayTransition", {{"Z", std::to_string(z)}, {"trans", std::to_string(trans)}}));
        }
    }

    const auto tables = oracle.run_batch(requests);
    REQUIRE(tables.size() == requests.size());
    REQUIRE(oracle.invocations() == 1);
}

TEST_CASE("Single-mode run returns one unframed table", "[process][refdump][single]") {
    ProcessOracle oracle(refdump_config());

    const auto table = oracle.run_single(Request::build("Element", {{"Z", "26"}}));
    REQUIRE(table.rows.size() == 1);
    REQUIRE(table.row_map(0).at("symbol") == "Fe");

    const auto empty = oracle.run_single(Request::build("XRayTransition", {{"Z", "6"}, {"trans", "4"}}));
    REQUIRE(empty.empty());
    REQUIRE_FALSE(empty.columns.empty());
}

TEST_CASE("Out-of-range argument in single mode is a process error", "[process][refdump][errors]") {
    ProcessOracle oracle(refdump_config());
    try {
        (void)oracle.run_single(Request::build("Element", {{"Z", "200"}}));
        FAIL("expected OracleProcessError");
    } catch (const OracleProcessError& ex) {
        REQUIRE(ex.exit_code() == 1);
        REQUIRE(ex.stderr_text().find("out of range") != std::string::npos);
    }
}

TEST_CASE("Out-of-range argument in batch mode loses only its frame", "[process][refdump][errors]") {
    ProcessOracle oracle(refdump_config());

    const auto bad = Request::build("Element", {{"Z", "200"}});
    const auto good = Request::build("Element", {{"Z", "26"}});
    auto tables = oracle.run_batch(RequestSet{bad, good});

    REQUIRE(tables.size() == 1);
    REQUIRE(oracle.diagnostics().find("out of range") != std::string::npos);

    ResultCache cache;
    cache.populate(std::move(tables));
    REQUIRE(cache.lookup(good).rows.size() == 1);
    REQUIRE_THROWS_AS(cache.lookup(bad), CacheMissError);
}

TEST_CASE("Artifacts are written when an artifact directory is configured", "[process][artifacts]") {
    const auto dir = scratch_dir("golden_bridge_process_artifacts");
    auto cfg = refdump_config();
    cfg.artifact_dir = dir / "oracle";
    ProcessOracle oracle(cfg);

    (void)oracle.run_batch(RequestSet{Request::build("Element", {{"Z", "1"}})});

    REQUIRE(read_file(dir / "oracle" / "batch_input.txt") == "Element Z=1\n");
    REQUIRE(read_file(dir / "oracle" / "batch_stdout.txt").find("#BEGIN dump=Element Z=1") != std::string::npos);
    REQUIRE(std::filesystem::exists(dir / "oracle" / "batch_stderr.txt"));
    REQUIRE(read_file(dir / "oracle" / "adapter_diag.txt").find("cmd:") != std::string::npos);

    std::filesystem::remove_all(dir);
}

/* ========================================================================== */
/* MISBEHAVING ORACLES                                                        */
/* ========================================================================== */

TEST_CASE("Missing or non-executable oracle is unavailable", "[process][errors]") {
    const auto dir = scratch_dir("golden_bridge_process_unavailable");

    ProcessOracle::Config cfg;
    cfg.executable = dir / "no_such_oracle";
    REQUIRE_THROWS_AS(ProcessOracle(cfg).run_batch(RequestSet{Request::build("Element", {{"Z", "1"}})}),
                      OracleUnavailableError);

    {
        std::ofstream out(dir / "plain.txt");
        out << "not a program\n";
    }
    cfg.executable = dir / "plain.txt";
    REQUIRE_THROWS_AS(ProcessOracle(cfg).run_single(Request::build("Element", {{"Z", "1"}})),
                      OracleUnavailableError);

    cfg.executable = "golden-bridge-oracle-that-is-not-on-path";
    REQUIRE_THROWS_AS(ProcessOracle(cfg).run_single(Request::build("Element", {{"Z", "1"}})),
                      OracleUnavailableError);

    std::filesystem::remove_all(dir);
}

TEST_CASE("Non-zero exit carries the oracle's stderr", "[process][errors]") {
    const auto dir = scratch_dir("golden_bridge_process_exit");
    ProcessOracle::Config cfg;
    cfg.executable = write_script(dir, "failing.sh", "cat >/dev/null\necho 'fatal: reference library not loaded' >&2\nexit 3\n");
    ProcessOracle oracle(cfg);

    try {
        (void)oracle.run_batch(RequestSet{Request::build("Element", {{"Z", "1"}})});
        FAIL("expected OracleProcessError");
    } catch (const OracleProcessError& ex) {
        REQUIRE(ex.exit_code() == 3);
        REQUIRE(ex.stderr_text() == "fatal: reference library not loaded\n");
        REQUIRE(ex.category() == golden::bridge::ErrorCategory::infrastructure);
    }
    std::filesystem::remove_all(dir);
}

TEST_CASE("Hung oracle is killed after the timeout", "[process][errors]") {
    const auto dir = scratch_dir("golden_bridge_process_timeout");
    ProcessOracle::Config cfg;
    cfg.executable = write_script(dir, "hang.sh", "sleep 30\n");
    cfg.timeout = std::chrono::milliseconds(200);
    ProcessOracle oracle(cfg);

    const auto started = std::chrono::steady_clock::now();
    try {
        (void)oracle.run_batch(RequestSet{Request::build("Element", {{"Z", "1"}})});
        FAIL("expected OracleProcessError");
    } catch (const OracleProcessError& ex) {
        REQUIRE(ex.timed_out());
        REQUIRE(ex.exit_code() == -1);
        REQUIRE(std::string(ex.what()).find("timed out") != std::string::npos);
    }
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));
    std::filesystem::remove_all(dir);
}

TEST_CASE("Oracle exiting with 124 is not a timeout", "[process][errors]") {
    const auto dir = scratch_dir("golden_bridge_process_exit_124");
    ProcessOracle::Config cfg;
    cfg.executable = write_script(dir, "exit124.sh", "cat >/dev/null\nexit 124\n");
    cfg.timeout = std::chrono::milliseconds(30000);
    ProcessOracle oracle(cfg);

    try {
        (void)oracle.run_batch(RequestSet{Request::build("Element", {{"Z", "1"}})});
        FAIL("expected OracleProcessError");
    } catch (const OracleProcessError& ex) {
        REQUIRE_FALSE(ex.timed_out());
        REQUIRE(ex.exit_code() == 124);
    }
    std::filesystem::remove_all(dir);
}

TEST_CASE("Timeouts beyond the poll range still run the oracle", "[process]") {
    auto cfg = refdump_config();
    cfg.timeout = std::chrono::milliseconds(std::int64_t{5} * 1000 * 1000 * 1000);
    ProcessOracle oracle(cfg);

    const auto tables = oracle.run_batch(RequestSet{Request::build("Element", {{"Z", "26"}})});
    REQUIRE(tables.size() == 1);
    REQUIRE(oracle.diagnostics().find("[batch] rc=0") != std::string::npos);
}

TEST_CASE("Malformed framing is a protocol error", "[process][errors]") {
    const auto dir = scratch_dir("golden_bridge_process_protocol");
    ProcessOracle::Config cfg;
    cfg.executable = write_script(dir, "truncated.sh", "cat >/dev/null\necho '#BEGIN dump=Element Z=1'\necho 'Z'\n");
    ProcessOracle oracle(cfg);

    REQUIRE_THROWS_AS(oracle.run_batch(RequestSet{Request::build("Element", {{"Z", "1"}})}), ProtocolError);
    std::filesystem::remove_all(dir);
}

TEST_CASE("Oracle that exits without reading its input", "[process]") {
    const auto dir = scratch_dir("golden_bridge_process_early_exit");
    ProcessOracle::Config cfg;
    cfg.executable = write_script(dir, "lazy.sh", "echo 'nothing to see'\nexit 0\n");
    ProcessOracle oracle(cfg);

    RequestSet requests;
    for (int z = 1; z <= 109; ++z) {
        for (int trans = 0; trans < 100; ++trans) {
            requests.insert(Request::build("XRayTransition", {{"Z", std::to_string(z)}, {"trans", std::to_string(trans)}}));
        }
    }

    const auto tables = oracle.run_batch(requests);
    REQUIRE(tables.empty());
    REQUIRE(oracle.diagnostics().find("nothing to see") != std::string::npos);
    std::filesystem::remove_all(dir);
}

TEST_CASE("Leading and batch arguments are passed through", "[process]") {
    const auto dir = scratch_dir("golden_bridge_process_args");
    const auto script = write_script(dir, "echo_args.sh",
                                     "cat >/dev/null\n"
                                     "echo \"#BEGIN dump=Args first=$1 second=$2\"\n"
                                     "echo 'ok'\n"
                                     "echo 'true'\n"
                                     "echo '#END'\n");
    ProcessOracle::Config cfg;
    cfg.executable = "/bin/sh";
    cfg.leading_args = {script.string()};
    cfg.batch_args = {"--mode", "stream"};
    cfg.working_dir = dir;
    ProcessOracle oracle(cfg);

    const auto tables = oracle.run_batch(RequestSet{Request::build("Element", {{"Z", "1"}})});
    REQUIRE(tables.count(Request::build("Args", {{"first", "--mode"}, {"second", "stream"}})) == 1);
    std::filesystem::remove_all(dir);
}
