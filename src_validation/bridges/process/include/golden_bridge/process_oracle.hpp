#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "golden_bridge/oracle_adapter.hpp"
#include "golden_bridge/request.hpp"
#include "golden_bridge/result_table.hpp"

namespace golden::bridge
{

/**
 * Subprocess transport to the reference oracle.
 *
 * The oracle is an executable speaking the dump protocol on its standard streams:
 *  - batch mode:  <executable> <leading_args...> <batch_args...>
 *                 stdin = one wire line per request, stdout = #BEGIN/#END framed CSV
 *  - single mode: <executable> <leading_args...> <module> [key=value]...
 *                 stdout = unframed CSV
 * Exit code 0 means success; anything else is reported with the captured stderr.
 *
 * Each call spawns exactly one process and owns it until it is reaped: stdin is fed while
 * stdout/stderr are drained, so large batches cannot stall on full pipes, and every
 * descriptor and child is released on all exit paths (including timeouts and exceptions).
 */
class ProcessOracle : public OracleAdapter
{
public:
    struct Config
    {
        // Oracle entry point; a bare name is searched on PATH.
        std::filesystem::path executable;

        // Arguments placed before the mode arguments (e.g. a launcher's own flags).
        std::vector<std::string> leading_args;

        // Arguments selecting batch mode.
        std::vector<std::string> batch_args{"batch"};

        // Working directory of the oracle process (empty = inherit).
        std::filesystem::path working_dir;

        // Kill the oracle and fail after this long (0 = wait indefinitely).
        std::chrono::milliseconds timeout{0};

        // When set, batch input, raw output and diagnostics are written here.
        std::filesystem::path artifact_dir;
    };

    explicit ProcessOracle(Config cfg);

    /**
     * Runs the whole batch in one oracle process.
     *
     * Throws:
     *  - OracleUnavailableError when the executable cannot be found or launched
     *  - OracleProcessError on non-zero exit or timeout (captured stderr attached)
     *  - ProtocolError when stdout is not well-formed framed output
     */
    [[nodiscard]] ResultMap run_batch(const RequestSet& requests) override;

    /**
     * Single-request convenience entry point (no framing, no caching).
     * Same error behaviour as run_batch().
     */
    [[nodiscard]] RawTable run_single(const Request& request);

    [[nodiscard]] const Config& config() const noexcept { return cfg_; }

    // Number of oracle processes spawned by this instance.
    [[nodiscard]] std::size_t invocations() const noexcept { return invocations_; }

    // Command lines, exit codes, timings and oracle stderr of every invocation.
    [[nodiscard]] const std::string& diagnostics() const noexcept { return diag_; }

private:
    struct Outcome
    {
        int exit_code{0};
        std::string stdout_text;
        std::string stderr_text;
    };

    Outcome run_process(const std::vector<std::string>& args, const std::string& stdin_text, const char* tag);

    Config cfg_;
    std::size_t invocations_{0};
    std::string diag_;
};

} // namespace golden::bridge
