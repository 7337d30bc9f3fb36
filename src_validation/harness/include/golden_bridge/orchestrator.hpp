#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "declaration.hpp"
#include "oracle_adapter.hpp"
#include "result_cache.hpp"
#include "schema.hpp"
#include "schema_validator.hpp"

namespace golden::bridge {

/**
 * \brief Bridges test discovery to the oracle and serves reference data to test bodies.
 *
 * Per session state machine:
 * \code{.txt}
 * IDLE -> SCANNING -> DONE_EMPTY                      (no selected test needs the oracle)
 *                  -> BATCHING -> POPULATED -> DONE   (one oracle invocation)
 *                              -> FAILED              (error propagated, run aborts)
 * \endcode
 * collect() runs once, before any test body. Retrieval only reads the cache and may be
 * called any number of times afterwards.
 */
class Orchestrator {
public:
    enum class State {
        idle,
        scanning,
        batching,
        populated,
        done,
        done_empty,
        failed,
    };

    struct Config {
        // Optional echo of the diagnostics log (e.g. &std::cerr).
        std::ostream* log{nullptr};
    };

    Orchestrator(OracleAdapter& adapter, ResultCache& cache, const SchemaRegistry& schemas);
    Orchestrator(OracleAdapter& adapter, ResultCache& cache, const SchemaRegistry& schemas, Config config);

    /**
     * Collects the requests of the selected declarations, runs the oracle once if any were
     * found and populates the cache.
     *
     * Throws OrchestratorStateError when called a second time; construction, transport and
     * protocol errors propagate unchanged after the state moves to FAILED.
     */
    State collect(const std::vector<const OracleDeclaration*>& selected);

    /**
     * Reference records for one test invocation: rebuilds the request from the declaration's
     * module and \a arguments, looks it up and validates it against the module schema.
     *
     * Throws CacheMissError or SchemaViolationError.
     */
    [[nodiscard]] std::vector<Record> records(const OracleDeclaration& declaration,
                                              const ArgumentList& arguments) const;

    /// Same as records(), resolving the declaration by test name; throws MissingDeclarationError.
    [[nodiscard]] std::vector<Record> records_for(const DeclarationRegistry& registry,
                                                  std::string_view test_name,
                                                  const ArgumentList& arguments) const;

    /// Raw cached table for one test invocation (no schema validation).
    [[nodiscard]] const RawTable& raw_table(const OracleDeclaration& declaration,
                                            const ArgumentList& arguments) const;

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] std::size_t batched_requests() const noexcept { return batched_; }
    [[nodiscard]] const std::string& diagnostics() const noexcept { return diag_; }

private:
    void transition(State next);
    void note(const std::string& line);

    OracleAdapter& adapter_;
    ResultCache& cache_;
    const SchemaRegistry& schemas_;
    Config config_;
    State state_{State::idle};
    std::size_t batched_{0};
    std::string diag_;
};

[[nodiscard]] const char* to_string(Orchestrator::State state) noexcept;

}  // namespace golden::bridge
