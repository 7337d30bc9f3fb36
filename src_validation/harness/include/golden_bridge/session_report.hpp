#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "declaration.hpp"
#include "orchestrator.hpp"
#include "schema_validator.hpp"

namespace golden::bridge {

struct RequestOutcome {
    std::string test_name;
    std::string wire_line;
    std::string status;  // PASS, MISSING, SCHEMA_ERROR
    std::string message;
    std::vector<std::string> columns;
    std::vector<Record> records;
};

struct SessionReport {
    std::string state;
    std::size_t unique_requests{0};
    std::size_t oracle_invocations{0};
    std::vector<RequestOutcome> outcomes;

    [[nodiscard]] std::size_t count(const std::string& status) const;
    [[nodiscard]] bool all_passed() const;
};

/**
 * \brief Resolves every test invocation of \a selected against the populated cache.
 *
 * One outcome per (declaration, grid combination), in declaration order. Cache misses and
 * schema violations are recorded as MISSING and SCHEMA_ERROR outcomes; an empty result
 * table is a PASS with zero records.
 */
[[nodiscard]] SessionReport evaluate_session(const Orchestrator& orchestrator,
                                             const std::vector<const OracleDeclaration*>& selected);

}  // namespace golden::bridge
