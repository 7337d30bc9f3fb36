#pragma once

#include "request.hpp"
#include "result_table.hpp"

namespace golden::bridge {

/**
 * \brief Transport to the reference oracle.
 *
 * run_batch() resolves a whole set of requests in one oracle invocation and is the only
 * entry point the orchestrator uses. Requests the oracle produced no frame for are simply
 * absent from the returned map; completeness is checked at cache lookup.
 */
class OracleAdapter {
public:
    virtual ~OracleAdapter() = default;

    /// Throws OracleUnavailableError, OracleProcessError or ProtocolError; never returns partial results.
    [[nodiscard]] virtual ResultMap run_batch(const RequestSet& requests) = 0;
};

}  // namespace golden::bridge
