#include "golden_bridge/session_report.hpp"
#include "golden_bridge/errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace golden::bridge {

std::size_t SessionReport::count(const std::string& status) const {
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                                  [&status](const RequestOutcome& o) { return o.status == status; }));
}

bool SessionReport::all_passed() const {
    return count("PASS") == outcomes.size();
}

SessionReport evaluate_session(const Orchestrator& orchestrator,
                               const std::vector<const OracleDeclaration*>& selected) {
    SessionReport report;
    report.state = to_string(orchestrator.state());
    report.unique_requests = orchestrator.batched_requests();

    for (const auto* declaration : selected) {
        if (declaration == nullptr) {
            continue;
        }
        for (const auto& arguments : declaration->grid.combinations()) {
            RequestOutcome outcome;
            outcome.test_name = declaration->test_name;
            outcome.wire_line = Request::build(declaration->module, arguments).to_wire_line();
            try {
                outcome.columns = orchestrator.raw_table(*declaration, arguments).columns;
                outcome.records = orchestrator.records(*declaration, arguments);
                outcome.status = "PASS";
            } catch (const CacheMissError& ex) {
                outcome.status = "MISSING";
                outcome.message = ex.what();
            } catch (const SchemaViolationError& ex) {
                outcome.status = "SCHEMA_ERROR";
                outcome.message = ex.what();
            }
            report.outcomes.push_back(std::move(outcome));
        }
    }
    return report;
}

}  // namespace golden::bridge
