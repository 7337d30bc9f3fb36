#include "golden_bridge/orchestrator.hpp"
#include "golden_bridge/errors.hpp"

#include <exception>
#include <ostream>
#include <string>
#include <utility>

namespace golden::bridge {

const char* to_string(Orchestrator::State state) noexcept {
    switch (state) {
        case Orchestrator::State::idle:       return "IDLE";
        case Orchestrator::State::scanning:   return "SCANNING";
        case Orchestrator::State::batching:   return "BATCHING";
        case Orchestrator::State::populated:  return "POPULATED";
        case Orchestrator::State::done:       return "DONE";
        case Orchestrator::State::done_empty: return "DONE-EMPTY";
        case Orchestrator::State::failed:     return "FAILED";
    }
    return "UNKNOWN";
}

Orchestrator::Orchestrator(OracleAdapter& adapter, ResultCache& cache, const SchemaRegistry& schemas)
    : Orchestrator(adapter, cache, schemas, Config{}) {}

Orchestrator::Orchestrator(OracleAdapter& adapter, ResultCache& cache, const SchemaRegistry& schemas, Config config)
    : adapter_{adapter}, cache_{cache}, schemas_{schemas}, config_{config} {}

void Orchestrator::note(const std::string& line) {
    diag_ += line;
    diag_ += "\n";
    if (config_.log != nullptr) {
        *config_.log << line << "\n";
    }
}

void Orchestrator::transition(State next) {
    note(std::string("[orchestrator] ") + to_string(state_) + " -> " + to_string(next));
    state_ = next;
}

Orchestrator::State Orchestrator::collect(const std::vector<const OracleDeclaration*>& selected) {
    if (state_ != State::idle) {
        throw OrchestratorStateError(std::string("Collection already performed (state ") + to_string(state_) + ")");
    }

    try {
        transition(State::scanning);

        RequestSet requests;
        std::size_t combinations = 0;
        for (const auto* declaration : selected) {
            if (declaration == nullptr) {
                continue;
            }
            for (auto& request : declaration->requests()) {
                ++combinations;
                requests.insert(std::move(request));
            }
        }

        if (requests.empty()) {
            note("[oracle] no selected test requires reference data; oracle not launched");
            transition(State::done_empty);
            return state_;
        }

        transition(State::batching);
        note("[oracle] invoking oracle for " + std::to_string(requests.size()) + " unique requests (" +
             std::to_string(combinations) + " test invocations)");
        auto tables = adapter_.run_batch(requests);
        batched_ = requests.size();

        std::size_t missing = 0;
        for (const auto& request : requests) {
            if (tables.find(request) == tables.end()) {
                ++missing;
                note("[oracle] no frame returned for '" + request.to_wire_line() + "'");
            }
        }
        note("[oracle] received " + std::to_string(tables.size()) + " frames, " + std::to_string(missing) +
             " requests unresolved");

        cache_.populate(std::move(tables));
        transition(State::populated);
        transition(State::done);
        return state_;
    } catch (const std::exception& ex) {
        note(std::string("[orchestrator] collection aborted: ") + ex.what());
        state_ = State::failed;
        throw;
    }
}

const RawTable& Orchestrator::raw_table(const OracleDeclaration& declaration, const ArgumentList& arguments) const {
    const auto request = Request::build(declaration.module, arguments);
    return cache_.lookup(request);
}

std::vector<Record> Orchestrator::records(const OracleDeclaration& declaration,
                                          const ArgumentList& arguments) const {
    const auto request = Request::build(declaration.module, arguments);
    const auto& table = cache_.lookup(request);
    try {
        return validate(table, schemas_.at(declaration.module));
    } catch (const SchemaViolationError& ex) {
        throw SchemaViolationError(std::string(ex.what()) + " [request '" + request.to_wire_line() + "']",
                                   ex.column());
    }
}

std::vector<Record> Orchestrator::records_for(const DeclarationRegistry& registry,
                                              std::string_view test_name,
                                              const ArgumentList& arguments) const {
    const auto* declaration = registry.find(test_name);
    if (declaration == nullptr) {
        throw MissingDeclarationError(std::string{test_name});
    }
    return records(*declaration, arguments);
}

}  // namespace golden::bridge
