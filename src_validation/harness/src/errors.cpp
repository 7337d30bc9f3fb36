#include "golden_bridge/errors.hpp"

#include <string>
#include <utility>

namespace golden::bridge {

const char* to_string(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::construction:   return "construction";
        case ErrorCategory::infrastructure: return "infrastructure";
        case ErrorCategory::framework:      return "framework";
        case ErrorCategory::data:           return "data";
        case ErrorCategory::usage:          return "usage";
    }
    return "unknown";
}

BridgeError::BridgeError(ErrorCategory category, const std::string& message)
    : std::runtime_error(message), category_{category} {}

DuplicateArgumentError::DuplicateArgumentError(const std::string& module, const std::string& key)
    : BridgeError(ErrorCategory::construction,
                  "Duplicate argument key '" + key + "' in request for module '" + module + "'"),
      key_{key} {}

RequestFormatError::RequestFormatError(const std::string& message)
    : BridgeError(ErrorCategory::construction, message) {}

OracleUnavailableError::OracleUnavailableError(const std::string& message)
    : BridgeError(ErrorCategory::infrastructure, message) {}

OracleProcessError::OracleProcessError(const std::string& message,
                                       int exit_code,
                                       std::string stderr_text,
                                       bool timed_out)
    : BridgeError(ErrorCategory::infrastructure,
                  stderr_text.empty() ? message : message + "\n" + stderr_text),
      exit_code_{exit_code},
      stderr_text_{std::move(stderr_text)},
      timed_out_{timed_out} {}

ProtocolError::ProtocolError(const std::string& message, std::size_t line_no)
    : BridgeError(ErrorCategory::infrastructure,
                  line_no == 0 ? "Oracle protocol error: " + message
                               : "Oracle protocol error at output line " + std::to_string(line_no) +
                                     ": " + message),
      line_no_{line_no} {}

CacheAlreadyPopulatedError::CacheAlreadyPopulatedError()
    : BridgeError(ErrorCategory::framework,
                  "Result cache already populated; the oracle must run once per session") {}

CacheMissError::CacheMissError(const std::string& wire_line)
    : BridgeError(ErrorCategory::framework,
                  "No reference data collected for request '" + wire_line +
                      "' (request was not batched or the oracle produced no frame for it)"),
      wire_line_{wire_line} {}

SchemaViolationError::SchemaViolationError(const std::string& message, std::string column)
    : BridgeError(ErrorCategory::data, message), column_{std::move(column)} {}

MissingDeclarationError::MissingDeclarationError(const std::string& test_name)
    : BridgeError(ErrorCategory::usage,
                  "Test '" + test_name +
                      "' requested reference data without declaring an oracle module") {}

OrchestratorStateError::OrchestratorStateError(const std::string& message)
    : BridgeError(ErrorCategory::usage, message) {}

}  // namespace golden::bridge
