#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace golden::bridge {

/**
 * \brief Attribution of a bridge failure.
 *
 * Test reports use the category to tell infrastructure problems apart from
 * test logic problems and framework misuse.
 */
enum class ErrorCategory {
    construction,    ///< Malformed request declaration (aborts collection)
    infrastructure,  ///< Oracle launch/exit/protocol failure (aborts collection)
    framework,       ///< Cache misuse or request reconstruction mismatch
    data,            ///< Oracle output does not match the declared schema
    usage,           ///< Retrieval path used without opting in
};

[[nodiscard]] const char* to_string(ErrorCategory category) noexcept;

/**
 * \brief Base of every error raised by the bridge.
 */
class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorCategory category, const std::string& message);

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

// Request model

class DuplicateArgumentError : public BridgeError {
public:
    DuplicateArgumentError(const std::string& module, const std::string& key);

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/// Module, key or value violates the wire-line grammar.
class RequestFormatError : public BridgeError {
public:
    explicit RequestFormatError(const std::string& message);
};

// Oracle process adapter and wire codec

class OracleUnavailableError : public BridgeError {
public:
    explicit OracleUnavailableError(const std::string& message);
};

class OracleProcessError : public BridgeError {
public:
    OracleProcessError(const std::string& message, int exit_code, std::string stderr_text, bool timed_out = false);

    /// -1 when the oracle produced no exit status of its own (killed on timeout, wait failure).
    [[nodiscard]] int exit_code() const noexcept { return exit_code_; }
    [[nodiscard]] const std::string& stderr_text() const noexcept { return stderr_text_; }
    [[nodiscard]] bool timed_out() const noexcept { return timed_out_; }

private:
    int exit_code_;
    std::string stderr_text_;
    bool timed_out_;
};

class ProtocolError : public BridgeError {
public:
    ProtocolError(const std::string& message, std::size_t line_no);

    /// 1-based line of the oracle output where the violation was detected (0 if unknown).
    [[nodiscard]] std::size_t line_no() const noexcept { return line_no_; }

private:
    std::size_t line_no_;
};

// Result cache

class CacheAlreadyPopulatedError : public BridgeError {
public:
    CacheAlreadyPopulatedError();
};

class CacheMissError : public BridgeError {
public:
    explicit CacheMissError(const std::string& wire_line);

    [[nodiscard]] const std::string& wire_line() const noexcept { return wire_line_; }

private:
    std::string wire_line_;
};

// Schema validation

class SchemaViolationError : public BridgeError {
public:
    SchemaViolationError(const std::string& message, std::string column);

    /// Offending column, empty when the violation is not tied to one column.
    [[nodiscard]] const std::string& column() const noexcept { return column_; }

private:
    std::string column_;
};

// Orchestrator

class MissingDeclarationError : public BridgeError {
public:
    explicit MissingDeclarationError(const std::string& test_name);
};

class OrchestratorStateError : public BridgeError {
public:
    explicit OrchestratorStateError(const std::string& message);
};

}  // namespace golden::bridge
