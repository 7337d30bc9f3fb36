#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "result_table.hpp"
#include "schema.hpp"

namespace golden::bridge {

/// Typed field value; std::monostate represents null.
using Value = std::variant<std::monostate, std::string, std::int64_t, double, bool>;

/**
 * \brief One validated oracle row.
 *
 * Holds a value for every column of its schema, in schema order, each of the declared
 * type (or null for nullable columns). Named accessors throw SchemaViolationError for
 * unknown columns, nulls read through get<T>() and type mismatches.
 */
class Record {
public:
    Record(std::shared_ptr<const Schema> schema, std::vector<Value> values);

    [[nodiscard]] const Schema& schema() const noexcept { return *schema_; }
    [[nodiscard]] const std::vector<Value>& values() const noexcept { return values_; }

    [[nodiscard]] const Value& at(std::string_view column) const;
    [[nodiscard]] bool is_null(std::string_view column) const;

    /// T is one of std::string, std::int64_t, double, bool.
    template <typename T>
    [[nodiscard]] T get(std::string_view column) const {
        const auto& value = at(column);
        if (const auto* typed = std::get_if<T>(&value)) {
            return *typed;
        }
        throw_bad_access(column, std::holds_alternative<std::monostate>(value));
    }

    /// Like get(), but a null field yields std::nullopt.
    template <typename T>
    [[nodiscard]] std::optional<T> optional(std::string_view column) const {
        const auto& value = at(column);
        if (std::holds_alternative<std::monostate>(value)) {
            return std::nullopt;
        }
        if (const auto* typed = std::get_if<T>(&value)) {
            return *typed;
        }
        throw_bad_access(column, false);
    }

private:
    [[noreturn]] void throw_bad_access(std::string_view column, bool is_null) const;

    std::shared_ptr<const Schema> schema_;
    std::vector<Value> values_;
};

/**
 * \brief Promotes raw string rows to typed records.
 *
 * Every schema column must be present in the table header and every header column must
 * be declared by the schema. Each raw value is whitespace-trimmed and parsed to the
 * declared type; empty values (and the literal "null" for non-STRING columns) are null
 * and only accepted for nullable columns. Violations raise SchemaViolationError naming
 * the column and the 0-based row index.
 */
[[nodiscard]] std::vector<Record> validate(const RawTable& table, const std::shared_ptr<const Schema>& schema);

[[nodiscard]] std::vector<Record> validate(const RawTable& table, const Schema& schema);

/// Renders a field value the way the oracle would (null as empty string).
[[nodiscard]] std::string to_display_string(const Value& value);

}  // namespace golden::bridge
