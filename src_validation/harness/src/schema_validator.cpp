#include "golden_bridge/schema_validator.hpp"
#include "golden_bridge/errors.hpp"
#include "golden_bridge/request.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace {

using golden::bridge::Column;
using golden::bridge::ColumnType;
using golden::bridge::SchemaViolationError;
using golden::bridge::Value;

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

std::string_view trim(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return input.substr(begin, end - begin + 1);
}

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

std::string location(const std::string& module, std::size_t row, const Column& column) {
    return "module '" + module + "' row " + std::to_string(row) + " column '" + column.name + "'";
}

Value parse_value(std::string_view raw, const Column& column, const std::string& module, std::size_t row) {
    const auto text = trim(raw);
    const bool is_null = text.empty() || (column.type != ColumnType::string && text == "null");
    if (is_null) {
        if (!column.nullable) {
            throw SchemaViolationError("Schema violation in " + location(module, row, column) +
                                           ": null value for non-nullable column",
                                       column.name);
        }
        return std::monostate{};
    }

    const auto unparseable = [&]() {
        return SchemaViolationError("Schema violation in " + location(module, row, column) + ": expected " +
                                        golden::bridge::to_string(column.type) + ", got '" + std::string{text} +
                                        "'",
                                    column.name);
    };

    switch (column.type) {
        case ColumnType::string:
            return std::string{text};
        case ColumnType::integer: {
            std::int64_t parsed = 0;
            const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
            if (ec != std::errc{} || end != text.data() + text.size()) {
                throw unparseable();
            }
            return parsed;
        }
        case ColumnType::real: {
            double parsed = 0.0;
            const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
            if (ec != std::errc{} || end != text.data() + text.size()) {
                throw unparseable();
            }
            return parsed;
        }
        case ColumnType::boolean: {
            const auto lowered = to_lower_copy(text);
            if (lowered == "true") return true;
            if (lowered == "false") return false;
            throw unparseable();
        }
    }
    throw unparseable();
}

}  // namespace

namespace golden::bridge {

Record::Record(std::shared_ptr<const Schema> schema, std::vector<Value> values)
    : schema_{std::move(schema)}, values_{std::move(values)} {}

const Value& Record::at(std::string_view column) const {
    const auto index = schema_->index_of(column);
    if (!index) {
        throw SchemaViolationError("Module '" + schema_->module() + "' has no column '" + std::string{column} + "'",
                                   std::string{column});
    }
    return values_.at(*index);
}

bool Record::is_null(std::string_view column) const {
    return std::holds_alternative<std::monostate>(at(column));
}

void Record::throw_bad_access(std::string_view column, bool is_null) const {
    const auto index = schema_->index_of(column);
    const auto declared = index ? golden::bridge::to_string(schema_->columns()[*index].type) : "UNKNOWN";
    if (is_null) {
        throw SchemaViolationError("Column '" + std::string{column} + "' of module '" + schema_->module() +
                                       "' is null; use optional() for nullable columns",
                                   std::string{column});
    }
    throw SchemaViolationError("Column '" + std::string{column} + "' of module '" + schema_->module() +
                                   "' is declared " + declared + "; requested a different type",
                               std::string{column});
}

std::vector<Record> validate(const RawTable& table, const std::shared_ptr<const Schema>& schema) {
    const auto& module = schema->module();
    const auto& columns = schema->columns();

    std::vector<std::size_t> positions;
    positions.reserve(columns.size());
    for (const auto& column : columns) {
        const auto position = table.column_index(column.name);
        if (!position) {
            throw SchemaViolationError("Schema violation in module '" + module + "': missing column '" +
                                           column.name + "'",
                                       column.name);
        }
        positions.push_back(*position);
    }
    for (const auto& header : table.columns) {
        if (!schema->index_of(header)) {
            throw SchemaViolationError("Schema violation in module '" + module + "': unexpected column '" +
                                           header + "'",
                                       header);
        }
    }

    std::vector<Record> records;
    records.reserve(table.rows.size());
    for (std::size_t row = 0; row < table.rows.size(); ++row) {
        const auto& fields = table.rows[row];
        std::vector<Value> values;
        values.reserve(columns.size());
        for (std::size_t i = 0; i < columns.size(); ++i) {
            if (positions[i] >= fields.size()) {
                throw SchemaViolationError("Schema violation in " + location(module, row, columns[i]) +
                                               ": field missing from row",
                                           columns[i].name);
            }
            values.push_back(parse_value(fields[positions[i]], columns[i], module, row));
        }
        records.emplace_back(schema, std::move(values));
    }
    return records;
}

std::vector<Record> validate(const RawTable& table, const Schema& schema) {
    return validate(table, std::make_shared<const Schema>(schema));
}

std::string to_display_string(const Value& value) {
    struct Visitor {
        std::string operator()(std::monostate) const { return {}; }
        std::string operator()(const std::string& v) const { return v; }
        std::string operator()(std::int64_t v) const { return std::to_string(v); }
        std::string operator()(double v) const { return format_wire_double(v); }
        std::string operator()(bool v) const { return v ? "true" : "false"; }
    };
    return std::visit(Visitor{}, value);
}

}  // namespace golden::bridge
