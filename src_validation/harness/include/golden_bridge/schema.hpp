#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace golden::bridge {

/// Primitive column types of the oracle's CSV tables.
enum class ColumnType {
    string,
    integer,
    real,
    boolean,
};

/// Wire spelling of a column type: STRING, INT, DOUBLE, BOOL.
[[nodiscard]] const char* to_string(ColumnType type) noexcept;

[[nodiscard]] std::optional<ColumnType> column_type_from_string(std::string_view name);

struct Column {
    std::string name;
    ColumnType type{ColumnType::string};
    bool nullable{false};
};

/**
 * \brief Fixed, ordered column declaration of one dump module.
 *
 * Typed records always expose their fields in this order, independent of the order the
 * oracle emitted them in.
 */
class Schema {
public:
    /// Throws std::invalid_argument on an empty module name, empty or duplicate column names.
    Schema(std::string module, std::vector<Column> columns);

    [[nodiscard]] const std::string& module() const noexcept { return module_; }
    [[nodiscard]] const std::vector<Column>& columns() const noexcept { return columns_; }

    [[nodiscard]] std::optional<std::size_t> index_of(std::string_view column) const;

private:
    std::string module_;
    std::vector<Column> columns_;
};

/**
 * \brief Explicit module -> schema association consumed by the validator.
 *
 * Registries are plain values: build one per session (reference_schemas(), JSON files or
 * add()) and pass it wherever records are validated.
 *
 * JSON layout understood by parse_json()/load_json():
 * \code{.json}
 * { "modules": {
 *     "Element": [ {"name": "Z", "type": "INT"},
 *                  {"name": "ionization_energy", "type": "DOUBLE", "nullable": true} ] } }
 * \endcode
 */
class SchemaRegistry {
public:
    SchemaRegistry() = default;

    /// Throws std::invalid_argument if the module is already registered.
    void add(Schema schema);

    /// Throws SchemaViolationError when no schema is registered for \a module.
    [[nodiscard]] std::shared_ptr<const Schema> at(std::string_view module) const;

    [[nodiscard]] bool contains(std::string_view module) const;
    [[nodiscard]] std::vector<std::string> modules() const;
    [[nodiscard]] std::size_t size() const noexcept { return schemas_.size(); }

    /// Schemas of the Element, XRayTransition and AtomicShell reference dumps.
    [[nodiscard]] static SchemaRegistry reference_schemas();

    /// Throws std::runtime_error on malformed documents.
    [[nodiscard]] static SchemaRegistry parse_json(std::string_view document);
    [[nodiscard]] static SchemaRegistry load_json(const std::filesystem::path& file);

private:
    std::map<std::string, std::shared_ptr<const Schema>, std::less<>> schemas_;
};

}  // namespace golden::bridge
