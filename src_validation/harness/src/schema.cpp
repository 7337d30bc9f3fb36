#include "golden_bridge/schema.hpp"
#include "golden_bridge/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace {

using golden::bridge::Column;
using golden::bridge::ColumnType;
using nlohmann::json;

std::string to_upper_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::toupper(ch)));
    }
    return result;
}

Column required(std::string name, ColumnType type) {
    return Column{std::move(name), type, false};
}

Column nullable(std::string name, ColumnType type) {
    return Column{std::move(name), type, true};
}

Column column_from_json(const json& entry, const std::string& module) {
    if (!entry.is_object()) {
        throw std::runtime_error("Schema for module '" + module + "': column entries must be objects");
    }
    const auto name = entry.find("name");
    const auto type = entry.find("type");
    if (name == entry.end() || !name->is_string()) {
        throw std::runtime_error("Schema for module '" + module + "': column without a string 'name'");
    }
    if (type == entry.end() || !type->is_string()) {
        throw std::runtime_error("Schema for module '" + module + "': column '" + name->get<std::string>() +
                                 "' without a string 'type'");
    }
    const auto parsed = golden::bridge::column_type_from_string(type->get<std::string>());
    if (!parsed) {
        throw std::runtime_error("Schema for module '" + module + "': unknown type '" +
                                 type->get<std::string>() + "' for column '" + name->get<std::string>() + "'");
    }
    bool is_nullable = false;
    if (const auto flag = entry.find("nullable"); flag != entry.end()) {
        if (!flag->is_boolean()) {
            throw std::runtime_error("Schema for module '" + module + "': 'nullable' of column '" +
                                     name->get<std::string>() + "' must be a boolean");
        }
        is_nullable = flag->get<bool>();
    }
    return Column{name->get<std::string>(), *parsed, is_nullable};
}

}  // namespace

namespace golden::bridge {

const char* to_string(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::string:  return "STRING";
        case ColumnType::integer: return "INT";
        case ColumnType::real:    return "DOUBLE";
        case ColumnType::boolean: return "BOOL";
    }
    return "UNKNOWN";
}

std::optional<ColumnType> column_type_from_string(std::string_view name) {
    const auto upper = to_upper_copy(name);
    if (upper == "STRING") return ColumnType::string;
    if (upper == "INT") return ColumnType::integer;
    if (upper == "DOUBLE") return ColumnType::real;
    if (upper == "BOOL") return ColumnType::boolean;
    return std::nullopt;
}

Schema::Schema(std::string module, std::vector<Column> columns)
    : module_{std::move(module)}, columns_{std::move(columns)} {
    if (module_.empty()) {
        throw std::invalid_argument("Schema module name must not be empty");
    }
    std::set<std::string_view> seen;
    for (const auto& column : columns_) {
        if (column.name.empty()) {
            throw std::invalid_argument("Schema for module '" + module_ + "' has an empty column name");
        }
        if (!seen.insert(column.name).second) {
            throw std::invalid_argument("Schema for module '" + module_ + "' declares column '" + column.name +
                                        "' twice");
        }
    }
}

std::optional<std::size_t> Schema::index_of(std::string_view column) const {
    const auto it = std::find_if(columns_.begin(), columns_.end(),
                                 [column](const Column& c) { return c.name == column; });
    if (it == columns_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - columns_.begin());
}

void SchemaRegistry::add(Schema schema) {
    auto name = schema.module();
    if (schemas_.find(name) != schemas_.end()) {
        throw std::invalid_argument("Schema for module '" + name + "' registered twice");
    }
    schemas_.emplace(std::move(name), std::make_shared<const Schema>(std::move(schema)));
}

std::shared_ptr<const Schema> SchemaRegistry::at(std::string_view module) const {
    const auto it = schemas_.find(module);
    if (it == schemas_.end()) {
        throw SchemaViolationError("No schema registered for dump module '" + std::string{module} + "'", "");
    }
    return it->second;
}

bool SchemaRegistry::contains(std::string_view module) const {
    return schemas_.find(module) != schemas_.end();
}

std::vector<std::string> SchemaRegistry::modules() const {
    std::vector<std::string> names;
    names.reserve(schemas_.size());
    for (const auto& [name, schema] : schemas_) {
        names.push_back(name);
    }
    return names;
}

SchemaRegistry SchemaRegistry::reference_schemas() {
    using T = ColumnType;
    SchemaRegistry registry;

    registry.add(Schema("Element", {
        required("Z", T::integer),
        required("symbol", T::string),
        required("name", T::string),
        required("atomic_weight", T::real),
        required("mass_in_kg", T::real),
        nullable("ionization_energy", T::real),
        required("mean_ionization_potential", T::real),
    }));

    registry.add(Schema("XRayTransition", {
        required("Z", T::integer),
        required("transition_index", T::integer),
        required("transition_name", T::string),
        required("source_shell", T::string),
        required("destination_shell", T::string),
        required("family", T::string),
        required("is_well_known", T::boolean),
        nullable("exists", T::boolean),
        nullable("energy_eV", T::real),
        nullable("edge_energy_eV", T::real),
        nullable("weight_default", T::real),
        nullable("weight_family", T::real),
        nullable("weight_destination", T::real),
        nullable("weight_klm", T::real),
    }));

    registry.add(Schema("AtomicShell", {
        required("Z", T::integer),
        required("shell_index", T::integer),
        required("shell_name_siegbahn", T::string),
        required("shell_name_iupac", T::string),
        required("shell_name_atomic", T::string),
        required("family", T::string),
        required("principal_quantum_number", T::integer),
        required("orbital_angular_momentum", T::integer),
        required("total_angular_momentum", T::real),
        required("capacity", T::integer),
        nullable("exists", T::boolean),
        nullable("ground_state_occupancy", T::integer),
        nullable("edge_energy_ev", T::real),
        nullable("energy_J", T::real),
    }));

    return registry;
}

SchemaRegistry SchemaRegistry::parse_json(std::string_view document) {
    json root;
    try {
        root = json::parse(document);
    } catch (const json::parse_error& ex) {
        throw std::runtime_error(std::string("Invalid schema document: ") + ex.what());
    }

    const auto modules = root.find("modules");
    if (!root.is_object() || modules == root.end() || !modules->is_object()) {
        throw std::runtime_error("Schema document must contain a 'modules' object");
    }

    SchemaRegistry registry;
    for (const auto& [module, columns_json] : modules->items()) {
        if (!columns_json.is_array()) {
            throw std::runtime_error("Schema for module '" + module + "' must be an array of columns");
        }
        std::vector<Column> columns;
        columns.reserve(columns_json.size());
        for (const auto& entry : columns_json) {
            columns.push_back(column_from_json(entry, module));
        }
        try {
            registry.add(Schema(module, std::move(columns)));
        } catch (const std::invalid_argument& ex) {
            throw std::runtime_error(ex.what());
        }
    }
    return registry;
}

SchemaRegistry SchemaRegistry::load_json(const std::filesystem::path& file) {
    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open schema file: " + file.string());
    }
    std::ostringstream content;
    content << input.rdbuf();
    try {
        return parse_json(content.str());
    } catch (const std::runtime_error& ex) {
        throw std::runtime_error(file.string() + ": " + ex.what());
    }
}

}  // namespace golden::bridge
