#include "golden_refdump/dump_module.hpp"
#include "golden_refdump/reference_data.hpp"

#include "golden_bridge/schema.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace golden::refdump {

namespace {

using bridge::RawTable;
using bridge::Request;

const bridge::SchemaRegistry& schemas() {
    static const bridge::SchemaRegistry registry = bridge::SchemaRegistry::reference_schemas();
    return registry;
}

// Fills one row of a module's reference schema; unset columns stay empty (null).
class RowBuilder {
public:
    explicit RowBuilder(const bridge::Schema& schema)
        : schema_{schema}, values_(schema.columns().size()) {}

    template <typename T>
    RowBuilder& set(std::string_view column, const T& value) {
        const auto index = schema_.index_of(column);
        if (!index) {
            throw std::logic_error("Column '" + std::string{column} + "' is not part of " + schema_.module());
        }
        values_[*index] = bridge::to_wire_value(value);
        return *this;
    }

    template <typename T>
    RowBuilder& set(std::string_view column, const std::optional<T>& value) {
        if (value) {
            set(column, *value);
        }
        return *this;
    }

    [[nodiscard]] std::vector<std::string> build() const { return values_; }

private:
    const bridge::Schema& schema_;
    std::vector<std::string> values_;
};

RawTable empty_table(const bridge::Schema& schema) {
    RawTable table;
    for (const auto& column : schema.columns()) {
        table.columns.push_back(column.name);
    }
    return table;
}

int int_argument(const Request& request, std::string_view key, int min, int max) {
    const auto raw = request.argument(key);
    if (!raw) {
        throw std::invalid_argument("Missing required argument: " + std::string{key});
    }
    int value = 0;
    const auto* first = raw->data();
    const auto* last = raw->data() + raw->size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        throw std::invalid_argument("Invalid integer for argument '" + std::string{key} + "': " + *raw);
    }
    if (value < min || value > max) {
        throw std::invalid_argument("Argument '" + std::string{key} + "' value " + std::to_string(value) +
                                    " is out of range [" + std::to_string(min) + "-" + std::to_string(max) + "]");
    }
    return value;
}

class ElementDump : public DumpModule {
public:
    std::string_view name() const override { return "Element"; }
    std::string_view usage() const override { return "Element Z=<atomic number>"; }

    RawTable run(const Request& request) const override {
        const auto& schema = *schemas().at(name());
        const int z = int_argument(request, "Z", kFirstElement, kLastElement);
        const auto& data = element(z);

        std::optional<double> ionization;
        if (data.ionization_energy_ev) {
            ionization = *data.ionization_energy_ev * kJoulesPerElectronVolt;
        }

        auto table = empty_table(schema);
        table.rows.push_back(RowBuilder(schema)
                                 .set("Z", z)
                                 .set("symbol", data.symbol)
                                 .set("name", data.name)
                                 .set("atomic_weight", data.atomic_weight)
                                 .set("mass_in_kg", mass_in_kg(data))
                                 .set("ionization_energy", ionization)
                                 .set("mean_ionization_potential",
                                      mean_ionization_potential_ev(z) * kJoulesPerElectronVolt)
                                 .build());
        return table;
    }
};

class XRayTransitionDump : public DumpModule {
public:
    std::string_view name() const override { return "XRayTransition"; }
    std::string_view usage() const override { return "XRayTransition Z=<atomic number> trans=<transition index>"; }

    RawTable run(const Request& request) const override {
        const auto& schema = *schemas().at(name());
        const auto& lines = xray_lines();
        const int z = int_argument(request, "Z", kFirstElement, kLastElement);
        const int trans = int_argument(request, "trans", 0, static_cast<int>(lines.size()) - 1);
        const auto& line = lines[static_cast<std::size_t>(trans)];

        auto table = empty_table(schema);
        const auto source_edge = edge_energy_ev(z, line.source_shell);
        const auto destination_edge = edge_energy_ev(z, line.destination_shell);
        if (!source_edge || !destination_edge) {
            return table;
        }

        RowBuilder row(schema);
        row.set("Z", z)
            .set("transition_index", trans)
            .set("transition_name", line.name)
            .set("source_shell", line.source_shell)
            .set("destination_shell", line.destination_shell)
            .set("family", line.family)
            .set("is_well_known", line.well_known);

        if (line.well_known) {
            double family_total = 0.0;
            double destination_total = 0.0;
            for (const auto& other : lines) {
                if (!other.well_known || !edge_energy_ev(z, other.source_shell) ||
                    !edge_energy_ev(z, other.destination_shell)) {
                    continue;
                }
                if (other.family == line.family) {
                    family_total += other.relative_weight;
                }
                if (other.destination_shell == line.destination_shell) {
                    destination_total += other.relative_weight;
                }
            }

            row.set("exists", true)
                .set("energy_eV", *source_edge - *destination_edge)
                .set("edge_energy_eV", *source_edge)
                .set("weight_default", line.relative_weight)
                .set("weight_family", line.relative_weight / family_total)
                .set("weight_destination", line.relative_weight / destination_total)
                .set("weight_klm", line.relative_weight);
        }

        table.rows.push_back(row.build());
        return table;
    }
};

class AtomicShellDump : public DumpModule {
public:
    std::string_view name() const override { return "AtomicShell"; }
    std::string_view usage() const override { return "AtomicShell Z=<atomic number> shell_index=<shell index 0-48>"; }

    RawTable run(const Request& request) const override {
        const auto& schema = *schemas().at(name());
        const int z = int_argument(request, "Z", kFirstElement, kLastElement);
        const int index = int_argument(request, "shell_index", 0, kShellCount - 1);
        const auto& data = shell(index);

        RowBuilder row(schema);
        row.set("Z", z)
            .set("shell_index", index)
            .set("shell_name_siegbahn", data.siegbahn_name)
            .set("shell_name_iupac", data.iupac_name)
            .set("shell_name_atomic", data.atomic_name)
            .set("family", data.family)
            .set("principal_quantum_number", data.principal_quantum_number)
            .set("orbital_angular_momentum", data.orbital_angular_momentum)
            .set("total_angular_momentum", data.total_angular_momentum)
            .set("capacity", data.capacity);

        // Occupancy and energies are only reported for shells the ground state fills.
        const int occupancy = ground_state_occupancy(z, index);
        row.set("exists", occupancy > 0);
        if (occupancy > 0) {
            const auto edge = edge_energy_ev(z, data.iupac_name);
            row.set("ground_state_occupancy", occupancy).set("edge_energy_ev", edge);
            if (edge) {
                row.set("energy_J", *edge * kJoulesPerElectronVolt);
            }
        }

        auto table = empty_table(schema);
        table.rows.push_back(row.build());
        return table;
    }
};

const std::map<std::string, std::unique_ptr<DumpModule>, std::less<>>& modules() {
    static const auto registry = [] {
        std::map<std::string, std::unique_ptr<DumpModule>, std::less<>> m;
        auto add = [&m](std::unique_ptr<DumpModule> module) {
            std::string key{module->name()};
            m.emplace(std::move(key), std::move(module));
        };
        add(std::make_unique<AtomicShellDump>());
        add(std::make_unique<ElementDump>());
        add(std::make_unique<XRayTransitionDump>());
        return m;
    }();
    return registry;
}

}  // namespace

const DumpModule* find_module(std::string_view name) {
    const auto& registry = modules();
    const auto it = registry.find(name);
    return it == registry.end() ? nullptr : it->second.get();
}

std::vector<std::string> module_names() {
    std::vector<std::string> names;
    for (const auto& [name, module] : modules()) {
        names.push_back(name);
    }
    return names;
}

}  // namespace golden::refdump
