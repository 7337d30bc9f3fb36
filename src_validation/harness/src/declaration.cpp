#include "golden_bridge/declaration.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace golden::bridge {

ParameterGrid& ParameterGrid::range(std::string name, std::int64_t first, std::int64_t last) {
    if (last < first) {
        throw std::invalid_argument("Empty range " + std::to_string(first) + ".." + std::to_string(last) +
                                    " for parameter '" + name + "'");
    }
    std::vector<std::string> values;
    values.reserve(static_cast<std::size_t>(last - first + 1));
    for (std::int64_t v = first; v <= last; ++v) {
        values.push_back(std::to_string(v));
    }
    return axis_values(std::move(name), std::move(values));
}

ParameterGrid& ParameterGrid::axis_values(std::string name, std::vector<std::string> values) {
    const auto duplicate =
        std::find_if(axes_.begin(), axes_.end(), [&name](const Axis& axis) { return axis.name == name; });
    if (duplicate != axes_.end()) {
        throw std::invalid_argument("Parameter '" + name + "' declared twice");
    }
    axes_.push_back(Axis{std::move(name), std::move(values)});
    return *this;
}

std::size_t ParameterGrid::size() const noexcept {
    std::size_t total = 1;
    for (const auto& axis : axes_) {
        total *= axis.values.size();
    }
    return total;
}

std::vector<ArgumentList> ParameterGrid::combinations() const {
    std::vector<ArgumentList> result;
    const auto total = size();
    if (total == 0) {
        return result;
    }
    result.reserve(total);

    // Odometer over axis value indices; the last axis varies fastest.
    std::vector<std::size_t> cursor(axes_.size(), 0);
    for (std::size_t n = 0; n < total; ++n) {
        ArgumentList combination;
        combination.reserve(axes_.size());
        for (std::size_t a = 0; a < axes_.size(); ++a) {
            combination.emplace_back(axes_[a].name, axes_[a].values[cursor[a]]);
        }
        result.push_back(std::move(combination));

        for (std::size_t a = axes_.size(); a-- > 0;) {
            if (++cursor[a] < axes_[a].values.size()) {
                break;
            }
            cursor[a] = 0;
        }
    }
    return result;
}

std::vector<Request> OracleDeclaration::requests() const {
    std::vector<Request> built;
    for (auto& combination : grid.combinations()) {
        built.push_back(Request::build(module, std::move(combination)));
    }
    return built;
}

const OracleDeclaration& DeclarationRegistry::add(OracleDeclaration declaration) {
    auto name = declaration.test_name;
    const auto [it, inserted] = declarations_.emplace(std::move(name), std::move(declaration));
    if (!inserted) {
        throw std::invalid_argument("Oracle declaration for test '" + it->first + "' registered twice");
    }
    return it->second;
}

const OracleDeclaration* DeclarationRegistry::find(std::string_view test_name) const {
    const auto it = declarations_.find(test_name);
    return it == declarations_.end() ? nullptr : &it->second;
}

std::vector<const OracleDeclaration*> DeclarationRegistry::all() const {
    return select([](const OracleDeclaration&) { return true; });
}

}  // namespace golden::bridge
