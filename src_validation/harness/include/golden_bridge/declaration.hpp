#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "request.hpp"

namespace golden::bridge {

/**
 * \brief Named parametrization axes of one oracle-dependent test.
 *
 * The test runs once per combination of axis values (cartesian product, first axis
 * varying slowest). Values are kept in their string wire form.
 */
class ParameterGrid {
public:
    struct Axis {
        std::string name;
        std::vector<std::string> values;
    };

    ParameterGrid() = default;

    template <typename T>
    ParameterGrid& axis(std::string name, std::initializer_list<T> values) {
        std::vector<std::string> converted;
        converted.reserve(values.size());
        for (const auto& value : values) {
            converted.push_back(to_wire_value(value));
        }
        return axis_values(std::move(name), std::move(converted));
    }

    template <typename T>
    ParameterGrid& axis(std::string name, const std::vector<T>& values) {
        std::vector<std::string> converted;
        converted.reserve(values.size());
        for (const auto& value : values) {
            converted.push_back(to_wire_value(value));
        }
        return axis_values(std::move(name), std::move(converted));
    }

    /// Inclusive integer range [first, last].
    ParameterGrid& range(std::string name, std::int64_t first, std::int64_t last);

    /// Throws std::invalid_argument if the axis name is already used.
    ParameterGrid& axis_values(std::string name, std::vector<std::string> values);

    [[nodiscard]] const std::vector<Axis>& axes() const noexcept { return axes_; }

    /// Number of combinations (1 for a grid without axes).
    [[nodiscard]] std::size_t size() const noexcept;

    /// Every combination as key=value pairs in axis order.
    [[nodiscard]] std::vector<ArgumentList> combinations() const;

private:
    std::vector<Axis> axes_;
};

/**
 * \brief Oracle dependency of one test: which dump module and which arguments.
 */
struct OracleDeclaration {
    std::string test_name;
    std::string module;
    ParameterGrid grid;

    /// One request per grid combination (duplicates collapse in the caller's RequestSet).
    [[nodiscard]] std::vector<Request> requests() const;
};

/**
 * \brief Test-name keyed collection of declarations.
 *
 * The host integration registers declarations here and hands the subset belonging to
 * the user's test selection to the orchestrator.
 */
class DeclarationRegistry {
public:
    /// Throws std::invalid_argument if \a declaration.test_name is already registered.
    const OracleDeclaration& add(OracleDeclaration declaration);

    /// nullptr when the test has no oracle declaration.
    [[nodiscard]] const OracleDeclaration* find(std::string_view test_name) const;

    [[nodiscard]] std::vector<const OracleDeclaration*> all() const;

    template <typename Predicate>
    [[nodiscard]] std::vector<const OracleDeclaration*> select(Predicate&& is_selected) const {
        std::vector<const OracleDeclaration*> selected;
        for (const auto& [name, declaration] : declarations_) {
            if (is_selected(declaration)) {
                selected.push_back(&declaration);
            }
        }
        return selected;
    }

    [[nodiscard]] std::size_t size() const noexcept { return declarations_.size(); }

private:
    std::map<std::string, OracleDeclaration, std::less<>> declarations_;
};

}  // namespace golden::bridge
