#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace golden::bridge {

using Argument = std::pair<std::string, std::string>;
using ArgumentList = std::vector<Argument>;

/**
 * \brief Renders a floating point value in the wire numeric format.
 *
 * Fixed-precision scientific notation with 12 fractional digits, locale independent
 * (equivalent to printf "%.12e" in the C locale), e.g. 7.112000000000e+03.
 */
[[nodiscard]] std::string format_wire_double(double value);

/**
 * \brief Coerces a parametrized value to its string wire form.
 *
 * Booleans become true/false, a plain char the one-character string, integers decimal,
 * floating point values use format_wire_double(); string-like values are taken verbatim.
 */
template <typename T>
[[nodiscard]] std::string to_wire_value(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_same_v<T, char>) {
        return std::string(1, value);
    } else if constexpr (std::is_integral_v<T>) {
        return std::to_string(value);
    } else if constexpr (std::is_floating_point_v<T>) {
        return format_wire_double(static_cast<double>(value));
    } else {
        return std::string(value);
    }
}

/**
 * \brief Canonical identifier of one unit of reference computation.
 *
 * A request names an oracle dump module and a set of key=value arguments. Arguments
 * are sorted by key at construction, so requests built from any permutation of the
 * same argument set compare equal, hash identically and render the same wire line.
 *
 * Wire line grammar (also the batch input line sent to the oracle):
 * \code{.txt}
 * module (SP key=value)*      e.g. "XRayTransition Z=26 trans=1"
 * \endcode
 * Module, keys and values must be non-empty and may contain neither '=' nor whitespace.
 */
class Request {
public:
    /**
     * Builds a canonical request.
     *
     * Throws RequestFormatError when the module, a key or a value violates the wire
     * grammar and DuplicateArgumentError when a key appears twice.
     */
    [[nodiscard]] static Request build(std::string module, ArgumentList arguments);

    /**
     * Parses a wire line back into a request. Argument order in the line is irrelevant.
     */
    [[nodiscard]] static Request parse_wire_line(std::string_view line);

    [[nodiscard]] const std::string& module() const noexcept { return module_; }
    [[nodiscard]] const ArgumentList& arguments() const noexcept { return arguments_; }

    [[nodiscard]] std::optional<std::string> argument(std::string_view key) const;

    [[nodiscard]] std::string to_wire_line() const;

    [[nodiscard]] std::size_t hash() const noexcept;

    friend bool operator==(const Request&, const Request&) = default;
    friend std::strong_ordering operator<=>(const Request&, const Request&) = default;

private:
    Request(std::string module, ArgumentList arguments);

    std::string module_;
    ArgumentList arguments_;
};

/// Deduplicating, deterministically ordered collection of requests.
using RequestSet = std::set<Request>;

}  // namespace golden::bridge

template <>
struct std::hash<golden::bridge::Request> {
    std::size_t operator()(const golden::bridge::Request& request) const noexcept {
        return request.hash();
    }
};
