#include "golden_bridge/request.hpp"
#include "golden_bridge/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

bool is_wire_token(std::string_view token) {
    if (token.empty()) {
        return false;
    }
    return std::none_of(token.begin(), token.end(), [](unsigned char ch) {
        return ch == '=' || std::isspace(ch) != 0;
    });
}

void hash_combine(std::size_t& seed, std::size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

}  // namespace

namespace golden::bridge {

std::string format_wire_double(double value) {
    std::array<char, 64> buffer{};
    const auto [end, ec] =
        std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, std::chars_format::scientific, 12);
    if (ec != std::errc{}) {
        throw std::runtime_error("Unable to format floating point value");
    }
    return std::string(buffer.data(), end);
}

Request::Request(std::string module, ArgumentList arguments)
    : module_{std::move(module)}, arguments_{std::move(arguments)} {}

Request Request::build(std::string module, ArgumentList arguments) {
    if (!is_wire_token(module)) {
        throw RequestFormatError("Invalid module name '" + module +
                                 "': must be non-empty and contain no '=' or whitespace");
    }
    for (const auto& [key, value] : arguments) {
        if (!is_wire_token(key)) {
            throw RequestFormatError("Invalid argument key '" + key + "' for module '" + module + "'");
        }
        if (!is_wire_token(value)) {
            throw RequestFormatError("Invalid value '" + value + "' for argument '" + key + "' of module '" +
                                     module + "'");
        }
    }

    std::stable_sort(arguments.begin(), arguments.end(),
                     [](const Argument& lhs, const Argument& rhs) { return lhs.first < rhs.first; });

    const auto duplicate = std::adjacent_find(
        arguments.begin(), arguments.end(),
        [](const Argument& lhs, const Argument& rhs) { return lhs.first == rhs.first; });
    if (duplicate != arguments.end()) {
        throw DuplicateArgumentError(module, duplicate->first);
    }

    return Request(std::move(module), std::move(arguments));
}

Request Request::parse_wire_line(std::string_view line) {
    std::vector<std::string_view> tokens;
    std::size_t pos = 0;
    while (pos < line.size()) {
        const auto begin = line.find_first_not_of(kWhitespace, pos);
        if (begin == std::string_view::npos) {
            break;
        }
        auto end = line.find_first_of(kWhitespace, begin);
        if (end == std::string_view::npos) {
            end = line.size();
        }
        tokens.push_back(line.substr(begin, end - begin));
        pos = end;
    }

    if (tokens.empty()) {
        throw RequestFormatError("Empty request line");
    }

    ArgumentList arguments;
    arguments.reserve(tokens.size() - 1);
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const auto token = tokens[i];
        const auto delimiter = token.find('=');
        if (delimiter == std::string_view::npos) {
            throw RequestFormatError("Invalid argument '" + std::string{token} + "' in request line '" +
                                     std::string{line} + "', expected key=value");
        }
        arguments.emplace_back(std::string{token.substr(0, delimiter)}, std::string{token.substr(delimiter + 1)});
    }

    return build(std::string{tokens.front()}, std::move(arguments));
}

std::optional<std::string> Request::argument(std::string_view key) const {
    const auto it = std::lower_bound(arguments_.begin(), arguments_.end(), key,
                                     [](const Argument& arg, std::string_view k) { return arg.first < k; });
    if (it == arguments_.end() || it->first != key) {
        return std::nullopt;
    }
    return it->second;
}

std::string Request::to_wire_line() const {
    std::string line = module_;
    for (const auto& [key, value] : arguments_) {
        line.push_back(' ');
        line += key;
        line.push_back('=');
        line += value;
    }
    return line;
}

std::size_t Request::hash() const noexcept {
    const std::hash<std::string> hasher;
    std::size_t seed = hasher(module_);
    for (const auto& [key, value] : arguments_) {
        hash_combine(seed, hasher(key));
        hash_combine(seed, hasher(value));
    }
    return seed;
}

}  // namespace golden::bridge
