#include "golden_bridge/declaration_loader.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";
constexpr std::string_view kParamPrefix = "param.";
constexpr std::string_view kRangeSeparator = "..";

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

std::string location(const std::filesystem::path& file, std::size_t line_no) {
    return file.string() + ":" + std::to_string(line_no);
}

bool parse_int(std::string_view text, std::int64_t& out) {
    if (text.empty()) {
        return false;
    }
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

void add_axis(golden::bridge::ParameterGrid& grid,
              std::string name,
              std::string_view raw,
              const std::filesystem::path& file,
              std::size_t line_no) {
    try {
        const auto range_at = raw.find(kRangeSeparator);
        if (range_at != std::string_view::npos && raw.find(',') == std::string_view::npos) {
            std::int64_t first = 0;
            std::int64_t last = 0;
            if (!parse_int(trim_copy(raw.substr(0, range_at)), first) ||
                !parse_int(trim_copy(raw.substr(range_at + kRangeSeparator.size())), last)) {
                throw std::runtime_error("Invalid integer range '" + std::string{raw} + "' at " +
                                         location(file, line_no));
            }
            grid.range(std::move(name), first, last);
            return;
        }

        std::vector<std::string> values;
        std::size_t pos = 0;
        while (pos <= raw.size()) {
            auto comma = raw.find(',', pos);
            if (comma == std::string_view::npos) {
                comma = raw.size();
            }
            auto value = trim_copy(raw.substr(pos, comma - pos));
            if (value.empty()) {
                throw std::runtime_error("Empty value for parameter '" + name + "' at " + location(file, line_no));
            }
            values.push_back(std::move(value));
            pos = comma + 1;
        }
        grid.axis_values(std::move(name), std::move(values));
    } catch (const std::invalid_argument& ex) {
        throw std::runtime_error(std::string(ex.what()) + " at " + location(file, line_no));
    }
}

}  // namespace

namespace golden::bridge {

std::vector<OracleDeclaration> DeclarationLoader::load(const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw std::runtime_error("Declaration file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw std::runtime_error("Declaration path is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open declaration file: " + file.string());
    }

    std::string id_prefix = file.stem().string();
    if (id_prefix.empty()) {
        id_prefix = file.filename().string();
    }

    std::vector<OracleDeclaration> declarations;
    OracleDeclaration current;
    bool touched = false;
    std::size_t block_line = 0;

    auto push_current = [&]() {
        if (!touched) {
            return;
        }
        if (current.module.empty()) {
            throw std::runtime_error("Declaration without 'module' at " + location(file, block_line));
        }
        if (current.test_name.empty()) {
            current.test_name = id_prefix + "#" + std::to_string(declarations.size() + 1);
        }
        declarations.emplace_back(std::move(current));
        current = OracleDeclaration{};
        touched = false;
    };

    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;

        const auto trimmed = trim_copy(raw_line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        if (trimmed == "---") {
            push_current();
            continue;
        }

        const auto delimiter = trimmed.find('=');
        if (delimiter == std::string::npos) {
            throw std::runtime_error("Expected 'key=value' entry at " + location(file, line_no));
        }

        auto key = trim_copy(std::string_view{trimmed}.substr(0, delimiter));
        auto value = trim_copy(std::string_view{trimmed}.substr(delimiter + 1));

        if (key.empty()) {
            throw std::runtime_error("Empty key at " + location(file, line_no));
        }

        if (!touched) {
            block_line = line_no;
        }
        touched = true;

        if (key == "test") {
            current.test_name = std::move(value);
        } else if (key == "module") {
            if (value.empty()) {
                throw std::runtime_error("Empty module name at " + location(file, line_no));
            }
            current.module = std::move(value);
        } else if (key.rfind(kParamPrefix, 0) == 0) {
            auto name = key.substr(kParamPrefix.size());
            if (name.empty()) {
                throw std::runtime_error("Empty parameter name at " + location(file, line_no));
            }
            add_axis(current.grid, std::move(name), value, file, line_no);
        } else {
            throw std::runtime_error("Unknown key '" + key + "' at " + location(file, line_no));
        }
    }

    push_current();
    return declarations;
}

std::vector<OracleDeclaration> DeclarationLoader::load_directory(const std::filesystem::path& root) const {
    if (!std::filesystem::exists(root)) {
        throw std::runtime_error("Declaration root does not exist: " + root.string());
    }

    if (!std::filesystem::is_directory(root)) {
        return load(root);
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            files.emplace_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());

    std::vector<OracleDeclaration> declarations;
    for (const auto& path : files) {
        auto loaded = load(path);
        std::move(loaded.begin(), loaded.end(), std::back_inserter(declarations));
    }
    return declarations;
}

}  // namespace golden::bridge
