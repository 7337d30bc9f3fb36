#include "golden_bridge/result_table.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace golden::bridge {

std::optional<std::size_t> RawTable::column_index(std::string_view column) const {
    const auto it = std::find(columns.begin(), columns.end(), column);
    if (it == columns.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - columns.begin());
}

std::map<std::string, std::string> RawTable::row_map(std::size_t row) const {
    if (row >= rows.size()) {
        throw std::out_of_range("Row index " + std::to_string(row) + " out of range (" +
                                std::to_string(rows.size()) + " rows)");
    }
    std::map<std::string, std::string> mapped;
    const auto& fields = rows[row];
    for (std::size_t i = 0; i < columns.size() && i < fields.size(); ++i) {
        mapped.emplace(columns[i], fields[i]);
    }
    return mapped;
}

}  // namespace golden::bridge
