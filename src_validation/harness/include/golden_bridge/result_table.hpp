#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "request.hpp"

namespace golden::bridge {

/**
 * \brief Raw tabular output of one request, exactly as emitted by the oracle.
 *
 * Values are untyped strings positionally matched to \a columns; every row carries
 * as many fields as there are columns (the wire codec enforces this). A table with
 * columns but no rows is a valid, empty result.
 */
struct RawTable {
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;

    [[nodiscard]] bool empty() const noexcept { return rows.empty(); }

    /// Position of \a column in the header, if present.
    [[nodiscard]] std::optional<std::size_t> column_index(std::string_view column) const;

    /// Row \a row as a column name -> raw value mapping.
    [[nodiscard]] std::map<std::string, std::string> row_map(std::size_t row) const;

    friend bool operator==(const RawTable&, const RawTable&) = default;
};

/// Decoded oracle output: one raw table per request that produced a frame.
using ResultMap = std::unordered_map<Request, RawTable>;

}  // namespace golden::bridge
