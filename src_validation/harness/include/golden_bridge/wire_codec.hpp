#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "request.hpp"
#include "result_table.hpp"

namespace golden::bridge::wire {

inline constexpr std::string_view kBeginMarker = "#BEGIN dump=";
inline constexpr std::string_view kEndMarker = "#END";

/**
 * \brief Renders the oracle's batch input: one wire line per request, newline terminated.
 */
[[nodiscard]] std::string encode_batch(const RequestSet& requests);

/**
 * \brief Renders a table as unframed CSV (header row followed by data rows).
 *
 * No quoting is performed; values must not contain commas or line breaks.
 */
[[nodiscard]] std::string encode_csv(const RawTable& table);

/**
 * \brief Wraps a table in a batch frame echoing the request in canonical order.
 * \code{.txt}
 * #BEGIN dump=<module> <key>=<value> ...
 * <header-row>
 * <data-row>*
 * #END
 * \endcode
 */
[[nodiscard]] std::string encode_frame(const Request& request, const RawTable& table);

/**
 * \brief Decodes framed batch output into one raw table per echoed request.
 *
 * The request line of each #BEGIN marker is parsed and canonicalized, so the oracle
 * may echo arguments in any order. Blank lines are skipped anywhere; other
 * non-frame lines are skipped and reported in \a diag_out.
 *
 * Throws ProtocolError on nested or unterminated frames, a stray #END, a frame without
 * header, a field-count mismatch, or two frames for the same request.
 */
[[nodiscard]] ResultMap decode_batch(std::string_view output, std::string& diag_out);

[[nodiscard]] ResultMap decode_batch(std::string_view output);

/**
 * \brief Decodes the unframed CSV emitted by the oracle's single-request mode.
 */
[[nodiscard]] RawTable decode_single(std::string_view output);

/// Splits one CSV line on commas; no quoting is recognised.
[[nodiscard]] std::vector<std::string> split_fields(std::string_view line);

}  // namespace golden::bridge::wire
