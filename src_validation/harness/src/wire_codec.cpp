#include "golden_bridge/wire_codec.hpp"
#include "golden_bridge/errors.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

constexpr std::string_view kTrailingWhitespace = " \t\r\f\v";

std::string_view rtrim(std::string_view line) {
    const auto end = line.find_last_not_of(kTrailingWhitespace);
    if (end == std::string_view::npos) {
        return {};
    }
    return line.substr(0, end + 1);
}

// Splits on '\n' and strips trailing whitespace (including '\r') from every line.
std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        lines.push_back(rtrim(text.substr(pos, end - pos)));
        pos = end + 1;
    }
    return lines;
}

void append_joined(std::string& out, const std::vector<std::string>& fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        out += fields[i];
    }
    out.push_back('\n');
}

std::vector<std::string> parse_header(std::string_view line, std::size_t line_no) {
    if (line.empty()) {
        throw golden::bridge::ProtocolError("empty header row", line_no);
    }
    auto columns = golden::bridge::wire::split_fields(line);
    std::set<std::string> seen;
    for (const auto& column : columns) {
        if (column.empty()) {
            throw golden::bridge::ProtocolError("empty column name in header '" + std::string{line} + "'",
                                                line_no);
        }
        if (!seen.insert(column).second) {
            throw golden::bridge::ProtocolError("duplicate column '" + column + "' in header", line_no);
        }
    }
    return columns;
}

std::vector<std::string> parse_row(std::string_view line,
                                   const std::vector<std::string>& columns,
                                   std::size_t line_no) {
    auto fields = golden::bridge::wire::split_fields(line);
    if (fields.size() != columns.size()) {
        throw golden::bridge::ProtocolError("data row has " + std::to_string(fields.size()) +
                                                " fields but header has " + std::to_string(columns.size()),
                                            line_no);
    }
    return fields;
}

}  // namespace

namespace golden::bridge::wire {

std::vector<std::string> split_fields(std::string_view line) {
    std::vector<std::string> fields;
    std::size_t pos = 0;
    while (true) {
        const auto comma = line.find(',', pos);
        if (comma == std::string_view::npos) {
            fields.emplace_back(line.substr(pos));
            break;
        }
        fields.emplace_back(line.substr(pos, comma - pos));
        pos = comma + 1;
    }
    return fields;
}

std::string encode_batch(const RequestSet& requests) {
    std::string out;
    for (const auto& request : requests) {
        out += request.to_wire_line();
        out.push_back('\n');
    }
    return out;
}

std::string encode_csv(const RawTable& table) {
    std::string out;
    append_joined(out, table.columns);
    for (const auto& row : table.rows) {
        append_joined(out, row);
    }
    return out;
}

std::string encode_frame(const Request& request, const RawTable& table) {
    std::string out{kBeginMarker};
    const auto line = request.to_wire_line();
    out += line;
    out.push_back('\n');
    out += encode_csv(table);
    out += kEndMarker;
    out.push_back('\n');
    return out;
}

ResultMap decode_batch(std::string_view output, std::string& diag_out) {
    enum class State { outside, header, rows };

    ResultMap tables;
    State state = State::outside;
    std::optional<Request> current;
    RawTable table;
    std::size_t begin_line = 0;

    const auto lines = split_lines(output);
    for (std::size_t index = 0; index < lines.size(); ++index) {
        const auto line = lines[index];
        const std::size_t line_no = index + 1;

        if (line.rfind("#BEGIN", 0) == 0) {
            if (state != State::outside) {
                throw ProtocolError("nested #BEGIN inside frame opened at line " + std::to_string(begin_line),
                                    line_no);
            }
            if (line.rfind(kBeginMarker, 0) != 0) {
                throw ProtocolError("malformed frame marker '" + std::string{line} + "'", line_no);
            }
            try {
                current = Request::parse_wire_line(line.substr(kBeginMarker.size()));
            } catch (const BridgeError& ex) {
                throw ProtocolError("invalid request in frame marker: " + std::string{ex.what()}, line_no);
            }
            table = RawTable{};
            begin_line = line_no;
            state = State::header;
            continue;
        }

        if (line == kEndMarker) {
            if (state == State::outside) {
                throw ProtocolError("#END without #BEGIN", line_no);
            }
            if (state == State::header) {
                throw ProtocolError("frame for '" + current->to_wire_line() + "' has no header row", line_no);
            }
            const auto wire_line = current->to_wire_line();
            if (!tables.emplace(std::move(*current), std::move(table)).second) {
                throw ProtocolError("duplicate frame for request '" + wire_line + "'", line_no);
            }
            current.reset();
            table = RawTable{};
            state = State::outside;
            continue;
        }

        switch (state) {
            case State::outside:
                if (!line.empty()) {
                    diag_out += "ignored output line " + std::to_string(line_no) + " outside frames: " +
                                std::string{line} + "\n";
                }
                break;
            case State::header:
                if (!line.empty()) {
                    table.columns = parse_header(line, line_no);
                    state = State::rows;
                }
                break;
            case State::rows:
                // Blank lines inside a frame carry no row.
                if (!line.empty()) {
                    table.rows.push_back(parse_row(line, table.columns, line_no));
                }
                break;
        }
    }

    if (state != State::outside) {
        throw ProtocolError("unterminated frame for request '" + current->to_wire_line() + "' opened at line " +
                                std::to_string(begin_line),
                            lines.size());
    }
    return tables;
}

ResultMap decode_batch(std::string_view output) {
    std::string ignored_diag;
    return decode_batch(output, ignored_diag);
}

RawTable decode_single(std::string_view output) {
    const auto lines = split_lines(output);
    std::size_t index = 0;
    while (index < lines.size() && lines[index].empty()) {
        ++index;
    }
    if (index == lines.size()) {
        throw ProtocolError("single-mode output contains no header row", 0);
    }

    RawTable table;
    table.columns = parse_header(lines[index], index + 1);
    for (++index; index < lines.size(); ++index) {
        if (!lines[index].empty()) {
            table.rows.push_back(parse_row(lines[index], table.columns, index + 1));
        }
    }
    return table;
}

}  // namespace golden::bridge::wire
