#include "golden_bridge/report_writer.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using golden::bridge::RequestOutcome;
using golden::bridge::SessionReport;

json value_to_json(const golden::bridge::Value& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        return *integer;
    }
    if (const auto* real = std::get_if<double>(&value)) {
        return *real;
    }
    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag;
    }
    return nullptr;
}

json outcome_to_json(const RequestOutcome& outcome) {
    json rows = json::array();
    for (const auto& record : outcome.records) {
        json row = json::object();
        const auto& columns = record.schema().columns();
        for (std::size_t i = 0; i < columns.size(); ++i) {
            row[columns[i].name] = value_to_json(record.values()[i]);
        }
        rows.push_back(std::move(row));
    }

    return json{
        {"test", outcome.test_name},
        {"request", outcome.wire_line},
        {"status", outcome.status},
        {"message", outcome.message},
        {"columns", outcome.columns},
        {"row_count", outcome.records.size()},
        {"rows", std::move(rows)},
    };
}

json build_summary(const SessionReport& report) {
    json summary = {
        {"state", report.state},
        {"unique_requests", report.unique_requests},
        {"oracle_invocations", report.oracle_invocations},
        {"total", report.outcomes.size()},
        {"by_status", json::object()},
        {"requests", json::array()},
    };

    auto& by_status = summary["by_status"];
    for (const auto& outcome : report.outcomes) {
        summary["requests"].push_back(outcome_to_json(outcome));
        auto& counter = by_status[outcome.status];
        if (!counter.is_number()) {
            counter = 0;
        }
        counter = counter.get<std::size_t>() + 1;
    }

    return summary;
}

std::string escape_html(const std::string& input) {
    std::ostringstream oss;
    for (char ch : input) {
        switch (ch) {
            case '&':
                oss << "&amp;";
                break;
            case '<':
                oss << "&lt;";
                break;
            case '>':
                oss << "&gt;";
                break;
            case '"':
                oss << "&quot;";
                break;
            case '\'':
                oss << "&#39;";
                break;
            default:
                oss << ch;
        }
    }
    return oss.str();
}

std::string records_to_html(const RequestOutcome& outcome) {
    if (outcome.records.empty()) {
        return outcome.status == "PASS" ? "<em>no rows</em>" : std::string{};
    }
    std::ostringstream oss;
    oss << "<table class=\"rows\"><tr>";
    for (const auto& column : outcome.records.front().schema().columns()) {
        oss << "<th>" << escape_html(column.name) << "</th>";
    }
    oss << "</tr>";
    for (const auto& record : outcome.records) {
        oss << "<tr>";
        for (const auto& value : record.values()) {
            oss << "<td>" << escape_html(golden::bridge::to_display_string(value)) << "</td>";
        }
        oss << "</tr>";
    }
    oss << "</table>";
    return oss.str();
}

std::string render_html(const SessionReport& report) {
    std::ostringstream oss;
    oss << "<!DOCTYPE html><html><head><meta charset=\"utf-8\"/>"
        << "<title>Golden Reference Report</title>"
        << "<style>"
        << "body{font-family:system-ui, sans-serif;margin:2rem;}"
        << "table{border-collapse:collapse;width:100%;}"
        << "th,td{border:1px solid #ccc;padding:0.5rem;vertical-align:top;}"
        << "th{background:#f5f5f5;text-align:left;}"
        << "table.rows td,table.rows th{padding:0.2rem;font-size:0.85rem;}"
        << ".status-PASS{color:#0a7c2f;font-weight:bold;}"
        << ".status-MISSING{color:#ff8800;font-weight:bold;}"
        << ".status-SCHEMA_ERROR{color:#c1121f;font-weight:bold;}"
        << "</style></head><body>";

    oss << "<h1>Golden Reference Report</h1>";

    std::map<std::string, std::size_t> counts;
    for (const auto& outcome : report.outcomes) {
        ++counts[outcome.status];
    }

    oss << "<section><h2>Summary</h2><ul>";
    oss << "<li>Collection state: " << escape_html(report.state) << "</li>";
    oss << "<li>Unique oracle requests: " << report.unique_requests << "</li>";
    oss << "<li>Oracle invocations: " << report.oracle_invocations << "</li>";
    oss << "<li>Test invocations: " << report.outcomes.size() << "</li>";
    for (const auto& [status, count] : counts) {
        oss << "<li>" << escape_html(status) << ": " << count << "</li>";
    }
    oss << "</ul></section>";

    oss << "<section><h2>Requests</h2><table>";
    oss << "<thead><tr>"
        << "<th>#</th>"
        << "<th>Test</th>"
        << "<th>Request</th>"
        << "<th>Status</th>"
        << "<th>Message</th>"
        << "<th>Reference rows</th>"
        << "</tr></thead><tbody>";

    for (std::size_t index = 0; index < report.outcomes.size(); ++index) {
        const auto& outcome = report.outcomes[index];
        const auto status_class = "status-" + outcome.status;

        oss << "<tr>";
        oss << "<td>" << (index + 1) << "</td>";
        oss << "<td>" << escape_html(outcome.test_name) << "</td>";
        oss << "<td><code>" << escape_html(outcome.wire_line) << "</code></td>";
        oss << "<td class=\"" << escape_html(status_class) << "\">" << escape_html(outcome.status) << "</td>";
        oss << "<td>" << escape_html(outcome.message) << "</td>";
        oss << "<td>" << records_to_html(outcome) << "</td>";
        oss << "</tr>";
    }

    oss << "</tbody></table></section>";
    oss << "</body></html>";
    return oss.str();
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
}

}  // namespace

namespace golden::bridge {

void ReportWriter::write_summary(const std::filesystem::path& destination, const SessionReport& report) const {
    const json summary = build_summary(report);
    write_file(destination, summary.dump(2));
}

void ReportWriter::write_detailed(const std::filesystem::path& destination, const SessionReport& report) const {
    write_file(destination, render_html(report));
}

}  // namespace golden::bridge
