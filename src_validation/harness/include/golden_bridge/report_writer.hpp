#pragma once

#include "session_report.hpp"

#include <filesystem>

namespace golden::bridge {

/**
 * \brief Emits machine-readable and human-friendly reports for golden sessions.
 *
 * - write_summary(): JSON document with session counters, per-request status and the typed
 *   reference rows of every resolved request.
 * - write_detailed(): HTML report with a tabular view of the outcomes.
 */
class ReportWriter {
public:
    ReportWriter() = default;

    void write_summary(const std::filesystem::path& destination, const SessionReport& report) const;

    void write_detailed(const std::filesystem::path& destination, const SessionReport& report) const;
};

}  // namespace golden::bridge
