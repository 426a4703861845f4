#pragma once

#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/issue_record.hpp"
#include "core/scan_coordinator.hpp"

/**
 * @brief Output formats of a finished scan
 *
 * The CSV layout is read back by the remediation tools: columns
 * file_path, issue_type, severity, description in that order, one row per
 * Error or Warning record in report order. Severity is ERROR or WARNING only.
 */
class ReportWriter
{
public:
    static void writeCsv(std::ostream &out, const std::vector<IssueRecord> &issues);

    // Creates missing parent directories. Returns false (and logs) on failure
    static bool writeCsvFile(const std::string &file_path, const ScanReport &report);

    static nlohmann::json toJson(const ScanReport &report);
    // Invalid UTF-8 in paths or descriptions is written as U+FFFD
    static bool writeJsonFile(const std::string &file_path, const ScanReport &report);

    // Human readable summary, errors listed apart from warnings
    static void printSummary(std::ostream &out, const ScanReport &report);

    // RFC 4180: quote when the field holds a comma, quote, CR or LF; double embedded quotes
    static std::string escapeCsvField(const std::string &field);

    static constexpr const char *CSV_HEADER = "file_path,issue_type,severity,description";
};
