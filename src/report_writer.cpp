#include "core/report_writer.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>
#include <map>

namespace fs = std::filesystem;

namespace
{
    bool prepareParent(const std::string &file_path)
    {
        fs::path parent = fs::path(file_path).parent_path();
        if (parent.empty())
            return true;

        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec)
        {
            Logger::error("Cannot create directory " + parent.string() + ": " + ec.message());
            return false;
        }
        return true;
    }

    void printSection(std::ostream &out, const std::string &title, const std::vector<IssueRecord> &issues,
                      IssueSeverity severity)
    {
        std::map<std::string, size_t> per_type;
        for (const auto &issue : issues)
        {
            if (issue.severity == severity)
                ++per_type[IssueCategories::getDisplayName(issue.category)];
        }
        if (per_type.empty())
            return;

        out << title << ":\n";
        for (const auto &[type, count] : per_type)
        {
            out << "  " << type << ": " << count << "\n";
        }
        for (const auto &issue : issues)
        {
            if (issue.severity != severity)
                continue;
            out << "  - " << (issue.path.empty() ? std::string("(volume)") : issue.path) << ": "
                << issue.description << "\n";
        }
    }
}

std::string ReportWriter::escapeCsvField(const std::string &field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos)
        return field;

    std::string escaped = "\"";
    for (char c : field)
    {
        if (c == '"')
            escaped += '"';
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

void ReportWriter::writeCsv(std::ostream &out, const std::vector<IssueRecord> &issues)
{
    out << CSV_HEADER << "\r\n";
    for (const auto &issue : issues)
    {
        // Info records stay in the JSON report and the console summary
        if (issue.severity == IssueSeverity::Info)
            continue;
        out << escapeCsvField(issue.path) << ','
            << escapeCsvField(IssueCategories::getDisplayName(issue.category)) << ','
            << IssueCategories::getSeverityName(issue.severity) << ','
            << escapeCsvField(issue.description) << "\r\n";
    }
}

bool ReportWriter::writeCsvFile(const std::string &file_path, const ScanReport &report)
{
    if (!prepareParent(file_path))
        return false;

    std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
    {
        Logger::error("Cannot open CSV report for writing: " + file_path);
        return false;
    }

    writeCsv(file, report.issues);
    file.flush();
    if (!file)
    {
        Logger::error("Failed to write CSV report: " + file_path);
        return false;
    }

    Logger::info("CSV report written to " + file_path + " (" +
                 std::to_string(report.summary.errors + report.summary.warnings) + " rows)");
    return true;
}

nlohmann::json ReportWriter::toJson(const ScanReport &report)
{
    nlohmann::json volume;
    volume["filesystem"] = VolumeInspector::getFilesystemName(report.volume.filesystem);
    volume["filesystem_name"] = report.volume.filesystem_name;
    volume["partition_scheme"] = VolumeInspector::getPartitionSchemeName(report.volume.partition_scheme);
    if (report.volume.cluster_size_bytes)
        volume["cluster_size_bytes"] = *report.volume.cluster_size_bytes;
    else
        volume["cluster_size_bytes"] = nullptr;

    const ScanSummary &s = report.summary;
    nlohmann::json summary;
    summary["total_files"] = s.total_files;
    summary["files_discovered"] = s.files_discovered;
    summary["files_processed"] = s.files_processed;
    summary["files_failed"] = s.files_failed;
    summary["files_skipped"] = s.files_skipped;
    summary["audio_files"] = s.audio_files;
    summary["directories"] = s.directories;
    summary["worker_count"] = s.worker_count;
    summary["cancelled"] = s.cancelled;
    summary["elapsed_ms"] = s.elapsed_ms;
    summary["errors"] = s.errors;
    summary["warnings"] = s.warnings;
    summary["infos"] = s.infos;

    nlohmann::json by_extension = nlohmann::json::object();
    for (const auto &[extension, count] : s.files_by_extension)
    {
        by_extension[extension.empty() ? "(none)" : extension] = count;
    }
    summary["files_by_extension"] = by_extension;

    nlohmann::json by_category = nlohmann::json::object();
    for (const auto &[category, count] : s.issues_by_category)
    {
        if (count > 0)
            by_category[IssueCategories::getDisplayName(category)] = count;
    }
    summary["issues_by_type"] = by_category;

    nlohmann::json issues = nlohmann::json::array();
    for (const auto &issue : report.issues)
    {
        issues.push_back({{"file_path", issue.path},
                          {"issue_type", IssueCategories::getDisplayName(issue.category)},
                          {"severity", IssueCategories::getSeverityName(issue.severity)},
                          {"description", issue.description}});
    }

    nlohmann::json root;
    root["volume"] = volume;
    root["summary"] = summary;
    root["issues"] = issues;
    return root;
}

bool ReportWriter::writeJsonFile(const std::string &file_path, const ScanReport &report)
{
    if (!prepareParent(file_path))
        return false;

    std::ofstream file(file_path, std::ios::trunc);
    if (!file.is_open())
    {
        Logger::error("Cannot open JSON report for writing: " + file_path);
        return false;
    }

    try
    {
        // Names on FAT drives are often Latin-1, not UTF-8
        file << toJson(report).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error("Failed to serialize JSON report " + file_path + ": " + e.what());
        return false;
    }
    file.flush();
    if (!file)
    {
        Logger::error("Failed to write JSON report: " + file_path);
        return false;
    }

    Logger::info("JSON report written to " + file_path);
    return true;
}

void ReportWriter::printSummary(std::ostream &out, const ScanReport &report)
{
    const ScanSummary &s = report.summary;

    out << "Volume: " << VolumeInspector::getFilesystemName(report.volume.filesystem) << ", "
        << VolumeInspector::getPartitionSchemeName(report.volume.partition_scheme) << ", cluster size "
        << (report.volume.cluster_size_bytes ? std::to_string(*report.volume.cluster_size_bytes) + " bytes"
                                             : std::string("unknown"))
        << "\n";
    out << "Files: " << s.total_files << " (" << s.audio_files << " audio) in " << s.directories
        << " folders, " << s.files_processed << " analyzed";
    if (s.files_failed > 0)
        out << ", " << s.files_failed << " unreadable";
    if (s.files_skipped > 0)
        out << ", " << s.files_skipped << " skipped";
    out << "\n";
    if (s.cancelled)
        out << "Scan was cancelled before all files were analyzed\n";
    out << "\n";

    printSection(out, "ERRORS (" + std::to_string(s.errors) + ")", report.issues, IssueSeverity::Error);
    printSection(out, "WARNINGS (" + std::to_string(s.warnings) + ")", report.issues, IssueSeverity::Warning);

    if (s.errors == 0 && s.warnings == 0)
        out << "No compatibility problems found\n";
    else if (s.errors == 0)
        out << "No errors, the drive should play; review the warnings above\n";
    else
        out << "The drive has " << s.errors << " error(s) that will prevent playback\n";
}
