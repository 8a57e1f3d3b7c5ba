#include "upload_guard/validate/result_formatter.hpp"
#include "upload_guard/common/logger.hpp"
#include <iomanip>
#include <sstream>

namespace upload_guard {
namespace validate {

nlohmann::json toJson(const ValidationResult& result) {
    nlohmann::json json;

    json["is_valid"] = result.is_valid;
    json["detected_mime"] = result.detected_mime;
    json["file_size"] = result.file_size;
    json["content_hash"] = result.content_hash;
    json["warnings"] = result.warnings;

    if (result.error_message) {
        json["error_message"] = *result.error_message;
    }
    if (result.error_code) {
        json["error_code"] = core::ValidationErrorCodeHelper::toString(*result.error_code);
    }
    if (result.malware_scan_result) {
        json["malware_scan_result"] = *result.malware_scan_result;
    }

    return json;
}

nlohmann::json toJson(const FileReport& report) {
    nlohmann::json json;
    json["path"] = report.path;
    json["name"] = report.name;

    if (report.result) {
        json["result"] = toJson(*report.result);
    }
    if (report.read_error) {
        json["read_error"] = *report.read_error;
    }

    return json;
}

ResultFormatter::ResultFormatter(OutputFormat format) : format_(format) {}

void ResultFormatter::formatReport(const FileReport& report, std::ostream& out) {
    if (format_ == OutputFormat::JSON) {
        // Names and paths are raw filesystem bytes; invalid UTF-8 becomes U+FFFD.
        out << toJson(report).dump(verbose_ ? 2 : -1, ' ', false,
                                   nlohmann::json::error_handler_t::replace) << "\n";
    } else {
        formatTextReport(report, out);
    }
}

void ResultFormatter::formatSummary(const BatchSummary& summary, std::ostream& out) {
    if (format_ == OutputFormat::JSON) {
        formatJsonSummary(summary, out);
    } else {
        formatTextSummary(summary, out);
    }
}

void ResultFormatter::formatTextReport(const FileReport& report, std::ostream& out) {
    if (!report.result) {
        out << colorize("ERROR", "\033[31m") << ": " << report.path;
        if (report.read_error) {
            out << " - " << *report.read_error;
        }
        out << "\n";
        return;
    }

    const auto& result = *report.result;

    if (result.is_valid) {
        const char* color = result.warnings.empty() ? "\033[32m" : "\033[33m";
        out << colorize("ACCEPTED", color) << ": " << report.path;
        out << " (" << result.detected_mime;
        out << ", " << formatFileSize(result.file_size);
        out << ", sha256 " << common::hashPrefix(result.content_hash);
        if (result.malware_scan_result) {
            out << ", scan " << *result.malware_scan_result;
        }
        out << ")";
    } else {
        out << colorize("REJECTED", "\033[31m") << ": " << report.path;
        if (result.error_message) {
            out << " - " << *result.error_message;
        }
        if (verbose_ && result.error_code) {
            out << " [" << core::ValidationErrorCodeHelper::toString(*result.error_code) << "]";
        }
    }
    out << "\n";

    for (const auto& warning : result.warnings) {
        out << "  " << colorize("warning", "\033[33m") << ": " << warning << "\n";
    }

    if (verbose_ && !result.content_hash.empty()) {
        out << "  sha256: " << result.content_hash << "\n";
    }
}

void ResultFormatter::formatTextSummary(const BatchSummary& summary, std::ostream& out) {
    out << "\n" << colorize("-------- VALIDATION SUMMARY --------", "\033[1m") << "\n";

    out << "Files examined: " << summary.total_files << "\n";

    if (summary.accepted > 0) {
        out << "  - " << colorize("Accepted", "\033[32m") << ": " << summary.accepted;
        if (summary.warned > 0) {
            out << " (" << summary.warned << " with warnings)";
        }
        out << "\n";
    }

    if (summary.rejected > 0) {
        out << "  - " << colorize("Rejected", "\033[31m") << ": " << summary.rejected << "\n";
    }

    if (summary.unreadable > 0) {
        out << "  - Unreadable: " << summary.unreadable << "\n";
    }

    uint64_t total_bytes = 0;
    for (const auto& report : summary.reports) {
        if (report.result) {
            total_bytes += report.result->file_size;
        }
    }
    out << "Data examined: " << formatFileSize(total_bytes) << "\n";
    out << "Elapsed: " << formatDuration(summary.total_time) << "\n";
}

void ResultFormatter::formatJsonSummary(const BatchSummary& summary, std::ostream& out) {
    nlohmann::json json;

    json["total_files"] = summary.total_files;
    json["accepted"] = summary.accepted;
    json["rejected"] = summary.rejected;
    json["warned"] = summary.warned;
    json["unreadable"] = summary.unreadable;
    json["total_time_ms"] = summary.total_time.count();

    json["reports"] = nlohmann::json::array();
    for (const auto& report : summary.reports) {
        json["reports"].push_back(toJson(report));
    }

    out << json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

std::string ResultFormatter::colorize(const std::string& text, const std::string& color) {
    if (colors_enabled_) {
        return color + text + "\033[0m";
    }
    return text;
}

std::string ResultFormatter::formatFileSize(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    return oss.str();
}

std::string ResultFormatter::formatDuration(std::chrono::milliseconds ms) {
    auto count = ms.count();

    if (count < 1000) {
        return std::to_string(count) + "ms";
    } else if (count < 60000) {
        return std::to_string(count / 1000) + "." + std::to_string((count % 1000) / 100) + "s";
    }
    auto minutes = count / 60000;
    auto seconds = (count % 60000) / 1000;
    return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
}

}}
