#pragma once

#include "validation_result.hpp"
#include "batch_validator.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <ostream>
#include <chrono>

namespace upload_guard {
namespace validate {

enum class OutputFormat {
    TEXT,
    JSON
};

nlohmann::json toJson(const ValidationResult& result);
nlohmann::json toJson(const FileReport& report);

class ResultFormatter {
public:
    explicit ResultFormatter(OutputFormat format = OutputFormat::TEXT);

    void formatReport(const FileReport& report, std::ostream& out);
    void formatSummary(const BatchSummary& summary, std::ostream& out);

    void setColorsEnabled(bool enabled) { colors_enabled_ = enabled; }
    void setVerbose(bool verbose) { verbose_ = verbose; }

private:
    OutputFormat format_;
    bool colors_enabled_ = true;
    bool verbose_ = false;

    void formatTextReport(const FileReport& report, std::ostream& out);
    void formatTextSummary(const BatchSummary& summary, std::ostream& out);
    void formatJsonSummary(const BatchSummary& summary, std::ostream& out);

    std::string colorize(const std::string& text, const std::string& color);
    std::string formatFileSize(uint64_t bytes);
    std::string formatDuration(std::chrono::milliseconds ms);
};

}}
