#pragma once

#include "file_validator.hpp"
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <chrono>

namespace upload_guard {
namespace validate {

struct BatchOptions {
    bool recursive = false;
    int max_threads = 4;
    int max_recursion_depth = 32;
    std::optional<std::string> claimed_content_type;
};

struct FileReport {
    std::string path;
    std::string name;
    std::optional<ValidationResult> result;
    std::optional<std::string> read_error;
};

struct BatchSummary {
    size_t total_files = 0;
    size_t accepted = 0;
    size_t rejected = 0;
    size_t warned = 0;
    size_t unreadable = 0;
    std::chrono::milliseconds total_time{0};
    std::vector<FileReport> reports;
};

class BatchValidator {
public:
    explicit BatchValidator(const FileValidator& validator);

    // The display name drives the extension check; it defaults to the file name.
    FileReport validateFile(const std::filesystem::path& path,
                            const std::optional<std::string>& display_name = std::nullopt,
                            const std::optional<std::string>& claimed_content_type = std::nullopt) const;

    BatchSummary validateDirectory(const std::filesystem::path& directory, const BatchOptions& options) const;

    static std::vector<std::filesystem::path> collectFiles(const std::filesystem::path& directory,
                                                           const BatchOptions& options,
                                                           int current_depth = 0);

private:
    const FileValidator& validator_;

    static void updateCounters(BatchSummary& summary, const FileReport& report);
};

}}
