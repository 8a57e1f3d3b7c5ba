#include "upload_guard/validate/batch_validator.hpp"
#include "upload_guard/common/logger.hpp"
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>
#include <tbb/task_arena.h>
#include <fstream>
#include <algorithm>
#include <limits>
#include <cerrno>
#include <cstring>

namespace upload_guard {
namespace validate {

BatchValidator::BatchValidator(const FileValidator& validator) : validator_(validator) {}

FileReport BatchValidator::validateFile(const std::filesystem::path& path,
                                        const std::optional<std::string>& display_name,
                                        const std::optional<std::string>& claimed_content_type) const {
    FileReport report;
    report.path = path.string();
    report.name = display_name ? *display_name : path.filename().string();

    std::error_code ec;
    uint64_t actual_size = std::filesystem::file_size(path, ec);
    if (ec) {
        report.read_error = ec.message();
        common::Logger::instance().warn("[Batch] Unreadable | path={} | error={}", report.path, ec.message());
        return report;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        report.read_error = std::strerror(errno);
        common::Logger::instance().warn("[Batch] Open failed | path={} | error={}", report.path, *report.read_error);
        return report;
    }

    // Oversized inputs only need enough bytes to trip the size check.
    uint64_t max_size = validator_.config().max_file_size;
    uint64_t read_limit = max_size == std::numeric_limits<uint64_t>::max() ? max_size : max_size + 1;
    uint64_t to_read = std::min<uint64_t>(actual_size, read_limit);

    std::string content(static_cast<size_t>(to_read), '\0');
    if (to_read > 0 && !file.read(&content[0], static_cast<std::streamsize>(to_read))) {
        report.read_error = "short read";
        common::Logger::instance().warn("[Batch] Read failed | path={} | expected={} | got={}",
                                       report.path, to_read, file.gcount());
        return report;
    }

    auto result = validator_.validate(report.name, content, claimed_content_type);
    result.file_size = actual_size;
    report.result = std::move(result);
    return report;
}

std::vector<std::filesystem::path> BatchValidator::collectFiles(const std::filesystem::path& directory,
                                                                const BatchOptions& options,
                                                                int current_depth) {
    std::vector<std::filesystem::path> files;

    if (current_depth > options.max_recursion_depth) {
        common::Logger::instance().warn("[Batch] Depth limit reached | path={}", directory.string());
        return files;
    }

    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(directory, ec);
         it != std::filesystem::directory_iterator();
         it.increment(ec)) {

        if (ec) {
            common::Logger::instance().warn("[Batch] Directory entry skipped | path={} | error={}",
                                           directory.string(), ec.message());
            ec.clear();
            continue;
        }

        if (std::filesystem::is_symlink(it->path(), ec)) {
            continue;
        }

        if (std::filesystem::is_directory(it->path(), ec)) {
            if (options.recursive) {
                auto nested = collectFiles(it->path(), options, current_depth + 1);
                files.insert(files.end(), nested.begin(), nested.end());
            }
        } else if (std::filesystem::is_regular_file(it->path(), ec)) {
            files.push_back(it->path());
        }
    }

    if (ec) {
        common::Logger::instance().error("[Batch] Directory unreadable | path={} | error={}",
                                        directory.string(), ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

BatchSummary BatchValidator::validateDirectory(const std::filesystem::path& directory,
                                               const BatchOptions& options) const {
    auto start_time = std::chrono::steady_clock::now();
    BatchSummary summary;

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        common::Logger::instance().error("[Batch] Invalid directory | path={}", directory.string());
        return summary;
    }

    auto files = collectFiles(directory, options);
    summary.total_files = files.size();
    summary.reports.resize(files.size());

    common::Logger::instance().info("[Batch] Starting | path={} | files={} | recursive={} | threads={}",
                                   directory.string(), files.size(), options.recursive, options.max_threads);

    int threads = std::max(1, options.max_threads);
    tbb::task_arena arena(threads);
    arena.execute([&] {
        tbb::parallel_for(tbb::blocked_range<size_t>(0, files.size()),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i != range.end(); ++i) {
                    summary.reports[i] = validateFile(files[i], std::nullopt, options.claimed_content_type);
                }
            });
    });

    for (const auto& report : summary.reports) {
        updateCounters(summary, report);
    }

    summary.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    common::Logger::instance().info("[Batch] Complete | files={} | accepted={} | rejected={} | unreadable={} | time_ms={}",
                                   summary.total_files, summary.accepted, summary.rejected,
                                   summary.unreadable, summary.total_time.count());
    return summary;
}

void BatchValidator::updateCounters(BatchSummary& summary, const FileReport& report) {
    if (!report.result) {
        summary.unreadable++;
        return;
    }
    if (report.result->is_valid) {
        summary.accepted++;
        if (!report.result->warnings.empty()) {
            summary.warned++;
        }
    } else {
        summary.rejected++;
    }
}

}}
