#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace upload_guard {
namespace common {

struct ProcessResult {
    bool started = false;
    bool timed_out = false;
    int exit_code = -1;
    int launch_errno = 0;
    std::string output;
    std::chrono::milliseconds elapsed{0};
};

// Runs argv[0] (PATH lookup) with stdout and stderr merged into one capture.
// The child runs in its own process group; on deadline the whole group is killed.
class ProcessRunner {
public:
    explicit ProcessRunner(size_t max_output = 64 * 1024);

    ProcessResult run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) const;

private:
    size_t max_output_;
};

// mkstemp-backed file removed when the object goes out of scope.
class TempFile {
public:
    TempFile(const std::string& dir, const std::string& prefix);
    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    bool write(const uint8_t* data, size_t size);

    bool valid() const { return !path_.empty(); }
    const std::string& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::string path_;
    std::string error_;
    int fd_ = -1;

    void closeFd();
};

}}
