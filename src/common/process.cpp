#include "upload_guard/common/process.hpp"
#include "upload_guard/common/logger.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <thread>
#include <algorithm>

namespace upload_guard {
namespace common {

namespace {

void closeQuietly(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}

ProcessRunner::ProcessRunner(size_t max_output) : max_output_(max_output) {}

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout) const {
    ProcessResult result;
    auto start = std::chrono::steady_clock::now();
    auto deadline = start + timeout;

    if (argv.empty()) {
        result.launch_errno = EINVAL;
        return result;
    }

    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.launch_errno = errno;
        return result;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.launch_errno = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.launch_errno = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        execvp(args[0], args.data());
        int exec_errno = errno;
        ssize_t ignored = ::write(err_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    int read_fd = out_pipe[0];
    int errno_fd = err_pipe[0];
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(errno_fd, &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    closeQuietly(errno_fd);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        closeQuietly(read_fd);
        result.launch_errno = exec_errno;
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return result;
    }

    result.started = true;

    char buffer[4096];
    bool eof = false;
    while (!eof) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }
        int wait_ms = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());

        struct pollfd pfd{read_fd, POLLIN, 0};
        int ready = poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t got = ::read(read_fd, buffer, sizeof(buffer));
        if (got < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (got == 0) {
            eof = true;
            break;
        }
        size_t room = max_output_ > result.output.size() ? max_output_ - result.output.size() : 0;
        result.output.append(buffer, std::min(room, static_cast<size_t>(got)));
    }
    closeQuietly(read_fd);

    int status = 0;
    if (!result.timed_out) {
        while (true) {
            pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                result.exit_code = decodeStatus(status);
                break;
            }
            if (waited < 0 && errno != EINTR) {
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    if (result.timed_out) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        Logger::instance().debug("[Process] Killed after deadline | command={} | timeout_ms={}",
                                argv[0], timeout.count());
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

TempFile::TempFile(const std::string& dir, const std::string& prefix) {
    std::string pattern = dir;
    if (!pattern.empty() && pattern.back() != '/') {
        pattern += '/';
    }
    pattern += prefix + "XXXXXX";

    std::vector<char> tmpl(pattern.begin(), pattern.end());
    tmpl.push_back('\0');

    fd_ = mkostemp(tmpl.data(), O_CLOEXEC);
    if (fd_ < 0) {
        error_ = std::strerror(errno);
        return;
    }
    path_ = tmpl.data();
}

TempFile::~TempFile() {
    closeFd();
    if (!path_.empty()) {
        if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
            Logger::instance().warn("[TempFile] Unlink failed | path={} | error={}",
                                   path_, std::strerror(errno));
        }
    }
}

bool TempFile::write(const uint8_t* data, size_t size) {
    if (fd_ < 0) {
        if (error_.empty()) {
            error_ = "file not open";
        }
        return false;
    }

    size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd_, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            error_ = std::strerror(errno);
            closeFd();
            return false;
        }
        written += static_cast<size_t>(n);
    }

    closeFd();
    return true;
}

void TempFile::closeFd() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}}
