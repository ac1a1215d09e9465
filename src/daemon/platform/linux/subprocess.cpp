#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv,
            const std::optional<std::string>& input, bool capture_output) {
    if (argv.empty()) return std::unexpected("empty command line");

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};

    if (input && ::pipe2(in_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe()"));
    }
    if (capture_output && ::pipe2(out_pipe, O_CLOEXEC) < 0) {
        auto msg = errno_message("pipe()");
        close_fd(in_pipe[0]);
        close_fd(in_pipe[1]);
        return std::unexpected(msg);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_message("fork()");
        close_fd(in_pipe[0]);
        close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return std::unexpected(msg);
    }

    if (pid == 0) {
        if (input) ::dup2(in_pipe[0], STDIN_FILENO);
        if (capture_output) ::dup2(out_pipe[1], STDOUT_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);

    std::string write_error;
    if (input) {
        size_t total_written = 0;
        while (total_written < input->size()) {
            ssize_t n = ::write(in_pipe[1], input->data() + total_written,
                                input->size() - total_written);
            if (n < 0) {
                if (errno == EINTR) continue;
                write_error = errno_message("write()");
                break;
            }
            total_written += static_cast<size_t>(n);
        }
        close_fd(in_pipe[1]);
    }

    ProcessResult result;
    if (capture_output) {
        char buf[4096];
        while (true) {
            ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (n == 0) break;
            result.output.append(buf, static_cast<size_t>(n));
        }
        close_fd(out_pipe[0]);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid()"));
    }

    if (!write_error.empty()) return std::unexpected(write_error);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }
    return result;
}
