#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

void redirect(int target_fd, const char* path, int flags) {
    int fd = ::open(path, flags | O_CLOEXEC, 0600);
    if (fd < 0) return;
    ::dup2(fd, target_fd);
    ::close(fd);
}

} // namespace

void daemonize(const std::string& log_path) {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) _exit(1);

    // Second fork: never reacquire a controlling terminal.
    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    ::umask(077);
    if (::chdir("/") < 0) _exit(1);

    redirect(STDIN_FILENO, "/dev/null", O_RDONLY);
    redirect(STDOUT_FILENO, "/dev/null", O_WRONLY);

    if (log_path.empty()) {
        redirect(STDERR_FILENO, "/dev/null", O_WRONLY);
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(log_path).parent_path(), ec);
    redirect(STDERR_FILENO, log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND);
    std::setvbuf(stderr, nullptr, _IOLBF, 0);
}

} // namespace platform
