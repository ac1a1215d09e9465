#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      ring_buf_(config_.audio.ring_buffer_samples()),
      audio_capture_(ring_buf_),
      keystrokes_(config_.output.paste_shortcut),
      notifier_(config_.ui.show_notifications, verbose_),
      worker_event_fd_(eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)),
      silence_event_fd_(eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)),
      core_(config_, verbose_, audio_capture_, clipboard_, keystrokes_,
            notifier_, ipc_server_,
            // NotifyCallback (worker thread)
            [this]() { signal_event(worker_event_fd_); },
            // SilenceCallback (PipeWire thread)
            [this]() { signal_event(silence_event_fd_); }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
    if (silence_event_fd_ >= 0) ::close(silence_event_fd_);
}

bool LinuxEventLoop::init() {
    if (worker_event_fd_ < 0 || silence_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // Core init (backend, history db)
    if (!core_.init()) return false;

    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    for (int fd : {signal_fd_, ipc_server_.server_fd(), worker_event_fd_, silence_event_fd_}) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                drain_event(worker_event_fd_);
                core_.on_processing_complete();
                continue;
            }

            if (fd == silence_event_fd_) {
                drain_event(silence_event_fd_);
                core_.on_silence_detected();
                continue;
            }

            handle_client(fd);
        }
    }

    core_.shutdown();
    ipc_server_.stop();
}

void LinuxEventLoop::handle_client(int fd) {
    // A client may pipeline several commands in one write.
    for (;;) {
        nlohmann::json cmd;
        switch (ipc_server_.read_command(fd, cmd)) {
            case ReadResult::Incomplete:
                return;
            case ReadResult::Closed:
                drop_client(fd);
                return;
            case ReadResult::Command:
                break;
        }

        auto response = core_.handle_request(cmd);

        if (response.value("status", "") == "processing") {
            core_.add_waiting_client(fd);
        } else if (!ipc_server_.send_response(fd, response)) {
            drop_client(fd);
            return;
        }
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    core_.remove_waiting_client(fd);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::signal_event(int fd) {
    uint64_t val = 1;
    // Only fails when the counter would overflow, which still wakes epoll.
    (void)::write(fd, &val, sizeof(val));
}

void LinuxEventLoop::drain_event(int fd) {
    uint64_t val;
    while (::read(fd, &val, sizeof(val)) > 0) {}
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voicekey] {}", msg);
    }
}
