#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/desktop_notifier.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/linux/wayland_clipboard.hpp"
#include "platform/linux/wtype_keystrokes.hpp"
#include "ring_buffer.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void drop_client(int fd);
    static void signal_event(int fd);
    static void drain_event(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    RingBuffer ring_buf_;
    PipeWireCapture audio_capture_;
    WaylandClipboard clipboard_;
    WtypeKeystrokes keystrokes_;
    DesktopNotifier notifier_;
    UnixSocketServer ipc_server_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    int silence_event_fd_ = -1;

    // Portable business logic
    DaemonCore core_;

    std::atomic<bool> running_{false};
};
