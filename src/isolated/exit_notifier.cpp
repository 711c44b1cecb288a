/*
 * exit_notifier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef _WIN32

#include "exit_notifier.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandrun::isolated {

namespace {

int openPidfd([[maybe_unused]] int processId) {
#if defined(__linux__) && defined(SYS_pidfd_open)
    long fd = ::syscall(SYS_pidfd_open, static_cast<pid_t>(processId), 0);
    if (fd >= 0) {
        ::fcntl(static_cast<int>(fd), F_SETFD, FD_CLOEXEC);
        return static_cast<int>(fd);
    }
    spdlog::debug("pidfd_open unavailable ({}), using watcher thread",
                  std::strerror(errno));
#endif
    return -1;
}

}  // namespace

Result<ExitNotifier> ExitNotifier::watch(int processId) {
    ExitNotifier notifier;

    int pidfd = openPidfd(processId);
    if (pidfd >= 0) {
        notifier.fd_ = pidfd;
        notifier.pidfd_ = true;
        return notifier;
    }

    int fds[2];
    if (::pipe(fds) != 0) {
        spdlog::error("Failed to create exit notification pipe: {}",
                      std::strerror(errno));
        return std::unexpected(RunnerError::PipeCreationFailed);
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    notifier.fd_ = fds[0];
    notifier.writeFd_ = fds[1];

    try {
        int writeFd = fds[1];
        notifier.watcher_ = std::thread([processId, writeFd] {
            siginfo_t info{};
            while (::waitid(P_PID, static_cast<id_t>(processId), &info,
                            WEXITED | WNOWAIT) != 0) {
                if (errno != EINTR) {
                    break;
                }
            }
            char byte = 1;
            while (::write(writeFd, &byte, 1) < 0 && errno == EINTR) {
            }
        });
    } catch (const std::system_error& e) {
        spdlog::error("Failed to start exit watcher thread: {}", e.what());
        return std::unexpected(RunnerError::ProcessSpawnFailed);
    }

    return notifier;
}

ExitNotifier::~ExitNotifier() {
    release();
}

ExitNotifier::ExitNotifier(ExitNotifier&& other) noexcept
    : fd_(other.fd_),
      writeFd_(other.writeFd_),
      pidfd_(other.pidfd_),
      watcher_(std::move(other.watcher_)) {
    other.fd_ = -1;
    other.writeFd_ = -1;
    other.pidfd_ = false;
}

ExitNotifier& ExitNotifier::operator=(ExitNotifier&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        writeFd_ = other.writeFd_;
        pidfd_ = other.pidfd_;
        watcher_ = std::move(other.watcher_);
        other.fd_ = -1;
        other.writeFd_ = -1;
        other.pidfd_ = false;
    }
    return *this;
}

void ExitNotifier::release() noexcept {
    if (watcher_.joinable()) {
        watcher_.join();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (writeFd_ >= 0) {
        ::close(writeFd_);
        writeFd_ = -1;
    }
}

}  // namespace sandrun::isolated

#endif  // !_WIN32
