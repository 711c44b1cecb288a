/*
 * stream_pump_unix.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef _WIN32

#include "exit_notifier.hpp"
#include "stream_pump.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace sandrun::isolated {

namespace {

using Clock = std::chrono::steady_clock;

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int pollTimeout(Clock::time_point now, Clock::time_point limit) {
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(limit - now).count() + 1;
    return static_cast<int>(std::min<long long>(remaining, INT_MAX));
}

}  // namespace

Result<CapturedStreams> StreamPump::pump(ChildProcess& child,
                                         const std::optional<std::string>& stdinData,
                                         std::chrono::milliseconds timeout,
                                         std::uint64_t maxOutputBytes) {
    auto notifier = ExitNotifier::watch(child.processId);
    if (!notifier) {
        ProcessSpawner::killProcessTree(child);
        return std::unexpected(notifier.error());
    }
    spdlog::debug("Watching PID {} via {}", child.processId,
                  notifier->usesPidfd() ? "pidfd" : "watcher thread");

    BoundedBuffer out(maxOutputBytes);
    BoundedBuffer err(maxOutputBytes);
    std::vector<char> chunk(CHUNK_SIZE);

    std::string_view pending = stdinData ? std::string_view(*stdinData) : std::string_view{};
    if (child.stdinFd >= 0) {
        if (pending.empty()) {
            closeFd(child.stdinFd);
        } else {
            int flags = ::fcntl(child.stdinFd, F_GETFL);
            if (flags < 0 || ::fcntl(child.stdinFd, F_SETFL, flags | O_NONBLOCK) < 0) {
                spdlog::warn("Cannot make child stdin non-blocking: {}",
                             std::strerror(errno));
            }
        }
    }

    auto readInto = [&chunk](int& fd, BoundedBuffer& buffer) {
        ssize_t n = ::read(fd, chunk.data(), chunk.size());
        if (n > 0) {
            buffer.append(chunk.data(), static_cast<std::size_t>(n));
        } else if (n == 0) {
            closeFd(fd);
        } else if (errno != EINTR && errno != EAGAIN) {
            spdlog::debug("Read from child pipe failed: {}", std::strerror(errno));
            closeFd(fd);
        }
    };

    auto writePending = [&pending](int& fd) {
        ssize_t n = ::write(fd, pending.data(), pending.size());
        if (n > 0) {
            pending.remove_prefix(static_cast<std::size_t>(n));
            if (pending.empty()) {
                closeFd(fd);
            }
        } else if (n < 0 && errno != EINTR && errno != EAGAIN) {
            // EPIPE: the child stopped reading, the rest is dropped
            spdlog::debug("Write to child stdin stopped: {}", std::strerror(errno));
            closeFd(fd);
        }
    };

    bool exited = false;
    bool timedOut = false;
    const auto deadline = Clock::now() + timeout;
    std::optional<Clock::time_point> drainDeadline;

    while (child.stdoutFd >= 0 || child.stderrFd >= 0 || !exited) {
        auto now = Clock::now();
        auto limit = drainDeadline.value_or(deadline);

        if (now >= limit) {
            if (drainDeadline) {
                spdlog::debug("Drain grace elapsed for PID {}, output may be incomplete",
                              child.processId);
                break;
            }
            timedOut = true;
            spdlog::warn("PID {} exceeded {} ms wall-clock limit, killing process group",
                         child.processId, timeout.count());
            ProcessSpawner::killProcessTree(child);
            closeFd(child.stdinFd);
            drainDeadline = now + DRAIN_GRACE;
            continue;
        }

        pollfd fds[4];
        nfds_t count = 0;
        int outIndex = -1, errIndex = -1, inIndex = -1, exitIndex = -1;
        if (child.stdoutFd >= 0) {
            outIndex = static_cast<int>(count);
            fds[count++] = {child.stdoutFd, POLLIN, 0};
        }
        if (child.stderrFd >= 0) {
            errIndex = static_cast<int>(count);
            fds[count++] = {child.stderrFd, POLLIN, 0};
        }
        if (child.stdinFd >= 0) {
            inIndex = static_cast<int>(count);
            fds[count++] = {child.stdinFd, POLLOUT, 0};
        }
        if (!exited) {
            exitIndex = static_cast<int>(count);
            fds[count++] = {notifier->fd(), POLLIN, 0};
        }

        int ready = ::poll(fds, count, pollTimeout(now, limit));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll() failed while watching PID {}: {}", child.processId,
                          std::strerror(errno));
            ProcessSpawner::killProcessTree(child);
            return std::unexpected(RunnerError::CommunicationError);
        }
        if (ready == 0) {
            continue;
        }

        constexpr short DONE = POLLIN | POLLHUP | POLLERR | POLLNVAL;
        if (outIndex >= 0 && (fds[outIndex].revents & DONE)) {
            readInto(child.stdoutFd, out);
        }
        if (errIndex >= 0 && (fds[errIndex].revents & DONE)) {
            readInto(child.stderrFd, err);
        }
        if (inIndex >= 0) {
            if (fds[inIndex].revents & POLLOUT) {
                writePending(child.stdinFd);
            } else if (fds[inIndex].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                closeFd(child.stdinFd);
            }
        }
        if (exitIndex >= 0 && (fds[exitIndex].revents & DONE)) {
            exited = true;
            // Leftover group members would keep the pipes open
            ProcessSpawner::killProcessTree(child);
            closeFd(child.stdinFd);
            drainDeadline = Clock::now() + DRAIN_GRACE;
        }
    }

    if (out.truncated() || err.truncated()) {
        spdlog::info("Output of PID {} truncated at {} bytes per stream",
                     child.processId, maxOutputBytes);
    }

    CapturedStreams captured;
    captured.stdoutTruncated = out.truncated();
    captured.stderrTruncated = err.truncated();
    captured.stdoutBytes = out.release();
    captured.stderrBytes = err.release();
    captured.timedOut = timedOut;
    return captured;
}

}  // namespace sandrun::isolated

#endif  // !_WIN32
