/*
 * exit_notifier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SANDRUN_ISOLATED_EXIT_NOTIFIER_HPP
#define SANDRUN_ISOLATED_EXIT_NOTIFIER_HPP

#ifndef _WIN32

#include "types.hpp"

#include <thread>

namespace sandrun::isolated {

/**
 * @brief Pollable descriptor that becomes readable when a child exits
 *
 * Uses a pidfd where the kernel provides one. Otherwise a watcher thread
 * blocks in waitid(WNOWAIT) and writes to a pipe. Neither path reaps the
 * child, so its process group stays valid for a later killpg().
 *
 * The watched process must be terminated before the notifier is
 * destroyed, since the watcher thread is joined.
 */
class ExitNotifier {
public:
    /**
     * @brief Starts watching a child process
     * @param processId Child to watch
     * @return Notifier, or PipeCreationFailed
     */
    [[nodiscard]] static Result<ExitNotifier> watch(int processId);

    ~ExitNotifier();

    ExitNotifier(const ExitNotifier&) = delete;
    ExitNotifier& operator=(const ExitNotifier&) = delete;

    ExitNotifier(ExitNotifier&& other) noexcept;
    ExitNotifier& operator=(ExitNotifier&& other) noexcept;

    /**
     * @brief Descriptor to include in poll() with POLLIN
     */
    [[nodiscard]] int fd() const noexcept { return fd_; }

    /**
     * @brief Whether the kernel pidfd path is in use
     */
    [[nodiscard]] bool usesPidfd() const noexcept { return pidfd_; }

private:
    ExitNotifier() = default;
    void release() noexcept;

    int fd_{-1};
    int writeFd_{-1};
    bool pidfd_{false};
    std::thread watcher_;
};

}  // namespace sandrun::isolated

#endif  // !_WIN32

#endif  // SANDRUN_ISOLATED_EXIT_NOTIFIER_HPP
