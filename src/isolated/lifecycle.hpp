/*
 * lifecycle.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SANDRUN_ISOLATED_LIFECYCLE_HPP
#define SANDRUN_ISOLATED_LIFECYCLE_HPP

#include "process_spawning.hpp"
#include "types.hpp"

namespace sandrun::isolated {

/**
 * @brief Process lifecycle management
 *
 * Owns one spawned child. If the child has not been reaped when the
 * owner goes away, its whole process tree is killed and reaped, and all
 * parent-side streams are closed.
 */
class ProcessLifecycle {
public:
    explicit ProcessLifecycle(ChildProcess child);
    ~ProcessLifecycle();

    // Non-copyable
    ProcessLifecycle(const ProcessLifecycle&) = delete;
    ProcessLifecycle& operator=(const ProcessLifecycle&) = delete;

    // Movable
    ProcessLifecycle(ProcessLifecycle&&) noexcept;
    ProcessLifecycle& operator=(ProcessLifecycle&&) noexcept;

    /**
     * @brief Get the child's process ID, -1 once reaped
     */
    [[nodiscard]] int getProcessId() const noexcept;

    /**
     * @brief Check if the child still needs reaping
     */
    [[nodiscard]] bool isRunning() const noexcept;

    /**
     * @brief Access the child's handles for I/O
     */
    [[nodiscard]] ChildProcess& child() noexcept { return child_; }

    /**
     * @brief Kill the child's whole process tree
     * @return True if a kill was delivered
     */
    bool kill();

    /**
     * @brief Wait for the child and collect its exit status
     */
    [[nodiscard]] Result<ExitStatus> reap();

    /**
     * @brief Kill and reap if needed, then close every stream
     */
    void cleanup();

private:
    ChildProcess child_;
    bool reaped_{false};
};

}  // namespace sandrun::isolated

#endif  // SANDRUN_ISOLATED_LIFECYCLE_HPP
