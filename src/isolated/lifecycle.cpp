/*
 * lifecycle.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "lifecycle.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace sandrun::isolated {

ProcessLifecycle::ProcessLifecycle(ChildProcess child) : child_(child) {}

ProcessLifecycle::~ProcessLifecycle() {
    cleanup();
}

ProcessLifecycle::ProcessLifecycle(ProcessLifecycle&& other) noexcept
    : child_(std::exchange(other.child_, ChildProcess{})),
      reaped_(std::exchange(other.reaped_, true)) {}

ProcessLifecycle& ProcessLifecycle::operator=(ProcessLifecycle&& other) noexcept {
    if (this != &other) {
        cleanup();
        child_ = std::exchange(other.child_, ChildProcess{});
        reaped_ = std::exchange(other.reaped_, true);
    }
    return *this;
}

int ProcessLifecycle::getProcessId() const noexcept {
    return child_.processId;
}

bool ProcessLifecycle::isRunning() const noexcept {
    return !reaped_ && child_.processId > 0;
}

bool ProcessLifecycle::kill() {
    if (!isRunning()) {
        return false;
    }
    bool delivered = ProcessSpawner::killProcessTree(child_);
    spdlog::debug("Killed process tree of PID {}", child_.processId);
    return delivered;
}

Result<ExitStatus> ProcessLifecycle::reap() {
    if (!isRunning()) {
        return std::unexpected(RunnerError::CommunicationError);
    }
    auto status = ProcessSpawner::reap(child_);
    reaped_ = true;
    return status;
}

void ProcessLifecycle::cleanup() {
    if (isRunning()) {
        kill();
        if (auto status = reap(); !status) {
            spdlog::warn("Failed to reap abandoned child: {}",
                         runnerErrorToString(status.error()));
        }
    }
    ProcessSpawner::closeStreams(child_);
}

}  // namespace sandrun::isolated
