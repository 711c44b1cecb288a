/*
 * process_spawning.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SANDRUN_ISOLATED_PROCESS_SPAWNING_HPP
#define SANDRUN_ISOLATED_PROCESS_SPAWNING_HPP

#include "environment.hpp"
#include "limits.hpp"
#include "types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sandrun::isolated {

/**
 * @brief Everything needed to launch one bounded child
 */
struct SpawnOptions {
    std::filesystem::path executable;       ///< Resolved interpreter binary
    std::vector<std::string> arguments;     ///< argv[1..]
    EnvironmentMap environment;             ///< Complete child environment
    std::filesystem::path workingDirectory; ///< Child cwd
    ResourceLimitProfile limits;
    bool pipeStdin{false};                  ///< Otherwise stdin is the null device
};

/**
 * @brief Handles owned by the parent for one spawned child
 */
struct ChildProcess {
    int processId{-1};
#ifdef _WIN32
    void* processHandle{nullptr};
    void* jobHandle{nullptr};
    void* stdinHandle{nullptr};
    void* stdoutHandle{nullptr};
    void* stderrHandle{nullptr};
#else
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
#endif
};

/**
 * @brief How a reaped child terminated
 */
struct ExitStatus {
    std::optional<int> exitCode;    ///< Set on normal exit
    std::optional<int> termSignal;  ///< Set on signal death
};

/**
 * @brief Platform-independent process spawning interface
 */
class ProcessSpawner {
public:
    /**
     * @brief Spawn a child in its own process group with limits applied
     * @param options Launch description
     * @return Child handles, InterpreterNotFound if exec could not find or
     *         run the binary, PipeCreationFailed or ProcessSpawnFailed
     */
    [[nodiscard]] static Result<ChildProcess> spawn(const SpawnOptions& options);

    /**
     * @brief Kill the child and everything left in its process group/job
     * @return True if a kill was delivered
     */
    static bool killProcessTree(const ChildProcess& child);

    /**
     * @brief Block until the child is reaped
     * @return Exit status, or CommunicationError if waiting failed
     */
    [[nodiscard]] static Result<ExitStatus> reap(ChildProcess& child);

    /**
     * @brief Close every parent-side stream and handle still open
     */
    static void closeStreams(ChildProcess& child) noexcept;
};

}  // namespace sandrun::isolated

#endif  // SANDRUN_ISOLATED_PROCESS_SPAWNING_HPP
