/*
 * isolated_runner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "isolated_runner.hpp"
#include "config_discovery.hpp"
#include "encoding.hpp"
#include "lifecycle.hpp"
#include "process_spawning.hpp"
#include "stream_pump.hpp"
#include "temp_artifact.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace sandrun::isolated {

ProcessRunner::ProcessRunner(InterpreterConfig interpreter,
                             EnvironmentMap extraEnvironment)
    : interpreter_(std::move(interpreter)),
      extraEnvironment_(std::move(extraEnvironment)) {}

Result<RawExecution> ProcessRunner::run(const ExecutionRequest& request,
                                        const ResourceLimitProfile& limits) const {
    auto interpreterPath = ConfigDiscovery::resolveInterpreter(
        request.interpreterPath.value_or(interpreter_.path));
    if (!interpreterPath) {
        return std::unexpected(interpreterPath.error());
    }

    // Declared before the child so it outlives the reap
    auto artifact = TemporaryArtifact::create(request.sourceText);
    if (!artifact) {
        return std::unexpected(artifact.error());
    }

    SpawnOptions options;
    options.executable = *interpreterPath;
    options.arguments = interpreter_.arguments;
    options.arguments.push_back(artifact->sourcePath().string());
    options.environment = buildChildEnvironment(extraEnvironment_);
    options.workingDirectory = artifact->directory();
    options.limits = limits;
    options.pipeStdin = request.stdinData.has_value();

    std::optional<std::string> stdinText;
    if (request.stdinData) {
        stdinText = sanitizeUtf8(*request.stdinData);
    }

    auto startTime = std::chrono::steady_clock::now();
    auto child = ProcessSpawner::spawn(options);
    if (!child) {
        return std::unexpected(child.error());
    }

    ProcessLifecycle lifecycle(*child);
    auto captured = StreamPump::pump(lifecycle.child(), stdinText,
                                     limits.wallClockTimeout(), limits.maxOutputBytes());
    if (!captured) {
        return std::unexpected(captured.error());
    }

    auto status = lifecycle.reap();
    lifecycle.cleanup();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    if (!status) {
        return std::unexpected(status.error());
    }

    RawExecution raw;
    raw.exitCode = captured->timedOut ? std::nullopt : status->exitCode;
    raw.termSignal = status->termSignal;
    raw.stdoutBytes = std::move(captured->stdoutBytes);
    raw.stderrBytes = std::move(captured->stderrBytes);
    raw.timedOut = captured->timedOut;
    raw.stdoutTruncated = captured->stdoutTruncated;
    raw.stderrTruncated = captured->stderrTruncated;
    raw.elapsed = elapsed;
    raw.timeoutSeconds = static_cast<std::int64_t>(limits.wallClockTimeoutSeconds());

    spdlog::debug("{} finished in {} ms (exit {}, signal {}, timed out {})",
                  interpreterPath->string(), elapsed.count(),
                  raw.exitCode ? std::to_string(*raw.exitCode) : "-",
                  raw.termSignal ? std::to_string(*raw.termSignal) : "-", raw.timedOut);

    if (!artifact->remove()) {
        spdlog::warn("Temporary artifact left behind at {}",
                     artifact->directory().string());
    }
    return raw;
}

}  // namespace sandrun::isolated
