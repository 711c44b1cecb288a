/*
 * runner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "runner.hpp"
#include "classifier.hpp"
#include "config_discovery.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace sandrun::isolated {

// ============================================================================
// DiagnosticRunner::Impl
// ============================================================================

class DiagnosticRunner::Impl {
public:
    Impl(RunnerConfig config, std::unique_ptr<IsolatedRunner> backend)
        : config_(std::move(config)), backend_(std::move(backend)) {
        if (!backend_) {
            backend_ = std::make_unique<ProcessRunner>(config_.interpreter,
                                                       config_.environment);
        }
    }

    RunnerConfig config_;
    std::unique_ptr<IsolatedRunner> backend_;
};

// ============================================================================
// DiagnosticRunner
// ============================================================================

DiagnosticRunner::DiagnosticRunner()
    : pImpl_(std::make_unique<Impl>(RunnerConfig{}, nullptr)) {}

DiagnosticRunner::DiagnosticRunner(RunnerConfig config)
    : pImpl_(std::make_unique<Impl>(std::move(config), nullptr)) {}

DiagnosticRunner::DiagnosticRunner(RunnerConfig config,
                                   std::unique_ptr<IsolatedRunner> backend)
    : pImpl_(std::make_unique<Impl>(std::move(config), std::move(backend))) {}

DiagnosticRunner::~DiagnosticRunner() = default;

DiagnosticRunner::DiagnosticRunner(DiagnosticRunner&&) noexcept = default;
DiagnosticRunner& DiagnosticRunner::operator=(DiagnosticRunner&&) noexcept = default;

const RunnerConfig& DiagnosticRunner::getConfig() const {
    return pImpl_->config_;
}

const IsolatedRunner& DiagnosticRunner::backend() const {
    return *pImpl_->backend_;
}

ExecutionOutcome DiagnosticRunner::execute(const ExecutionRequest& request) const {
    const auto& limits = request.limits ? *request.limits : pImpl_->config_.limits;

    auto raw = pImpl_->backend_->run(request, limits);
    if (!raw) {
        spdlog::error("Run could not be started on '{}' backend: {}",
                      pImpl_->backend_->name(), runnerErrorToString(raw.error()));
        throw LaunchError(raw.error());
    }

    auto outcome = OutcomeClassifier::classify(std::move(*raw));
    spdlog::info("Run finished: {} in {} ms{}", executionStatusToString(outcome.status),
                 outcome.executionTime.count(),
                 outcome.errorKind ? " (" + *outcome.errorKind + ")" : std::string{});
    return outcome;
}

ExecutionOutcome DiagnosticRunner::executeFile(
    const std::filesystem::path& sourcePath, std::optional<std::string> stdinData,
    std::optional<ResourceLimitProfile> limits) const {
    std::ifstream file(sourcePath, std::ios::binary);
    if (!file) {
        spdlog::error("Cannot open source file {}", sourcePath.string());
        throw LaunchError(RunnerError::SourceNotReadable, sourcePath.string());
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        spdlog::error("Failed to read source file {}", sourcePath.string());
        throw LaunchError(RunnerError::SourceNotReadable, sourcePath.string());
    }

    ExecutionRequest request;
    request.sourceText = content.str();
    request.stdinData = std::move(stdinData);
    request.limits = std::move(limits);
    return execute(request);
}

std::future<ExecutionOutcome> DiagnosticRunner::executeAsync(
    ExecutionRequest request) const {
    return std::async(std::launch::async, [this, request = std::move(request)] {
        return execute(request);
    });
}

Result<void> DiagnosticRunner::validateConfig() const {
    const auto& config = pImpl_->config_;
    for (const auto& [name, value] : config.environment) {
        if (name.empty() || name.find('=') != std::string::npos) {
            spdlog::error("Invalid environment variable name '{}'", name);
            return std::unexpected(RunnerError::InvalidConfiguration);
        }
    }

    auto interpreter = ConfigDiscovery::resolveInterpreter(config.interpreter.path);
    if (!interpreter) {
        return std::unexpected(interpreter.error());
    }
    return {};
}

std::optional<std::filesystem::path> DiagnosticRunner::findInterpreter() {
    return ConfigDiscovery::findPythonExecutable();
}

std::optional<std::string> DiagnosticRunner::getInterpreterVersion() const {
    auto interpreter =
        ConfigDiscovery::resolveInterpreter(pImpl_->config_.interpreter.path);
    if (!interpreter) return std::nullopt;
    return ConfigDiscovery::getInterpreterVersion(*interpreter);
}

// ============================================================================
// RunnerFactory
// ============================================================================

std::unique_ptr<DiagnosticRunner> RunnerFactory::create() {
    return std::make_unique<DiagnosticRunner>();
}

std::unique_ptr<DiagnosticRunner> RunnerFactory::createQuick() {
    RunnerConfig config;
    config.limits = ResourceLimitProfile::quick();
    return std::make_unique<DiagnosticRunner>(std::move(config));
}

std::unique_ptr<DiagnosticRunner> RunnerFactory::createGenerous() {
    RunnerConfig config;
    config.limits = ResourceLimitProfile::generous();
    return std::make_unique<DiagnosticRunner>(std::move(config));
}

std::unique_ptr<DiagnosticRunner> RunnerFactory::create(const RunnerConfig& config) {
    return std::make_unique<DiagnosticRunner>(config);
}

}  // namespace sandrun::isolated
