/*
 * limits.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "limits.hpp"

#include <spdlog/spdlog.h>

#include <limits>
#include <optional>

namespace sandrun::isolated {

namespace {
constexpr std::uint64_t BYTES_PER_MB = 1024ULL * 1024;
constexpr std::uint64_t MAX_MEMORY_MB =
    std::numeric_limits<std::uint64_t>::max() / BYTES_PER_MB;

// Missing keys yield the fallback; negative or non-integer values yield nullopt
std::optional<std::uint64_t> readCount(const nlohmann::json& j, const char* key,
                                       std::uint64_t fallback) {
    auto it = j.find(key);
    if (it == j.end()) {
        return fallback;
    }
    if (!it->is_number_integer() ||
        (!it->is_number_unsigned() && it->get<std::int64_t>() < 0)) {
        spdlog::warn("Resource limit '{}' must be a non-negative integer, got {}",
                     key, it->dump());
        return std::nullopt;
    }
    return it->get<std::uint64_t>();
}
}  // namespace

Result<ResourceLimitProfile> ResourceLimitProfile::create(
    std::uint64_t cpuSeconds, std::uint64_t memoryBytes,
    std::uint64_t maxOutputBytes, std::uint64_t maxOpenFiles,
    std::uint64_t wallClockTimeoutSeconds) {
    if (cpuSeconds == 0 || memoryBytes == 0 || maxOutputBytes == 0 ||
        maxOpenFiles == 0 || wallClockTimeoutSeconds == 0) {
        spdlog::warn("Rejected resource limit profile with a zero ceiling");
        return std::unexpected(RunnerError::InvalidConfiguration);
    }

    ResourceLimitProfile profile;
    profile.cpuSeconds_ = cpuSeconds;
    profile.memoryBytes_ = memoryBytes;
    profile.maxOutputBytes_ = maxOutputBytes;
    profile.maxOpenFiles_ = maxOpenFiles;
    profile.wallClockTimeoutSeconds_ = wallClockTimeoutSeconds;
    return profile;
}

ResourceLimitProfile ResourceLimitProfile::defaults() noexcept {
    return ResourceLimitProfile{};
}

ResourceLimitProfile ResourceLimitProfile::quick() noexcept {
    ResourceLimitProfile profile;
    profile.cpuSeconds_ = 2;
    profile.memoryBytes_ = 64 * BYTES_PER_MB;
    profile.maxOutputBytes_ = 1 * BYTES_PER_MB;
    profile.maxOpenFiles_ = 64;
    profile.wallClockTimeoutSeconds_ = 2;
    return profile;
}

ResourceLimitProfile ResourceLimitProfile::generous() noexcept {
    ResourceLimitProfile profile;
    profile.cpuSeconds_ = 30;
    profile.memoryBytes_ = 512 * BYTES_PER_MB;
    profile.maxOutputBytes_ = 64 * BYTES_PER_MB;
    profile.maxOpenFiles_ = 1024;
    profile.wallClockTimeoutSeconds_ = 30;
    return profile;
}

Result<ResourceLimitProfile> ResourceLimitProfile::withCpuSeconds(
    std::uint64_t value) const {
    return create(value, memoryBytes_, maxOutputBytes_, maxOpenFiles_,
                  wallClockTimeoutSeconds_);
}

Result<ResourceLimitProfile> ResourceLimitProfile::withMemoryBytes(
    std::uint64_t value) const {
    return create(cpuSeconds_, value, maxOutputBytes_, maxOpenFiles_,
                  wallClockTimeoutSeconds_);
}

Result<ResourceLimitProfile> ResourceLimitProfile::withMemoryMB(
    std::uint64_t value) const {
    if (value > MAX_MEMORY_MB) {
        spdlog::warn("Rejected memory limit of {} MiB: exceeds {} MiB", value,
                     MAX_MEMORY_MB);
        return std::unexpected(RunnerError::InvalidConfiguration);
    }
    return withMemoryBytes(value * BYTES_PER_MB);
}

Result<ResourceLimitProfile> ResourceLimitProfile::withMaxOutputBytes(
    std::uint64_t value) const {
    return create(cpuSeconds_, memoryBytes_, value, maxOpenFiles_,
                  wallClockTimeoutSeconds_);
}

Result<ResourceLimitProfile> ResourceLimitProfile::withMaxOpenFiles(
    std::uint64_t value) const {
    return create(cpuSeconds_, memoryBytes_, maxOutputBytes_, value,
                  wallClockTimeoutSeconds_);
}

Result<ResourceLimitProfile> ResourceLimitProfile::withWallClockTimeoutSeconds(
    std::uint64_t value) const {
    return create(cpuSeconds_, memoryBytes_, maxOutputBytes_, maxOpenFiles_,
                  value);
}

nlohmann::json ResourceLimitProfile::toJson() const {
    return {
        {"cpuSeconds", cpuSeconds_},
        {"memoryBytes", memoryBytes_},
        {"maxOutputBytes", maxOutputBytes_},
        {"maxOpenFiles", maxOpenFiles_},
        {"wallClockTimeoutSeconds", wallClockTimeoutSeconds_}
    };
}

Result<ResourceLimitProfile> ResourceLimitProfile::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::unexpected(RunnerError::InvalidConfiguration);
    }

    try {
        ResourceLimitProfile base;
        std::optional<std::uint64_t> memoryBytes = base.memoryBytes_;
        if (j.contains("memoryBytes")) {
            memoryBytes = readCount(j, "memoryBytes", base.memoryBytes_);
        } else if (j.contains("memoryMB")) {
            auto memoryMB = readCount(j, "memoryMB", 0);
            if (memoryMB && *memoryMB > MAX_MEMORY_MB) {
                spdlog::warn("Rejected memory limit of {} MiB: exceeds {} MiB",
                             *memoryMB, MAX_MEMORY_MB);
                return std::unexpected(RunnerError::InvalidConfiguration);
            }
            memoryBytes = memoryMB.transform(
                [](std::uint64_t mb) { return mb * BYTES_PER_MB; });
        }

        auto cpuSeconds = readCount(j, "cpuSeconds", base.cpuSeconds_);
        auto maxOutputBytes = readCount(j, "maxOutputBytes", base.maxOutputBytes_);
        auto maxOpenFiles = readCount(j, "maxOpenFiles", base.maxOpenFiles_);
        auto wallClock = readCount(j, "wallClockTimeoutSeconds",
                                   base.wallClockTimeoutSeconds_);
        if (!memoryBytes || !cpuSeconds || !maxOutputBytes || !maxOpenFiles ||
            !wallClock) {
            return std::unexpected(RunnerError::InvalidConfiguration);
        }

        return create(*cpuSeconds, *memoryBytes, *maxOutputBytes, *maxOpenFiles,
                      *wallClock);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Invalid resource limit profile: {}", e.what());
        return std::unexpected(RunnerError::InvalidConfiguration);
    }
}

}  // namespace sandrun::isolated
