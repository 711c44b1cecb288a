/*
 * limits.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file limits.hpp
 * @brief Resource limit profile applied to one isolated run
 * @date 2024
 * @version 1.0.0
 */

#ifndef SANDRUN_ISOLATED_LIMITS_HPP
#define SANDRUN_ISOLATED_LIMITS_HPP

#include "types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>

namespace sandrun::isolated {

/**
 * @brief Immutable set of ceilings for one child process
 *
 * The wall-clock timeout and the CPU ceiling are independent triggers;
 * nothing requires one to be larger than the other.
 */
class ResourceLimitProfile {
public:
    static constexpr std::uint64_t DEFAULT_CPU_SECONDS = 5;
    static constexpr std::uint64_t DEFAULT_MEMORY_BYTES = 128ULL * 1024 * 1024;
    static constexpr std::uint64_t DEFAULT_MAX_OUTPUT_BYTES = 16ULL * 1024 * 1024;
    static constexpr std::uint64_t DEFAULT_MAX_OPEN_FILES = 256;
    static constexpr std::uint64_t DEFAULT_WALL_CLOCK_SECONDS = 5;

    /**
     * @brief Constructs the default profile
     */
    ResourceLimitProfile() = default;

    /**
     * @brief Creates a validated profile
     * @return Profile, or InvalidConfiguration if any value is zero
     */
    [[nodiscard]] static Result<ResourceLimitProfile> create(
        std::uint64_t cpuSeconds, std::uint64_t memoryBytes,
        std::uint64_t maxOutputBytes, std::uint64_t maxOpenFiles,
        std::uint64_t wallClockTimeoutSeconds);

    /**
     * @brief Default profile (5 s CPU, 128 MiB, 16 MiB output, 256 fds, 5 s)
     */
    [[nodiscard]] static ResourceLimitProfile defaults() noexcept;

    /**
     * @brief Tight profile for quick checks
     */
    [[nodiscard]] static ResourceLimitProfile quick() noexcept;

    /**
     * @brief Relaxed profile for heavier snippets
     */
    [[nodiscard]] static ResourceLimitProfile generous() noexcept;

    [[nodiscard]] std::uint64_t cpuSeconds() const noexcept { return cpuSeconds_; }
    [[nodiscard]] std::uint64_t memoryBytes() const noexcept { return memoryBytes_; }
    [[nodiscard]] std::uint64_t maxOutputBytes() const noexcept { return maxOutputBytes_; }
    [[nodiscard]] std::uint64_t maxOpenFiles() const noexcept { return maxOpenFiles_; }
    [[nodiscard]] std::uint64_t wallClockTimeoutSeconds() const noexcept {
        return wallClockTimeoutSeconds_;
    }

    /**
     * @brief Wall-clock timeout as a duration
     */
    [[nodiscard]] std::chrono::seconds wallClockTimeout() const noexcept {
        return std::chrono::seconds{wallClockTimeoutSeconds_};
    }

    // Copy-modifiers: each returns a new profile, or InvalidConfiguration
    [[nodiscard]] Result<ResourceLimitProfile> withCpuSeconds(std::uint64_t value) const;
    [[nodiscard]] Result<ResourceLimitProfile> withMemoryBytes(std::uint64_t value) const;
    [[nodiscard]] Result<ResourceLimitProfile> withMemoryMB(std::uint64_t value) const;
    [[nodiscard]] Result<ResourceLimitProfile> withMaxOutputBytes(std::uint64_t value) const;
    [[nodiscard]] Result<ResourceLimitProfile> withMaxOpenFiles(std::uint64_t value) const;
    [[nodiscard]] Result<ResourceLimitProfile> withWallClockTimeoutSeconds(
        std::uint64_t value) const;

    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @brief Reads a profile from JSON, missing keys keep their defaults
     *
     * Memory may be given as "memoryBytes" or "memoryMB"; bytes win when
     * both are present.
     */
    [[nodiscard]] static Result<ResourceLimitProfile> fromJson(const nlohmann::json& j);

    bool operator==(const ResourceLimitProfile&) const = default;

private:
    std::uint64_t cpuSeconds_{DEFAULT_CPU_SECONDS};
    std::uint64_t memoryBytes_{DEFAULT_MEMORY_BYTES};
    std::uint64_t maxOutputBytes_{DEFAULT_MAX_OUTPUT_BYTES};
    std::uint64_t maxOpenFiles_{DEFAULT_MAX_OPEN_FILES};
    std::uint64_t wallClockTimeoutSeconds_{DEFAULT_WALL_CLOCK_SECONDS};
};

}  // namespace sandrun::isolated

#endif  // SANDRUN_ISOLATED_LIMITS_HPP
