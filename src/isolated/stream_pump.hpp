/*
 * stream_pump.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file stream_pump.hpp
 * @brief Feeds a child's stdin and collects its output under a deadline
 * @date 2024
 * @version 1.0.0
 */

#ifndef SANDRUN_ISOLATED_STREAM_PUMP_HPP
#define SANDRUN_ISOLATED_STREAM_PUMP_HPP

#include "process_spawning.hpp"
#include "types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sandrun::isolated {

/**
 * @brief Byte buffer that keeps at most a fixed number of bytes
 *
 * Bytes past the ceiling are dropped and the buffer is flagged.
 */
class BoundedBuffer {
public:
    explicit BoundedBuffer(std::uint64_t capacity) : capacity_(capacity) {}

    void append(const char* data, std::size_t size);
    void append(std::string_view data) { append(data.data(), data.size()); }

    [[nodiscard]] const std::string& data() const noexcept { return data_; }
    [[nodiscard]] std::string release() noexcept { return std::move(data_); }
    [[nodiscard]] bool truncated() const noexcept { return truncated_; }
    [[nodiscard]] std::uint64_t capacity() const noexcept { return capacity_; }

private:
    std::string data_;
    std::uint64_t capacity_;
    bool truncated_{false};
};

/**
 * @brief Output captured from one child
 */
struct CapturedStreams {
    std::string stdoutBytes;
    std::string stderrBytes;
    bool stdoutTruncated{false};
    bool stderrTruncated{false};
    bool timedOut{false};
};

/**
 * @brief Runs the I/O race for one child until it exits or times out
 *
 * On return the child is dead or exiting, but not yet reaped.
 */
class StreamPump {
public:
    /// Time allowed to drain pipes after a kill
    static constexpr std::chrono::milliseconds DRAIN_GRACE{500};

    /// Read chunk size
    static constexpr std::size_t CHUNK_SIZE = 64 * 1024;

    /**
     * @brief Pump stdin/stdout/stderr until exit or deadline
     * @param child Spawned child, stdin handle open iff stdinData is set
     * @param stdinData Bytes to write to the child's stdin
     * @param timeout Wall-clock limit measured from this call
     * @param maxOutputBytes Capture ceiling per stream
     * @return Captured streams, or CommunicationError on an I/O failure
     */
    [[nodiscard]] static Result<CapturedStreams> pump(
        ChildProcess& child, const std::optional<std::string>& stdinData,
        std::chrono::milliseconds timeout, std::uint64_t maxOutputBytes);
};

}  // namespace sandrun::isolated

#endif  // SANDRUN_ISOLATED_STREAM_PUMP_HPP
