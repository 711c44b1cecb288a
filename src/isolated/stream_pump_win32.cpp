/*
 * stream_pump_win32.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifdef _WIN32

#include "stream_pump.hpp"

#include <spdlog/spdlog.h>

#include <functional>
#include <system_error>
#include <thread>
#include <vector>

#include <windows.h>

namespace sandrun::isolated {

namespace {

void readUntilEof(HANDLE handle, BoundedBuffer& buffer) {
    std::vector<char> chunk(StreamPump::CHUNK_SIZE);
    DWORD bytesRead = 0;
    while (ReadFile(handle, chunk.data(), static_cast<DWORD>(chunk.size()), &bytesRead,
                    nullptr) &&
           bytesRead > 0) {
        buffer.append(chunk.data(), bytesRead);
    }
}

void writeAll(HANDLE handle, std::string_view data) {
    while (!data.empty()) {
        DWORD written = 0;
        if (!WriteFile(handle, data.data(), static_cast<DWORD>(data.size()), &written,
                       nullptr)) {
            spdlog::debug("Write to child stdin stopped: {}", GetLastError());
            break;
        }
        data.remove_prefix(written);
    }
    CloseHandle(handle);
}

}  // namespace

Result<CapturedStreams> StreamPump::pump(ChildProcess& child,
                                         const std::optional<std::string>& stdinData,
                                         std::chrono::milliseconds timeout,
                                         std::uint64_t maxOutputBytes) {
    BoundedBuffer out(maxOutputBytes);
    BoundedBuffer err(maxOutputBytes);

    std::thread writer;
    std::thread outReader;
    std::thread errReader;
    try {
        if (child.stdinHandle != nullptr) {
            HANDLE stdinHandle = static_cast<HANDLE>(child.stdinHandle);
            child.stdinHandle = nullptr;
            std::string_view data = stdinData ? std::string_view(*stdinData)
                                              : std::string_view{};
            writer = std::thread(writeAll, stdinHandle, data);
        }
        outReader = std::thread(readUntilEof, static_cast<HANDLE>(child.stdoutHandle),
                                std::ref(out));
        errReader = std::thread(readUntilEof, static_cast<HANDLE>(child.stderrHandle),
                                std::ref(err));
    } catch (const std::system_error& e) {
        spdlog::error("Failed to start pipe threads: {}", e.what());
        ProcessSpawner::killProcessTree(child);
        for (auto* t : {&writer, &outReader, &errReader}) {
            if (t->joinable()) t->join();
        }
        return std::unexpected(RunnerError::CommunicationError);
    }

    DWORD waitResult = WaitForSingleObject(static_cast<HANDLE>(child.processHandle),
                                           static_cast<DWORD>(timeout.count()));
    bool timedOut = waitResult == WAIT_TIMEOUT;
    if (timedOut) {
        spdlog::warn("PID {} exceeded {} ms wall-clock limit, terminating job",
                     child.processId, timeout.count());
    }
    // Leftover job members would keep the pipes open
    ProcessSpawner::killProcessTree(child);

    for (auto* t : {&writer, &outReader, &errReader}) {
        if (t->joinable()) t->join();
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

#endif  // _WIN32
