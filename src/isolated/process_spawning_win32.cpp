/*
 * process_spawning_win32.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifdef _WIN32

#include "process_spawning.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <string>
#include <vector>

#include <windows.h>

namespace sandrun::isolated {

namespace {

void closeHandle(void*& handle) noexcept {
    if (handle != nullptr && handle != INVALID_HANDLE_VALUE) {
        CloseHandle(static_cast<HANDLE>(handle));
    }
    handle = nullptr;
}

std::string quoteArgument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
        return arg;
    }
    std::string quoted = "\"";
    std::size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
        } else if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
            quoted += c;
            backslashes = 0;
            continue;
        } else {
            backslashes = 0;
        }
        quoted += c;
    }
    quoted.append(backslashes, '\\');
    quoted += '"';
    return quoted;
}

bool createPipe(HANDLE& readEnd, HANDLE& writeEnd, bool parentReads) {
    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;
    if (!CreatePipe(&readEnd, &writeEnd, &sa, 0)) {
        return false;
    }
    // The parent's end must not leak into the child
    HANDLE parentEnd = parentReads ? readEnd : writeEnd;
    return SetHandleInformation(parentEnd, HANDLE_FLAG_INHERIT, 0) != 0;
}

void warnLimitsOnce() {
    static std::once_flag once;
    std::call_once(once, [] {
        spdlog::warn("CPU, file size and descriptor limits are not enforced on "
                     "Windows; only the wall-clock and job memory limits apply");
    });
}

}  // namespace

Result<ChildProcess> ProcessSpawner::spawn(const SpawnOptions& options) {
    warnLimitsOnce();

    std::string cmdLine = quoteArgument(options.executable.string());
    for (const auto& arg : options.arguments) {
        cmdLine += " " + quoteArgument(arg);
    }

    std::string envBlock;
    for (const auto& entry : toEnvironmentEntries(options.environment)) {
        envBlock += entry;
        envBlock.push_back('\0');
    }
    envBlock.push_back('\0');

    HANDLE stdinRead = nullptr, stdinWrite = nullptr;
    HANDLE stdoutRead = nullptr, stdoutWrite = nullptr;
    HANDLE stderrRead = nullptr, stderrWrite = nullptr;

    auto closeAll = [&] {
        for (HANDLE h : {stdinRead, stdinWrite, stdoutRead, stdoutWrite,
                         stderrRead, stderrWrite}) {
            if (h != nullptr && h != INVALID_HANDLE_VALUE) {
                CloseHandle(h);
            }
        }
    };

    bool pipesOk = createPipe(stdoutRead, stdoutWrite, true) &&
                   createPipe(stderrRead, stderrWrite, true);
    if (pipesOk && options.pipeStdin) {
        pipesOk = createPipe(stdinRead, stdinWrite, false);
    } else if (pipesOk) {
        SECURITY_ATTRIBUTES sa{};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;
        stdinRead = CreateFileA("NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE,
                                &sa, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        pipesOk = stdinRead != INVALID_HANDLE_VALUE;
    }
    if (!pipesOk) {
        spdlog::error("Failed to create child pipes: {}", GetLastError());
        closeAll();
        return std::unexpected(RunnerError::PipeCreationFailed);
    }

    HANDLE job = CreateJobObjectA(nullptr, nullptr);
    if (job == nullptr) {
        spdlog::error("CreateJobObject failed: {}", GetLastError());
        closeAll();
        return std::unexpected(RunnerError::ProcessSpawnFailed);
    }

    JOBOBJECT_EXTENDED_LIMIT_INFORMATION jobLimits{};
    jobLimits.BasicLimitInformation.LimitFlags =
        JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE | JOB_OBJECT_LIMIT_PROCESS_MEMORY;
    jobLimits.ProcessMemoryLimit = static_cast<SIZE_T>(options.limits.memoryBytes());
    if (!SetInformationJobObject(job, JobObjectExtendedLimitInformation, &jobLimits,
                                 sizeof(jobLimits))) {
        spdlog::warn("Failed to apply job limits: {}", GetLastError());
    }

    STARTUPINFOA si;
    PROCESS_INFORMATION pi;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = stdinRead;
    si.hStdOutput = stdoutWrite;
    si.hStdError = stderrWrite;
    ZeroMemory(&pi, sizeof(pi));

    std::string workingDirectory = options.workingDirectory.string();
    if (!CreateProcessA(
            nullptr,
            cmdLine.data(),
            nullptr,
            nullptr,
            TRUE,  // Inherit the three std handles
            CREATE_NO_WINDOW | CREATE_SUSPENDED,
            envBlock.data(),
            workingDirectory.empty() ? nullptr : workingDirectory.c_str(),
            &si,
            &pi)) {
        DWORD error = GetLastError();
        spdlog::error("CreateProcess failed for {}: {}", options.executable.string(),
                      error);
        CloseHandle(job);
        closeAll();
        if (error == ERROR_FILE_NOT_FOUND || error == ERROR_PATH_NOT_FOUND ||
            error == ERROR_ACCESS_DENIED) {
            return std::unexpected(RunnerError::InterpreterNotFound);
        }
        return std::unexpected(RunnerError::ProcessSpawnFailed);
    }

    if (!AssignProcessToJobObject(job, pi.hProcess)) {
        spdlog::error("AssignProcessToJobObject failed: {}", GetLastError());
        TerminateProcess(pi.hProcess, 1);
        WaitForSingleObject(pi.hProcess, INFINITE);
        CloseHandle(pi.hThread);
        CloseHandle(pi.hProcess);
        CloseHandle(job);
        closeAll();
        return std::unexpected(RunnerError::ProcessSpawnFailed);
    }
    ResumeThread(pi.hThread);
    CloseHandle(pi.hThread);

    // Child-side ends belong to the child now
    CloseHandle(stdinRead);
    CloseHandle(stdoutWrite);
    CloseHandle(stderrWrite);

    ChildProcess child;
    child.processId = static_cast<int>(pi.dwProcessId);
    child.processHandle = pi.hProcess;
    child.jobHandle = job;
    child.stdinHandle = stdinWrite;
    child.stdoutHandle = stdoutRead;
    child.stderrHandle = stderrRead;

    spdlog::debug("Spawned {} with PID {}", options.executable.string(),
                  pi.dwProcessId);
    return child;
}

bool ProcessSpawner::killProcessTree(const ChildProcess& child) {
    if (child.jobHandle != nullptr) {
        return TerminateJobObject(static_cast<HANDLE>(child.jobHandle), 1) != 0;
    }
    if (child.processHandle != nullptr) {
        return TerminateProcess(static_cast<HANDLE>(child.processHandle), 1) != 0;
    }
    return false;
}

Result<ExitStatus> ProcessSpawner::reap(ChildProcess& child) {
    if (child.processHandle == nullptr) {
        return std::unexpected(RunnerError::CommunicationError);
    }

    WaitForSingleObject(static_cast<HANDLE>(child.processHandle), INFINITE);

    DWORD exitCode = 0;
    bool ok = GetExitCodeProcess(static_cast<HANDLE>(child.processHandle), &exitCode) != 0;
    closeHandle(child.processHandle);
    closeHandle(child.jobHandle);
    child.processId = -1;

    if (!ok) {
        spdlog::error("GetExitCodeProcess failed: {}", GetLastError());
        return std::unexpected(RunnerError::CommunicationError);
    }

    ExitStatus exitStatus;
    exitStatus.exitCode = static_cast<int>(exitCode);
    return exitStatus;
}

void ProcessSpawner::closeStreams(ChildProcess& child) noexcept {
    closeHandle(child.stdinHandle);
    closeHandle(child.stdoutHandle);
    closeHandle(child.stderrHandle);
}

}  // namespace sandrun::isolated

#endif  // _WIN32
