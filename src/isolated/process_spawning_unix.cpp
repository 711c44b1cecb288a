/*
 * process_spawning_unix.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef _WIN32

#include "process_spawning.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandrun::isolated {

namespace {

// Used only when RLIMIT_NOFILE is unlimited; matches the kernel's default nr_open
constexpr long UNLIMITED_FD_BOUND = 1L << 20;

struct ChildLimit {
    int resource;
    rlim_t value;
    rlim_t hardValue;
    const char* warning;
};

void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

bool makePipe(int fds[2]) {
    if (::pipe(fds) != 0) {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Only async-signal-safe calls are allowed in the helpers below.
void childWarn(const char* message) {
    auto len = std::strlen(message);
    while (::write(STDERR_FILENO, message, len) < 0 && errno == EINTR) {
    }
}

[[noreturn]] void childFail(int errorPipe, int error) {
    while (::write(errorPipe, &error, sizeof(error)) < 0 && errno == EINTR) {
    }
    ::_exit(127);
}

std::vector<ChildLimit> computeLimits(const ResourceLimitProfile& limits) {
    auto cpu = static_cast<rlim_t>(limits.cpuSeconds());
    auto memory = static_cast<rlim_t>(limits.memoryBytes());
    auto fileSize = static_cast<rlim_t>(limits.maxOutputBytes());
    auto files = static_cast<rlim_t>(limits.maxOpenFiles());

    struct rlimit inherited{};
    if (::getrlimit(RLIMIT_NOFILE, &inherited) == 0 &&
        inherited.rlim_max != RLIM_INFINITY) {
        files = std::min(files, inherited.rlim_max);
    }

    // CPU hard limit one second past the soft one: SIGXCPU first, then SIGKILL
    return {
        {RLIMIT_CPU, cpu, cpu + 1, "[warn] could not apply CPU time limit\n"},
        {RLIMIT_AS, memory, memory, "[warn] could not apply memory limit\n"},
        {RLIMIT_FSIZE, fileSize, fileSize, "[warn] could not apply file size limit\n"},
        {RLIMIT_NOFILE, files, files, "[warn] could not apply open file limit\n"},
    };
}

// Descriptors opened before the soft limit was lowered may sit above it
long inheritedFdBound() {
    struct rlimit current{};
    if (::getrlimit(RLIMIT_NOFILE, &current) != 0 ||
        current.rlim_max == RLIM_INFINITY) {
        return UNLIMITED_FD_BOUND;
    }
    return static_cast<long>(current.rlim_max);
}

// Closes every descriptor from 3 upwards except keepFd. Runs in the child.
void closeInheritedFds(int keepFd, long fdBound) {
#ifdef SYS_close_range
    bool closed = true;
    if (keepFd > 3) {
        closed = ::syscall(SYS_close_range, 3U,
                           static_cast<unsigned>(keepFd - 1), 0U) == 0;
    }
    if (closed && ::syscall(SYS_close_range, static_cast<unsigned>(keepFd + 1),
                            ~0U, 0U) == 0) {
        return;
    }
#endif
    for (long fd = 3; fd < fdBound; ++fd) {
        if (fd != keepFd) {
            ::close(static_cast<int>(fd));
        }
    }
}

std::vector<char*> toArgv(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

}  // namespace

Result<ChildProcess> ProcessSpawner::spawn(const SpawnOptions& options) {
    ignoreSigpipeOnce();

    // Everything the child needs is built before fork()
    std::vector<std::string> argStrings;
    argStrings.push_back(options.executable.string());
    argStrings.insert(argStrings.end(), options.arguments.begin(),
                      options.arguments.end());
    auto envStrings = toEnvironmentEntries(options.environment);
    auto argv = toArgv(argStrings);
    auto envp = toArgv(envStrings);
    auto executable = options.executable.string();
    auto workingDirectory = options.workingDirectory.string();
    auto childLimits = computeLimits(options.limits);

    long fdBound = inheritedFdBound();

    int stdinPipe[2] = {-1, -1};
    int stdoutPipe[2] = {-1, -1};
    int stderrPipe[2] = {-1, -1};
    int errorPipe[2] = {-1, -1};
    int nullFd = -1;

    auto closeAll = [&] {
        for (int* p : {stdinPipe, stdoutPipe, stderrPipe, errorPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
        closeFd(nullFd);
    };

    if ((options.pipeStdin && !makePipe(stdinPipe)) || !makePipe(stdoutPipe) ||
        !makePipe(stderrPipe) || !makePipe(errorPipe)) {
        spdlog::error("Failed to create child pipes: {}", std::strerror(errno));
        closeAll();
        return std::unexpected(RunnerError::PipeCreationFailed);
    }

    if (!options.pipeStdin) {
        nullFd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (nullFd < 0) {
            spdlog::error("Failed to open /dev/null: {}", std::strerror(errno));
            closeAll();
            return std::unexpected(RunnerError::PipeCreationFailed);
        }
    }
    int childStdin = options.pipeStdin ? stdinPipe[0] : nullFd;

    pid_t pid = ::fork();
    if (pid < 0) {
        spdlog::error("Fork failed: {}", std::strerror(errno));
        closeAll();
        return std::unexpected(RunnerError::ProcessSpawnFailed);
    }

    if (pid == 0) {
        // Child process
        ::setpgid(0, 0);

        struct sigaction defaultAction{};
        defaultAction.sa_handler = SIG_DFL;
        sigemptyset(&defaultAction.sa_mask);
        sigaction(SIGPIPE, &defaultAction, nullptr);

        sigset_t mask;
        sigemptyset(&mask);
        sigprocmask(SIG_SETMASK, &mask, nullptr);

        if (::dup2(childStdin, STDIN_FILENO) < 0 ||
            ::dup2(stdoutPipe[1], STDOUT_FILENO) < 0 ||
            ::dup2(stderrPipe[1], STDERR_FILENO) < 0) {
            childFail(errorPipe[1], errno);
        }

        if (!workingDirectory.empty() && ::chdir(workingDirectory.c_str()) != 0) {
            childFail(errorPipe[1], errno);
        }

        for (const auto& limit : childLimits) {
            struct rlimit value{limit.value, limit.hardValue};
            if (::setrlimit(limit.resource, &value) != 0) {
                childWarn(limit.warning);
            }
        }

        closeInheritedFds(errorPipe[1], fdBound);

        ::execve(executable.c_str(), argv.data(), envp.data());
        childFail(errorPipe[1], errno);
    }

    // Parent process. Either side may win the setpgid race; EACCES means
    // the child already exec'd with its own group in place.
    if (::setpgid(pid, pid) != 0 && errno != EACCES) {
        spdlog::debug("setpgid({}) from parent failed: {}", pid,
                      std::strerror(errno));
    }

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);
    closeFd(errorPipe[1]);
    closeFd(nullFd);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(errorPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        closeAll();
        spdlog::error("Failed to exec {}: {}", executable, std::strerror(childErrno));
        if (childErrno == ENOENT || childErrno == EACCES) {
            return std::unexpected(RunnerError::InterpreterNotFound);
        }
        return std::unexpected(RunnerError::ProcessSpawnFailed);
    }

    ChildProcess child;
    child.processId = static_cast<int>(pid);
    child.stdinFd = stdinPipe[1];
    child.stdoutFd = stdoutPipe[0];
    child.stderrFd = stderrPipe[0];

    spdlog::debug("Spawned {} with PID {}", executable, pid);
    return child;
}

bool ProcessSpawner::killProcessTree(const ChildProcess& child) {
    if (child.processId <= 0) {
        return false;
    }
    if (::killpg(static_cast<pid_t>(child.processId), SIGKILL) == 0) {
        return true;
    }
    // Group already empty, or setpgid never took effect
    return ::kill(static_cast<pid_t>(child.processId), SIGKILL) == 0;
}

Result<ExitStatus> ProcessSpawner::reap(ChildProcess& child) {
    if (child.processId <= 0) {
        return std::unexpected(RunnerError::CommunicationError);
    }

    int status = 0;
    struct rusage usage{};
    pid_t result;
    do {
        result = ::wait4(static_cast<pid_t>(child.processId), &status, 0, &usage);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        spdlog::error("wait4({}) failed: {}", child.processId, std::strerror(errno));
        return std::unexpected(RunnerError::CommunicationError);
    }

    spdlog::debug("Reaped PID {} (user {}.{:06}s, sys {}.{:06}s, max RSS {} KiB)",
                  child.processId, usage.ru_utime.tv_sec, usage.ru_utime.tv_usec,
                  usage.ru_stime.tv_sec, usage.ru_stime.tv_usec, usage.ru_maxrss);
    child.processId = -1;

    ExitStatus exitStatus;
    if (WIFEXITED(status)) {
        exitStatus.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exitStatus.termSignal = WTERMSIG(status);
    }
    return exitStatus;
}

void ProcessSpawner::closeStreams(ChildProcess& child) noexcept {
    closeFd(child.stdinFd);
    closeFd(child.stdoutFd);
    closeFd(child.stderrFd);
}

}  // namespace sandrun::isolated

#endif  // !_WIN32
