/*
 * engine_process.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-04

Description: Engine process implementation (fork/exec, process groups)

**************************************************/

#include "engine_process.hpp"

#include "exceptions.hpp"
#include "process_reaper.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace wayfarer::supervisor {

namespace {

constexpr std::size_t READ_CHUNK = 4096;
constexpr std::size_t MAX_LINE_LENGTH = 64 * 1024;
constexpr auto WAIT_POLL_INTERVAL = std::chrono::milliseconds(20);

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

auto isExecutableFile(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) &&
           ::access(path.c_str(), X_OK) == 0;
}

auto decodeWaitStatus(int status) -> int {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

auto EngineProcess::resolveExecutable(const std::filesystem::path& executable)
    -> std::optional<std::filesystem::path> {
    if (executable.empty()) {
        return std::nullopt;
    }

    if (executable.string().find('/') != std::string::npos) {
        if (isExecutableFile(executable)) {
            std::error_code ec;
            auto absolute = std::filesystem::absolute(executable, ec);
            return ec ? executable : absolute;
        }
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    std::string searchPath = pathEnv != nullptr ? pathEnv : "/usr/bin:/bin";

    std::size_t start = 0;
    while (start <= searchPath.size()) {
        auto end = searchPath.find(':', start);
        if (end == std::string::npos) {
            end = searchPath.size();
        }
        std::filesystem::path dir =
            searchPath.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }
        auto candidate = dir / executable;
        if (isExecutableFile(candidate)) {
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

auto EngineProcess::spawn(const ProcessConfig& config)
    -> std::unique_ptr<EngineProcess> {
    auto resolved = resolveExecutable(config.executable);
    if (!resolved) {
        throw LaunchError(fmt::format("executable not found: {}",
                                      config.executable.string()));
    }

    std::string workDir;
    if (config.workingDirectory) {
        std::error_code ec;
        if (!std::filesystem::is_directory(*config.workingDirectory, ec)) {
            throw LaunchError(fmt::format("working directory does not exist: {}",
                                          config.workingDirectory->string()));
        }
        workDir = config.workingDirectory->string();
    }

    // Everything the child touches is prepared before fork
    std::string program = resolved->string();
    std::vector<std::string> argStore;
    argStore.reserve(config.arguments.size() + 1);
    argStore.push_back(config.executable.string());
    argStore.insert(argStore.end(), config.arguments.begin(),
                    config.arguments.end());

    std::vector<std::string> envStore;
    for (char** entry = environ; entry != nullptr && *entry != nullptr;
         ++entry) {
        std::string_view var(*entry);
        auto key = var.substr(0, var.find('='));
        if (!config.environment.contains(std::string(key))) {
            envStore.emplace_back(var);
        }
    }
    for (const auto& [key, value] : config.environment) {
        envStore.push_back(key + "=" + value);
    }

    std::vector<char*> argv;
    for (auto& arg : argStore) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& var : envStore) {
        envp.push_back(var.data());
    }
    envp.push_back(nullptr);

    int outPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        throw LaunchError(fmt::format("pipe failed: {}", strerror(errno)));
    }
    if (::pipe2(statusPipe, O_CLOEXEC) != 0) {
        int err = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        throw LaunchError(fmt::format("pipe failed: {}", strerror(err)));
    }

    const char* workDirPath = workDir.empty() ? nullptr : workDir.c_str();

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(statusPipe[0]);
        closeFd(statusPipe[1]);
        throw LaunchError(fmt::format("fork failed: {}", strerror(err)));
    }

    if (pid == 0) {
        ::setpgid(0, 0);

        sigset_t mask;
        sigemptyset(&mask);
        ::sigprocmask(SIG_SETMASK, &mask, nullptr);

        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(outPipe[1], STDERR_FILENO);

        if (workDirPath != nullptr && ::chdir(workDirPath) != 0) {
            int err = errno;
            [[maybe_unused]] auto written =
                ::write(statusPipe[1], &err, sizeof(err));
            ::_exit(127);
        }

        ::execve(program.c_str(), argv.data(), envp.data());

        int err = errno;
        [[maybe_unused]] auto written =
            ::write(statusPipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    closeFd(outPipe[1]);
    closeFd(statusPipe[1]);

    // Both sides set the group so signals never race the child's setpgid
    ::setpgid(pid, pid);

    int childErrno = 0;
    ssize_t bytes;
    do {
        bytes = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
    } while (bytes < 0 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (bytes == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        closeFd(outPipe[0]);
        throw LaunchError(fmt::format("failed to execute {}: {}", program,
                                      strerror(childErrno)));
    }

    std::unique_ptr<EngineProcess> process(new EngineProcess(pid, outPipe[0]));
    if (!ProcessReaper::instance().track(pid)) {
        spdlog::warn("Process reaper is full, pid {} will not be cleaned up "
                     "at exit",
                     pid);
    }

    spdlog::info("Started engine process {}: {}", pid,
                 CommandBuilder::toString(config));
    return process;
}

EngineProcess::EngineProcess(pid_t pid, int outputFd)
    : pid_(pid),
      outputFd_(outputFd),
      startTime_(std::chrono::steady_clock::now()) {}

EngineProcess::~EngineProcess() {
    if (!exitCode()) {
        kill();
    }
    closeFd(outputFd_);
    ProcessReaper::instance().untrack(pid_);
}

auto EngineProcess::readLine(std::string& line,
                             std::chrono::milliseconds timeout) -> ReadStatus {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            line.assign(buffer_, 0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return ReadStatus::Line;
        }

        if (buffer_.size() >= MAX_LINE_LENGTH ||
            (eof_ && !buffer_.empty())) {
            line = std::move(buffer_);
            buffer_.clear();
            return ReadStatus::Line;
        }
        if (eof_) {
            return ReadStatus::Closed;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        pollfd pfd{outputFd_, POLLIN, 0};
        int ret = ::poll(&pfd, 1,
                         static_cast<int>(std::max<long long>(0, remaining.count())));
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll on engine output failed: {}", strerror(errno));
            eof_ = true;
            continue;
        }
        if (ret == 0) {
            return ReadStatus::Timeout;
        }

        char chunk[READ_CHUNK];
        ssize_t bytes = ::read(outputFd_, chunk, sizeof(chunk));
        if (bytes > 0) {
            buffer_.append(chunk, static_cast<std::size_t>(bytes));
        } else if (bytes == 0) {
            eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            spdlog::error("read on engine output failed: {}", strerror(errno));
            eof_ = true;
        }
    }
}

void EngineProcess::recordExit(int status) {
    exitCode_ = decodeWaitStatus(status);
    ProcessReaper::instance().untrack(pid_);
    spdlog::debug("Engine process {} exited with code {}", pid_, *exitCode_);
}

auto EngineProcess::poll() -> std::optional<int> {
    std::lock_guard lock(exitMutex_);
    if (exitCode_) {
        return exitCode_;
    }

    // Peek first so the group id stays reserved while stragglers are killed
    siginfo_t info{};
    if (::waitid(P_PID, static_cast<id_t>(pid_), &info,
                 WEXITED | WNOHANG | WNOWAIT) != 0 ||
        info.si_pid == 0) {
        return std::nullopt;
    }
    ::kill(-pid_, SIGKILL);

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);
    if (result == pid_) {
        recordExit(status);
    } else {
        exitCode_ = -1;
        ProcessReaper::instance().untrack(pid_);
    }
    return exitCode_;
}

auto EngineProcess::exitCode() const -> std::optional<int> {
    std::lock_guard lock(exitMutex_);
    return exitCode_;
}

auto EngineProcess::waitFor(std::chrono::milliseconds timeout)
    -> std::optional<int> {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto code = poll()) {
            return code;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
    }
}

auto EngineProcess::terminate(std::chrono::milliseconds grace) -> int {
    if (auto code = poll()) {
        return *code;
    }

    spdlog::info("Terminating engine process {} (grace {}ms)", pid_,
                 grace.count());
    ::kill(-pid_, SIGTERM);

    if (auto code = waitFor(grace)) {
        return *code;
    }

    spdlog::warn("Engine process {} ignored SIGTERM, sending SIGKILL", pid_);
    return kill();
}

auto EngineProcess::kill() -> int {
    std::lock_guard lock(exitMutex_);
    if (exitCode_) {
        return *exitCode_;
    }

    ::kill(-pid_, SIGKILL);

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        recordExit(status);
    } else {
        exitCode_ = 128 + SIGKILL;
        ProcessReaper::instance().untrack(pid_);
    }
    return *exitCode_;
}

}  // namespace wayfarer::supervisor
