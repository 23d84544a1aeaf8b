/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/command.hpp"
#include "quay/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace quay {

namespace {
void appendLimited(std::string& dst, const char* src, ssize_t n, std::size_t limit, bool& truncated) {
    if (n <= 0) {
        return;
    }
    const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
    dst.append(src, take);
    if (take < static_cast<std::size_t>(n)) {
        truncated = true;
    }
}

void drain(int fd, std::string& dst, std::size_t limit, bool& truncated) {
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n <= 0) {
            break;
        }
        appendLimited(dst, buf, n, limit, truncated);
    }
}

void closePipe(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
}

std::string tail(const std::string& text, std::size_t max) {
    return text.size() <= max ? text : "..." + text.substr(text.size() - max);
}
}

CommandHandler::CommandHandler(CommandConfig config) : config_(std::move(config)) {}

HandlerResult CommandHandler::operator()(const Job& job, const CancelToken& token) const {
    HandlerResult result;

    // Everything the child needs is built before fork().
    std::vector<std::string> envs;
    for (char** e = environ; e && *e; ++e) {
        if (std::strncmp(*e, "QUAY_JOB_ID=", 12) != 0 && std::strncmp(*e, "QUAY_ATTEMPT=", 13) != 0) {
            envs.emplace_back(*e);
        }
    }
    envs.push_back("QUAY_JOB_ID=" + job.id);
    envs.push_back("QUAY_ATTEMPT=" + std::to_string(job.currentAttempt()));
    std::vector<char*> envp;
    envp.reserve(envs.size() + 1);
    for (auto& e : envs) envp.push_back(e.data());
    envp.push_back(nullptr);

    std::string shell = config_.shell;
    std::string flag = "-c";
    std::string script = job.payload;
    char* argv[] = {shell.data(), flag.data(), script.data(), nullptr};

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe(outPipe) != 0 || ::pipe(errPipe) != 0) {
        closePipe(outPipe);
        closePipe(errPipe);
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        closePipe(outPipe);
        closePipe(errPipe);
        result.error = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        ::setsid();
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        ::execve(shell.c_str(), argv, envp.data());
        _exit(127);
    }

    ::close(outPipe[1]);
    ::close(errPipe[1]);
    ::fcntl(outPipe[0], F_SETFL, O_NONBLOCK);
    ::fcntl(errPipe[0], F_SETFL, O_NONBLOCK);
    LOG_DEBUG("Job " + job.id + " spawned pid " + std::to_string(pid));

    std::string out;
    std::string err;
    bool outTruncated = false;
    bool errTruncated = false;
    bool terminated = false;
    std::chrono::steady_clock::time_point killAt{};
    int status = 0;
    char buf[4096];

    while (true) {
        ssize_t n = ::read(outPipe[0], buf, sizeof(buf));
        appendLimited(out, buf, n, config_.maxOutputBytes, outTruncated);
        n = ::read(errPipe[0], buf, sizeof(buf));
        appendLimited(err, buf, n, config_.maxOutputBytes, errTruncated);

        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            break;
        }
        if (w < 0 && errno != EINTR) {
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
            closePipe(outPipe);
            closePipe(errPipe);
            return result;
        }

        if (token.cancelled()) {
            const auto now = std::chrono::steady_clock::now();
            if (!terminated) {
                LOG_DEBUG("Cancelling job " + job.id + " (pid " + std::to_string(pid) + ")");
                ::kill(-pid, SIGTERM);
                terminated = true;
                killAt = now + config_.termGrace;
            } else if (now >= killAt) {
                ::kill(-pid, SIGKILL);
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
                break;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    drain(outPipe[0], out, config_.maxOutputBytes, outTruncated);
    drain(errPipe[0], err, config_.maxOutputBytes, errTruncated);
    ::close(outPipe[0]);
    ::close(errPipe[0]);
    if (outTruncated) out += "(truncated)";

    if (terminated) {
        result.error = "cancelled";
        return result;
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        result.ok = true;
        result.output = std::move(out);
        return result;
    }

    if (WIFEXITED(status)) {
        result.error = "exit code " + std::to_string(WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
        result.error = "killed by signal " + std::to_string(WTERMSIG(status));
    } else {
        result.error = "abnormal termination";
    }
    if (!err.empty()) {
        result.error += ": " + tail(err, 2048);
    }
    return result;
}

} // namespace quay
