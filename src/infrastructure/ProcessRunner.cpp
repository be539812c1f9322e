/**
 * @file ProcessRunner.cpp
 * @brief Implementation of ProcessRunner (POSIX).
 */

#include "infrastructure/ProcessRunner.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <iostream>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace docingest::infrastructure {

namespace {

constexpr int kExecFailedExitCode = 127;

void CloseIfOpen(int& fd) {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

} // namespace

bool ProcessRunner::HasTool(const std::string& tool) {
    if (tool.empty()) return false;
    if (tool.find('/') != std::string::npos) {
        return access(tool.c_str(), X_OK) == 0;
    }
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return false;

    std::stringstream dirs(pathEnv);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::filesystem::path candidate = std::filesystem::path(dir) / tool;
        if (access(candidate.c_str(), X_OK) == 0) return true;
    }
    return false;
}

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv, std::chrono::seconds timeout) {
    ProcessResult result;
    if (argv.empty()) return result;

    // Built before fork(): the child of a multithreaded parent must not allocate.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    // Close-on-exec so helpers forked concurrently by other workers never inherit these ends.
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (pipe2(outPipe, O_CLOEXEC) != 0 || pipe2(errPipe, O_CLOEXEC) != 0) {
        std::cerr << "[ProcessRunner] Failed to create pipes: " << std::strerror(errno) << std::endl;
        CloseIfOpen(outPipe[0]);
        CloseIfOpen(outPipe[1]);
        CloseIfOpen(errPipe[0]);
        CloseIfOpen(errPipe[1]);
        return result;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "[ProcessRunner] Failed to fork: " << std::strerror(errno) << std::endl;
        CloseIfOpen(outPipe[0]);
        CloseIfOpen(outPipe[1]);
        CloseIfOpen(errPipe[0]);
        CloseIfOpen(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        close(outPipe[0]);
        close(outPipe[1]);
        close(errPipe[0]);
        close(errPipe[1]);
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }

        execvp(args[0], args.data());
        _exit(kExecFailedExitCode);
    }

    // Parent process
    close(outPipe[1]);
    close(errPipe[1]);
    int outFd = outPipe[0];
    int errFd = errPipe[0];
    result.launched = true;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> buffer{};

    while (outFd != -1 || errFd != -1) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (outFd != -1) fds[count++] = {outFd, POLLIN, 0};
        if (errFd != -1) fds[count++] = {errFd, POLLIN, 0};

        int ready = poll(fds, count, static_cast<int>(std::min<long long>(remaining.count(), 500)));
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[ProcessRunner] poll failed: " << std::strerror(errno) << std::endl;
            break;
        }
        if (ready == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                (fds[i].fd == outFd ? result.out : result.err).append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || (n < 0 && errno != EINTR && errno != EAGAIN)) {
                if (fds[i].fd == outFd) {
                    CloseIfOpen(outFd);
                } else {
                    CloseIfOpen(errFd);
                }
            }
        }
    }

    CloseIfOpen(outFd);
    CloseIfOpen(errFd);

    int status = 0;
    if (result.timedOut) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        std::cerr << "[ProcessRunner] " << argv[0] << " killed after " << timeout.count() << "s" << std::endl;
        return result;
    }

    // Output is closed; give the child until the deadline to exit.
    while (true) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) break;
        if (waited < 0 && errno != EINTR) {
            result.exitCode = -1;
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.timedOut = true;
            return result;
        }
        usleep(10000);
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        if (result.exitCode == kExecFailedExitCode && !HasTool(argv[0])) {
            result.launched = false;
        }
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace docingest::infrastructure
