#include "Process.hpp"
#include "Logger.hpp"
#include <csignal>
#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>

static void ignoreSigpipeOnce() {
    static bool done = false;
    if (!done) {
        signal(SIGPIPE, SIG_IGN);
        done = true;
    }
}

bool Process::start() {
    if (argv.empty()) return false;

    // Everything the child touches is prepared before fork.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int outFd = open(logPath.empty() ? "/dev/null" : logPath.c_str(),
                     O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (outFd < 0) {
        logError("Process", name + ": cannot open log " + logPath + ": " + strerror(errno));
        return false;
    }

    int pipeFds[2] = {-1, -1};
    if (pipeStdin) {
        ignoreSigpipeOnce();
        if (pipe2(pipeFds, O_CLOEXEC) != 0) {
            logError("Process", name + ": pipe failed: " + strerror(errno));
            close(outFd);
            return false;
        }
    }

    int nullIn = pipeStdin ? -1 : open("/dev/null", O_RDONLY | O_CLOEXEC);

    pid = fork();
    if (pid == 0) {
        setpgid(0, 0);
        dup2(pipeStdin ? pipeFds[0] : nullIn, STDIN_FILENO);
        dup2(outFd, STDOUT_FILENO);
        dup2(outFd, STDERR_FILENO);
        execvp(args[0], args.data());
        _exit(127);
    }

    close(outFd);
    if (nullIn >= 0) close(nullIn);

    if (pid < 0) {
        logError("Process", name + ": fork failed: " + strerror(errno));
        if (pipeStdin) {
            close(pipeFds[0]);
            close(pipeFds[1]);
        }
        return false;
    }

    if (pipeStdin) {
        close(pipeFds[0]);
        stdinFd = pipeFds[1];
    }
    // Avoid the race where the parent signals the group before the child ran setpgid.
    setpgid(pid, pid);
    reaped = false;
    exitStatus = -1;
    startedAt = std::chrono::steady_clock::now();
    return true;
}

bool Process::isAlive() {
    if (pid <= 0 || reaped) return false;
    int status = 0;
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) {
        exitStatus = status;
        reaped = true;
        closeStdin();
        return false;
    }
    if (r < 0 && errno == ECHILD) {
        reaped = true;
        closeStdin();
        return false;
    }
    return true;
}

void Process::stop(std::chrono::milliseconds grace) {
    closeStdin();
    if (!isAlive()) return;

    kill(-pid, SIGTERM);
    kill(pid, SIGTERM);
    if (waitExit(grace)) return;

    logWarn("Process", name + " (pid " + std::to_string(pid) + ") ignored SIGTERM, killing");
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);

    int status = 0;
    while (true) {
        pid_t r = waitpid(pid, &status, 0);
        if (r == pid) {
            exitStatus = status;
            break;
        }
        if (r < 0 && errno != EINTR) break;
    }
    reaped = true;
}

bool Process::waitExit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (isAlive()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

int Process::exitCode() const {
    if (!reaped || exitStatus < 0) return -1;
    if (WIFEXITED(exitStatus)) return WEXITSTATUS(exitStatus);
    return -1;
}

bool Process::writeStdin(const void* data, size_t len) {
    if (stdinFd < 0) return false;
    const char* p = static_cast<const char*>(data);
    while (len > 0) {
        ssize_t n = write(stdinFd, p, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

void Process::closeStdin() {
    if (stdinFd >= 0) {
        close(stdinFd);
        stdinFd = -1;
    }
}

std::string Process::commandLine() const {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}
