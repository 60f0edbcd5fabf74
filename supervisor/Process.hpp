#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <sys/types.h>

// Child process handle. The child runs in its own process group so that a
// stop reaches any helpers it spawned.
struct Process {
    pid_t pid = -1;
    std::string name;
    std::vector<std::string> argv;
    std::string logPath;     // child stdout/stderr; empty -> /dev/null
    bool pipeStdin = false;

    int stdinFd = -1;
    int exitStatus = -1;     // raw waitpid status once reaped
    bool reaped = false;
    std::chrono::steady_clock::time_point startedAt;

    bool start();

    // Reaps with WNOHANG. False once the child has exited.
    bool isAlive();

    // SIGTERM, wait up to grace, SIGKILL, then a blocking waitpid.
    // Returns only once the child is reaped.
    void stop(std::chrono::milliseconds grace = std::chrono::milliseconds(5000));

    // Waits for a one-shot child. False on timeout (child still running).
    bool waitExit(std::chrono::milliseconds timeout);

    // Exit code if exited normally, -1 otherwise.
    int exitCode() const;

    bool writeStdin(const void* data, size_t len);
    void closeStdin();

    std::string commandLine() const;
};
