#pragma once

#include <string>
#include <vector>

#include <sys/types.h>

#include "result.hpp"

class FdGuard {
    int fd;
public:
    explicit FdGuard(int fd): fd(fd) {}
    FdGuard(const FdGuard&) = delete;
    ~FdGuard();

    int get() const {
        return fd;
    }

    // Closes now instead of at scope exit; for pipe ends whose close is a signal to the reader.
    void reset();
};

struct SpawnOptions {
    std::vector<std::string> argv;
    // Empty keeps the parent's stdout.
    std::string stdout_path;
    bool stderr_to_null = false;
    // -1 keeps the parent's stdin.
    int stdin_fd = -1;
    // Keeps terminal SIGINT, which goes to the foreground process group, away from the child.
    bool new_process_group = false;
};

// Fails when the output file cannot be created or the program cannot be executed.
Result<pid_t, std::string> spawn_process(const SpawnOptions& options);

// Polls without reaping, so a later wait_process still collects the status.
Result<bool, std::string> process_has_exited(pid_t pid);

// Returns the raw wait status.
Result<int, std::string> wait_process(pid_t pid);

std::string describe_wait_status(int status);

Status write_all(int fd, const std::string& data);
