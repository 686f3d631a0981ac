#pragma once

#include <string>
#include <signal.h>
#include <sys/types.h>

#include "result.hpp"

// ok(false) when the process no longer exists.
Result<bool, std::string> deliver_signal(pid_t pid, int signal_number);

// SIGINT sets a flag polled by the sampling loop instead of killing the profiler.
Status install_interrupt_handler();
bool was_interrupted();
void clear_interrupted();

// A renderer that exits early must surface as a failed exit status, not kill us on write().
class IgnoreSigpipeGuard {
    bool installed = false;
    struct sigaction previous;
public:
    IgnoreSigpipeGuard();
    IgnoreSigpipeGuard(const IgnoreSigpipeGuard&) = delete;
    ~IgnoreSigpipeGuard();
};
