#pragma once

#include <string>
#include <vector>

#include <sys/types.h>

#include "result.hpp"

struct Debugger {
    pid_t pid = 0;
    std::string session_path;
    bool reaped = false;
};

// gdb attaches to `target_pid`, runs the script, and writes its stdout to `session_path`.
Result<Debugger, std::string> attach_debugger(const std::string& gdb, pid_t target_pid, const std::string& script_path, const std::string& session_path);

// gdb starts `command` itself; the target's pid shows up later in the session file.
Result<Debugger, std::string> launch_debugger(const std::string& gdb, const std::vector<std::string>& command, const std::string& script_path, const std::string& session_path);

Result<bool, std::string> debugger_has_exited(const Debugger& debugger);

// Used when gdb must go away before its stop catch-point is armed.
Status terminate_debugger(const Debugger& debugger);

// Reaps gdb and returns its raw wait status. Must be called exactly once.
Result<int, std::string> wait_debugger(Debugger& debugger);
