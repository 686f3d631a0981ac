#include <sstream>
#include <string>
#include <utility>
#include <chrono>

#include <errno.h>
#include <limits.h>
#include <math.h>
#include <stdlib.h>

#include <unistd.h>

#include "profile_session.hpp"

using std::string;
using std::to_string;
using std::move;

#define SESSION_FILE_PREFIX "/tmp/ghc-ssp-"

const char* to_string(ProfileMode mode) {
    switch (mode) {
        case ProfileMode::Attach: return "attach";
        case ProfileMode::Launch: return "launch";
    }
    return "unknown";
}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::WaitingReady: return "waiting for readiness";
        case SessionState::WaitingPid: return "waiting for target pid";
        case SessionState::Sampling: return "sampling";
        case SessionState::Done: return "done";
    }
    return "unknown";
}

const char* to_string(StopReason reason) {
    switch (reason) {
        case StopReason::None: return "none";
        case StopReason::Cancelled: return "cancelled";
        case StopReason::TargetLost: return "target exited";
        case StopReason::DebuggerExited: return "debugger exited";
        case StopReason::DurationElapsed: return "duration elapsed";
        case StopReason::ReadyTimeout: return "debugger did not become ready in time";
        case StopReason::SignalFailed: return "signal delivery failed";
    }
    return "unknown";
}

ProfileSession ProfileSession::attach(pid_t pid, double frequency) {
    ProfileSession session;
    session.mode = ProfileMode::Attach;
    session.target_pid = pid;
    session.frequency = frequency;
    session.state = SessionState::WaitingReady;

    string base = string(SESSION_FILE_PREFIX) + to_string(pid);
    session.script_path = base + ".gdb";
    session.session_path = base + ".log";
    return session;
}

ProfileSession ProfileSession::launch(std::vector<std::string> command, double frequency) {
    ProfileSession session;
    session.mode = ProfileMode::Launch;
    session.command = move(command);
    session.frequency = frequency;
    session.state = SessionState::WaitingPid;

    // The target pid is not known before gdb starts it.
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    string base = string(SESSION_FILE_PREFIX) + to_string(now_ms) + "-" + to_string(getpid());
    session.script_path = base + ".gdb";
    session.session_path = base + ".log";
    return session;
}

Result<pid_t, std::string> parse_pid(const std::string& text) {
    char* end = nullptr;
    errno = 0;
    long value = strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || errno == ERANGE || value < 1 || value > INT_MAX) {
        return ResultInit::err("invalid pid '" + text + "', expected 1.." + to_string(INT_MAX));
    }
    return ResultInit::ok(pid_t(value));
}

Result<double, std::string> parse_frequency(const std::string& text) {
    char* end = nullptr;
    double value = strtod(text.c_str(), &end);
    if (text.empty() || *end != '\0' || !isfinite(value) || value < MIN_FREQUENCY || value > MAX_FREQUENCY) {
        std::ostringstream message;
        message << "invalid frequency '" << text << "', expected " << MIN_FREQUENCY << ".." << MAX_FREQUENCY << " Hz";
        return ResultInit::err(message.str());
    }
    return ResultInit::ok(double(value));
}
