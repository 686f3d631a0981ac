#pragma once

#include <stdint.h>
#include <string>
#include <vector>

#include <sys/types.h>

#include "result.hpp"

enum class ProfileMode {
    Attach,
    Launch,
};

enum class SessionState {
    WaitingReady,
    WaitingPid,
    Sampling,
    Done,
};

enum class StopReason {
    None,
    Cancelled,
    TargetLost,
    DebuggerExited,
    DurationElapsed,
    ReadyTimeout,
    SignalFailed,
};

const char* to_string(ProfileMode mode);
const char* to_string(SessionState state);
const char* to_string(StopReason reason);

struct ProfileSession {
    ProfileMode mode = ProfileMode::Attach;
    // Known up front in attach mode, read from the session file in launch mode.
    pid_t target_pid = 0;
    std::vector<std::string> command;

    double frequency = 10.0;
    uint32_t duration_seconds = 0;
    uint32_t ready_timeout_seconds = 0;

    std::string script_path;
    std::string session_path;

    SessionState state = SessionState::WaitingReady;
    StopReason stop_reason = StopReason::None;
    uint64_t interrupts_sent = 0;
    uint64_t polls = 0;
    bool stop_signal_sent = false;
    double elapsed_seconds = 0;

    static ProfileSession attach(pid_t pid, double frequency);
    static ProfileSession launch(std::vector<std::string> command, double frequency);
};

// Sampling rates outside this range are rejected on the command line.
const double MIN_FREQUENCY = 0.01;
const double MAX_FREQUENCY = 1000.0;

// A decimal pid in 1..INT_MAX.
Result<pid_t, std::string> parse_pid(const std::string& text);
// A finite rate in Hz within [MIN_FREQUENCY, MAX_FREQUENCY].
Result<double, std::string> parse_frequency(const std::string& text);
