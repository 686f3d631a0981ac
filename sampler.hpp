#pragma once

#include <chrono>
#include <functional>
#include <string>

#include <sys/types.h>

#include "result.hpp"
#include "profile_session.hpp"
#include "session_log.hpp"
#include "debugger.hpp"

// Everything the loop does to the outside world. Tests replace these.
struct SamplerHooks {
    std::function<Result<bool, std::string>(pid_t, int)> send_signal;
    std::function<Result<bool, std::string>()> debugger_exited;
    std::function<Status()> terminate_debugger;
    std::function<bool()> interrupted;
    std::function<void(std::chrono::duration<double>)> sleep;

    static SamplerHooks for_debugger(const Debugger& debugger);
};

// Polls `log` until gdb is ready, then signals the target once per period
// until cancellation, the duration limit, or the end of the target or gdb.
// Never fails: every problem ends the loop and is recorded in session.stop_reason.
void run_sampler(ProfileSession& session, SessionLog& log, const SamplerHooks& hooks, bool debug);
