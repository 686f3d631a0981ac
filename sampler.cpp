#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include <signal.h>

#include "sampler.hpp"
#include "script_generator.hpp"
#include "signals.hpp"

using std::cerr;
using std::string;

SamplerHooks SamplerHooks::for_debugger(const Debugger& debugger) {
    const Debugger* gdb = &debugger;

    SamplerHooks hooks;
    hooks.send_signal = deliver_signal;
    hooks.debugger_exited = [gdb]() { return debugger_has_exited(*gdb); };
    hooks.terminate_debugger = [gdb]() { return ::terminate_debugger(*gdb); };
    hooks.interrupted = was_interrupted;
    hooks.sleep = [](std::chrono::duration<double> duration) {
        std::this_thread::sleep_for(std::chrono::duration_cast<std::chrono::microseconds>(duration));
    };
    return hooks;
}

static void finish(ProfileSession& session, StopReason reason) {
    session.state = SessionState::Done;
    session.stop_reason = reason;
}

// Ends the session so that gdb exits on its own and can be reaped.
static void shut_down(ProfileSession& session, const SamplerHooks& hooks, StopReason reason) {
    if (session.state != SessionState::Sampling) {
        // Catch-points may not be armed yet: a signal to the target could kill it.
        auto terminated = hooks.terminate_debugger();
        if (!terminated.isOk()) {
            cerr << "Stopping gdb failed: " << terminated.getErrRef() << "\n";
        }
    } else if (session.mode == ProfileMode::Attach) {
        if (!session.stop_signal_sent) {
            session.stop_signal_sent = true;
            auto delivered = hooks.send_signal(session.target_pid, STOP_SIGNAL);
            if (!delivered.isOk()) {
                cerr << "Sending stop signal failed: " << delivered.getErrRef() << "\n";
            }
        }
    } else {
        // The target stops on SIGTERM, which ends the batch gdb session.
        auto delivered = hooks.send_signal(session.target_pid, SIGTERM);
        if (!delivered.isOk()) {
            cerr << "Stopping launched process failed: " << delivered.getErrRef() << "\n";
        }
    }

    finish(session, reason);
}

static bool poll_readiness(ProfileSession& session, SessionLog& log) {
    ++session.polls;
    log.reload();

    if (session.mode == ProfileMode::Attach) {
        return log.contains(ATTACH_READY_MARKER);
    }

    auto pid = log.find_process_id();
    if (pid.has_value()) {
        session.target_pid = *pid;
        return true;
    }
    return false;
}

void run_sampler(ProfileSession& session, SessionLog& log, const SamplerHooks& hooks, bool debug) {
    auto loop_start = std::chrono::steady_clock::now();
    const std::chrono::duration<double> period(1.0 / session.frequency);

    session.state = session.mode == ProfileMode::Attach ? SessionState::WaitingReady : SessionState::WaitingPid;

    while (session.state != SessionState::Done) {
        auto start = std::chrono::steady_clock::now();
        std::chrono::duration<double> running = start - loop_start;

        if (hooks.interrupted()) {
            cerr << "Interrupted while " << to_string(session.state) << ", stopping\n";
            shut_down(session, hooks, StopReason::Cancelled);
            break;
        }

        if (session.duration_seconds > 0 && running >= std::chrono::seconds(session.duration_seconds)) {
            shut_down(session, hooks, StopReason::DurationElapsed);
            break;
        }

        // Checked before every signal: with gdb gone, SIGUSR1 would kill the target.
        auto exited = hooks.debugger_exited();
        if (!exited.isOk()) {
            cerr << "Checking gdb state failed: " << exited.getErrRef() << "\n";
            finish(session, StopReason::DebuggerExited);
            break;
        }
        if (exited.getOkRef()) {
            finish(session, StopReason::DebuggerExited);
            break;
        }

        if (session.state == SessionState::WaitingReady || session.state == SessionState::WaitingPid) {
            if (session.ready_timeout_seconds > 0 && running >= std::chrono::seconds(session.ready_timeout_seconds)) {
                cerr << "gdb did not become ready within " << session.ready_timeout_seconds << " seconds\n";
                shut_down(session, hooks, StopReason::ReadyTimeout);
                break;
            }

            if (poll_readiness(session, log)) {
                session.state = SessionState::Sampling;
                cerr << "gdb is ready, sampling pid " << session.target_pid << " at " << session.frequency << " Hz (Ctrl-C to stop)\n";
            } else if (debug) {
                cerr << "poll " << session.polls << ": gdb not ready\n";
            }
        } else {
            auto delivered = hooks.send_signal(session.target_pid, SAMPLE_SIGNAL);
            if (!delivered.isOk()) {
                cerr << "Sampling failed: " << delivered.getErrRef() << "\n";
                shut_down(session, hooks, StopReason::SignalFailed);
                break;
            }
            if (!delivered.getOkRef()) {
                // Exited between the gdb check and kill()
                finish(session, StopReason::TargetLost);
                break;
            }

            ++session.interrupts_sent;
            if (debug) {
                cerr << "interrupt " << session.interrupts_sent << " sent to pid " << session.target_pid << "\n";
            }
        }

        std::chrono::duration<double> to_sleep = period - (std::chrono::steady_clock::now() - start);
        hooks.sleep(to_sleep.count() > 0 ? to_sleep : std::chrono::duration<double>(0));
    }

    std::chrono::duration<double> total = std::chrono::steady_clock::now() - loop_start;
    session.elapsed_seconds = total.count();
}
