#pragma once

#include <string>
#include <signal.h>

#include "result.hpp"
#include "profile_session.hpp"

// "Sample now": caught by gdb, which dumps the running light threads.
const int SAMPLE_SIGNAL = SIGUSR1;
// "Stop profiling": caught by gdb in attach mode, which detaches and exits.
const int STOP_SIGNAL = SIGUSR2;

// Printed by gdb when the stop catch-point, the last one in the attach script, is armed.
#define ATTACH_READY_MARKER "Catchpoint 2 (signal SIGUSR2)"
// First line of `info proc` output in launch mode.
#define PROCESS_ID_MARKER "process "
// Prefix of every stack sample printed by `info tsoprofile`.
#define PROFILE_TAG "PROFILE;"
// Prefix of the lines `info tsoprofile` prints when a stack cannot be read.
#define CAPABILITY_ERROR_TAG "error:"

struct ScriptOptions {
    // Collapse consecutive identical frames (recursion).
    bool uniq_frames = false;
    // Keep unresolved and RTS (stg_*) frames.
    bool verbose_frames = false;
};

std::string generate_script(ProfileMode mode, const std::string& plugin_path, const ScriptOptions& options);
Status write_script(const std::string& path, const std::string& script);
