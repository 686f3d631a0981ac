#pragma once

#include <functional>
#include <string>

#include "result.hpp"
#include "debugger.hpp"
#include "flamegraph_exporter.hpp"
#include "profile_session.hpp"
#include "sample_collector.hpp"
#include "sampler.hpp"
#include "script_generator.hpp"

struct ProfileOptions {
    std::string gdb = "gdb";
    std::string plugin;
    ScriptOptions script;
    Renderer renderer;
    std::string output;
    // Empty: no folded copy.
    std::string folded;
    bool debug = false;
};

struct ProfileReport {
    Collection collection;
    bool debugger_reaped = false;
    int debugger_status = 0;
    // False when nothing was sampled; the output path is then left alone.
    bool rendered = false;
};

using HooksFactory = std::function<SamplerHooks(const Debugger&)>;

// Writes the script, starts gdb, samples until the session ends, reaps gdb,
// then collects and exports whatever was sampled.
// Fails only on startup, collection and export errors.
Result<ProfileReport, std::string> run_profile(ProfileSession& session, const ProfileOptions& options, const HooksFactory& make_hooks);
