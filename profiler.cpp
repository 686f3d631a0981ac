#include <iostream>
#include <string>
#include <utility>

#include "process.hpp"
#include "profiler.hpp"
#include "session_log.hpp"

using std::cerr;
using std::string;
using std::move;

static void print_summary(const Collection& collection) {
    cerr << "Collected " << total_samples(collection.table) << " samples (" << collection.table.size() << " unique stacks";
    if (collection.stats.empty_stacks > 0) {
        cerr << ", " << collection.stats.empty_stacks << " empty";
    }
    if (collection.stats.capability_errors > 0) {
        cerr << ", " << collection.stats.capability_errors << " unreadable";
    }
    cerr << ")\n";
}

Result<ProfileReport, std::string> run_profile(ProfileSession& session, const ProfileOptions& options, const HooksFactory& make_hooks) {
    if (session.mode == ProfileMode::Launch && session.command.empty()) {
        return ResultInit::err("no command to launch");
    }

    auto written = write_script(session.script_path, generate_script(session.mode, options.plugin, options.script));
    if (!written.isOk()) {
        return ResultInit::err("Writing gdb script failed: " + written.getErrRef());
    }

    if (session.mode == ProfileMode::Attach) {
        cerr << "Attaching to pid " << session.target_pid << " (session file: " << session.session_path << ")\n";
    } else {
        cerr << "Launching " << session.command[0] << " under gdb (session file: " << session.session_path << ")\n";
    }

    auto started = session.mode == ProfileMode::Attach
        ? attach_debugger(options.gdb, session.target_pid, session.script_path, session.session_path)
        : launch_debugger(options.gdb, session.command, session.script_path, session.session_path);
    if (!started.isOk()) {
        return ResultInit::err(move(started).getErrRef());
    }
    Debugger debugger = move(started).getOkRef();

    SessionLog log(session.session_path);
    run_sampler(session, log, make_hooks(debugger), options.debug);

    cerr << "Sampling completed. Sent " << session.interrupts_sent << " interrupts in " << session.elapsed_seconds
         << " seconds (" << to_string(session.stop_reason) << ")\n";

    ProfileReport report;

    // gdb flushes its last samples on exit, so the session file is complete only after the reap.
    auto gdb_status = wait_debugger(debugger);
    if (!gdb_status.isOk()) {
        cerr << gdb_status.getErrRef() << "\n";
    } else {
        report.debugger_status = gdb_status.getOkRef();
        if (options.debug) {
            cerr << "gdb finished: " << describe_wait_status(report.debugger_status) << "\n";
        }
    }
    report.debugger_reaped = debugger.reaped;

    auto collected = collect_samples(session.session_path);
    if (!collected.isOk()) {
        return ResultInit::err("Collecting samples failed: " + collected.getErrRef());
    }
    report.collection = move(collected).getOkRef();
    print_summary(report.collection);

    if (!options.folded.empty()) {
        auto folded = write_folded(report.collection.table, options.folded);
        if (!folded.isOk()) {
            return ResultInit::err("Writing folded stacks failed: " + folded.getErrRef());
        }
    }

    if (total_samples(report.collection.table) == 0) {
        // flamegraph.pl refuses empty input.
        cerr << "No samples collected, flame graph not written\n";
        return ResultInit::ok(move(report));
    }

    auto rendered = render_flamegraph(format_folded(report.collection.table), options.renderer, options.output);
    if (!rendered.isOk()) {
        return ResultInit::err("Rendering flame graph failed: " + rendered.getErrRef());
    }
    report.rendered = true;

    cerr << "Flame graph written to " << options.output << "\n";
    return ResultInit::ok(move(report));
}
