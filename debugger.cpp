#include <string>
#include <vector>
#include <utility>

#include <signal.h>

#include "debugger.hpp"
#include "process.hpp"
#include "signals.hpp"

using std::string;
using std::to_string;
using std::vector;
using std::move;

static Result<Debugger, string> start(SpawnOptions&& options, const string& session_path) {
    auto spawned = spawn_process(options);
    if (!spawned.isOk()) {
        return ResultInit::err(string("starting ") + options.argv[0] + " failed: " + move(spawned).getErrRef());
    }

    Debugger debugger;
    debugger.pid = spawned.getOkRef();
    debugger.session_path = session_path;
    return ResultInit::ok(move(debugger));
}

Result<Debugger, std::string> attach_debugger(const std::string& gdb, pid_t target_pid, const std::string& script_path, const std::string& session_path) {
    SpawnOptions options;
    options.argv = { gdb, "-q", "-nx", "-batch", "-p", to_string(target_pid), "-x", script_path };
    options.stdout_path = session_path;
    options.new_process_group = true;
    return start(move(options), session_path);
}

Result<Debugger, std::string> launch_debugger(const std::string& gdb, const std::vector<std::string>& command, const std::string& script_path, const std::string& session_path) {
    if (command.empty()) {
        return ResultInit::err("no command to launch");
    }

    SpawnOptions options;
    options.argv = { gdb, "-q", "-nx", "-batch", "-x", script_path, "--args" };
    options.argv.insert(options.argv.end(), command.begin(), command.end());
    options.stdout_path = session_path;
    options.stderr_to_null = true;
    options.new_process_group = true;
    return start(move(options), session_path);
}

Result<bool, std::string> debugger_has_exited(const Debugger& debugger) {
    if (debugger.reaped) {
        return ResultInit::ok(true);
    }
    return process_has_exited(debugger.pid);
}

Status terminate_debugger(const Debugger& debugger) {
    if (debugger.reaped) {
        return ResultInit::ok();
    }

    auto delivered = deliver_signal(debugger.pid, SIGTERM);
    if (!delivered.isOk()) {
        return ResultInit::err(string(delivered.getErrRef()));
    }
    return ResultInit::ok();
}

Result<int, std::string> wait_debugger(Debugger& debugger) {
    if (debugger.reaped) {
        return ResultInit::err(string("debugger ") + to_string(debugger.pid) + " was already reaped");
    }

    auto status = wait_process(debugger.pid);
    if (status.isOk()) {
        debugger.reaped = true;
    }
    return status;
}
