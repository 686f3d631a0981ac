#include <string>
#include <fstream>

#include <errno.h>
#include <string.h>

#include "script_generator.hpp"

using std::string;
using std::to_string;

static const char* const ATTACH_TEMPLATE =
    "set pagination off\n"
    "set confirm off\n"
    "source {plugin}\n"
    "handle SIGUSR1 nostop noprint nopass\n"
    "handle SIGUSR2 nostop noprint nopass\n"
    "catch signal SIGUSR1\n"
    "commands\n"
    "silent\n"
    "{profile}\n"
    "continue\n"
    "end\n"
    "catch signal SIGUSR2\n"
    "commands\n"
    "silent\n"
    "detach\n"
    "quit\n"
    "end\n"
    "continue\n";

// Both stops are armed before `run`, so the pid report implies the
// sampling catch-point is in place.
static const char* const LAUNCH_TEMPLATE =
    "set pagination off\n"
    "set confirm off\n"
    "source {plugin}\n"
    "handle SIGUSR1 nostop noprint nopass\n"
    "break main\n"
    "commands\n"
    "silent\n"
    "info proc\n"
    "continue\n"
    "end\n"
    "catch signal SIGUSR1\n"
    "commands\n"
    "silent\n"
    "{profile}\n"
    "continue\n"
    "end\n"
    "run\n";

static void replace_all(string& text, const string& key, const string& value) {
    size_t pos = 0;
    while ((pos = text.find(key, pos)) != string::npos) {
        text.replace(pos, key.size(), value);
        pos += value.size();
    }
}

std::string generate_script(ProfileMode mode, const std::string& plugin_path, const ScriptOptions& options) {
    string profile_command = "info tsoprofile";
    if (options.uniq_frames) {
        profile_command += " -u";
    }
    if (options.verbose_frames) {
        profile_command += " -v";
    }

    string script = mode == ProfileMode::Attach ? ATTACH_TEMPLATE : LAUNCH_TEMPLATE;
    replace_all(script, "{plugin}", plugin_path);
    replace_all(script, "{profile}", profile_command);
    return script;
}

Status write_script(const std::string& path, const std::string& script) {
    std::ofstream stream(path.c_str(), std::ios::out | std::ios::trunc);
    if (!stream) {
        int errno_copy = errno;
        return ResultInit::err(string("open(") + path + ") failed: errno = " + to_string(errno_copy) + " message = " + strerror(errno_copy));
    }

    stream << script;
    stream.flush();
    if (!stream) {
        return ResultInit::err(string("writing gdb script to ") + path + " failed");
    }

    return ResultInit::ok();
}
