#include <iostream>
#include <vector>
#include <string>

#include <stdint.h>
#include <stdlib.h>
#include <unistd.h>
#include <sys/stat.h>

#include "flamegraph_exporter.hpp"
#include "profile_session.hpp"
#include "profiler.hpp"
#include "sampler.hpp"
#include "signals.hpp"

#define PROJECT_NAME "ghc-ssp"

using std::cerr;
using std::vector;
using std::string;

struct CliArguments {
    bool parsed;
    pid_t pid;
    vector<string> command;
    double frequency;
    uint32_t duration_seconds;
    uint32_t ready_timeout_seconds;
    string output;
    string folded;
    string plugin;
    string gdb;
    string flamegraph;
    bool uniq;
    bool verbose_stacks;
    bool debug;

    static CliArguments parse(int argc, char** argv) {
        vector<string> args { &argv[1], &argv[argc] };

        CliArguments result {
            true,
            0,
            {},
            10.0,
            0,
            0,
            "",
            "",
            "gdb-ghcrts.py",
            "gdb",
            "flamegraph.pl",
            false,
            false,
            false
        };

        auto value = [&](vector<string>::iterator& it) -> string {
            if (it + 1 == args.end()) {
                cerr << *it << " requires a value\n";
                result.parsed = false;
                return string();
            }
            ++it;
            return *it;
        };

        for (auto it = args.begin(); it != args.end(); ++it) {
            if (*it == "--") {
                result.command.assign(it + 1, args.end());
                break;
            } else if (*it == "--pid") {
                auto pid = parse_pid(value(it));
                if (pid.isOk()) {
                    result.pid = pid.getOkRef();
                } else {
                    cerr << "--pid: " << pid.getErrRef() << "\n";
                    result.parsed = false;
                }
            } else if (*it == "--frequency") {
                auto frequency = parse_frequency(value(it));
                if (frequency.isOk()) {
                    result.frequency = frequency.getOkRef();
                } else {
                    cerr << "--frequency: " << frequency.getErrRef() << "\n";
                    result.parsed = false;
                }
            } else if (*it == "--duration_sec") {
                result.duration_seconds = atol(value(it).c_str());
            } else if (*it == "--ready_timeout_sec") {
                result.ready_timeout_seconds = atol(value(it).c_str());
            } else if (*it == "--output") {
                result.output = value(it);
            } else if (*it == "--folded") {
                result.folded = value(it);
            } else if (*it == "--plugin") {
                result.plugin = value(it);
            } else if (*it == "--gdb") {
                result.gdb = value(it);
            } else if (*it == "--flamegraph") {
                result.flamegraph = value(it);
            } else if (*it == "--uniq") {
                result.uniq = true;
            } else if (*it == "--verbose_stacks") {
                result.verbose_stacks = true;
            } else if (*it == "--debug") {
                result.debug = true;
            } else {
                cerr << "Unknown arguments: " << *it << "\n";
                result.parsed = false;
            }
        }

        if (result.parsed && (result.pid == 0) == result.command.empty()) {
            cerr << "Exactly one of --pid and -- COMMAND must be specified\n";
            result.parsed = false;
        }

        if (result.output.empty()) {
            cerr << "--output must be specified\n";
            result.parsed = false;
        }

        return result;
    }
};

static bool file_exists(const string& path) {
    struct stat statbuf;
    return stat(path.c_str(), &statbuf) == 0 && S_ISREG(statbuf.st_mode);
}

static bool find_executable(const string& name) {
    if (name.find('/') != string::npos) {
        return access(name.c_str(), X_OK) == 0;
    }

    const char* path_env = getenv("PATH");
    string path = path_env ? path_env : "";
    size_t begin = 0;
    while (begin <= path.size()) {
        size_t end = path.find(':', begin);
        if (end == string::npos) {
            end = path.size();
        }
        string dir = path.substr(begin, end - begin);
        string candidate = (dir.empty() ? string(".") : dir) + "/" + name;
        if (file_exists(candidate) && access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
        begin = end + 1;
    }
    return false;
}

static bool preflight(const CliArguments& cli_args) {
    bool ok = true;
    if (!file_exists(cli_args.plugin)) {
        cerr << "gdb plugin " << cli_args.plugin << " not found (use --plugin)\n";
        ok = false;
    }
    if (!find_executable(cli_args.gdb)) {
        cerr << cli_args.gdb << " not found in PATH\n";
        ok = false;
    }
    if (!find_executable(cli_args.flamegraph)) {
        cerr << cli_args.flamegraph << " not found in PATH\n";
        ok = false;
    }
    return ok;
}

int main(int argc, char **argv) {
    auto cli_args = CliArguments::parse(argc, argv);
    if (!cli_args.parsed) {
        cerr << "Usage: " PROJECT_NAME " (--pid PID | -- COMMAND [ARGS...]) --output FILE.svg [--frequency 10] [--duration_sec 0] [--ready_timeout_sec 0] "
                "[--plugin gdb-ghcrts.py] [--gdb gdb] [--flamegraph flamegraph.pl] [--folded FILE] [--uniq] [--verbose_stacks] [--debug]\n";
        return 1;
    }

    if (!preflight(cli_args)) {
        return 1;
    }

    ProfileSession session = cli_args.pid != 0
        ? ProfileSession::attach(cli_args.pid, cli_args.frequency)
        : ProfileSession::launch(cli_args.command, cli_args.frequency);
    session.duration_seconds = cli_args.duration_seconds;
    session.ready_timeout_seconds = cli_args.ready_timeout_seconds;

    auto handler = install_interrupt_handler();
    if (!handler.isOk()) {
        cerr << handler.getErrRef() << "\n";
        return 1;
    }

    ProfileOptions options;
    options.gdb = cli_args.gdb;
    options.plugin = cli_args.plugin;
    options.script.uniq_frames = cli_args.uniq;
    options.script.verbose_frames = cli_args.verbose_stacks;
    options.renderer = Renderer::flamegraph(cli_args.flamegraph);
    options.output = cli_args.output;
    options.folded = cli_args.folded;
    options.debug = cli_args.debug;

    // No samples is not a failure: the run still exits 0, without a flame graph.
    auto profiled = run_profile(session, options, SamplerHooks::for_debugger);
    if (!profiled.isOk()) {
        cerr << profiled.getErrRef() << "\n";
        return 1;
    }
    return 0;
}
