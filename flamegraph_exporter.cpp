#include <string>
#include <vector>
#include <fstream>
#include <iostream>
#include <utility>

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <sys/wait.h>

#include "flamegraph_exporter.hpp"
#include "process.hpp"
#include "signals.hpp"

using std::string;
using std::to_string;
using std::move;

Renderer Renderer::flamegraph(const std::string& program) {
    return Renderer { program, { "--title", "ghc-ssp light-thread profile", "--countname", "samples" } };
}

std::string format_folded(const SampleTable& table) {
    string result;
    for (const auto& entry: table) {
        result += entry.first;
        result += ' ';
        result += to_string(entry.second);
        result += '\n';
    }
    return result;
}

Status write_folded(const SampleTable& table, const std::string& path) {
    std::ofstream stream(path.c_str(), std::ios::out | std::ios::trunc);
    if (!stream) {
        int errno_copy = errno;
        return ResultInit::err(string("open(") + path + ") failed: errno = " + to_string(errno_copy) + " message = " + strerror(errno_copy));
    }

    stream << format_folded(table);
    stream.flush();
    if (!stream) {
        return ResultInit::err(string("writing folded stacks to ") + path + " failed");
    }

    return ResultInit::ok();
}

// Removes the temporary output unless the render succeeded.
class TempOutputGuard {
    string path;
public:
    bool keep = false;
    TempOutputGuard(string path): path(move(path)) {}
    TempOutputGuard(const TempOutputGuard&) = delete;
    ~TempOutputGuard() {
        if (!keep && unlink(path.c_str()) != 0 && errno != ENOENT) {
            std::cerr << "unlink(" << path << ") failed with errno = " << errno << " message = " << strerror(errno) << "\n";
        }
    }
};

Status render_flamegraph(const std::string& folded, const Renderer& renderer, const std::string& output_path) {
    IgnoreSigpipeGuard sigpipe_guard;

    string temp_path = output_path + ".tmp";
    TempOutputGuard temp_guard(temp_path);

    int input_pipe[2];
    if (pipe2(input_pipe, O_CLOEXEC) != 0) {
        int errno_copy = errno;
        return ResultInit::err(string("pipe2() failed with errno = ") + to_string(errno_copy) + " message = " + strerror(errno_copy));
    }
    FdGuard input_read(input_pipe[0]);
    FdGuard input_write(input_pipe[1]);

    SpawnOptions options;
    options.argv.push_back(renderer.program);
    options.argv.insert(options.argv.end(), renderer.arguments.begin(), renderer.arguments.end());
    options.stdin_fd = input_read.get();
    options.stdout_path = temp_path;

    auto spawned = spawn_process(options);
    if (!spawned.isOk()) {
        return ResultInit::err(string("starting ") + renderer.program + " failed: " + move(spawned).getErrRef());
    }
    pid_t pid = spawned.getOkRef();
    input_read.reset();

    auto written = write_all(input_write.get(), folded);
    input_write.reset();

    auto status = wait_process(pid);
    if (!status.isOk()) {
        return ResultInit::err(string(status.getErrRef()));
    }

    int raw_status = status.getOkRef();
    if (!WIFEXITED(raw_status) || WEXITSTATUS(raw_status) != 0) {
        return ResultInit::err(renderer.program + " failed: " + describe_wait_status(raw_status));
    }

    if (!written.isOk()) {
        return ResultInit::err(string("feeding ") + renderer.program + " failed: " + written.getErrRef());
    }

    if (rename(temp_path.c_str(), output_path.c_str()) != 0) {
        int errno_copy = errno;
        return ResultInit::err(string("rename(") + temp_path + ", " + output_path + ") failed: errno = " + to_string(errno_copy) + " message = " + strerror(errno_copy));
    }
    temp_guard.keep = true;

    return ResultInit::ok();
}
