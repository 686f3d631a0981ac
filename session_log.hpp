#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <stdint.h>

#include <sys/types.h>

// Read-only view of the file gdb writes its output to. gdb only appends,
// so the file is re-read from the start whenever it has grown.
struct SessionLog {
    std::string path;
    uint64_t last_length = 0;
    std::string contents;

    explicit SessionLog(std::string path);

    // Returns true when new output was picked up.
    bool reload();

    bool contains(std::string_view marker) const;

    // Pid from the first line starting with `process `, as printed by `info proc`.
    std::optional<pid_t> find_process_id() const;
};
