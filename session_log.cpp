#include <string>
#include <fstream>
#include <sstream>
#include <utility>

#include <stdlib.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>

#include "session_log.hpp"
#include "script_generator.hpp"

using std::string;
using std::string_view;

SessionLog::SessionLog(std::string path) : path(std::move(path)) {}

bool SessionLog::reload() {
    struct stat statbuf;
    int rc = lstat(path.c_str(), &statbuf);
    if (rc != 0) {
        // gdb has not created it yet
        return false;
    }

    uint64_t file_size = statbuf.st_size;
    if (file_size <= last_length) {
        return false;
    }

    std::ifstream in(path.c_str());
    if (!in) {
        return false;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    contents = buffer.str();
    last_length = contents.size();
    return true;
}

bool SessionLog::contains(std::string_view marker) const {
    return string_view(contents).find(marker) != string_view::npos;
}

std::optional<pid_t> SessionLog::find_process_id() const {
    const string_view marker(PROCESS_ID_MARKER);
    string_view rest(contents);

    while (!rest.empty()) {
        size_t eol = rest.find('\n');
        if (eol == string_view::npos) {
            // A partial last line may still be growing.
            break;
        }

        string_view line = rest.substr(0, eol);
        rest.remove_prefix(eol + 1);

        if (line.substr(0, marker.size()) != marker) {
            continue;
        }

        string digits(line.substr(marker.size()));
        char* end = nullptr;
        long pid = strtol(digits.c_str(), &end, 10);
        if (end != digits.c_str() && pid > 0) {
            return static_cast<pid_t>(pid);
        }
    }

    return std::nullopt;
}
