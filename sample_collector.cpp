#include <string>
#include <string_view>
#include <fstream>
#include <utility>

#include <errno.h>
#include <string.h>

#include "sample_collector.hpp"
#include "script_generator.hpp"

using std::string;
using std::string_view;
using std::to_string;
using std::move;

static string_view trim(string_view text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == string_view::npos) {
        return string_view();
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

static bool starts_with(string_view text, string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

Collection collect_samples(std::istream& in) {
    const string_view tag(PROFILE_TAG);
    const string_view error_tag(CAPABILITY_ERROR_TAG);

    Collection collection;
    string line;
    while (std::getline(in, line)) {
        string_view view(line);

        if (starts_with(view, error_tag)) {
            ++collection.stats.capability_errors;
            continue;
        }

        if (!starts_with(view, tag)) {
            continue;
        }

        ++collection.stats.tagged_lines;
        string_view stack = trim(view.substr(tag.size()));
        if (stack.empty()) {
            ++collection.stats.empty_stacks;
            continue;
        }

        ++collection.table[string(stack)];
    }

    return collection;
}

Result<Collection, std::string> collect_samples(const std::string& session_path) {
    std::ifstream in(session_path.c_str());
    if (!in) {
        int errno_copy = errno;
        return ResultInit::err(string("open(") + session_path + ") failed: errno = " + to_string(errno_copy) + " message = " + strerror(errno_copy));
    }

    Collection collection = collect_samples(in);
    if (in.bad()) {
        return ResultInit::err(string("reading ") + session_path + " failed");
    }

    return ResultInit::ok(move(collection));
}

uint64_t total_samples(const SampleTable& table) {
    uint64_t total = 0;
    for (const auto& entry: table) {
        total += entry.second;
    }
    return total;
}
