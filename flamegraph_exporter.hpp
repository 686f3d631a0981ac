#pragma once

#include <string>
#include <vector>

#include "result.hpp"
#include "sample_collector.hpp"

struct Renderer {
    std::string program;
    std::vector<std::string> arguments;

    // flamegraph.pl with the arguments every profile is rendered with.
    static Renderer flamegraph(const std::string& program);
};

// `<stack> <count>` lines, sorted by stack.
std::string format_folded(const SampleTable& table);

Status write_folded(const SampleTable& table, const std::string& path);

// Pipes `folded` through the renderer into `output_path`. On failure no file is left at `output_path`.
Status render_flamegraph(const std::string& folded, const Renderer& renderer, const std::string& output_path);
