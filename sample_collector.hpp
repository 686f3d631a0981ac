#pragma once

#include <stdint.h>
#include <istream>
#include <map>
#include <string>

#include "result.hpp"

// Folded stack -> number of times it was sampled. Ordered, so iteration is the export order.
using SampleTable = std::map<std::string, uint64_t>;

struct CollectStats {
    uint64_t tagged_lines = 0;
    uint64_t empty_stacks = 0;
    uint64_t capability_errors = 0;
};

struct Collection {
    SampleTable table;
    CollectStats stats;
};

Collection collect_samples(std::istream& in);
Result<Collection, std::string> collect_samples(const std::string& session_path);

uint64_t total_samples(const SampleTable& table);
