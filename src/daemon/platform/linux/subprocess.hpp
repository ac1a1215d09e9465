#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

struct ProcessResult {
    int exit_code = 0;
    std::string output;   // stdout, only when captured
};

// fork/exec argv[0] from PATH and wait for it. Optional data is written to
// the child's stdin. Fails only if the process could not be run at all;
// a non-zero exit is reported through exit_code (127: not found).
std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv,
            const std::optional<std::string>& input = std::nullopt,
            bool capture_output = false);
