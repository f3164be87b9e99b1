#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace ClipRelay {
    struct ProcessResult {
        int exit_code = -1;
        bool timed_out = false;
        std::string output; // captured stdout
        std::string error;  // spawn/wait failure, empty on success

        bool Ok() const { return error.empty() && !timed_out && exit_code == 0; }
    };

    // Runs argv[0] with the given arguments, capturing stdout. The child is
    // killed once `timeout` elapses.
    ProcessResult RunProcess(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout,
                             size_t max_output_bytes = 16 * 1024 * 1024);
}
