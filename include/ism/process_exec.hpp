#pragma once

#include "ism/utility.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace imagesmith {

/**
 * @brief Runs a subprocess to completion, blocking the calling thread.
 *
 * Output goes to the parent's stdout/stderr.
 *
 * @param args The command line arguments (first argument is the executable).
 * @param working_dir Optional working directory for the subprocess.
 * @param deadline Upper bound on the run time; zero means unbounded. On expiry the
 *        process is terminated (then killed) and `Timeout` is returned.
 * @return The exit status, or an error if the process could not be run.
 */
Result<int> process_exec(std::vector<std::string> &&args, std::optional<std::string> working_dir = std::nullopt,
                         std::chrono::milliseconds deadline = std::chrono::milliseconds::zero());

} // namespace imagesmith
