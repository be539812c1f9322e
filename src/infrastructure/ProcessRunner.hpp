/**
 * @file ProcessRunner.hpp
 * @brief Bounded execution of external helper programs.
 */

#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace docingest::infrastructure {

/**
 * @struct ProcessResult
 * @brief Exit status and captured output of a helper process.
 */
struct ProcessResult {
    int exitCode = -1;
    bool launched = false;   ///< False when fork/exec failed.
    bool timedOut = false;   ///< The process was killed after the deadline.
    std::string out;
    std::string err;

    bool ok() const { return launched && !timedOut && exitCode == 0; }
};

class ProcessRunner {
public:
    /**
     * @brief Runs argv[0] (looked up in PATH) without a shell.
     *
     * Stdout and stderr are drained concurrently; the child is killed with SIGKILL
     * when the timeout expires.
     */
    static ProcessResult Run(const std::vector<std::string>& argv, std::chrono::seconds timeout);

    /** @brief True when an executable with this name is found in PATH. */
    static bool HasTool(const std::string& tool);
};

} // namespace docingest::infrastructure
