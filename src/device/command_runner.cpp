/**
 * @file command_runner.cpp
 * @brief popen()-backed command runner and probe environment helpers.
 */

#include "device/probe.hpp"

#include <cstdio>
#include <sys/wait.h>

namespace archetype {

Result<std::string> PopenCommandRunner::run(const std::string& command) {
    std::string full = command + " 2>/dev/null";
    FILE* pipe = popen(full.c_str(), "r");
    if (!pipe) {
        return Error{ErrorCode::BackendProbeFailure, "Failed to start: " + command};
    }

    char buffer[512];
    std::string output;
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }

    int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return Error{ErrorCode::BackendProbeFailure,
                     "Command failed (status " + std::to_string(status) + "): " + command};
    }
    return output;
}

std::filesystem::path ProbeEnvironment::resolve(std::string_view absolute) const {
    while (!absolute.empty() && absolute.front() == '/') absolute.remove_prefix(1);
    return root / std::filesystem::path{absolute};
}

}  // namespace archetype
