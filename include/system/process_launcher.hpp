#pragma once

#include "util/result.hpp"

#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace onova {

struct LaunchRequest {
    std::string program;            // absolute path, or a name looked up in PATH
    std::vector<std::string> args;  // excluding argv[0]
    std::string working_dir;        // empty keeps the caller's

    std::vector<std::string> Argv() const;
};

class IProcessLauncher {
  public:
    virtual ~IProcessLauncher() = default;

    // Starts the program in a new session with stdio on /dev/null and returns
    // once exec has succeeded. The child is not waited for.
    virtual Result LaunchDetached(const LaunchRequest& request, pid_t& out_pid) const = 0;
};

std::shared_ptr<const IProcessLauncher> DefaultProcessLauncher();

// PATH lookup; returns the input unchanged when it already contains a '/'.
std::string ResolveProgramPath(const std::string& program);

} // namespace onova
