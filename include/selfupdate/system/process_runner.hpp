#pragma once

#include "selfupdate/util/result.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace selfupdate {

class IProcessRunner {
  public:
    virtual ~IProcessRunner() = default;

    // Runs argv[0] (a path, no PATH lookup) with stdio bound to /dev/null.
    // Fails if the process cannot be started or outlives `timeout`; the
    // child is killed in that case. Otherwise `exit_code` holds its status
    // (128 + signal number when it died from a signal).
    virtual Result Run(const std::vector<std::string>& argv,
                       std::chrono::milliseconds timeout,
                       int& exit_code) const = 0;
};

std::shared_ptr<const IProcessRunner> DefaultProcessRunner();

} // namespace selfupdate
