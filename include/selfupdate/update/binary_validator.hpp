#pragma once

#include "selfupdate/system/process_runner.hpp"
#include "selfupdate/util/result.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace selfupdate {

// Checks that a file is a runnable build of the product: a regular file,
// executable, that exits 0 for `--version` (or, failing that, `version`).
class BinaryValidator {
  public:
    struct Options {
        std::vector<std::vector<std::string>> probes = {{"--version"}, {"version"}};
        std::chrono::milliseconds timeout{30000};
    };

    BinaryValidator();
    explicit BinaryValidator(std::shared_ptr<const IProcessRunner> runner);
    BinaryValidator(std::shared_ptr<const IProcessRunner> runner, Options opt);

    Result Validate(const std::string& path) const;

  private:
    std::shared_ptr<const IProcessRunner> runner_;
    Options opt_;
};

} // namespace selfupdate
