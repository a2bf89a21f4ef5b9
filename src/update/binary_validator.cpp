#include "selfupdate/update/binary_validator.hpp"

#include "selfupdate/util/logger.hpp"

#include <cerrno>
#include <sys/stat.h>

namespace selfupdate {

BinaryValidator::BinaryValidator() : BinaryValidator(nullptr, Options{}) {}

BinaryValidator::BinaryValidator(std::shared_ptr<const IProcessRunner> runner)
    : BinaryValidator(std::move(runner), Options{}) {}

BinaryValidator::BinaryValidator(std::shared_ptr<const IProcessRunner> runner, Options opt)
    : runner_(runner ? std::move(runner) : DefaultProcessRunner()), opt_(std::move(opt)) {}

Result BinaryValidator::Validate(const std::string& path) const {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return Result::FromErrno("binary not accessible: " + path);
    if (!S_ISREG(st.st_mode)) return Result::Fail(EINVAL, "not a regular file: " + path);

    if ((st.st_mode & 0111) != 0111) {
        if (::chmod(path.c_str(), (st.st_mode & 07777) | 0111) != 0) {
            return Result::FromErrno("cannot make executable: " + path);
        }
    }

    std::string last_error = "no probe configured";
    for (const auto& probe : opt_.probes) {
        std::vector<std::string> argv{path};
        argv.insert(argv.end(), probe.begin(), probe.end());

        int exit_code = -1;
        auto r = runner_->Run(argv, opt_.timeout, exit_code);
        if (!r.is_ok()) {
            last_error = r.msg;
            // Timeouts are not retried with the next probe.
            if (r.err == ETIMEDOUT) break;
            continue;
        }
        if (exit_code == 0) {
            LogDebug("Validated %s", path.c_str());
            return Result::Ok();
        }
        last_error = "exit code " + std::to_string(exit_code);
    }
    return Result::Fail(-1, "binary validation failed for " + path + ": " + last_error);
}

} // namespace selfupdate
