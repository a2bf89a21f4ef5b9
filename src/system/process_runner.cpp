#include "selfupdate/system/process_runner.hpp"

#include "selfupdate/util/logger.hpp"

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace selfupdate {

namespace {

int DecodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

class PosixProcessRunner final : public IProcessRunner {
  public:
    Result Run(const std::vector<std::string>& argv,
               std::chrono::milliseconds timeout,
               int& exit_code) const override {
        if (argv.empty()) return Result::Fail(EINVAL, "empty command line");

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);

        const pid_t pid = ::fork();
        if (pid < 0) return Result::FromErrno("fork");

        if (pid == 0) {
            // Child: only async-signal-safe calls from here on.
            const int devnull = ::open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::dup2(devnull, STDOUT_FILENO);
                ::dup2(devnull, STDERR_FILENO);
                if (devnull > STDERR_FILENO) ::close(devnull);
            }
            ::execv(args[0], args.data());
            ::_exit(127);
        }

        using namespace std::chrono;
        const auto deadline = steady_clock::now() + timeout;
        while (true) {
            int status = 0;
            const pid_t w = ::waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                exit_code = DecodeStatus(status);
                return Result::Ok();
            }
            if (w < 0 && errno != EINTR) {
                return Result::FromErrno("waitpid");
            }
            if (steady_clock::now() >= deadline) {
                ::kill(pid, SIGKILL);
                while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
                }
                LogWarn("Killed %s after %lld ms", argv[0].c_str(),
                        static_cast<long long>(timeout.count()));
                return Result::Fail(ETIMEDOUT, argv[0] + " timed out after " +
                                                   std::to_string(timeout.count()) + " ms");
            }
            std::this_thread::sleep_for(milliseconds(10));
        }
    }
};

} // namespace

std::shared_ptr<const IProcessRunner> DefaultProcessRunner() {
    static const std::shared_ptr<const IProcessRunner> kDefault = std::make_shared<PosixProcessRunner>();
    return kDefault;
}

} // namespace selfupdate
