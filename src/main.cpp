#include "selfupdate/cli/commands.hpp"
#include "selfupdate/system/signals.hpp"

#include <cstdio>
#include <getopt.h>
#include <string>
#include <vector>

namespace {

enum LongOnly : int {
    kBackupDir = 1000,
    kCurrentVersion,
    kLogFile,
    kLogLevel,
};

} // namespace

int main(int argc, char **argv) {
    selfupdate::InstallSignalHandlers();

    selfupdate::cli::GlobalOptions opt = selfupdate::cli::DefaultGlobalOptions();

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"feed", required_argument, nullptr, 'f'},
        {"binary", required_argument, nullptr, 'b'},
        {"backup-dir", required_argument, nullptr, kBackupDir},
        {"work-dir", required_argument, nullptr, 'w'},
        {"current-version", required_argument, nullptr, kCurrentVersion},
        {"log-file", required_argument, nullptr, kLogFile},
        {"log-level", required_argument, nullptr, kLogLevel},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // '+' stops at the subcommand so its own options are left alone.
    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "+hc:f:b:w:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                selfupdate::cli::PrintUsage(stdout, argv[0]);
                return 0;

            case 'c':
                opt.config_path = optarg;
                break;

            case 'f':
                opt.feed = optarg;
                break;

            case 'b':
                opt.binary_path = optarg;
                break;

            case kBackupDir:
                opt.backup_dir = optarg;
                break;

            case 'w':
                opt.work_dir = optarg;
                break;

            case kCurrentVersion:
                opt.current_version = optarg;
                break;

            case kLogFile:
                opt.log_file = optarg;
                break;

            case kLogLevel:
                opt.log_level = optarg;
                break;

            case 'v':
                opt.verbose = true;
                break;

            default:
                selfupdate::cli::PrintUsage(stderr, argv[0]);
                return 2;
        }
    }

    if (optind >= argc) {
        selfupdate::cli::PrintUsage(stderr, argv[0]);
        return 2;
    }
    std::vector<std::string> args(argv + optind, argv + argc);

    selfupdate::cli::App app(opt);
    if (auto r = app.Init(); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    return app.Run(args);
}
