#include "onova/lock_file.hpp"
#include "onova/options.hpp"
#include "updater/updater.hpp"
#include "updater/updater_args.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <getopt.h>
#include <string>
#include <vector>

#ifndef ONOVA_VERSION
#define ONOVA_VERSION "0.0.0"
#endif

namespace {

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] <updatee> <content-dir> <True|False> <routed-args-b64> <executables-b64>\n"
        "\n"
        "Options:\n"
        "  -c, --config <path>    Options file (default: <self>.json)\n"
        "  -l, --log <path>       Log file (default: <self>.log)\n"
        "  -V, --version          Print version and exit\n"
        "  -h, --help             Show this help\n",
        argv0);
}

std::string SelfPath(const char* argv0) {
    std::error_code ec;
    auto p = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) return p.string();
    return std::filesystem::absolute(argv0, ec).string();
}

} // namespace

int main(int argc, char** argv) {
    const std::string self = SelfPath(argv[0]);
    std::string config_path = self + ".json";
    std::string log_path = self + ".log";

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"log", required_argument, nullptr, 'l'},
        {"version", no_argument, nullptr, 'V'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    // '+' stops at the first positional so base64 payloads are never parsed as options.
    while ((c = getopt_long(argc, argv, "+hVc:l:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'V':
                std::printf("onova-updater %s\n", ONOVA_VERSION);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'l':
                log_path = optarg;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    const std::vector<std::string> positional(argv + optind, argv + argc);
    auto args = onova::UpdaterArgs::Decode(positional);
    if (!args) {
        std::fprintf(stderr, "ERROR: %s\n", args.error().c_str());
        PrintUsage(argv[0]);
        return 2;
    }

    onova::UpdaterOptions options;
    onova::LogLevel level = onova::LogLevel::Info;
    std::error_code ec;
    const bool have_config = std::filesystem::exists(config_path, ec);
    onova::Result config_result;
    if (have_config) {
        config_result = onova::LoadUpdaterConfigFromFile(config_path, options, level);
    }
    onova::Logger::Instance().SetLevel(level);

    onova::Updater updater(std::move(*args), options);
    if (auto r = updater.OpenLog(log_path, level); !r.is_ok()) {
        LogWarn("%s", r.message().c_str());
    }
    if (!config_result.is_ok()) {
        updater.Log().Write(onova::LogLevel::Warn, "using default options: %s", config_result.message().c_str());
    }

    // Held until exit so a manager can tell this helper is still running.
    auto self_lock = onova::LockFile::TryAcquireShared(self);

    updater.Run();
    return 0;
}
