#include "onova/options.hpp"

#include "util/config_json_utils.hpp"

namespace onova {

using namespace config::detail;

namespace {

Result FillUpdaterOptions(const nlohmann::json& j, UpdaterOptions& out) {
    if (!j.is_object()) {
        return Result::Fail(UpdateErrc::Config, "'Updater' must be an object");
    }
    if (auto r = GetMillisIfPresent(j, "WaitTimeoutMs", out.wait_timeout); !r.is_ok()) return r;
    if (auto r = GetMillisIfPresent(j, "PollIntervalMs", out.poll_interval); !r.is_ok()) return r;
    if (auto r = GetStringIfPresent(j, "RuntimeHost", out.runtime_host); !r.is_ok()) return r;
    if (auto r = GetBoolIfPresent(j, "AllowSiblingExecutable", out.allow_sibling_executable); !r.is_ok())
        return r;
    if (auto r = GetStringIfPresent(j, "ElevationCommand", out.elevation_command); !r.is_ok()) return r;

    if (out.poll_interval.count() == 0) {
        return Result::Fail(UpdateErrc::Config, "'PollIntervalMs' must be positive");
    }
    return Result::Ok();
}

Result FillLogLevel(const nlohmann::json& j, LogLevel& out) {
    std::string name;
    if (auto r = GetStringIfPresent(j, "LogLevel", name); !r.is_ok()) return r;
    if (name.empty()) return Result::Ok();

    auto lvl = ParseLogLevel(name);
    if (!lvl) {
        return Result::Fail(UpdateErrc::Config, "unknown LogLevel '" + name + "'");
    }
    out = *lvl;
    return Result::Ok();
}

Result WithPath(Result r, const std::string& path) {
    if (!r.is_ok() && r.msg.find(path) == std::string::npos) {
        r.msg += " in " + path;
    }
    return r;
}

} // namespace

const char* LogLevelName(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::None:  return "none";
    }
    return "info";
}

Result LoadManagerOptionsFromFile(const std::string& path, ManagerOptions& out) {
    nlohmann::json j;
    if (auto r = LoadJsonObjectFromFile(path, j); !r.is_ok()) return r;

    ManagerOptions opt = out;
    if (auto r = GetStringIfPresent(j, "StorageRoot", opt.storage_root); !r.is_ok()) return WithPath(r, path);
    if (auto r = GetStringIfPresent(j, "PackageExtension", opt.package_extension); !r.is_ok())
        return WithPath(r, path);
    if (auto r = GetStringIfPresent(j, "UpdaterSourcePath", opt.updater_source_path); !r.is_ok())
        return WithPath(r, path);
    if (auto r = FillLogLevel(j, opt.log_level); !r.is_ok()) return WithPath(r, path);

    if (auto it = j.find("Updater"); it != j.end()) {
        if (auto r = FillUpdaterOptions(*it, opt.updater); !r.is_ok()) return WithPath(r, path);
    }

    if (opt.package_extension.empty()) {
        return Result::Fail(UpdateErrc::Config, "'PackageExtension' must not be empty in " + path);
    }

    out = std::move(opt);
    return Result::Ok();
}

Result SaveUpdaterConfig(const std::string& path, const UpdaterOptions& opt, LogLevel level) {
    nlohmann::json j = {
        {"LogLevel", LogLevelName(level)},
        {"Updater",
         {
             {"WaitTimeoutMs", opt.wait_timeout.count()},
             {"PollIntervalMs", opt.poll_interval.count()},
             {"RuntimeHost", opt.runtime_host},
             {"AllowSiblingExecutable", opt.allow_sibling_executable},
             {"ElevationCommand", opt.elevation_command},
         }},
    };

    try {
        return SaveJsonToFile(path, j);
    } catch (const std::exception& e) {
        return Result::Fail(UpdateErrc::Config, std::string("cannot serialize updater config: ") + e.what());
    }
}

Result LoadUpdaterConfigFromFile(const std::string& path, UpdaterOptions& out, LogLevel& level) {
    nlohmann::json j;
    if (auto r = LoadJsonObjectFromFile(path, j); !r.is_ok()) return r;

    UpdaterOptions opt = out;
    LogLevel lvl = level;
    if (auto r = FillLogLevel(j, lvl); !r.is_ok()) return WithPath(r, path);
    if (auto it = j.find("Updater"); it != j.end()) {
        if (auto r = FillUpdaterOptions(*it, opt); !r.is_ok()) return WithPath(r, path);
    }

    out = std::move(opt);
    level = lvl;
    return Result::Ok();
}

} // namespace onova
