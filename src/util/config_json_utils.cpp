#include "util/config_json_utils.hpp"

#include "io/atomic_file_writer.hpp"

#include <fstream>

namespace onova::config::detail {

namespace {

Result WrongType(const char* key, const char* expected) {
    return Result::Fail(UpdateErrc::Config, std::string("'") + key + "' must be " + expected);
}

} // namespace

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(UpdateErrc::Config, "cannot open " + path);
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        return Result::Fail(UpdateErrc::Config, "invalid JSON in " + path + ": " + e.what());
    }

    if (!out.is_object()) {
        return Result::Fail(UpdateErrc::Config, "root must be JSON object: " + path);
    }
    return Result::Ok();
}

Result SaveJsonToFile(const std::string& path, const nlohmann::json& j) {
    const std::string text = j.dump(2) + "\n";

    AtomicFileWriter w;
    if (auto r = AtomicFileWriter::Open(path, 0644, w); !r.is_ok()) return r;
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(text.data());
    if (auto r = w.WriteAll({bytes, text.size()}); !r.is_ok()) return r;
    return w.Commit();
}

Result GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_string())
        return WrongType(key, "a string");
    out = it->get<std::string>();
    return Result::Ok();
}

Result GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!(it->is_number_unsigned() || it->is_number_integer()))
        return WrongType(key, "an integer");
    auto v = it->get<long long>();
    if (v < 0)
        return WrongType(key, "non-negative");
    out = static_cast<std::uint64_t>(v);
    return Result::Ok();
}

Result GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_boolean())
        return WrongType(key, "a boolean");
    out = it->get<bool>();
    return Result::Ok();
}

Result GetMillisIfPresent(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    std::uint64_t v = static_cast<std::uint64_t>(out.count());
    if (auto r = GetU64IfPresent(j, key, v); !r.is_ok()) return r;
    out = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(v));
    return Result::Ok();
}

} // namespace onova::config::detail
