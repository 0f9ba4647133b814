#pragma once
#include <string>
#include <utility>

namespace onova {

enum class UpdateErrc : int {
    None = 0,
    Disposed,
    LockNotAcquired,
    UpdaterAlreadyLaunched,
    UpdateNotPrepared,
    ResolverFailure,
    ExtractorFailure,
    Cancelled,
    Io,
    LaunchFailed,
    StillHeld,
    InvalidArgument,
    Config,
};

const char* ToString(UpdateErrc code);

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }
    UpdateErrc code() const { return static_cast<UpdateErrc>(err); }
    bool Is(UpdateErrc c) const { return !ok && code() == c; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
    static Result Fail(UpdateErrc e, std::string m) {
        return Fail(static_cast<int>(e), std::move(m));
    }
};

} // namespace onova
