#include "util/result.hpp"

namespace onova {

const char* ToString(UpdateErrc code) {
    switch (code) {
        case UpdateErrc::None:                   return "None";
        case UpdateErrc::Disposed:               return "Disposed";
        case UpdateErrc::LockNotAcquired:        return "LockNotAcquired";
        case UpdateErrc::UpdaterAlreadyLaunched: return "UpdaterAlreadyLaunched";
        case UpdateErrc::UpdateNotPrepared:      return "UpdateNotPrepared";
        case UpdateErrc::ResolverFailure:        return "ResolverFailure";
        case UpdateErrc::ExtractorFailure:       return "ExtractorFailure";
        case UpdateErrc::Cancelled:              return "Cancelled";
        case UpdateErrc::Io:                     return "Io";
        case UpdateErrc::LaunchFailed:           return "LaunchFailed";
        case UpdateErrc::StillHeld:              return "StillHeld";
        case UpdateErrc::InvalidArgument:        return "InvalidArgument";
        case UpdateErrc::Config:                 return "Config";
    }
    return "Unknown";
}

} // namespace onova
