#include "errors.hpp"

namespace Hookstage {

const char* errorKindName(HookErrorKind kind)
{
    switch (kind) {
        case HookErrorKind::None:              return "None";
        case HookErrorKind::UnrecognizedPhase: return "UnrecognizedPhase";
        case HookErrorKind::UnknownOperation:  return "UnknownOperation";
        case HookErrorKind::InvalidManifest:   return "InvalidManifest";
        case HookErrorKind::SubmissionFailed:  return "SubmissionFailed";
        case HookErrorKind::ReadinessTimeout:  return "ReadinessTimeout";
        case HookErrorKind::HookFailed:        return "HookFailed";
        case HookErrorKind::Cancelled:         return "Cancelled";
        case HookErrorKind::PhaseAborted:      return "PhaseAborted";
        case HookErrorKind::MainActionFailed:  return "MainActionFailed";
        case HookErrorKind::ConfigError:       return "ConfigError";
    }
    return "Unknown";
}

} // namespace Hookstage
