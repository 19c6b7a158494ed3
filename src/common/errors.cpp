#include "errors.h"

namespace texq {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::InfrastructureUnavailable: return "infrastructure_unavailable";
        case ErrorKind::Broker: return "broker";
        case ErrorKind::StateConflict: return "state_conflict";
        case ErrorKind::Config: return "config";
    }
    return "unknown";
}

} // namespace texq
