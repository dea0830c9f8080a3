#include "geo_sentinel/errors.hpp"

namespace geo_sentinel {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidPing:
            return "invalid_ping";
        case ErrorKind::StaleOrDuplicate:
            return "stale_or_duplicate";
        case ErrorKind::GeofenceEvaluationError:
            return "geofence_evaluation_error";
        case ErrorKind::PersistenceFailure:
            return "persistence_failure";
        case ErrorKind::SubscriberOverloaded:
            return "subscriber_overloaded";
    }
    return "unknown";
}

}  // namespace geo_sentinel
