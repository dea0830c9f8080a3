// === Error Taxonomy ==========================================================
//
// Failure categories surfaced by the engine. None of them is fatal to the
// process: each degrades a single ping, geofence evaluation, persisted record
// or subscriber.

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace geo_sentinel {

enum class ErrorKind {
    InvalidPing,              /**< Malformed ping, discarded without state change. */
    StaleOrDuplicate,         /**< Ping not newer than the recorded position. */
    GeofenceEvaluationError,  /**< One geofence could not be evaluated. */
    PersistenceFailure,       /**< A write to storage failed after retries. */
    SubscriberOverloaded      /**< A subscriber queue overflowed and was disconnected. */
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/** @brief Raised while evaluating a single geofence; caught per geofence. */
class GeofenceEvaluationError : public std::runtime_error {
  public:
    GeofenceEvaluationError(std::string geofence_id, const std::string& message)
        : std::runtime_error(message),
          str_geofence_id_(std::move(geofence_id)) {}

    [[nodiscard]] const std::string& geofence_id() const noexcept {
        return str_geofence_id_;
    }

  private:
    std::string str_geofence_id_;
};

}  // namespace geo_sentinel
