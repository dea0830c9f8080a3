// === Containment Tracker =====================================================
//
// Per (device, geofence) inside/outside state machine with hysteresis. A
// device only enters once it is clearly inside the circle (distance below
// radius - margin) and only exits once it is clearly outside (distance above
// radius + margin); positions in the dead band keep the previous decision.
// The margin follows the reported accuracy of the fix so noisy devices get a
// wider band.
//
// States are created lazily on the first evaluation of a pair, which only
// records the initial decision and never emits a transition. States whose
// geofence left the active snapshot are dropped silently the next time the
// device is evaluated, and eagerly through purge_geofence().

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "geo_sentinel/geofence_registry.hpp"
#include "geo_sentinel/logging.hpp"
#include "geo_sentinel/types.hpp"

namespace geo_sentinel {

struct ContainmentConfig final {
    double max_margin_m{50.0}; /**< Upper bound on the accuracy-derived margin. */
    /** Optional cap on the margin as a fraction of the radius; unbounded unless set. */
    double max_margin_radius_ratio{std::numeric_limits<double>::infinity()};
};

/** @brief Inside/outside decision for one (device, geofence) pair. */
struct ContainmentState final {
    bool inside{false};
    TimePoint last_transition_at{};
};

/** @brief A committed boundary crossing. */
struct ContainmentTransition final {
    std::string geofence_id{};
    std::string geofence_name{};
    GeofenceKind geofence_kind{GeofenceKind::Custom};
    bool entered{false};
    double distance_m{};
    double margin_m{};
};

/** @brief Outcome of evaluating one fix against an active snapshot. */
struct EvaluationReport final {
    std::vector<ContainmentTransition> transitions{};
    std::vector<std::string> inside_geofence_ids{}; /**< Geofences the device is inside after the pass. */
    std::size_t evaluated_count{};
    std::size_t failed_count{};
};

/**
 * @brief Apply the hysteresis rule to a previous decision.
 *
 * @return The new decision when a transition happens, nullopt otherwise.
 */
[[nodiscard]] std::optional<bool> hysteresis_transition(bool currently_inside, double distance_m, double radius_m, double margin_m) noexcept;

class ContainmentTracker final {
  public:
    explicit ContainmentTracker(ContainmentConfig config, std::size_t shard_count = 16);

    /**
     * @brief Evaluate @p fix against every geofence of @p snapshot.
     *
     * Callers serialise evaluations per device. A failure on one geofence is
     * logged and counted; the remaining geofences are still evaluated.
     */
    EvaluationReport evaluate(const std::string& device_id, const PositionFix& fix, const GeofenceSnapshot& snapshot);

    /** @brief Margin applied for a fix of the given accuracy against @p radius_m. */
    [[nodiscard]] double margin_for(double accuracy_m, double radius_m) const noexcept;

    /** @brief Drop every state held for @p geofence_id; returns the number removed. */
    std::size_t purge_geofence(const std::string& geofence_id);

    /** @brief Sorted ids of the geofences @p device_id is currently inside. */
    [[nodiscard]] std::vector<std::string> inside_geofences(const std::string& device_id) const;

    [[nodiscard]] std::optional<ContainmentState> state(const std::string& device_id, const std::string& geofence_id) const;
    [[nodiscard]] std::size_t state_count() const;
    [[nodiscard]] const ContainmentConfig& config() const noexcept;

  private:
    using GeofenceStates = std::unordered_map<std::string, ContainmentState>;

    struct Shard final {
        mutable std::mutex mutex;
        std::unordered_map<std::string, GeofenceStates> map_device_states;
    };

    [[nodiscard]] Shard& shard_for(const std::string& device_id) const;

    ContainmentConfig config_;
    std::vector<std::unique_ptr<Shard>> list_shards_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace geo_sentinel
