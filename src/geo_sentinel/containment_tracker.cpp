#include "geo_sentinel/containment_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <unordered_set>

#include "geo_sentinel/errors.hpp"
#include "geo_sentinel/geo_math.hpp"

namespace geo_sentinel {

namespace {

double checked_distance_m(const PositionFix& fix, const Geofence& geofence) {
    if (!std::isfinite(geofence.radius_m) || geofence.radius_m <= 0.0) {
        throw GeofenceEvaluationError(geofence.id, "radius is not a positive finite number");
    }
    const double distance_m = haversine_distance_m(fix.coordinate, geofence.center);
    if (!std::isfinite(distance_m)) {
        throw GeofenceEvaluationError(geofence.id, "distance computation produced a non-finite value");
    }
    return distance_m;
}

}  // namespace

std::optional<bool> hysteresis_transition(bool currently_inside, double distance_m, double radius_m, double margin_m) noexcept {
    if (!currently_inside && distance_m < radius_m - margin_m) {
        return true;
    }
    if (currently_inside && distance_m > radius_m + margin_m) {
        return false;
    }
    return std::nullopt;
}

ContainmentTracker::ContainmentTracker(ContainmentConfig config, std::size_t shard_count)
    : config_(config),
      logger_(get_logger()) {
    if (shard_count == 0) {
        throw std::invalid_argument("ContainmentTracker requires at least one shard");
    }
    if (config_.max_margin_m < 0.0 || config_.max_margin_radius_ratio < 0.0) {
        throw std::invalid_argument("ContainmentTracker margins cannot be negative");
    }
    list_shards_.reserve(shard_count);
    for (std::size_t index = 0; index < shard_count; ++index) {
        list_shards_.push_back(std::make_unique<Shard>());
    }
}

ContainmentTracker::Shard& ContainmentTracker::shard_for(const std::string& device_id) const {
    const std::size_t index = std::hash<std::string>{}(device_id) % list_shards_.size();
    return *list_shards_[index];
}

const ContainmentConfig& ContainmentTracker::config() const noexcept {
    return config_;
}

double ContainmentTracker::margin_for(double accuracy_m, double radius_m) const noexcept {
    const double accuracy = std::isfinite(accuracy_m) ? std::max(accuracy_m, 0.0) : config_.max_margin_m;
    const double margin = std::min(accuracy, config_.max_margin_m);
    if (!std::isfinite(config_.max_margin_radius_ratio)) {
        return margin;
    }
    return std::min(margin, radius_m * config_.max_margin_radius_ratio);
}

EvaluationReport ContainmentTracker::evaluate(const std::string& device_id, const PositionFix& fix, const GeofenceSnapshot& snapshot) {
    EvaluationReport report{};
    Shard& shard = shard_for(device_id);
    std::scoped_lock lock(shard.mutex);
    GeofenceStates& states = shard.map_device_states[device_id];

    std::unordered_set<std::string> set_active_ids;
    set_active_ids.reserve(snapshot.geofences.size());

    for (const Geofence& geofence : snapshot.geofences) {
        set_active_ids.insert(geofence.id);
        try {
            const double distance_m = checked_distance_m(fix, geofence);
            const double margin_m = margin_for(fix.accuracy_m, geofence.radius_m);
            ++report.evaluated_count;

            const auto iterator_state = states.find(geofence.id);
            if (iterator_state == states.end()) {
                states.emplace(geofence.id, ContainmentState{distance_m <= geofence.radius_m, fix.timestamp});
                continue;
            }

            ContainmentState& state = iterator_state->second;
            const std::optional<bool> next_inside = hysteresis_transition(state.inside, distance_m, geofence.radius_m, margin_m);
            if (!next_inside.has_value()) {
                continue;
            }
            state.inside = next_inside.value();
            state.last_transition_at = fix.timestamp;
            report.transitions.push_back(ContainmentTransition{
                geofence.id,
                geofence.name,
                geofence.kind,
                state.inside,
                distance_m,
                margin_m
            });
        } catch (const GeofenceEvaluationError& exc) {
            ++report.failed_count;
            logger_->error(
                R"({{"component":"containment","device":"{}","geofence":"{}","error":"{}"}})",
                device_id,
                exc.geofence_id(),
                exc.what()
            );
        } catch (const std::exception& exc) {
            ++report.failed_count;
            logger_->error(
                R"({{"component":"containment","device":"{}","geofence":"{}","error":"{}"}})",
                device_id,
                geofence.id,
                exc.what()
            );
        }
    }

    for (auto iterator_state = states.begin(); iterator_state != states.end();) {
        if (set_active_ids.count(iterator_state->first) == 0) {
            logger_->debug("Dropping containment state {}/{} for inactive geofence", device_id, iterator_state->first);
            iterator_state = states.erase(iterator_state);
            continue;
        }
        if (iterator_state->second.inside) {
            report.inside_geofence_ids.push_back(iterator_state->first);
        }
        ++iterator_state;
    }
    std::sort(report.inside_geofence_ids.begin(), report.inside_geofence_ids.end());
    return report;
}

std::size_t ContainmentTracker::purge_geofence(const std::string& geofence_id) {
    std::size_t removed = 0;
    for (const auto& shard : list_shards_) {
        std::scoped_lock lock(shard->mutex);
        for (auto& [device_id, states] : shard->map_device_states) {
            removed += states.erase(geofence_id);
        }
    }
    return removed;
}

std::vector<std::string> ContainmentTracker::inside_geofences(const std::string& device_id) const {
    std::vector<std::string> inside_ids;
    Shard& shard = shard_for(device_id);
    std::scoped_lock lock(shard.mutex);
    const auto iterator_device = shard.map_device_states.find(device_id);
    if (iterator_device == shard.map_device_states.end()) {
        return inside_ids;
    }
    for (const auto& [geofence_id, state] : iterator_device->second) {
        if (state.inside) {
            inside_ids.push_back(geofence_id);
        }
    }
    std::sort(inside_ids.begin(), inside_ids.end());
    return inside_ids;
}

std::optional<ContainmentState> ContainmentTracker::state(const std::string& device_id, const std::string& geofence_id) const {
    Shard& shard = shard_for(device_id);
    std::scoped_lock lock(shard.mutex);
    const auto iterator_device = shard.map_device_states.find(device_id);
    if (iterator_device == shard.map_device_states.end()) {
        return std::nullopt;
    }
    const auto iterator_state = iterator_device->second.find(geofence_id);
    if (iterator_state == iterator_device->second.end()) {
        return std::nullopt;
    }
    return iterator_state->second;
}

std::size_t ContainmentTracker::state_count() const {
    std::size_t total = 0;
    for (const auto& shard : list_shards_) {
        std::scoped_lock lock(shard->mutex);
        for (const auto& [device_id, states] : shard->map_device_states) {
            total += states.size();
        }
    }
    return total;
}

}  // namespace geo_sentinel
