#include <stdexcept>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "geo_sentinel/geofence_registry.hpp"

using namespace geo_sentinel;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    geo_sentinel::test::ensure_logger_initialized();
    return true;
}();

Geofence make_geofence(const std::string& id, double radius_m, bool active = true) {
    return Geofence{id, "Fence " + id, GeofenceKind::SafeZone, GeodeticCoordinate{40.0, -74.0}, radius_m, active};
}
}  // namespace

TEST_CASE("GeofenceRegistry publishes copy-on-write snapshots") {
    GeofenceRegistry registry{};
    const GeofenceSnapshotPtr empty = registry.snapshot();
    REQUIRE(empty->geofences.empty());

    REQUIRE(registry.upsert(make_geofence("g1", 100.0)) == GeofenceChange::Added);
    const GeofenceSnapshotPtr first = registry.snapshot();
    REQUIRE(first->geofences.size() == 1);
    REQUIRE(first->version > empty->version);

    REQUIRE(registry.upsert(make_geofence("g2", 250.0)) == GeofenceChange::Added);

    SECTION("earlier snapshots are never mutated") {
        REQUIRE(first->geofences.size() == 1);
        REQUIRE(registry.snapshot()->geofences.size() == 2);
    }

    SECTION("updates replace the geometry") {
        REQUIRE(registry.upsert(make_geofence("g1", 300.0)) == GeofenceChange::Updated);
        REQUIRE(registry.find("g1")->radius_m == Approx(300.0));
        REQUIRE(registry.size() == 2);
    }

    SECTION("deactivated geofences stay known but leave the snapshot") {
        REQUIRE(registry.upsert(make_geofence("g1", 100.0, false)) == GeofenceChange::Deactivated);
        REQUIRE(registry.size() == 2);
        const GeofenceSnapshotPtr current = registry.snapshot();
        REQUIRE(current->geofences.size() == 1);
        REQUIRE(current->geofences.front().id == "g2");
    }

    SECTION("removal drops the geofence entirely") {
        REQUIRE(registry.remove("g2"));
        REQUIRE_FALSE(registry.remove("g2"));
        REQUIRE_FALSE(registry.find("g2").has_value());
        REQUIRE(registry.snapshot()->geofences.size() == 1);
    }
}

TEST_CASE("GeofenceRegistry rejects malformed geofences") {
    GeofenceRegistry registry{};
    REQUIRE_THROWS_AS(registry.upsert(make_geofence("", 100.0)), std::invalid_argument);
    REQUIRE_THROWS_AS(registry.upsert(make_geofence("g1", 0.0)), std::invalid_argument);
    REQUIRE_THROWS_AS(registry.upsert(make_geofence("g1", -5.0)), std::invalid_argument);

    Geofence off_planet = make_geofence("g1", 100.0);
    off_planet.center = GeodeticCoordinate{91.0, 0.0};
    REQUIRE_THROWS_AS(registry.upsert(off_planet), std::invalid_argument);

    REQUIRE(registry.size() == 0);
}
