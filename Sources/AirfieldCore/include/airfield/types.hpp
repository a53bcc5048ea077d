#pragma once

#include <string>
#include <optional>
#include <vector>
#include <variant>

namespace airfield {

// A position on the sphere in degrees.
struct geo_point {
    double lat = 0.0;
    double lon = 0.0;

    geo_point() = default;
    geo_point(double latitude, double longitude) : lat(latitude), lon(longitude) {}

    bool operator==(const geo_point& other) const {
        return lat == other.lat && lon == other.lon;
    }
};

// Axis-aligned lat/lon rectangle, inclusive on every side
struct geo_bounds {
    double min_lat = 0.0;
    double max_lat = 0.0;
    double min_lon = 0.0;
    double max_lon = 0.0;

    geo_bounds() = default;

    geo_bounds(double minLat, double maxLat, double minLon, double maxLon)
        : min_lat(minLat), max_lat(maxLat), min_lon(minLon), max_lon(maxLon) {}

    static geo_bounds whole_globe() {
        return geo_bounds(-90.0, 90.0, -180.0, 180.0);
    }

    bool operator==(const geo_bounds& other) const {
        return min_lat == other.min_lat && max_lat == other.max_lat &&
               min_lon == other.min_lon && max_lon == other.max_lon;
    }

    bool operator!=(const geo_bounds& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Query region - the rectangle(s) that enclose a search circle
// ============================================================================

struct single_region {
    geo_bounds bounds;
};

// Used only when the circle straddles the antimeridian. Both pieces share the
// same latitude bounds; west ends at +180, east starts at -180.
struct split_region {
    geo_bounds west;
    geo_bounds east;
};

using query_region = std::variant<single_region, split_region>;

/// Pieces of a region in the order they are queried (west first).
std::vector<geo_bounds> region_pieces(const query_region& region);

inline bool is_split(const query_region& region) {
    return std::holds_alternative<split_region>(region);
}

// ============================================================================
// Airport records
// ============================================================================

struct airport {
    std::string id;            // backend document id, empty if not reported
    std::string name;
    double lat = 0.0;
    double lon = 0.0;

    // Great-circle distance from the search origin (km). Set by filter_and_sort.
    std::optional<double> distance;

    geo_point position() const { return geo_point(lat, lon); }
};

using airport_list = std::vector<airport>;

} // namespace airfield
