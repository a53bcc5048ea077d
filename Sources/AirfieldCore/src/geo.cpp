#include "airfield/geo.hpp"
#include "airfield/log.hpp"
#include <algorithm>
#include <cmath>

namespace airfield {

namespace {

// Latitude overshoot below this is still treated as reaching the pole.
constexpr double pole_tolerance = 1e-9;

double to_radians(double degrees) {
    return degrees * pi / 180.0;
}

query_region full_band(double lat_s, double lat_n) {
    return single_region{geo_bounds(lat_s, lat_n, -180.0, 180.0)};
}

} // namespace

std::vector<geo_bounds> region_pieces(const query_region& region) {
    if (auto* split = std::get_if<split_region>(&region)) {
        return {split->west, split->east};
    }
    return {std::get<single_region>(region).bounds};
}

double haversine_distance(const geo_point& a, const geo_point& b) {
    double lat1 = to_radians(a.lat);
    double lat2 = to_radians(b.lat);
    double latitude_delta = to_radians(b.lat - a.lat);
    double longitude_delta = to_radians(b.lon - a.lon);

    double latitude_hav = std::sin(latitude_delta / 2.0);
    latitude_hav *= latitude_hav;
    double longitude_hav = std::sin(longitude_delta / 2.0);
    longitude_hav *= longitude_hav;

    double h = latitude_hav + std::cos(lat1) * std::cos(lat2) * longitude_hav;
    // Rounding can push h a hair past 1 for antipodal points
    h = std::clamp(h, 0.0, 1.0);
    return 2.0 * earth_radius_km * std::asin(std::sqrt(h));
}

query_region enclosing_region(double radius_km, const geo_point& origin) {
    // The circle covers the whole sphere
    if (radius_km >= earth_circumference_km / 2.0) {
        LOG_DEBUG("geo", "radius %.3f km covers the globe", radius_km);
        return single_region{geo_bounds::whole_globe()};
    }

    // Linear approximation along a meridian
    double dlat = radius_km / earth_circumference_km * 360.0;
    double lat_s = origin.lat - dlat;
    double lat_n = origin.lat + dlat;

    bool pole_reached = false;
    if (lat_s <= -90.0 + pole_tolerance) {
        lat_s = -90.0;
        pole_reached = true;
    }
    if (lat_n >= 90.0 - pole_tolerance) {
        lat_n = 90.0;
        pole_reached = true;
    }
    // A circle over a pole cannot be bounded in longitude
    if (pole_reached) {
        LOG_DEBUG("geo", "pole reached: lat [%f, %f]", lat_s, lat_n);
        return full_band(lat_s, lat_n);
    }

    double small_circumference = earth_circumference_km * std::cos(to_radians(origin.lat));
    if (radius_km >= small_circumference / 2.0) {
        return full_band(lat_s, lat_n);
    }

    double dlon = radius_km / small_circumference * 360.0;
    double lon_w = origin.lon - dlon;
    double lon_e = origin.lon + dlon;

    // dlon < 180 here, so at most one side crosses the antimeridian
    if (lon_w < -180.0) {
        lon_w += 360.0;
        LOG_DEBUG("geo", "split at antimeridian (west overflow): %f / %f", lon_w, lon_e);
        return split_region{geo_bounds(lat_s, lat_n, lon_w, 180.0),
                            geo_bounds(lat_s, lat_n, -180.0, lon_e)};
    }
    if (lon_e > 180.0) {
        lon_e -= 360.0;
        LOG_DEBUG("geo", "split at antimeridian (east overflow): %f / %f", lon_w, lon_e);
        return split_region{geo_bounds(lat_s, lat_n, lon_w, 180.0),
                            geo_bounds(lat_s, lat_n, -180.0, lon_e)};
    }

    return single_region{geo_bounds(lat_s, lat_n, lon_w, lon_e)};
}

} // namespace airfield
