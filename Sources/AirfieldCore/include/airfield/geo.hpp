#pragma once

#include "types.hpp"

namespace airfield {

/// Mean earth radius used by every distance and projection calculation (km).
constexpr double earth_radius_km = 6371.0088;

constexpr double pi = 3.14159265358979323846;

/// Great-circle circumference of the sphere (km).
constexpr double earth_circumference_km = 2.0 * pi * earth_radius_km;

/// Haversine distance between two points, in km.
double haversine_distance(const geo_point& a, const geo_point& b);

inline double haversine_distance(double lat1, double lon1, double lat2, double lon2) {
    return haversine_distance(geo_point(lat1, lon1), geo_point(lat2, lon2));
}

/// Rectangle(s) guaranteed to contain every point within `radius_km` of
/// `origin`. The result may include area outside the circle (corners, the
/// full longitude band near the poles), never less.
///
/// Returns a split_region when the longitude range crosses +/-180; the
/// pieces are (lat_S, lat_N, lon_W, 180) and (lat_S, lat_N, -180, lon_E).
///
/// radius_km must be positive; origin must be a valid lat/lon.
query_region enclosing_region(double radius_km, const geo_point& origin);

inline query_region enclosing_region(double radius_km, double lat, double lon) {
    return enclosing_region(radius_km, geo_point(lat, lon));
}

} // namespace airfield
