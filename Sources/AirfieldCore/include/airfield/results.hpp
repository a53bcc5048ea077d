#pragma once

#include "types.hpp"
#include <iosfwd>

namespace airfield {

/// Attach the distance from `origin` to every candidate, drop those farther
/// than `radius_km` (a candidate at exactly radius_km is kept) and return the
/// rest ordered by ascending distance. Equal distances keep their input order.
airport_list filter_and_sort(airport_list candidates, double radius_km, const geo_point& origin);

/// Summary line with the query as entered, then one "name  distance km" row
/// per airport (3 decimals). The stream's formatting state is left unchanged.
void print_results(std::ostream& out, double radius_km, const geo_point& origin,
                   const airport_list& airports);

} // namespace airfield
