#include "airfield/results.hpp"
#include "airfield/geo.hpp"
#include <algorithm>
#include <iomanip>
#include <ostream>

namespace airfield {

airport_list filter_and_sort(airport_list candidates, double radius_km, const geo_point& origin) {
    airport_list within;
    within.reserve(candidates.size());

    for (auto& candidate : candidates) {
        double d = haversine_distance(origin, candidate.position());
        if (d <= radius_km) {
            candidate.distance = d;
            within.push_back(std::move(candidate));
        }
    }

    std::stable_sort(within.begin(), within.end(), [](const airport& a, const airport& b) {
        return *a.distance < *b.distance;
    });
    return within;
}

void print_results(std::ostream& out, double radius_km, const geo_point& origin,
                   const airport_list& airports) {
    out << airports.size() << " airport(s) within " << radius_km << " km of ("
        << origin.lat << ", " << origin.lon << ")" << std::endl;

    auto flags = out.flags();
    auto precision = out.precision();
    out << std::fixed << std::setprecision(3);
    for (const auto& a : airports) {
        out << "  " << std::left << std::setw(40) << a.name << std::right
            << std::setw(12) << a.distance.value_or(0.0) << " km" << std::endl;
    }
    out.flags(flags);
    out.precision(precision);
}

} // namespace airfield
