// airfield - interactive radius search over the airport index
//
// Reads "radius; latitude; longitude" lines from stdin and prints the
// airports within radius km of the point, nearest first. "quit" exits.

#include <AirfieldCore.hpp>
#include <iostream>
#include <string>

int main() {
    airfield::configuration config;
    try {
        config = airfield::configuration::from_environment();
    } catch (const airfield::config_error& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    airfield::set_log_level(config.log);
    LOG_INFO("main", "searching %s", config.search_url().c_str());

    airfield::airport_search finder(config);

    std::cout << "Find airports around a point. Enter: radius; latitude; longitude"
              << " (km, degrees). Type 'quit' to exit." << std::endl;

    std::string line;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        auto input = airfield::parse_input(line);
        if (input.status == airfield::input_status::quit) {
            break;
        }
        if (input.status == airfield::input_status::invalid) {
            std::cout << "Invalid input: " << input.message << std::endl;
            continue;
        }

        const auto& q = input.query;
        auto result = finder.search(q.radius_km, q.lat, q.lon);
        if (!result) {
            std::cout << "Search failed: " << result.error().message << std::endl;
            continue;
        }
        airfield::print_results(std::cout, q.radius_km, airfield::geo_point(q.lat, q.lon), result.airports());
    }

    finder.close();
    return 0;
}
