#pragma once

#include <string>

namespace airfield {

enum class input_status {
    ok,
    invalid,
    quit
};

struct search_query {
    double radius_km = 0.0;
    double lat = 0.0;
    double lon = 0.0;
};

struct parsed_input {
    input_status status = input_status::invalid;
    search_query query;     // set when status == ok
    std::string message;    // reason when status == invalid
};

/// Parse one line of the form "radius; latitude; longitude".
/// "quit" (any case, surrounding whitespace ignored) asks to exit.
parsed_input parse_input(const std::string& line);

} // namespace airfield
