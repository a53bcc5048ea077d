#include "airfield/input.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <locale>
#include <optional>
#include <sstream>
#include <vector>

namespace airfield {

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::optional<double> parse_number(const std::string& text) {
    if (text.empty()) return std::nullopt;
    std::istringstream ss(text);
    ss.imbue(std::locale::classic());
    double value = 0.0;
    ss >> value;
    if (ss.fail() || !ss.eof() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

parsed_input invalid(std::string message) {
    parsed_input result;
    result.status = input_status::invalid;
    result.message = std::move(message);
    return result;
}

} // namespace

parsed_input parse_input(const std::string& line) {
    std::string text = trim(line);

    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "quit") {
        parsed_input result;
        result.status = input_status::quit;
        return result;
    }

    std::vector<std::string> fields;
    std::stringstream ss(text);
    for (std::string field; std::getline(ss, field, ';');) {
        fields.push_back(trim(field));
    }
    // getline drops an empty trailing field ("1;2;3;")
    if (!text.empty() && text.back() == ';') {
        fields.push_back("");
    }
    if (fields.size() != 3) {
        return invalid("expected three values: radius; latitude; longitude");
    }

    static const char* names[] = {"radius", "latitude", "longitude"};
    double values[3];
    for (size_t i = 0; i < 3; ++i) {
        auto number = parse_number(fields[i]);
        if (!number) {
            return invalid(std::string(names[i]) + " is not a number: '" + fields[i] + "'");
        }
        values[i] = *number;
    }

    if (values[0] <= 0.0) {
        return invalid("radius must be greater than 0");
    }
    if (values[1] < -90.0 || values[1] > 90.0) {
        return invalid("latitude must be between -90 and 90");
    }
    if (values[2] < -180.0 || values[2] > 180.0) {
        return invalid("longitude must be between -180 and 180");
    }

    parsed_input result;
    result.status = input_status::ok;
    result.query = search_query{values[0], values[1], values[2]};
    return result;
}

} // namespace airfield
