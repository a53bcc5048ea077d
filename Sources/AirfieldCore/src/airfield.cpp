#include "airfield/airfield.hpp"
#include "airfield/log.hpp"
#include <algorithm>
#include <cctype>

namespace airfield {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

std::optional<log_level> parse_log_level(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "off") return log_level::off;
    if (lower == "error") return log_level::error;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "info") return log_level::info;
    if (lower == "debug") return log_level::debug;
    return std::nullopt;
}

const char* log_level_name(log_level level) {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "unknown";
}

void search_error::rethrow() const {
    if (cause) {
        std::rethrow_exception(cause);
    }
    throw backend_error(message);
}

// ============================================================================
// airport_search implementation
// ============================================================================

airport_search::airport_search(const configuration& config)
    : session_(search_session::open(config)) {
}

airport_search::airport_search(search_session session)
    : session_(std::move(session)) {
}

search_result airport_search::search(double radius_km, double lat, double lon) {
    geo_point origin(lat, lon);
    auto region = enclosing_region(radius_km, origin);
    LOG_DEBUG("search", "radius %.3f km around (%f, %f): %zu rectangle(s)",
              radius_km, lat, lon, region_pieces(region).size());

    search_index_client client(session_);
    airport_list candidates;
    try {
        candidates = client.collect(region);
    } catch (const backend_error& e) {
        last_request_count_ = client.requests_issued();
        return search_error{search_error::kind::backend, e.what(), std::current_exception()};
    }
    last_request_count_ = client.requests_issued();

    size_t candidate_count = candidates.size();
    auto airports = filter_and_sort(std::move(candidates), radius_km, origin);
    LOG_INFO("search", "%zu of %zu candidates within %.3f km of (%f, %f)",
             airports.size(), candidate_count, radius_km, lat, lon);
    return airports;
}

} // namespace airfield
