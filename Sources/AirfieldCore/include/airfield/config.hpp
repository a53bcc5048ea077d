#pragma once

#include "log.hpp"
#include <string>
#include <stdexcept>

namespace airfield {

class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Hard cap on rows per search request imposed by the backend.
constexpr int max_page_size = 200;

struct configuration {
    /// Account root of the search service.
    std::string base_url = "https://mikerhodes.cloudant.com";

    /// Database, design document and search index holding the airports.
    std::string database = "airportdb";
    std::string design_doc = "view1";
    std::string index = "geo";

    /// Rows requested per page. Clamped to 1..max_page_size when used.
    int page_size = max_page_size;

    /// HTTP basic authentication. Empty username = anonymous.
    std::string username;
    std::string password;

    long timeout_seconds = 30;

    log_level log = log_level::warn;

    int effective_page_size() const;

    /// {base_url}/{database}/_design/{design_doc}/_search/{index}
    std::string search_url() const;

    /// Defaults overridden by AIRFIELD_* environment variables.
    /// Throws config_error on an unparsable value.
    static configuration from_environment();
};

} // namespace airfield
