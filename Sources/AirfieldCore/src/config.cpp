#include "airfield/config.hpp"
#include <algorithm>
#include <cstdlib>

namespace airfield {

namespace {

const char* env(const char* name) {
    const char* value = getenv(name);
    return (value && *value) ? value : nullptr;
}

long parse_long(const char* name, const char* text) {
    try {
        size_t consumed = 0;
        long value = std::stol(text, &consumed);
        if (consumed != std::string(text).size()) {
            throw config_error(std::string(name) + ": trailing characters in '" + text + "'");
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw config_error(std::string(name) + ": not a number: '" + text + "'");
    } catch (const std::out_of_range&) {
        throw config_error(std::string(name) + ": out of range: '" + text + "'");
    }
}

std::string strip_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

} // namespace

int configuration::effective_page_size() const {
    return std::clamp(page_size, 1, max_page_size);
}

std::string configuration::search_url() const {
    return strip_trailing_slashes(base_url) + "/" + database + "/_design/" + design_doc +
           "/_search/" + index;
}

configuration configuration::from_environment() {
    configuration config;

    if (auto v = env("AIRFIELD_BASE_URL")) config.base_url = v;
    if (auto v = env("AIRFIELD_DATABASE")) config.database = v;
    if (auto v = env("AIRFIELD_DESIGN_DOC")) config.design_doc = v;
    if (auto v = env("AIRFIELD_INDEX")) config.index = v;
    if (auto v = env("AIRFIELD_USERNAME")) config.username = v;
    if (auto v = env("AIRFIELD_PASSWORD")) config.password = v;

    if (auto v = env("AIRFIELD_PAGE_SIZE")) {
        long size = parse_long("AIRFIELD_PAGE_SIZE", v);
        if (size < 1 || size > max_page_size) {
            throw config_error("AIRFIELD_PAGE_SIZE must be between 1 and " +
                               std::to_string(max_page_size));
        }
        config.page_size = static_cast<int>(size);
    }
    if (auto v = env("AIRFIELD_TIMEOUT")) {
        long timeout = parse_long("AIRFIELD_TIMEOUT", v);
        if (timeout < 0) {
            throw config_error("AIRFIELD_TIMEOUT must not be negative");
        }
        config.timeout_seconds = timeout;
    }
    if (auto v = env("AIRFIELD_LOG_LEVEL")) {
        auto level = parse_log_level(v);
        if (!level) {
            throw config_error(std::string("AIRFIELD_LOG_LEVEL: unknown level '") + v + "'");
        }
        config.log = *level;
    }

    return config;
}

} // namespace airfield
