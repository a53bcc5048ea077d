#include "airfield/search_index.hpp"
#include "airfield/log.hpp"
#include <nlohmann/json.hpp>
#include <charconv>
#include <cstdint>
#include <iterator>
#include <system_error>

namespace airfield {

using json = nlohmann::json;

namespace {

// Shortest fixed-notation text that reads back as the same double, so
// printing never moves a bound and never uses an exponent.
std::string format_coordinate(double value) {
    char buffer[400];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::fixed);
    if (ec != std::errc()) {
        throw backend_error("could not format coordinate");
    }
    return std::string(buffer, end);
}

std::string snippet(const std::string& body) {
    constexpr size_t max_len = 200;
    return body.size() <= max_len ? body : body.substr(0, max_len) + "...";
}

airport parse_row(const json& row, size_t index) {
    auto where = "row " + std::to_string(index);
    if (!row.is_object() || !row.contains("fields") || !row["fields"].is_object()) {
        throw backend_error("malformed response: " + where + " has no fields object");
    }
    const auto& fields = row["fields"];

    airport a;
    if (row.contains("id") && row["id"].is_string()) {
        a.id = row["id"].get<std::string>();
    }
    if (!fields.contains("name") || !fields["name"].is_string()) {
        throw backend_error("malformed response: " + where + " has no name");
    }
    if (!fields.contains("lat") || !fields["lat"].is_number() ||
        !fields.contains("lon") || !fields["lon"].is_number()) {
        throw backend_error("malformed response: " + where + " has no numeric lat/lon");
    }
    a.name = fields["name"].get<std::string>();
    a.lat = fields["lat"].get<double>();
    a.lon = fields["lon"].get<double>();
    return a;
}

} // namespace

// ============================================================================
// search_session implementation
// ============================================================================

search_session::search_session(configuration config, std::unique_ptr<http_client> client)
    : config_(std::move(config)), client_(std::move(client)) {
}

search_session::~search_session() {
    close();
}

search_session::search_session(search_session&& other) noexcept
    : config_(std::move(other.config_)), client_(std::move(other.client_)) {
}

search_session& search_session::operator=(search_session&& other) noexcept {
    if (this != &other) {
        close();
        config_ = std::move(other.config_);
        client_ = std::move(other.client_);
    }
    return *this;
}

search_session search_session::open(const configuration& config) {
    curl_options options;
    options.timeout_seconds = config.timeout_seconds;
    options.username = config.username;
    options.password = config.password;
    return search_session(config, std::make_unique<curl_http_client>(options));
}

void search_session::close() {
    if (client_) {
        LOG_DEBUG("session", "closing session for %s", config_.search_url().c_str());
        client_.reset();
    }
}

http_response search_session::get(const std::string& url) {
    if (!client_) {
        throw backend_error("search session is closed");
    }

    http_request request;
    request.method = "GET";
    request.url = url;
    request.headers["Accept"] = "application/json";

    try {
        return client_->send(request);
    } catch (const std::exception& e) {
        throw backend_error(std::string("transport failure: ") + e.what(), std::current_exception());
    }
}

// ============================================================================
// search_page implementation
// ============================================================================

search_page search_page::parse(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw backend_error(std::string("malformed response: ") + e.what(), std::current_exception());
    }

    if (!j.is_object()) {
        throw backend_error("malformed response: expected a JSON object");
    }
    if (!j.contains("total_rows") || !j["total_rows"].is_number_integer() ||
        j["total_rows"].get<int64_t>() < 0) {
        throw backend_error("malformed response: missing total_rows");
    }
    if (!j.contains("rows") || !j["rows"].is_array()) {
        throw backend_error("malformed response: missing rows");
    }

    search_page page;
    page.total_rows = j["total_rows"].get<size_t>();

    if (j.contains("bookmark")) {
        if (!j["bookmark"].is_string()) {
            throw backend_error("malformed response: bookmark is not a string");
        }
        page.bookmark = j["bookmark"].get<std::string>();
    }

    const auto& rows = j["rows"];
    page.rows.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        page.rows.push_back(parse_row(rows[i], i));
    }
    return page;
}

// ============================================================================
// search_index_client implementation
// ============================================================================

std::string search_index_client::format_query(const geo_bounds& bounds) {
    return "lat:[" + format_coordinate(bounds.min_lat) + " TO " + format_coordinate(bounds.max_lat) +
           "] AND lon:[" + format_coordinate(bounds.min_lon) + " TO " + format_coordinate(bounds.max_lon) + "]";
}

std::string search_index_client::page_url(const std::string& query, const std::string& bookmark) const {
    const auto& config = session_.config();
    std::string url = config.search_url() + "?q=" + url_encode(query) +
                      "&limit=" + std::to_string(config.effective_page_size());
    if (!bookmark.empty()) {
        url += "&bookmark=" + url_encode(bookmark);
    }
    return url;
}

search_page search_index_client::fetch_page(const std::string& query, const std::string& bookmark) {
    auto url = page_url(query, bookmark);
    LOG_DEBUG("search", "GET %s", url.c_str());

    ++requests_issued_;
    auto response = session_.get(url);

    if (response.status_code == 401 || response.status_code == 403) {
        throw backend_error("authentication failed (HTTP " + std::to_string(response.status_code) +
                            "): " + snippet(response.body_string()));
    }
    if (!response.is_success()) {
        throw backend_error("search request failed (HTTP " + std::to_string(response.status_code) +
                            "): " + snippet(response.body_string()));
    }
    return search_page::parse(response.body_string());
}

airport_list search_index_client::fetch_all(const std::string& query) {
    airport_list rows;
    std::string bookmark;
    size_t total = 0;

    do {
        auto page = fetch_page(query, bookmark);
        total = page.total_rows;

        if (page.rows.empty() && rows.size() < total) {
            throw backend_error("inconsistent paging: empty page after " + std::to_string(rows.size()) +
                                " of " + std::to_string(total) + " rows");
        }
        rows.insert(rows.end(),
                    std::make_move_iterator(page.rows.begin()),
                    std::make_move_iterator(page.rows.end()));

        if (rows.size() < total && page.bookmark.empty()) {
            throw backend_error("inconsistent paging: no bookmark after " + std::to_string(rows.size()) +
                                " of " + std::to_string(total) + " rows");
        }
        bookmark = std::move(page.bookmark);
    } while (rows.size() < total);

    LOG_DEBUG("search", "%zu rows for %s", rows.size(), query.c_str());
    return rows;
}

airport_list search_index_client::collect(const query_region& region) {
    airport_list combined;
    try {
        for (const auto& piece : region_pieces(region)) {
            auto rows = fetch_all(format_query(piece));
            combined.insert(combined.end(),
                            std::make_move_iterator(rows.begin()),
                            std::make_move_iterator(rows.end()));
        }
    } catch (const backend_error& e) {
        LOG_ERROR("search", "%s", e.what());
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("search", "unexpected failure: %s", e.what());
        throw backend_error(std::string("unexpected failure: ") + e.what(), std::current_exception());
    }
    return combined;
}

} // namespace airfield
