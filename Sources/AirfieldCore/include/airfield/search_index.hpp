#pragma once

#include "types.hpp"
#include "config.hpp"
#include "network.hpp"
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace airfield {

/// Any failure while talking to or reading from the search backend.
/// Keeps the exception that caused it, when there was one.
class backend_error : public std::runtime_error {
public:
    explicit backend_error(const std::string& msg, std::exception_ptr cause = nullptr)
        : std::runtime_error(msg), cause_(std::move(cause)) {}

    std::exception_ptr cause() const { return cause_; }

private:
    std::exception_ptr cause_;
};

// ============================================================================
// search_session - connection to one search index
// ============================================================================
//
// Owns the HTTP client for the lifetime of the session. Construction does no
// network I/O; connection problems surface on the first request. The client
// is released by close() or the destructor, whichever comes first.
// Not safe for concurrent use.

class search_session {
public:
    search_session(configuration config, std::unique_ptr<http_client> client);
    ~search_session();

    // Non-copyable
    search_session(const search_session&) = delete;
    search_session& operator=(const search_session&) = delete;

    // Moveable
    search_session(search_session&& other) noexcept;
    search_session& operator=(search_session&& other) noexcept;

    /// Session backed by libcurl, configured from `config`.
    static search_session open(const configuration& config);

    bool is_open() const { return client_ != nullptr; }
    void close();

    /// Throws backend_error if the session is closed or no response arrives.
    http_response get(const std::string& url);

    const configuration& config() const { return config_; }

private:
    configuration config_;
    std::unique_ptr<http_client> client_;
};

// ============================================================================
// search_index_client - paged rectangle queries
// ============================================================================

/// One page of a search response.
struct search_page {
    size_t total_rows = 0;     // matches for the whole query, not this page
    std::string bookmark;
    airport_list rows;

    /// Parse `{total_rows, bookmark, rows: [{id, fields: {name, lat, lon}}]}`.
    /// Throws backend_error if the body is not JSON of that shape.
    static search_page parse(const std::string& body);
};

class search_index_client {
public:
    explicit search_index_client(search_session& session) : session_(session) {}

    /// lat:[LOW TO HIGH] AND lon:[LOW TO HIGH]
    static std::string format_query(const geo_bounds& bounds);

    /// Request URL for one page; an empty bookmark asks for the first page.
    std::string page_url(const std::string& query, const std::string& bookmark) const;

    search_page fetch_page(const std::string& query, const std::string& bookmark = "");

    /// Every row matching `query`, following bookmarks until the reported
    /// total has been read.
    airport_list fetch_all(const std::string& query);

    /// Rows for every piece of `region`, concatenated in piece order.
    /// Throws backend_error; nothing is returned from a failed collection.
    airport_list collect(const query_region& region);

    size_t requests_issued() const { return requests_issued_; }

private:
    search_session& session_;
    size_t requests_issued_ = 0;
};

} // namespace airfield
