#pragma once

#include "types.hpp"
#include "config.hpp"
#include "geo.hpp"
#include "results.hpp"
#include "search_index.hpp"
#include <exception>
#include <string>
#include <variant>

namespace airfield {

// ============================================================================
// search_result - airports or a typed error
// ============================================================================

struct search_error {
    enum class kind {
        backend    // transport, authentication or malformed response
    };

    kind error_kind = kind::backend;
    std::string message;
    std::exception_ptr cause;   // original failure, may be null

    /// Rethrow the original failure (or a backend_error carrying the message).
    [[noreturn]] void rethrow() const;
};

class search_result {
public:
    search_result(airport_list airports) : value_(std::move(airports)) {}
    search_result(search_error error) : value_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<airport_list>(value_); }
    explicit operator bool() const { return ok(); }

    /// Sorted airports. Only valid when ok().
    const airport_list& airports() const { return std::get<airport_list>(value_); }
    airport_list& airports() { return std::get<airport_list>(value_); }

    /// Only valid when !ok().
    const search_error& error() const { return std::get<search_error>(value_); }

private:
    std::variant<airport_list, search_error> value_;
};

// ============================================================================
// airport_search - radius queries over a rectangle-only index
// ============================================================================
//
// Usage:
//   airfield::airport_search finder(airfield::configuration::from_environment());
//   auto result = finder.search(50.0, 47.0, 19.0);
//   if (result) for (auto& a : result.airports()) ...
//
// Inputs to search() are expected to be validated already:
// radius > 0, lat in [-90, 90], lon in [-180, 180].

class airport_search {
public:
    /// Searches through a libcurl-backed session.
    explicit airport_search(const configuration& config);

    /// Searches through an existing session (tests, pooled sessions).
    explicit airport_search(search_session session);

    search_result search(double radius_km, double lat, double lon);

    /// Release the underlying session. Later searches fail with a backend error.
    void close() { session_.close(); }

    /// Requests sent by the most recent search.
    size_t last_request_count() const { return last_request_count_; }

private:
    search_session session_;
    size_t last_request_count_ = 0;
};

} // namespace airfield
