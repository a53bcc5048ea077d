#include "airfield/network.hpp"
#include "airfield/log.hpp"
#include <curl/curl.h>
#include <climits>
#include <memory>

namespace airfield {

namespace {

// libcurl global state: initialised on first use, cleaned up at exit
class curl_global {
public:
    static void ensure() {
        static curl_global instance;
        (void)instance;
    }

private:
    curl_global() {
        CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (res != CURLE_OK) {
            throw transport_error(std::string("curl_global_init failed: ") + curl_easy_strerror(res));
        }
    }
    ~curl_global() { curl_global_cleanup(); }
};

using curl_handle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using curl_string = std::unique_ptr<char, decltype(&curl_free)>;

size_t write_callback(char* contents, size_t size, size_t nmemb, void* user_data) {
    auto* body = static_cast<std::vector<uint8_t>*>(user_data);
    size_t total = size * nmemb;
    body->insert(body->end(), contents, contents + total);
    return total;
}

// Header lines arrive one at a time ("Name: value\r\n")
size_t header_callback(char* buffer, size_t size, size_t nitems, void* user_data) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(user_data);
    size_t total = size * nitems;
    std::string line(buffer, total);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        auto first = value.find_first_not_of(" \t");
        auto last = value.find_last_not_of(" \t\r\n");
        value = (first == std::string::npos) ? "" : value.substr(first, last - first + 1);
        (*headers)[name] = value;
    }
    return total;
}

} // namespace

curl_http_client::curl_http_client(curl_options options) : options_(std::move(options)) {
    curl_global::ensure();
}

curl_http_client::~curl_http_client() {
    if (handle_) {
        curl_easy_cleanup(static_cast<CURL*>(handle_));
        handle_ = nullptr;
    }
}

http_response curl_http_client::send(const http_request& request) {
    if (request.method != "GET") {
        throw transport_error("unsupported method " + request.method + " for " + request.url);
    }
    if (!handle_) {
        handle_ = curl_easy_init();
        if (!handle_) {
            throw transport_error("curl_easy_init failed");
        }
    }
    CURL* curl = static_cast<CURL*>(handle_);
    curl_easy_reset(curl);

    http_response response;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    std::string credentials;
    if (!options_.username.empty()) {
        credentials = options_.username + ":" + options_.password;
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl, CURLOPT_USERPWD, credentials.c_str());
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        std::string error = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
        LOG_ERROR("http", "%s %s failed: %s", request.method.c_str(), request.url.c_str(), error.c_str());
        throw transport_error(request.method + " " + request.url + " failed: " + error);
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status_code = static_cast<int>(status);
    LOG_DEBUG("http", "%s %s -> %d (%zu bytes)", request.method.c_str(), request.url.c_str(),
              response.status_code, response.body.size());
    return response;
}

std::string url_encode(const std::string& value) {
    if (value.size() > static_cast<size_t>(INT_MAX)) {
        throw transport_error("url_encode: value too long");
    }
    curl_global::ensure();

    curl_handle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw transport_error("curl_easy_init failed");
    }
    curl_string escaped(curl_easy_escape(curl.get(), value.data(), static_cast<int>(value.size())),
                        &curl_free);
    if (!escaped) {
        throw transport_error("curl_easy_escape failed");
    }
    return std::string(escaped.get());
}

} // namespace airfield
