#pragma once

#include "../errors.hpp"

#include <curl/curl.h>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

struct HttpResponse {
    long status = 0;
    std::string body;
};

// A single multipart/form-data field. Fields with a filename are sent as
// file uploads.
struct FormField {
    std::string name;
    std::string value;
    std::string filename;
    std::string content_type;
};

// Thin libcurl wrapper. Transport failures come back already classified;
// HTTP error statuses are returned as responses and classified by the caller
// through classify_status().
class HttpClient {
public:
    struct Timeouts {
        long connect_ms = 10000;
        long total_ms = 30000;
    };

    explicit HttpClient(Timeouts timeouts);
    HttpClient() : HttpClient(Timeouts{}) {}
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    void set_bearer_token(std::string token) { bearer_ = std::move(token); }

    Result<HttpResponse> get(const std::string& url, long timeout_ms = 0) const;
    Result<HttpResponse> post_json(const std::string& url, const std::string& body) const;
    Result<HttpResponse> post_form(const std::string& url, const std::vector<FormField>& fields,
                                   std::span<const uint8_t> file_data) const;

private:
    Timeouts timeouts_;
    std::string bearer_;
};

Error classify_curl(CURLcode code, const std::string& url);

// Maps a non-2xx HTTP status onto the error taxonomy.
Error classify_status(long status, const std::string& detail);

bool is_success(long status);

// Best-effort human-readable reason from an error response body.
std::string error_detail(const std::string& body);

// Strips leading/trailing whitespace the servers like to return.
std::string trim_transcript(const std::string& text);
