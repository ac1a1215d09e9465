#include "http_client.hpp"

#include <format>
#include <memory>
#include <nlohmann/json.hpp>

namespace {

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct MimeDeleter {
    void operator()(curl_mime* m) const { curl_mime_free(m); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using MimeHandle = std::unique_ptr<curl_mime, MimeDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

HeaderList append_header(HeaderList list, const std::string& header) {
    curl_slist* raw = curl_slist_append(list.get(), header.c_str());
    if (raw) {
        (void)list.release();
        list.reset(raw);
    }
    return list;
}

} // namespace

HttpClient::HttpClient(Timeouts timeouts) : timeouts_(timeouts) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpClient::~HttpClient() {
    curl_global_cleanup();
}

namespace {

Result<HttpResponse> perform(CURL* curl, const std::string& url, HeaderList headers,
                             long connect_ms, long total_ms) {
    HttpResponse resp;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, connect_ms);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, total_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    }

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        return std::unexpected(classify_curl(res, url));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}

} // namespace

Result<HttpResponse> HttpClient::get(const std::string& url, long timeout_ms) const {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return std::unexpected(UnknownError{"curl_easy_init failed"});
    }

    HeaderList headers;
    if (!bearer_.empty()) {
        headers = append_header(std::move(headers), "Authorization: Bearer " + bearer_);
    }

    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    return perform(curl.get(), url, std::move(headers), timeouts_.connect_ms,
                   timeout_ms > 0 ? timeout_ms : timeouts_.total_ms);
}

Result<HttpResponse> HttpClient::post_json(const std::string& url, const std::string& body) const {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return std::unexpected(UnknownError{"curl_easy_init failed"});
    }

    HeaderList headers = append_header(HeaderList{}, "Content-Type: application/json");
    if (!bearer_.empty()) {
        headers = append_header(std::move(headers), "Authorization: Bearer " + bearer_);
    }

    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(body.size()));
    return perform(curl.get(), url, std::move(headers), timeouts_.connect_ms,
                   timeouts_.total_ms);
}

Result<HttpResponse> HttpClient::post_form(const std::string& url,
                                           const std::vector<FormField>& fields,
                                           std::span<const uint8_t> file_data) const {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return std::unexpected(UnknownError{"curl_easy_init failed"});
    }

    MimeHandle mime(curl_mime_init(curl.get()));
    for (const auto& f : fields) {
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, f.name.c_str());
        if (!f.filename.empty()) {
            curl_mime_data(part, reinterpret_cast<const char*>(file_data.data()),
                           file_data.size());
            curl_mime_filename(part, f.filename.c_str());
            if (!f.content_type.empty()) curl_mime_type(part, f.content_type.c_str());
        } else {
            curl_mime_data(part, f.value.c_str(), CURL_ZERO_TERMINATED);
        }
    }

    HeaderList headers;
    if (!bearer_.empty()) {
        headers = append_header(std::move(headers), "Authorization: Bearer " + bearer_);
    }

    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    return perform(curl.get(), url, std::move(headers), timeouts_.connect_ms,
                   timeouts_.total_ms);
}

Error classify_curl(CURLcode code, const std::string& url) {
    switch (code) {
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return NetworkError{NetworkKind::Refused,
                                std::format("{} is not reachable: {}", url,
                                            curl_easy_strerror(code))};
        case CURLE_OPERATION_TIMEDOUT:
            return NetworkError{NetworkKind::Timeout,
                                std::format("request to {} timed out", url)};
        case CURLE_LOGIN_DENIED:
            return NetworkError{NetworkKind::Auth, curl_easy_strerror(code)};
        default:
            return NetworkError{NetworkKind::Generic,
                                std::string("curl error: ") + curl_easy_strerror(code)};
    }
}

Error classify_status(long status, const std::string& detail) {
    switch (status) {
        case 401:
        case 403:
            return NetworkError{NetworkKind::Auth,
                                std::format("authentication rejected ({}): {}", status, detail)};
        case 404:
            return ServiceError{ServiceKind::NotFound,
                                std::format("model not found ({}): {}", status, detail)};
        case 429:
            return ServiceError{ServiceKind::RateLimited,
                                std::format("rate limit exceeded ({}): {}", status, detail)};
        default:
            return ServiceError{ServiceKind::Generic,
                                std::format("server returned {}: {}", status, detail)};
    }
}

bool is_success(long status) {
    return status >= 200 && status < 300;
}

std::string trim_transcript(const std::string& text) {
    auto start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

std::string error_detail(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        if (j.contains("error")) {
            const auto& e = j["error"];
            if (e.is_string()) return e.get<std::string>();
            if (e.is_object() && e.contains("message") && e["message"].is_string()) {
                return e["message"].get<std::string>();
            }
        }
    } catch (const nlohmann::json::exception&) {
        // Not JSON, fall through to the raw body.
    }

    constexpr size_t max_len = 200;
    auto trimmed = trim_transcript(body);
    if (trimmed.size() > max_len) trimmed = trimmed.substr(0, max_len) + "...";
    return trimmed.empty() ? std::string("no details") : trimmed;
}
