#pragma once
#include <asio.hpp>
#include <curl/curl.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace highway {

enum class HttpErrc {
    bad_url = 1,
    bad_response,
    timeout,
    body_too_large,
    rejected,
    proxy_failed,
    truncated,
    transfer_failed
};

const std::error_category& http_category();
std::error_code make_error_code(HttpErrc e);

} // namespace highway

namespace std {
template <> struct is_error_code_enum<highway::HttpErrc> : true_type {};
}

namespace highway {

struct HttpResponse {
    int status{0};
    std::map<std::string, std::string> headers; // names lower-cased
    std::vector<uint8_t> body;
    std::string redirect_url;                   // absolute Location of a 3xx

    std::string header(const std::string& name) const;
};

struct HttpResult {
    std::error_code ec;
    std::string detail;
    HttpResponse response;
};

struct HttpOptions {
    std::string method{"GET"};
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;
    std::chrono::milliseconds timeout{0};   // zero: no limit
    size_t max_body{static_cast<size_t>(-1)};
    std::string proxy;                      // empty: direct, $http_proxy ignored
    bool verify_peer{true};
    // Runs on the transfer thread once the headers of the final response
    // are in. A non-empty return aborts the request with HttpErrc::rejected
    // and that text as detail.
    std::function<std::string(const HttpResponse&)> check_headers;
};

// One HTTP exchange through libcurl. Redirects are not followed. The
// transfer runs on its own thread; the handler runs exactly once, on the
// io_context, which is kept busy until then.
class HttpRequest : public std::enable_shared_from_this<HttpRequest> {
public:
    using Handler = std::function<void(HttpResult&&)>;

    HttpRequest(asio::io_context& io, std::string url, HttpOptions opts, Handler handler);
    void start();
    // Aborts the transfer; the handler sees asio::error::operation_aborted
    // unless the result was already on its way.
    void cancel() { cancelled_ = true; }

private:
    static size_t on_header(char* data, size_t size, size_t n, void* user);
    static size_t on_body(char* data, size_t size, size_t n, void* user);
    static int on_progress(void* user, curl_off_t, curl_off_t, curl_off_t, curl_off_t);

    HttpResult perform();

    asio::io_context& io_;
    std::string url_;
    HttpOptions opts_;
    Handler handler_;
    std::atomic<bool> cancelled_{false};

    // transfer thread only
    CURL* curl_{nullptr};
    HttpResponse resp_;
    std::string rejected_;
    bool too_large_{false};
    bool headers_checked_{false};
};

} // namespace highway
