
#pragma once
#include <asio.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "util.hpp"

namespace highway {

struct FetchOptions {
    std::map<std::string, std::string> headers;
    int timeout_seconds{60};            // <= 0 falls back to 60
    bool use_proxy{false};              // honours $http_proxy
    std::string mime_prefix;            // must appear in Content-Type when set
    size_t max_bytes{kMaxUploadSize};
};

struct FetchResult {
    bool ok{false};
    std::string error;                  // human readable, offending value included
    std::vector<uint8_t> body;
};

using FetchHandler = std::function<void(FetchResult&&)>;

// GET with at most one redirect hop. Rejects non-200 statuses, a
// Content-Type without mime_prefix, bodies reaching max_bytes and timeouts.
void download_from_web(asio::io_context& io, const std::string& url,
                       const FetchOptions& opts, FetchHandler handler);

void download_web_image(asio::io_context& io, const std::string& url, bool use_proxy,
                        int timeout_seconds, FetchHandler handler,
                        std::map<std::string, std::string> headers = {});
void download_web_record(asio::io_context& io, const std::string& url, bool use_proxy,
                         int timeout_seconds, FetchHandler handler,
                         std::map<std::string, std::string> headers = {});

} // namespace highway
