
#include "web_fetch.hpp"
#include "http_request.hpp"
#include "logging.hpp"
#include <cstdlib>

namespace highway {

namespace {

std::string too_large(size_t max) {
  return "payload too large (maxsize=" + std::to_string(max) + ")";
}

void fetch_once(asio::io_context &io, const std::string &url,
                const FetchOptions &opts, bool redirected,
                FetchHandler handler) {
  if (!parse_url(url)) {
    FetchResult out;
    out.error = "bad url: " + url;
    handler(std::move(out));
    return;
  }
  int timeout = opts.timeout_seconds > 0 ? opts.timeout_seconds : 60;

  HttpOptions h;
  h.method = "GET";
  h.headers = opts.headers;
  h.timeout = std::chrono::seconds(timeout);
  h.max_body = opts.max_bytes;
  if (opts.use_proxy) {
    const char *proxy = std::getenv("http_proxy");
    if (proxy && *proxy)
      h.proxy = proxy;
  }
  std::string mime = opts.mime_prefix;
  size_t max = opts.max_bytes;
  h.check_headers = [mime, max, redirected](const HttpResponse &r) {
    if (r.status / 100 == 3 && !redirected && !r.header("location").empty())
      return std::string();
    if (r.status != 200)
      return "http status code: " + std::to_string(r.status);
    if (!mime.empty()) {
      std::string ct = r.header("content-type");
      if (ct.find(mime) == std::string::npos)
        return "not a valid " + mime + " file";
    }
    std::string cl = r.header("content-length");
    if (!cl.empty()) {
      try {
        if (std::stoull(cl) > max)
          return too_large(max);
      } catch (const std::exception &) {
        return "bad content-length: " + cl;
      }
    }
    return std::string();
  };

  asio::io_context *iop = &io;
  auto req = std::make_shared<HttpRequest>(
      io, url, std::move(h),
      [iop, opts, redirected, timeout,
       handler = std::move(handler)](HttpResult &&r) mutable {
        FetchResult out;
        if (r.ec == HttpErrc::rejected) {
          out.error = r.detail;
        } else if (r.ec == HttpErrc::timeout) {
          out.error = "download timeout (" + std::to_string(timeout) + "s)";
        } else if (r.ec == HttpErrc::body_too_large) {
          out.error = too_large(opts.max_bytes);
        } else if (r.ec) {
          out.error = r.detail;
        } else if (r.response.status / 100 == 3 && !redirected &&
                   !r.response.redirect_url.empty()) {
          const std::string &next = r.response.redirect_url;
          Logger::instance().log(LogLevel::DEBUG, "redirected to %s",
                                 next.c_str());
          fetch_once(*iop, next, opts, true, std::move(handler));
          return;
        } else if (r.response.status != 200) {
          out.error = "http status code: " + std::to_string(r.response.status);
        } else {
          out.ok = true;
          out.body = std::move(r.response.body);
        }
        if (!out.ok)
          Logger::instance().log(LogLevel::WARN, "download failed: %s",
                                 out.error.c_str());
        handler(std::move(out));
      });
  req->start();
}

} // namespace

void download_from_web(asio::io_context &io, const std::string &url,
                       const FetchOptions &opts, FetchHandler handler) {
  fetch_once(io, url, opts, false, std::move(handler));
}

void download_web_image(asio::io_context &io, const std::string &url,
                        bool use_proxy, int timeout_seconds,
                        FetchHandler handler,
                        std::map<std::string, std::string> headers) {
  FetchOptions opts;
  opts.headers = std::move(headers);
  opts.timeout_seconds = timeout_seconds;
  opts.use_proxy = use_proxy;
  opts.mime_prefix = "image";
  download_from_web(io, url, opts, std::move(handler));
}

void download_web_record(asio::io_context &io, const std::string &url,
                         bool use_proxy, int timeout_seconds,
                         FetchHandler handler,
                         std::map<std::string, std::string> headers) {
  FetchOptions opts;
  opts.headers = std::move(headers);
  opts.timeout_seconds = timeout_seconds;
  opts.use_proxy = use_proxy;
  opts.max_bytes = 0xfffffff;
  download_from_web(io, url, opts, std::move(handler));
}

} // namespace highway
