#include "http_request.hpp"
#include "logging.hpp"
#include <cctype>
#include <thread>

namespace highway {

namespace {

class HttpCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "http"; }
  std::string message(int ev) const override {
    switch (static_cast<HttpErrc>(ev)) {
    case HttpErrc::bad_url:
      return "bad url";
    case HttpErrc::bad_response:
      return "malformed http response";
    case HttpErrc::timeout:
      return "request timed out";
    case HttpErrc::body_too_large:
      return "response body too large";
    case HttpErrc::rejected:
      return "response rejected";
    case HttpErrc::proxy_failed:
      return "proxy tunnel failed";
    case HttpErrc::truncated:
      return "connection closed before the body was complete";
    case HttpErrc::transfer_failed:
      return "http transfer failed";
    }
    return "unknown http error";
  }
};

std::string lower(std::string s) {
  for (auto &c : s)
    c = (char)std::tolower((unsigned char)c);
  return s;
}

std::string trim(const std::string &s) {
  size_t b = s.find_first_not_of(" \t");
  if (b == std::string::npos)
    return {};
  size_t e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

bool curl_ready() {
  static const bool ok = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
  return ok;
}

struct EasyDeleter {
  void operator()(CURL *c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
  void operator()(curl_slist *l) const { curl_slist_free_all(l); }
};

} // namespace

const std::error_category &http_category() {
  static HttpCategory cat;
  return cat;
}

std::error_code make_error_code(HttpErrc e) {
  return {static_cast<int>(e), http_category()};
}

std::string HttpResponse::header(const std::string &name) const {
  auto it = headers.find(lower(name));
  return it == headers.end() ? std::string() : it->second;
}

HttpRequest::HttpRequest(asio::io_context &io, std::string url,
                         HttpOptions opts, Handler handler)
    : io_(io), url_(std::move(url)), opts_(std::move(opts)),
      handler_(std::move(handler)) {}

void HttpRequest::start() {
  auto self = shared_from_this();
  if (!curl_ready()) {
    asio::post(io_, [self]() {
      HttpResult r{HttpErrc::transfer_failed, "curl_global_init failed", {}};
      auto h = std::move(self->handler_);
      if (h)
        h(std::move(r));
    });
    return;
  }
  Logger::instance().log(LogLevel::DEBUG, "%s %s%s", opts_.method.c_str(),
                         url_.c_str(), opts_.proxy.empty() ? "" : " (proxied)");

  auto work = asio::make_work_guard(io_);
  std::thread([self, work = std::move(work)]() mutable {
    HttpResult r = self->perform();
    asio::post(self->io_, [self, r = std::move(r)]() mutable {
      auto h = std::move(self->handler_);
      if (h)
        h(std::move(r));
    });
    work.reset();
  }).detach();
}

size_t HttpRequest::on_header(char *data, size_t size, size_t n, void *user) {
  auto *self = static_cast<HttpRequest *>(user);
  size_t len = size * n;
  std::string line(data, len);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();

  if (line.compare(0, 5, "HTTP/") == 0) {
    // interim responses come first, only the last block counts
    self->resp_.headers.clear();
    return len;
  }
  if (line.empty()) {
    if (self->headers_checked_)
      return len; // end of chunked trailers
    long code = 0;
    curl_easy_getinfo(self->curl_, CURLINFO_RESPONSE_CODE, &code);
    self->resp_.status = (int)code;
    if (code / 100 == 1)
      return len;
    self->headers_checked_ = true;
    if (!self->opts_.check_headers)
      return len;
    self->rejected_ = self->opts_.check_headers(self->resp_);
    return self->rejected_.empty() ? len : 0;
  }

  size_t colon = line.find(':');
  if (colon == std::string::npos)
    return len;
  std::string name = lower(trim(line.substr(0, colon)));
  std::string value = trim(line.substr(colon + 1));
  auto it = self->resp_.headers.find(name);
  if (it == self->resp_.headers.end())
    self->resp_.headers.emplace(name, value);
  else
    it->second += ", " + value;
  return len;
}

size_t HttpRequest::on_body(char *data, size_t size, size_t n, void *user) {
  auto *self = static_cast<HttpRequest *>(user);
  size_t len = size * n;
  auto &body = self->resp_.body;
  if (body.size() + len >= self->opts_.max_body) {
    self->too_large_ = true;
    return 0;
  }
  body.insert(body.end(), data, data + len);
  return len;
}

int HttpRequest::on_progress(void *user, curl_off_t, curl_off_t, curl_off_t,
                             curl_off_t) {
  return static_cast<HttpRequest *>(user)->cancelled_ ? 1 : 0;
}

HttpResult HttpRequest::perform() {
  HttpResult r;
  std::unique_ptr<curl_slist, SlistDeleter> headers;
  auto add_header = [&headers](const std::string &line) {
    curl_slist *l = curl_slist_append(headers.get(), line.c_str());
    if (l) {
      headers.release();
      headers.reset(l);
    }
  };
  bool has_content_type = false;
  for (auto &h : opts_.headers) {
    has_content_type = has_content_type || lower(h.first) == "content-type";
    add_header(h.first + ": " + h.second);
  }
  // drop the headers curl adds to POST on its own
  add_header("Expect:");
  if (!has_content_type)
    add_header("Content-Type:");

  std::unique_ptr<CURL, EasyDeleter> easy(curl_easy_init());
  if (!easy) {
    r.ec = HttpErrc::transfer_failed;
    r.detail = "curl_easy_init failed";
    return r;
  }
  curl_ = easy.get();
  char errbuf[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(curl_, CURLOPT_URL, url_.c_str());
  curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, &HttpRequest::on_header);
  curl_easy_setopt(curl_, CURLOPT_HEADERDATA, this);
  curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &HttpRequest::on_body);
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, this);
  curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, &HttpRequest::on_progress);
  curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, this);
  curl_easy_setopt(curl_, CURLOPT_PROXY, opts_.proxy.c_str());
  curl_easy_setopt(curl_, CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);
  curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, opts_.verify_peer ? 1L : 0L);
  curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, opts_.verify_peer ? 2L : 0L);
  if (opts_.timeout.count() > 0)
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, (long)opts_.timeout.count());

  const char *body = opts_.body.empty()
                         ? ""
                         : reinterpret_cast<const char *>(opts_.body.data());
  if (opts_.method == "GET") {
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
  } else if (opts_.method == "HEAD") {
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
  } else {
    if (opts_.method != "POST")
      curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, opts_.method.c_str());
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE,
                     (curl_off_t)opts_.body.size());
  }

  CURLcode rc = curl_easy_perform(curl_);
  if (rc == CURLE_OK) {
    long code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &code);
    resp_.status = (int)code;
    char *location = nullptr;
    curl_easy_getinfo(curl_, CURLINFO_REDIRECT_URL, &location);
    if (location)
      resp_.redirect_url = location;
    r.response = std::move(resp_);
    return r;
  }

  r.detail = errbuf[0] ? errbuf : curl_easy_strerror(rc);
  switch (rc) {
  case CURLE_WRITE_ERROR:
    if (!rejected_.empty()) {
      r.ec = HttpErrc::rejected;
      r.detail = rejected_;
    } else if (too_large_) {
      r.ec = HttpErrc::body_too_large;
      r.detail = "maxsize=" + std::to_string(opts_.max_body);
    } else {
      r.ec = HttpErrc::transfer_failed;
    }
    break;
  case CURLE_ABORTED_BY_CALLBACK:
    r.ec = asio::error::operation_aborted;
    r.detail = "cancelled";
    break;
  case CURLE_OPERATION_TIMEDOUT:
    r.ec = HttpErrc::timeout;
    break;
  case CURLE_URL_MALFORMAT:
  case CURLE_UNSUPPORTED_PROTOCOL:
    r.ec = HttpErrc::bad_url;
    break;
  case CURLE_COULDNT_RESOLVE_PROXY:
    r.ec = HttpErrc::proxy_failed;
    break;
  case CURLE_PARTIAL_FILE:
    r.ec = HttpErrc::truncated;
    break;
  case CURLE_GOT_NOTHING:
  case CURLE_WEIRD_SERVER_REPLY:
    r.ec = HttpErrc::bad_response;
    break;
  default:
    r.ec = HttpErrc::transfer_failed;
    break;
  }
  r.response = std::move(resp_);
  return r;
}

} // namespace highway
