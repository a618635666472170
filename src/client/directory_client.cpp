
#include "directory_client.hpp"
#include "crypto.hpp"
#include "http_request.hpp"
#include "jce.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>
#include <stdexcept>

namespace highway {

namespace {

class DirectoryCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "directory"; }
  std::string message(int ev) const override {
    switch (static_cast<DirectoryErrc>(ev)) {
    case DirectoryErrc::transport:
      return "directory request failed";
    case DirectoryErrc::bad_status:
      return "directory server returned an error status";
    case DirectoryErrc::timeout:
      return "directory request timed out";
    case DirectoryErrc::decode:
      return "directory response could not be decoded";
    }
    return "unknown directory error";
  }
};

ServerEntry decode_entry(const JceValue &v) {
  JceStruct fields = v.kind() == JceValue::Kind::Bytes ? jce_decode(v.as_bytes())
                                                        : v.as_struct();
  ServerEntry e;
  const JceValue &addr = jce_field(fields, 1);
  if (addr.is_string())
    e.address = int32ip2str(addr.as_string());
  else
    e.address = int32ip2str((uint32_t)addr.as_int());
  int64_t port = jce_field(fields, 2).as_int();
  if (port < 0 || port > 65535)
    throw JceError("server entry port out of range: " + std::to_string(port));
  e.port = (uint16_t)port;
  return e;
}

class ServerListLookup : public std::enable_shared_from_this<ServerListLookup> {
public:
  ServerListLookup(asio::io_context &io, DirectoryConfig cfg,
                   DirectoryHandler handler)
      : io_(io), cfg_(std::move(cfg)), handler_(std::move(handler)),
        timer_(io) {}

  void start(std::vector<uint8_t> body) {
    auto self = shared_from_this();
    if (!parse_url(cfg_.url)) {
      asio::post(io_, [this, self]() {
        settle(DirectoryErrc::transport, "bad directory url " + cfg_.url);
      });
      return;
    }

    timer_.expires_after(cfg_.timeout);
    timer_.async_wait([this, self](std::error_code ec) {
      if (ec || settled_)
        return;
      settle(DirectoryErrc::timeout,
             std::to_string(cfg_.timeout.count()) + "ms elapsed");
      auto req = req_;
      if (req)
        req->cancel();
    });

    HttpOptions opts;
    opts.method = "POST";
    opts.body = std::move(body);
    opts.verify_peer = cfg_.verify_peer;
    opts.max_body = cfg_.max_body;
    auto req = std::make_shared<HttpRequest>(
        io_, cfg_.url, std::move(opts),
        [this, self](HttpResult &&r) { on_response(std::move(r)); });
    req_ = req;
    req->start();
  }

private:
  void on_response(HttpResult &&r) {
    req_.reset();
    if (settled_)
      return;
    if (r.ec) {
      settle(DirectoryErrc::transport, r.detail);
      return;
    }
    if (r.response.status / 100 != 2) {
      settle(DirectoryErrc::bad_status,
             "http status code: " + std::to_string(r.response.status));
      return;
    }
    std::vector<ServerEntry> servers;
    try {
      servers = parse_server_list_response(r.response.body);
    } catch (const std::exception &e) {
      settle(DirectoryErrc::decode, e.what());
      return;
    }
    DirectoryResult res;
    res.servers = std::move(servers);
    settled_ = true;
    timer_.cancel();
    Logger::instance().log(LogLevel::DEBUG, "directory returned %zu servers",
                           res.servers.size());
    handler_(std::move(res));
  }

  void settle(DirectoryErrc e, std::string detail) {
    if (settled_)
      return;
    settled_ = true;
    timer_.cancel();
    Logger::instance().log(LogLevel::WARN, "server list lookup failed: %s (%s)",
                           make_error_code(e).message().c_str(),
                           detail.c_str());
    DirectoryResult res;
    res.ec = e;
    res.detail = std::move(detail);
    handler_(std::move(res));
  }

  asio::io_context &io_;
  DirectoryConfig cfg_;
  DirectoryHandler handler_;
  asio::steady_timer timer_;
  std::shared_ptr<HttpRequest> req_;
  bool settled_{false};
};

} // namespace

const std::error_category &directory_category() {
  static DirectoryCategory cat;
  return cat;
}

std::error_code make_error_code(DirectoryErrc e) {
  return {static_cast<int>(e), directory_category()};
}

const std::vector<uint8_t> &directory_key() {
  static const std::vector<uint8_t> key = hex_to_bytes(kDirectoryKeyHex);
  return key;
}

std::vector<uint8_t> build_server_list_request(const ClientIdentity &id) {
  JceStruct req;
  req[1] = JceValue::integer(0);
  req[2] = JceValue::integer(0);
  req[3] = JceValue::integer(1);
  req[4] = JceValue::string("00000");
  req[5] = JceValue::integer(100);
  req[6] = JceValue::integer(id.sub_id);
  req[7] = JceValue::string(id.imei);
  for (uint8_t tag = 8; tag <= 13; tag++)
    req[tag] = JceValue::integer(0);
  req[14] = JceValue::integer(1);

  auto wrapped = jce_encode_wrapper({{kDirectoryMethod, req}},
                                    kDirectoryService, kDirectoryMethod);
  std::vector<uint8_t> body(4 + wrapped.size());
  put_u32be(body.data(), (uint32_t)body.size());
  std::copy(wrapped.begin(), wrapped.end(), body.begin() + 4);

  TeaCipher tea(directory_key());
  if (!tea.encrypt(body))
    throw std::runtime_error("directory request encryption failed");
  return body;
}

std::vector<ServerEntry>
parse_server_list_response(const std::vector<uint8_t> &encrypted) {
  std::vector<uint8_t> data = encrypted;
  TeaCipher tea(directory_key());
  if (!tea.decrypt(data))
    throw std::runtime_error("directory response decryption failed");
  if (data.size() < 4)
    throw std::runtime_error("directory response shorter than its length prefix");
  data.erase(data.begin(), data.begin() + 4);

  JceStruct parent = jce_decode_wrapper(data);
  std::vector<ServerEntry> out;
  for (auto &v : jce_field(parent, 2).as_list())
    out.push_back(decode_entry(v));
  return out;
}

void get_server_list(asio::io_context &io, const ClientIdentity &id,
                     const DirectoryConfig &cfg, DirectoryHandler handler) {
  std::vector<uint8_t> body = build_server_list_request(id);
  auto lookup = std::make_shared<ServerListLookup>(io, cfg, std::move(handler));
  lookup->start(std::move(body));
}

} // namespace highway
