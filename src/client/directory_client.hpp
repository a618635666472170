
#pragma once
#include <asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include "protocol.hpp"

namespace highway {

constexpr const char* kDirectoryUrl = "https://configsvr.msf.3g.qq.com/configsvr/serverlist.jsp";
constexpr const char* kDirectoryKeyHex = "F0441F5FF42DA58FDCF7949ABA62D411";
constexpr const char* kDirectoryService = "ConfigHttp";
constexpr const char* kDirectoryMethod = "HttpServerListReq";

enum class DirectoryErrc {
    transport = 1,
    bad_status,
    timeout,
    decode
};

const std::error_category& directory_category();
std::error_code make_error_code(DirectoryErrc e);

} // namespace highway

namespace std {
template <> struct is_error_code_enum<highway::DirectoryErrc> : true_type {};
}

namespace highway {

struct ServerEntry {
    std::string address;   // dotted quad
    uint16_t port{0};
};

struct DirectoryConfig {
    std::string url{kDirectoryUrl};
    std::chrono::milliseconds timeout{3000};
    bool verify_peer{true};
    size_t max_body{64 * 1024};   // responses reaching this size are dropped
};

struct DirectoryResult {
    std::error_code ec;
    std::string detail;    // underlying cause when ec is set
    std::vector<ServerEntry> servers;
};

using DirectoryHandler = std::function<void(DirectoryResult&&)>;

const std::vector<uint8_t>& directory_key();

// Length-prefixed, wrapped and TEA-encrypted HttpServerListReq.
std::vector<uint8_t> build_server_list_request(const ClientIdentity& id);

// Inverse of the server side of the exchange. Throws JceError or
// std::runtime_error on anything malformed.
std::vector<ServerEntry> parse_server_list_response(const std::vector<uint8_t>& encrypted);

// POSTs the request and reports the endpoint list in server order. The
// handler runs once, on the io_context, with ec set on any failure.
void get_server_list(asio::io_context& io, const ClientIdentity& id,
                     const DirectoryConfig& cfg, DirectoryHandler handler);

} // namespace highway
