
#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <vector>

namespace highway {

constexpr size_t kMaxUploadSize = 31457280; // 30 MiB

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::vector<uint8_t> hex_to_bytes(const std::string& hex);
std::string bytes_to_hex(const std::vector<uint8_t>& data);

void put_u32be(uint8_t* p, uint32_t v);
uint32_t get_u32be(const uint8_t* p);

struct Url {
    std::string scheme;
    std::string host;
    uint16_t port{0};
    std::string target; // path + query, always starts with '/'
};

std::optional<Url> parse_url(const std::string& url);

// Byte 0 of the dotted quad comes from the low 8 bits.
std::string int32ip2str(uint32_t ip);
inline std::string int32ip2str(const std::string& ip) { return ip; }

// Throws std::runtime_error on I/O failure or once the size reaches max_bytes.
std::vector<uint8_t> read_file(const std::string& path, size_t max_bytes = kMaxUploadSize);

} // namespace highway
