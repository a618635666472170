
#include "util.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace highway {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos)
    return false;
  host = s.substr(0, pos);
  try {
    int p = std::stoi(s.substr(pos + 1));
    if (p < 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

std::vector<uint8_t> hex_to_bytes(const std::string &hex) {
  std::vector<uint8_t> out;
  if (hex.empty() || (hex.size() % 2) != 0)
    return out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    if (!std::isxdigit((unsigned char)hex[i]) ||
        !std::isxdigit((unsigned char)hex[i + 1]))
      return {};
    unsigned int v;
    std::stringstream ss;
    ss << std::hex << hex.substr(i, 2);
    ss >> v;
    out.push_back((uint8_t)v);
  }
  return out;
}

std::string bytes_to_hex(const std::vector<uint8_t> &data) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t b : data) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0F]);
  }
  return out;
}

void put_u32be(uint8_t *p, uint32_t v) {
  p[0] = (uint8_t)(v >> 24);
  p[1] = (uint8_t)(v >> 16);
  p[2] = (uint8_t)(v >> 8);
  p[3] = (uint8_t)v;
}

uint32_t get_u32be(const uint8_t *p) {
  return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) |
         ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}

std::optional<Url> parse_url(const std::string &url) {
  auto sep = url.find("://");
  if (sep == std::string::npos)
    return std::nullopt;
  Url u;
  u.scheme = url.substr(0, sep);
  for (auto &c : u.scheme)
    c = (char)std::tolower((unsigned char)c);
  if (u.scheme == "http")
    u.port = 80;
  else if (u.scheme == "https")
    u.port = 443;
  else
    return std::nullopt;

  auto rest = url.substr(sep + 3);
  auto slash = rest.find_first_of("/?#");
  std::string authority = rest.substr(0, slash);
  u.target = slash == std::string::npos ? "/" : rest.substr(slash);
  auto hash = u.target.find('#');
  if (hash != std::string::npos)
    u.target.erase(hash);
  if (u.target.empty() || u.target[0] != '/')
    u.target.insert(u.target.begin(), '/');

  auto at = authority.rfind('@');
  if (at != std::string::npos)
    authority = authority.substr(at + 1);
  auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    std::string host;
    uint16_t port = 0;
    if (!parse_host_port(authority, host, port))
      return std::nullopt;
    u.host = host;
    u.port = port;
  } else {
    u.host = authority;
  }
  if (u.host.empty())
    return std::nullopt;
  return u;
}

std::string int32ip2str(uint32_t ip) {
  return std::to_string(ip & 0xFF) + "." + std::to_string((ip >> 8) & 0xFF) +
         "." + std::to_string((ip >> 16) & 0xFF) + "." +
         std::to_string((ip >> 24) & 0xFF);
}

std::vector<uint8_t> read_file(const std::string &path, size_t max_bytes) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw std::runtime_error("cannot open " + path);
  std::vector<uint8_t> data;
  std::vector<char> slice(5 * 1024 * 1024);
  while (in) {
    in.read(slice.data(), (std::streamsize)slice.size());
    std::streamsize n = in.gcount();
    if (n <= 0)
      break;
    data.insert(data.end(), slice.begin(), slice.begin() + n);
    if (data.size() >= max_bytes)
      throw std::runtime_error("payload too large (maxsize=" +
                               std::to_string(max_bytes) + ")");
  }
  if (in.bad())
    throw std::runtime_error("read failed: " + path);
  return data;
}

} // namespace highway
