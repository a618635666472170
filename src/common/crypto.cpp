
#include "crypto.hpp"
#include "util.hpp"
#include <openssl/evp.h>
#include <sodium.h>
#include <stdexcept>

namespace highway {

static constexpr uint32_t kTeaDelta = 0x9e3779b9u;
static constexpr int kTeaRounds = 16;

TeaCipher::TeaCipher(const std::vector<uint8_t> &key) {
  if (!set_key(key))
    throw std::invalid_argument("TEA key must be 16 bytes");
}

bool TeaCipher::set_key(const std::vector<uint8_t> &key) {
  if (key.size() != kKeySize) {
    have_key_ = false;
    return false;
  }
  for (int i = 0; i < 4; i++)
    k_[i] = get_u32be(key.data() + i * 4);
  have_key_ = true;
  return true;
}

void TeaCipher::encipher(uint32_t &y, uint32_t &z) const {
  uint32_t sum = 0;
  for (int i = 0; i < kTeaRounds; i++) {
    sum += kTeaDelta;
    y += ((z << 4) + k_[0]) ^ (z + sum) ^ ((z >> 5) + k_[1]);
    z += ((y << 4) + k_[2]) ^ (y + sum) ^ ((y >> 5) + k_[3]);
  }
}

void TeaCipher::decipher(uint32_t &y, uint32_t &z) const {
  uint32_t sum = kTeaDelta * kTeaRounds;
  for (int i = 0; i < kTeaRounds; i++) {
    z -= ((y << 4) + k_[2]) ^ (y + sum) ^ ((y >> 5) + k_[3]);
    y -= ((z << 4) + k_[0]) ^ (z + sum) ^ ((z >> 5) + k_[1]);
    sum -= kTeaDelta;
  }
}

bool TeaCipher::encrypt(std::vector<uint8_t> &inout) {
  if (!have_key_)
    return false;
  size_t fill = (6 - inout.size() % 8 + 8) % 8;
  std::vector<uint8_t> plain;
  plain.reserve(1 + fill + 2 + inout.size() + 7);
  plain.push_back((uint8_t)(0xF8 | fill));
  plain.insert(plain.end(), fill + 2, 0);
  plain.insert(plain.end(), inout.begin(), inout.end());
  plain.insert(plain.end(), 7, 0);

  std::vector<uint8_t> out(plain.size());
  uint32_t pre_x0 = 0, pre_x1 = 0; // previous pre-encryption block
  uint32_t pre_c0 = 0, pre_c1 = 0; // previous cipher block
  for (size_t off = 0; off < plain.size(); off += 8) {
    uint32_t x0 = get_u32be(&plain[off]) ^ pre_c0;
    uint32_t x1 = get_u32be(&plain[off + 4]) ^ pre_c1;
    uint32_t y = x0, z = x1;
    encipher(y, z);
    pre_c0 = y ^ pre_x0;
    pre_c1 = z ^ pre_x1;
    put_u32be(&out[off], pre_c0);
    put_u32be(&out[off + 4], pre_c1);
    pre_x0 = x0;
    pre_x1 = x1;
  }
  inout.swap(out);
  return true;
}

bool TeaCipher::decrypt(std::vector<uint8_t> &inout) {
  if (!have_key_)
    return false;
  if (inout.size() < 16 || inout.size() % 8 != 0)
    return false;
  std::vector<uint8_t> plain(inout.size());
  uint32_t pre_x0 = 0, pre_x1 = 0;
  uint32_t pre_c0 = 0, pre_c1 = 0;
  for (size_t off = 0; off < inout.size(); off += 8) {
    uint32_t c0 = get_u32be(&inout[off]);
    uint32_t c1 = get_u32be(&inout[off + 4]);
    uint32_t y = c0 ^ pre_x0, z = c1 ^ pre_x1;
    decipher(y, z);
    put_u32be(&plain[off], y ^ pre_c0);
    put_u32be(&plain[off + 4], z ^ pre_c1);
    pre_x0 = y;
    pre_x1 = z;
    pre_c0 = c0;
    pre_c1 = c1;
  }
  size_t start = 1 + (plain[0] & 0x07) + 2;
  if (start + 7 > plain.size())
    return false;
  for (size_t i = plain.size() - 7; i < plain.size(); i++)
    if (plain[i] != 0)
      return false;
  inout.assign(plain.begin() + start, plain.end() - 7);
  return true;
}

std::vector<uint8_t> md5(const uint8_t *data, size_t len) {
  std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
  unsigned int out_len = 0;
  if (EVP_Digest(data, len, out.data(), &out_len, EVP_md5(), nullptr) != 1)
    throw std::runtime_error("EVP_Digest(md5) failed");
  out.resize(out_len);
  return out;
}

uint16_t random_u16() {
  static const bool ready = sodium_init() >= 0;
  if (!ready)
    throw std::runtime_error("sodium_init failed");
  return (uint16_t)randombytes_uniform(65536);
}

} // namespace highway
