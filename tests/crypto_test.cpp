#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "crypto.hpp"
#include "util.hpp"

using highway::hex_to_bytes;
using highway::TeaCipher;

int main() {
  const auto key = hex_to_bytes("F0441F5FF42DA58FDCF7949ABA62D411");
  assert(key.size() == 16);

  // round trip across every padding width
  {
    TeaCipher tea(key);
    for (size_t n = 0; n < 80; n++) {
      std::vector<uint8_t> plain(n);
      for (size_t i = 0; i < n; i++)
        plain[i] = (uint8_t)(i * 7 + n);
      std::vector<uint8_t> buf = plain;
      assert(tea.encrypt(buf));
      assert(buf.size() % 8 == 0);
      assert(buf.size() >= 16);
      assert(buf.size() == ((n + 10 + 7) / 8) * 8);
      if (n > 0)
        assert(buf != plain);
      assert(tea.decrypt(buf));
      assert(buf == plain);
    }
  }

  // same key and input give the same ciphertext
  {
    TeaCipher a(key), b(key);
    std::vector<uint8_t> x = {1, 2, 3, 4, 5};
    std::vector<uint8_t> y = x;
    assert(a.encrypt(x));
    assert(b.encrypt(y));
    assert(x == y);
  }

  // a large buffer survives the chaining
  {
    TeaCipher tea(key);
    std::vector<uint8_t> plain(100000);
    for (size_t i = 0; i < plain.size(); i++)
      plain[i] = (uint8_t)(i ^ (i >> 8));
    auto buf = plain;
    assert(tea.encrypt(buf));
    assert(tea.decrypt(buf));
    assert(buf == plain);
  }

  // fixed vectors under the directory key, zero pad bytes
  {
    TeaCipher tea(key);
    struct {
      const char *plain;
      const char *cipher;
    } vectors[] = {
        {"68656c6c6f", "6b813f7d6928ba61548f75f510daeee8"},
        {"000102030405060708090a0b0c0d0e0f",
         "c155b8a70a49979817dd9d6dfe247efaf8aa0f5cfc32b07ad10262725dd6e942"},
    };
    for (auto &v : vectors) {
      auto buf = hex_to_bytes(v.plain);
      assert(tea.encrypt(buf));
      assert(highway::bytes_to_hex(buf) == v.cipher);
      assert(tea.decrypt(buf));
      assert(highway::bytes_to_hex(buf) == v.plain);
    }
    std::vector<uint8_t> empty;
    assert(tea.encrypt(empty));
    assert(highway::bytes_to_hex(empty) == "c155b8a70a499798703ce605662822e1");
  }

  // wrong key or damaged ciphertext is rejected
  {
    TeaCipher tea(key);
    std::vector<uint8_t> buf(32, 0x5A);
    assert(tea.encrypt(buf));
    auto other_key = key;
    other_key[0] ^= 1;
    TeaCipher other(other_key);
    auto copy = buf;
    assert(!other.decrypt(copy));

    std::vector<uint8_t> short_buf(8, 0);
    assert(!tea.decrypt(short_buf));
    std::vector<uint8_t> odd(17, 0);
    assert(!tea.decrypt(odd));
  }

  // keys must be 16 bytes
  {
    TeaCipher tea;
    std::vector<uint8_t> buf = {1, 2, 3};
    assert(!tea.encrypt(buf));
    assert(!tea.set_key(std::vector<uint8_t>(15, 1)));
    bool threw = false;
    try {
      TeaCipher bad(std::vector<uint8_t>(8, 1));
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    assert(threw);
  }

  // md5 reference vectors
  {
    assert(highway::bytes_to_hex(highway::md5(std::vector<uint8_t>())) ==
           "d41d8cd98f00b204e9800998ecf8427e");
    std::vector<uint8_t> abc = {'a', 'b', 'c'};
    assert(highway::bytes_to_hex(highway::md5(abc)) ==
           "900150983cd24fb0d6963f7d28e17f72");
  }

  // random sequence numbers vary
  {
    bool differs = false;
    uint16_t first = highway::random_u16();
    for (int i = 0; i < 64 && !differs; i++)
      differs = highway::random_u16() != first;
    assert(differs);
  }

  return 0;
}
