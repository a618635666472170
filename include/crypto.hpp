
#pragma once
#include <cstdint>
#include <vector>

namespace highway {

class CryptoProvider {
public:
    virtual ~CryptoProvider() = default;
    virtual bool set_key(const std::vector<uint8_t>& key) = 0;
    virtual bool encrypt(std::vector<uint8_t>& inout) = 0;
    virtual bool decrypt(std::vector<uint8_t>& inout) = 0;
};

// 16-round TEA chained the way the QQ servers expect. The plaintext is
// framed as [0xF8|fill][fill+2 pad bytes][data][7 zero bytes] so the total
// is a multiple of 8. Pad bytes are zero, which keeps encrypt() deterministic.
class TeaCipher : public CryptoProvider {
public:
    static constexpr size_t kKeySize = 16;

    TeaCipher() = default;
    // Throws std::invalid_argument unless the key is 16 bytes.
    explicit TeaCipher(const std::vector<uint8_t>& key);
    bool set_key(const std::vector<uint8_t>& key) override;
    bool encrypt(std::vector<uint8_t>& inout) override;
    bool decrypt(std::vector<uint8_t>& inout) override;
private:
    uint32_t k_[4]{};
    bool have_key_{false};
    void encipher(uint32_t& y, uint32_t& z) const;
    void decipher(uint32_t& y, uint32_t& z) const;
};

std::vector<uint8_t> md5(const uint8_t* data, size_t len);
inline std::vector<uint8_t> md5(const std::vector<uint8_t>& data) {
    return md5(data.data(), data.size());
}

// Uniform in [0, 65535].
uint16_t random_u16();

} // namespace highway
