
#pragma once
#include <cstdint>
#include <cstddef>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace highway {

enum JceType : uint8_t {
    JCE_INT8         = 0,
    JCE_INT16        = 1,
    JCE_INT32        = 2,
    JCE_INT64        = 3,
    JCE_FLOAT        = 4,
    JCE_DOUBLE       = 5,
    JCE_STRING1      = 6,
    JCE_STRING4      = 7,
    JCE_MAP          = 8,
    JCE_LIST         = 9,
    JCE_STRUCT_BEGIN = 10,
    JCE_STRUCT_END   = 11,
    JCE_ZERO_TAG     = 12,
    JCE_SIMPLE_LIST  = 13
};

class JceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class JceValue;
using JceList = std::vector<JceValue>;
using JceMap = std::vector<std::pair<JceValue, JceValue>>;
using JceStruct = std::map<uint8_t, JceValue>;

class JceValue {
public:
    enum class Kind { Int, Float, Double, String, Bytes, List, Map, Struct };

    JceValue() = default;
    static JceValue integer(int64_t v);
    static JceValue float32(float v);
    static JceValue float64(double v);
    static JceValue string(std::string v);
    static JceValue bytes(std::vector<uint8_t> v);
    static JceValue list(JceList v);
    static JceValue map(JceMap v);
    static JceValue structure(JceStruct v);

    Kind kind() const { return kind_; }
    bool is_int() const { return kind_ == Kind::Int; }
    bool is_string() const { return kind_ == Kind::String; }

    // Accessors throw JceError on a kind mismatch.
    int64_t as_int() const;
    double as_double() const;
    const std::string& as_string() const;
    const std::vector<uint8_t>& as_bytes() const;
    const JceList& as_list() const;
    const JceMap& as_map() const;
    const JceStruct& as_struct() const;

private:
    Kind kind_{Kind::Int};
    int64_t int_{0};
    double real_{0};
    std::string str_;
    std::vector<uint8_t> bytes_;
    std::shared_ptr<const JceList> list_;
    std::shared_ptr<const JceMap> map_;
    std::shared_ptr<const JceStruct> struct_;
};

// Returns v[tag] or throws JceError when the field is absent.
const JceValue& jce_field(const JceStruct& s, uint8_t tag);

class JceWriter {
public:
    void write(uint8_t tag, const JceValue& v);
    void write_int(uint8_t tag, int64_t v);
    void write_string(uint8_t tag, const std::string& v);
    void write_bytes(uint8_t tag, const std::vector<uint8_t>& v);
    const std::vector<uint8_t>& data() const { return out_; }
    std::vector<uint8_t> release() { return std::move(out_); }
private:
    void write_head(uint8_t tag, uint8_t type);
    std::vector<uint8_t> out_;
};

// Fields only, ascending tag order, no struct begin/end markers.
std::vector<uint8_t> jce_encode_struct(const JceStruct& s);

// Version 3 RequestPacket carrying each struct under its name in sBuffer.
std::vector<uint8_t> jce_encode_wrapper(const std::vector<std::pair<std::string, JceStruct>>& body,
                                        const std::string& service, const std::string& method,
                                        int32_t request_id = 0);

constexpr int kJceMaxDepth = 16;

// Reads fields until the buffer is exhausted. Nested structs are decoded
// recursively, up to kJceMaxDepth levels. Throws JceError.
JceStruct jce_decode(const uint8_t* data, size_t len);
inline JceStruct jce_decode(const std::vector<uint8_t>& data) {
    return jce_decode(data.data(), data.size());
}

// Unwraps a RequestPacket and returns the first struct in its sBuffer.
JceStruct jce_decode_wrapper(const std::vector<uint8_t>& data);

} // namespace highway
