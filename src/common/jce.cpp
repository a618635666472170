
#include "jce.hpp"
#include <cstring>
#include <limits>

namespace highway {

JceValue JceValue::integer(int64_t v) {
  JceValue r;
  r.kind_ = Kind::Int;
  r.int_ = v;
  return r;
}

JceValue JceValue::float32(float v) {
  JceValue r;
  r.kind_ = Kind::Float;
  r.real_ = v;
  return r;
}

JceValue JceValue::float64(double v) {
  JceValue r;
  r.kind_ = Kind::Double;
  r.real_ = v;
  return r;
}

JceValue JceValue::string(std::string v) {
  JceValue r;
  r.kind_ = Kind::String;
  r.str_ = std::move(v);
  return r;
}

JceValue JceValue::bytes(std::vector<uint8_t> v) {
  JceValue r;
  r.kind_ = Kind::Bytes;
  r.bytes_ = std::move(v);
  return r;
}

JceValue JceValue::list(JceList v) {
  JceValue r;
  r.kind_ = Kind::List;
  r.list_ = std::make_shared<const JceList>(std::move(v));
  return r;
}

JceValue JceValue::map(JceMap v) {
  JceValue r;
  r.kind_ = Kind::Map;
  r.map_ = std::make_shared<const JceMap>(std::move(v));
  return r;
}

JceValue JceValue::structure(JceStruct v) {
  JceValue r;
  r.kind_ = Kind::Struct;
  r.struct_ = std::make_shared<const JceStruct>(std::move(v));
  return r;
}

int64_t JceValue::as_int() const {
  if (kind_ != Kind::Int)
    throw JceError("jce value is not an integer");
  return int_;
}

double JceValue::as_double() const {
  if (kind_ == Kind::Float || kind_ == Kind::Double)
    return real_;
  if (kind_ == Kind::Int)
    return (double)int_;
  throw JceError("jce value is not a number");
}

const std::string &JceValue::as_string() const {
  if (kind_ != Kind::String)
    throw JceError("jce value is not a string");
  return str_;
}

const std::vector<uint8_t> &JceValue::as_bytes() const {
  if (kind_ != Kind::Bytes)
    throw JceError("jce value is not a byte list");
  return bytes_;
}

const JceList &JceValue::as_list() const {
  if (kind_ != Kind::List)
    throw JceError("jce value is not a list");
  return *list_;
}

const JceMap &JceValue::as_map() const {
  if (kind_ != Kind::Map)
    throw JceError("jce value is not a map");
  return *map_;
}

const JceStruct &JceValue::as_struct() const {
  if (kind_ != Kind::Struct)
    throw JceError("jce value is not a struct");
  return *struct_;
}

const JceValue &jce_field(const JceStruct &s, uint8_t tag) {
  auto it = s.find(tag);
  if (it == s.end())
    throw JceError("jce field " + std::to_string(tag) + " missing");
  return it->second;
}

// ---- writer ----

void JceWriter::write_head(uint8_t tag, uint8_t type) {
  if (tag < 15) {
    out_.push_back((uint8_t)((tag << 4) | type));
  } else {
    out_.push_back((uint8_t)(0xF0 | type));
    out_.push_back(tag);
  }
}

static void append_be(std::vector<uint8_t> &out, uint64_t v, int n) {
  for (int i = n - 1; i >= 0; i--)
    out.push_back((uint8_t)(v >> (i * 8)));
}

void JceWriter::write_int(uint8_t tag, int64_t v) {
  if (v == 0) {
    write_head(tag, JCE_ZERO_TAG);
  } else if (v >= std::numeric_limits<int8_t>::min() &&
             v <= std::numeric_limits<int8_t>::max()) {
    write_head(tag, JCE_INT8);
    append_be(out_, (uint64_t)v, 1);
  } else if (v >= std::numeric_limits<int16_t>::min() &&
             v <= std::numeric_limits<int16_t>::max()) {
    write_head(tag, JCE_INT16);
    append_be(out_, (uint64_t)v, 2);
  } else if (v >= std::numeric_limits<int32_t>::min() &&
             v <= std::numeric_limits<int32_t>::max()) {
    write_head(tag, JCE_INT32);
    append_be(out_, (uint64_t)v, 4);
  } else {
    write_head(tag, JCE_INT64);
    append_be(out_, (uint64_t)v, 8);
  }
}

void JceWriter::write_string(uint8_t tag, const std::string &v) {
  if (v.size() <= 0xFF) {
    write_head(tag, JCE_STRING1);
    out_.push_back((uint8_t)v.size());
  } else {
    write_head(tag, JCE_STRING4);
    append_be(out_, v.size(), 4);
  }
  out_.insert(out_.end(), v.begin(), v.end());
}

void JceWriter::write_bytes(uint8_t tag, const std::vector<uint8_t> &v) {
  write_head(tag, JCE_SIMPLE_LIST);
  write_head(0, JCE_INT8);
  write_int(0, (int64_t)v.size());
  out_.insert(out_.end(), v.begin(), v.end());
}

void JceWriter::write(uint8_t tag, const JceValue &v) {
  switch (v.kind()) {
  case JceValue::Kind::Int:
    write_int(tag, v.as_int());
    break;
  case JceValue::Kind::Float: {
    float f = (float)v.as_double();
    uint32_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    write_head(tag, JCE_FLOAT);
    append_be(out_, bits, 4);
    break;
  }
  case JceValue::Kind::Double: {
    double d = v.as_double();
    uint64_t bits;
    std::memcpy(&bits, &d, sizeof(bits));
    write_head(tag, JCE_DOUBLE);
    append_be(out_, bits, 8);
    break;
  }
  case JceValue::Kind::String:
    write_string(tag, v.as_string());
    break;
  case JceValue::Kind::Bytes:
    write_bytes(tag, v.as_bytes());
    break;
  case JceValue::Kind::List:
    write_head(tag, JCE_LIST);
    write_int(0, (int64_t)v.as_list().size());
    for (auto &e : v.as_list())
      write(0, e);
    break;
  case JceValue::Kind::Map:
    write_head(tag, JCE_MAP);
    write_int(0, (int64_t)v.as_map().size());
    for (auto &kv : v.as_map()) {
      write(0, kv.first);
      write(1, kv.second);
    }
    break;
  case JceValue::Kind::Struct:
    write_head(tag, JCE_STRUCT_BEGIN);
    for (auto &f : v.as_struct())
      write(f.first, f.second);
    write_head(0, JCE_STRUCT_END);
    break;
  }
}

std::vector<uint8_t> jce_encode_struct(const JceStruct &s) {
  JceWriter w;
  for (auto &f : s)
    w.write(f.first, f.second);
  return w.release();
}

std::vector<uint8_t>
jce_encode_wrapper(const std::vector<std::pair<std::string, JceStruct>> &body,
                   const std::string &service, const std::string &method,
                   int32_t request_id) {
  JceMap named;
  for (auto &entry : body) {
    std::vector<uint8_t> framed;
    framed.push_back((uint8_t)JCE_STRUCT_BEGIN); // tag 0
    auto fields = jce_encode_struct(entry.second);
    framed.insert(framed.end(), fields.begin(), fields.end());
    framed.push_back((uint8_t)JCE_STRUCT_END);
    named.emplace_back(JceValue::string(entry.first),
                       JceValue::bytes(std::move(framed)));
  }
  JceWriter buffer;
  buffer.write(0, JceValue::map(std::move(named)));

  JceStruct packet;
  packet[1] = JceValue::integer(3); // iVersion
  packet[2] = JceValue::integer(0); // cPacketType
  packet[3] = JceValue::integer(0); // iMessageType
  packet[4] = JceValue::integer(request_id);
  packet[5] = JceValue::string(service);
  packet[6] = JceValue::string(method);
  packet[7] = JceValue::bytes(buffer.release());
  packet[8] = JceValue::integer(0); // iTimeout
  packet[9] = JceValue::map({});    // context
  packet[10] = JceValue::map({});   // status
  return jce_encode_struct(packet);
}

// ---- reader ----

namespace {

class JceReader {
public:
  JceReader(const uint8_t *data, size_t len) : p_(data), end_(data + len) {}

  bool eof() const { return p_ >= end_; }

  void read_head(uint8_t &tag, uint8_t &type) {
    uint8_t b = take(1)[0];
    type = b & 0x0F;
    tag = b >> 4;
    if (tag == 15)
      tag = take(1)[0];
  }

  JceValue read_value(uint8_t type, int depth) {
    if ((type == JCE_MAP || type == JCE_LIST || type == JCE_STRUCT_BEGIN) &&
        depth >= kJceMaxDepth)
      throw JceError("jce nesting too deep");
    switch (type) {
    case JCE_INT8:
      return JceValue::integer((int8_t)take(1)[0]);
    case JCE_INT16:
      return JceValue::integer((int16_t)read_be(2));
    case JCE_INT32:
      return JceValue::integer((int32_t)read_be(4));
    case JCE_INT64:
      return JceValue::integer((int64_t)read_be(8));
    case JCE_FLOAT: {
      uint32_t bits = (uint32_t)read_be(4);
      float f;
      std::memcpy(&f, &bits, sizeof(f));
      return JceValue::float32(f);
    }
    case JCE_DOUBLE: {
      uint64_t bits = read_be(8);
      double d;
      std::memcpy(&d, &bits, sizeof(d));
      return JceValue::float64(d);
    }
    case JCE_STRING1: {
      size_t n = take(1)[0];
      const uint8_t *s = take(n);
      return JceValue::string(std::string((const char *)s, n));
    }
    case JCE_STRING4: {
      size_t n = (size_t)read_be(4);
      const uint8_t *s = take(n);
      return JceValue::string(std::string((const char *)s, n));
    }
    case JCE_MAP: {
      size_t n = read_length(depth);
      JceMap m;
      m.reserve(n);
      for (size_t i = 0; i < n; i++) {
        JceValue k = read_element(depth + 1);
        JceValue v = read_element(depth + 1);
        m.emplace_back(std::move(k), std::move(v));
      }
      return JceValue::map(std::move(m));
    }
    case JCE_LIST: {
      size_t n = read_length(depth);
      JceList l;
      l.reserve(n);
      for (size_t i = 0; i < n; i++)
        l.push_back(read_element(depth + 1));
      return JceValue::list(std::move(l));
    }
    case JCE_STRUCT_BEGIN:
      return JceValue::structure(read_fields(depth + 1, true));
    case JCE_ZERO_TAG:
      return JceValue::integer(0);
    case JCE_SIMPLE_LIST: {
      uint8_t tag, elem_type;
      read_head(tag, elem_type);
      if (elem_type != JCE_INT8)
        throw JceError("jce simple list of unsupported element type");
      size_t n = read_length(depth);
      const uint8_t *s = take(n);
      return JceValue::bytes(std::vector<uint8_t>(s, s + n));
    }
    default:
      throw JceError("jce unexpected type " + std::to_string(type));
    }
  }

  JceStruct read_fields(int depth, bool until_end) {
    JceStruct s;
    while (!eof()) {
      uint8_t tag, type;
      read_head(tag, type);
      if (type == JCE_STRUCT_END) {
        if (!until_end)
          throw JceError("jce unbalanced struct end");
        return s;
      }
      s[tag] = read_value(type, depth);
    }
    if (until_end)
      throw JceError("jce struct not terminated");
    return s;
  }

private:
  const uint8_t *p_;
  const uint8_t *end_;

  const uint8_t *take(size_t n) {
    if ((size_t)(end_ - p_) < n)
      throw JceError("jce buffer truncated");
    const uint8_t *r = p_;
    p_ += n;
    return r;
  }

  uint64_t read_be(int n) {
    const uint8_t *b = take((size_t)n);
    uint64_t v = 0;
    for (int i = 0; i < n; i++)
      v = (v << 8) | b[i];
    return v;
  }

  JceValue read_element(int depth) {
    uint8_t tag, type;
    read_head(tag, type);
    return read_value(type, depth);
  }

  // Every element needs at least one byte, so a count beyond the remaining
  // input is malformed. The count head sits one level below its container.
  size_t read_length(int depth) {
    JceValue v = read_element(depth + 1);
    if (!v.is_int())
      throw JceError("jce length is not an integer");
    int64_t n = v.as_int();
    if (n < 0 || (uint64_t)n > (uint64_t)(end_ - p_))
      throw JceError("jce bad length " + std::to_string(n));
    return (size_t)n;
  }
};

} // namespace

JceStruct jce_decode(const uint8_t *data, size_t len) {
  JceReader r(data, len);
  return r.read_fields(0, false);
}

JceStruct jce_decode_wrapper(const std::vector<uint8_t> &data) {
  JceStruct packet = jce_decode(data);
  JceStruct buffer = jce_decode(jce_field(packet, 7).as_bytes());
  const JceMap &named = jce_field(buffer, 0).as_map();
  if (named.empty())
    throw JceError("jce wrapper carries no body");
  const JceValue *nested = &named.front().second;
  // version 2 packets nest a map<type name, bytes> under each name
  if (nested->kind() == JceValue::Kind::Map) {
    if (nested->as_map().empty())
      throw JceError("jce wrapper carries no body");
    nested = &nested->as_map().front().second;
  }
  JceStruct inner = jce_decode(nested->as_bytes());
  return jce_field(inner, 0).as_struct();
}

} // namespace highway
