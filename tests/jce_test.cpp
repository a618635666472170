#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "crypto.hpp"
#include "directory_client.hpp"
#include "jce.hpp"
#include "util.hpp"

using highway::jce_decode;
using highway::jce_decode_wrapper;
using highway::jce_encode_struct;
using highway::jce_encode_wrapper;
using highway::jce_field;
using highway::JceError;
using highway::JceList;
using highway::JceStruct;
using highway::JceValue;
using highway::JceWriter;

static bool throws_jce(const std::vector<uint8_t> &data) {
  try {
    jce_decode(data);
  } catch (const JceError &) {
    return true;
  }
  return false;
}

int main() {
  // integers take the narrowest type, zero has its own head
  {
    JceWriter w;
    w.write_int(0, 0);
    w.write_int(1, 100);
    w.write_int(2, 1000);
    w.write_int(3, 100000);
    w.write_int(4, 10000000000LL);
    const std::vector<uint8_t> expected = {
        0x0C,                                           // tag 0 zero
        0x10, 0x64,                                     // tag 1 int8
        0x21, 0x03, 0xE8,                               // tag 2 int16
        0x32, 0x00, 0x01, 0x86, 0xA0,                   // tag 3 int32
        0x43, 0x00, 0x00, 0x00, 0x02, 0x54, 0x0B, 0xE4, 0x00}; // tag 4 int64
    assert(w.data() == expected);

    auto s = jce_decode(w.data());
    assert(jce_field(s, 0).as_int() == 0);
    assert(jce_field(s, 1).as_int() == 100);
    assert(jce_field(s, 2).as_int() == 1000);
    assert(jce_field(s, 3).as_int() == 100000);
    assert(jce_field(s, 4).as_int() == 10000000000LL);
  }

  // negative numbers and tags beyond 14
  {
    JceWriter w;
    w.write_int(20, -2);
    w.write_string(15, "hi");
    const std::vector<uint8_t> expected = {0xF0, 20, 0xFE, 0xF6, 15, 2, 'h', 'i'};
    assert(w.data() == expected);
    auto s = jce_decode(w.data());
    assert(jce_field(s, 20).as_int() == -2);
    assert(jce_field(s, 15).as_string() == "hi");
  }

  // long strings, byte lists, lists, maps and nested structs
  {
    std::string long_str(300, 'x');
    JceStruct inner;
    inner[1] = JceValue::string("10.0.0.1");
    inner[2] = JceValue::integer(8080);
    JceStruct s;
    s[0] = JceValue::string(long_str);
    s[1] = JceValue::bytes({1, 2, 3});
    s[2] = JceValue::list({JceValue::integer(5), JceValue::string("a")});
    s[3] = JceValue::map({{JceValue::string("k"), JceValue::integer(9)}});
    s[4] = JceValue::structure(inner);
    s[5] = JceValue::float64(1.5);

    auto bytes = jce_encode_struct(s);
    assert(bytes[0] == 0x07); // tag 0 string4
    auto d = jce_decode(bytes);
    assert(jce_field(d, 0).as_string() == long_str);
    assert(jce_field(d, 1).as_bytes() == std::vector<uint8_t>({1, 2, 3}));
    const JceList &l = jce_field(d, 2).as_list();
    assert(l.size() == 2 && l[0].as_int() == 5 && l[1].as_string() == "a");
    auto &m = jce_field(d, 3).as_map();
    assert(m.size() == 1 && m[0].first.as_string() == "k" &&
           m[0].second.as_int() == 9);
    auto &st = jce_field(d, 4).as_struct();
    assert(jce_field(st, 1).as_string() == "10.0.0.1");
    assert(jce_field(st, 2).as_int() == 8080);
    assert(jce_field(d, 5).as_double() == 1.5);
  }

  // kind mismatches and missing fields throw
  {
    JceStruct s;
    s[1] = JceValue::integer(1);
    bool threw = false;
    try {
      (void)jce_field(s, 1).as_string();
    } catch (const JceError &) {
      threw = true;
    }
    assert(threw);
    threw = false;
    try {
      (void)jce_field(s, 2);
    } catch (const JceError &) {
      threw = true;
    }
    assert(threw);
  }

  // malformed input
  {
    assert(throws_jce({0x12}));             // int16 without payload
    assert(throws_jce({0x06, 5, 'a'}));     // string shorter than its length
    assert(throws_jce({0x0A, 0x10, 0x01})); // struct never closed
    assert(throws_jce({0x0B}));             // stray struct end
    assert(throws_jce({0x09, 0x00, 0x7F})); // list count beyond input
    assert(throws_jce({0x0E}));             // unknown type
  }

  // nesting is bounded
  {
    std::vector<uint8_t> deep;
    for (int i = 0; i < highway::kJceMaxDepth + 1; i++)
      deep.push_back(0x0A);
    for (int i = 0; i < highway::kJceMaxDepth + 1; i++)
      deep.push_back(0x0B);
    assert(throws_jce(deep));

    std::vector<uint8_t> ok;
    for (int i = 0; i < highway::kJceMaxDepth; i++)
      ok.push_back(0x0A);
    for (int i = 0; i < highway::kJceMaxDepth; i++)
      ok.push_back(0x0B);
    assert(!throws_jce(ok));

    std::vector<uint8_t> lists;
    for (int i = 0; i < 64; i++) {
      lists.push_back(0x09); // list
      lists.push_back(0x00); // count 1
      lists.push_back(0x01);
    }
    lists.push_back(0x0C);
    assert(throws_jce(lists));
  }

  // containers standing in for a length field count towards the ceiling
  {
    const uint8_t heads[] = {0x08, 0x09};
    for (uint8_t head : heads) {
      for (size_t n : {20u, 200000u}) {
        std::string what;
        try {
          jce_decode(std::vector<uint8_t>(n, head));
        } catch (const JceError &e) {
          what = e.what();
        }
        assert(what == "jce nesting too deep");
      }
    }

    std::string what;
    try {
      jce_decode(std::vector<uint8_t>({0x09, 0x06, 0x01, '1'}));
    } catch (const JceError &e) {
      what = e.what();
    }
    assert(what == "jce length is not an integer");
  }

  // wrapper round trip
  {
    JceStruct body;
    body[1] = JceValue::integer(42);
    body[2] = JceValue::string("payload");
    auto packet = jce_encode_wrapper({{"SomeReq", body}}, "Svc", "Fn");
    auto outer = jce_decode(packet);
    assert(jce_field(outer, 1).as_int() == 3);
    assert(jce_field(outer, 5).as_string() == "Svc");
    assert(jce_field(outer, 6).as_string() == "Fn");
    assert(jce_field(outer, 9).as_map().empty());
    auto named = jce_decode(jce_field(outer, 7).as_bytes());
    auto &entries = jce_field(named, 0).as_map();
    assert(entries.size() == 1);
    assert(entries[0].first.as_string() == "SomeReq");
    auto framed = entries[0].second.as_bytes();
    assert(framed.front() == 0x0A && framed.back() == 0x0B);

    auto inner = jce_decode_wrapper(packet);
    assert(jce_field(inner, 1).as_int() == 42);
    assert(jce_field(inner, 2).as_string() == "payload");
  }

  // the server list request decrypts to the expected record
  {
    highway::ClientIdentity id;
    id.uin = 10001;
    id.sub_id = 537064989;
    id.imei = "866819027236657";
    auto enc = highway::build_server_list_request(id);
    assert(enc.size() % 8 == 0);
    highway::TeaCipher tea(highway::directory_key());
    assert(tea.decrypt(enc));
    assert(highway::get_u32be(enc.data()) == enc.size());
    std::vector<uint8_t> wrapped(enc.begin() + 4, enc.end());

    auto outer = jce_decode(wrapped);
    assert(jce_field(outer, 5).as_string() == "ConfigHttp");
    assert(jce_field(outer, 6).as_string() == "HttpServerListReq");
    auto req = jce_decode_wrapper(wrapped);
    assert(jce_field(req, 1).as_int() == 0);
    assert(jce_field(req, 3).as_int() == 1);
    assert(jce_field(req, 4).as_string() == "00000");
    assert(jce_field(req, 5).as_int() == 100);
    assert(jce_field(req, 6).as_int() == 537064989);
    assert(jce_field(req, 7).as_string() == "866819027236657");
    assert(jce_field(req, 13).as_int() == 0);
    assert(jce_field(req, 14).as_int() == 1);
    assert(req.size() == 14);
  }

  return 0;
}
