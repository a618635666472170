#include <algorithm>
#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "crypto.hpp"
#include "highway.pb.h"
#include "protocol.hpp"
#include "util.hpp"

using highway::build_upload_frames;
using highway::ClientIdentity;
using highway::FrameBuilder;
using highway::FrameView;
using highway::kChunkLimit;
using highway::make_upload_object;
using highway::parse_frame;
using highway::UploadObject;

static std::vector<uint8_t> pattern(size_t n) {
  std::vector<uint8_t> v(n);
  for (size_t i = 0; i < n; i++)
    v[i] = (uint8_t)(i * 31 + 7);
  return v;
}

static highway::pb::HighwayRequest head_of(const FrameView &fv) {
  highway::pb::HighwayRequest req;
  bool ok = req.ParseFromArray(fv.header, (int)fv.header_len);
  assert(ok);
  return req;
}

int main() {
  ClientIdentity id;
  id.uin = 123456789;
  id.sub_id = 537064989;
  id.imei = "86-xx";
  std::vector<uint8_t> key = {0xAA, 0xBB, 0xCC, 0xDD};

  // small buffer: one frame carrying the whole buffer
  {
    UploadObject o = make_upload_object(pattern(1000), key);
    auto frames = build_upload_frames(id, o, 2, 100);
    assert(frames.size() == 1);
    FrameView fv;
    assert(parse_frame(frames[0], fv));
    assert(frames[0][0] == 40);
    assert(frames[0].back() == 41);
    assert(fv.chunk_len == 1000);
    assert(std::vector<uint8_t>(fv.chunk, fv.chunk + fv.chunk_len) == o.buf);
    assert(highway::get_u32be(&frames[0][1]) == fv.header_len);
    assert(frames[0].size() == 9 + fv.header_len + fv.chunk_len + 1);

    auto req = head_of(fv);
    assert(req.base_head().version() == 1);
    assert(req.base_head().account() == "123456789");
    assert(req.base_head().command() == "PicUp.DataUp");
    assert(req.base_head().seq() == 100);
    assert(req.base_head().app_id() == 537064989u);
    assert(req.base_head().data_flag() == 4096);
    assert(req.base_head().command_id() == 2);
    assert(req.base_head().locale_id() == 2052);
    assert(req.seg_head().file_size() == 1000);
    assert(req.seg_head().has_data_offset());
    assert(req.seg_head().data_offset() == 0);
    assert(req.seg_head().data_length() == 1000);
    assert(req.seg_head().service_ticket() == std::string(key.begin(), key.end()));
    auto digest = highway::md5(o.buf);
    assert(req.seg_head().md5() == std::string(digest.begin(), digest.end()));
    assert(req.seg_head().file_md5() == std::string(o.md5.begin(), o.md5.end()));
  }

  // a buffer of exactly the limit stays one frame
  {
    UploadObject o = make_upload_object(pattern(kChunkLimit), key);
    auto frames = build_upload_frames(id, o, 2, 0);
    assert(frames.size() == 1);
    FrameView fv;
    assert(parse_frame(frames[0], fv));
    assert(fv.chunk_len == kChunkLimit);
  }

  // two full chunks, no trailing empty frame
  {
    UploadObject o = make_upload_object(pattern(2 * kChunkLimit), key);
    auto frames = build_upload_frames(id, o, 2, 0);
    assert(frames.size() == 2);
  }

  // 7,000,000 bytes with command 1001
  {
    UploadObject o = make_upload_object(pattern(7000000), key);
    auto frames = build_upload_frames(id, o, 1001, 65534);
    assert(frames.size() == 3);
    const uint32_t lens[] = {3000000, 3000000, 1000000};
    const uint64_t offsets[] = {0, 3000000, 6000000};
    const uint32_t seqs[] = {65534, 65535, 0};
    uint64_t total = 0;
    for (size_t i = 0; i < frames.size(); i++) {
      FrameView fv;
      assert(parse_frame(frames[i], fv));
      assert(fv.chunk_len == lens[i]);
      auto req = head_of(fv);
      assert(req.base_head().command_id() == 1001);
      assert(req.base_head().seq() == seqs[i]);
      assert(req.seg_head().data_offset() == offsets[i]);
      assert(req.seg_head().data_length() == lens[i]);
      assert(req.seg_head().file_size() == 7000000);
      assert(req.seg_head().data_offset() + req.seg_head().data_length() <=
             req.seg_head().file_size());
      assert(std::equal(fv.chunk, fv.chunk + fv.chunk_len,
                        o.buf.begin() + (long)offsets[i]));
      total += fv.chunk_len;
    }
    assert(total == o.buf.size());
  }

  // the builder is lazy and leaves the sequence after the last frame
  {
    UploadObject o = make_upload_object(pattern(kChunkLimit + 5), key);
    FrameBuilder b(id, o, 7, 65535);
    assert(b.frame_count() == 2);
    std::vector<uint8_t> f;
    assert(b.next(f));
    assert(b.next_seq() == 0);
    assert(b.next(f));
    FrameView fv;
    assert(parse_frame(f, fv));
    assert(fv.chunk_len == 5);
    assert(!b.next(f));
    assert(b.next_seq() == 1);
  }

  // deterministic for a fixed sequence, input untouched
  {
    UploadObject o = make_upload_object(pattern(4096), key);
    auto before = o.buf;
    auto a = build_upload_frames(id, o, 3, 9);
    auto b = build_upload_frames(id, o, 3, 9);
    assert(a == b);
    assert(o.buf == before);
  }

  // nothing to send
  {
    UploadObject o = make_upload_object({}, key);
    assert(build_upload_frames(id, o, 3).empty());
  }

  // malformed frames are refused
  {
    UploadObject o = make_upload_object(pattern(10), key);
    auto f = build_upload_frames(id, o, 3, 1)[0];
    FrameView fv;
    auto bad = f;
    bad[0] = 0;
    assert(!parse_frame(bad, fv));
    bad = f;
    bad.back() = 0;
    assert(!parse_frame(bad, fv));
    bad = f;
    bad.pop_back();
    bad.pop_back();
    bad.push_back(41);
    assert(!parse_frame(bad, fv));
    assert(!parse_frame(std::vector<uint8_t>(5, 40), fv));
  }

  // packed addresses are little-endian relative to the shift order
  {
    assert(highway::int32ip2str(0x01020304u) == "4.3.2.1");
    assert(highway::int32ip2str(0x0100007Fu) == "127.0.0.1");
    assert(highway::int32ip2str(0xFFFFFFFFu) == "255.255.255.255");
    assert(highway::int32ip2str(std::string("already-a-string")) ==
           "already-a-string");
  }

  return 0;
}
