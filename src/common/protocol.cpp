
#include "protocol.hpp"
#include "crypto.hpp"
#include "highway.pb.h"
#include "util.hpp"
#include <algorithm>
#include <stdexcept>

namespace highway {

UploadObject make_upload_object(std::vector<uint8_t> buf,
                                std::vector<uint8_t> key) {
  UploadObject o;
  o.md5 = md5(buf);
  o.buf = std::move(buf);
  o.key = std::move(key);
  return o;
}

FrameBuilder::FrameBuilder(const ClientIdentity &id, const UploadObject &obj,
                           uint32_t cmd, uint16_t first_seq)
    : id_(id), obj_(obj), cmd_(cmd), seq_(first_seq) {}

size_t FrameBuilder::frame_count() const {
  return (obj_.buf.size() + kChunkLimit - 1) / kChunkLimit;
}

bool FrameBuilder::next(std::vector<uint8_t> &frame) {
  if (offset_ >= obj_.buf.size())
    return false;
  size_t len = std::min(kChunkLimit, obj_.buf.size() - offset_);
  const uint8_t *chunk = obj_.buf.data() + offset_;

  pb::HighwayRequest req;
  auto *base = req.mutable_base_head();
  base->set_version(kHeadVersion);
  base->set_account(std::to_string(id_.uin));
  base->set_command(kUploadCommand);
  base->set_seq(seq_++);
  base->set_app_id(id_.sub_id);
  base->set_data_flag(kDataFlag);
  base->set_command_id(cmd_);
  base->set_locale_id(kLocaleId);
  auto *seg = req.mutable_seg_head();
  seg->set_file_size(obj_.buf.size());
  seg->set_data_offset(offset_);
  seg->set_data_length((uint32_t)len);
  seg->set_service_ticket(obj_.key.data(), obj_.key.size());
  auto chunk_md5 = md5(chunk, len);
  seg->set_md5(chunk_md5.data(), chunk_md5.size());
  seg->set_file_md5(obj_.md5.data(), obj_.md5.size());

  std::string head;
  if (!req.SerializeToString(&head))
    throw std::runtime_error("highway head serialization failed");

  frame.resize(kPreambleSize + head.size() + len + 1);
  frame[0] = kFrameStart;
  put_u32be(&frame[1], (uint32_t)head.size());
  put_u32be(&frame[5], (uint32_t)len);
  std::copy(head.begin(), head.end(), frame.begin() + kPreambleSize);
  std::copy(chunk, chunk + len, frame.begin() + kPreambleSize + head.size());
  frame.back() = kFrameEnd;

  offset_ += len;
  return true;
}

std::vector<std::vector<uint8_t>>
build_upload_frames(const ClientIdentity &id, const UploadObject &obj,
                    uint32_t cmd, uint16_t first_seq) {
  FrameBuilder b(id, obj, cmd, first_seq);
  std::vector<std::vector<uint8_t>> frames;
  frames.reserve(b.frame_count());
  std::vector<uint8_t> f;
  while (b.next(f))
    frames.push_back(std::move(f));
  return frames;
}

std::vector<std::vector<uint8_t>>
build_upload_frames(const ClientIdentity &id, const UploadObject &obj,
                    uint32_t cmd) {
  return build_upload_frames(id, obj, cmd, random_u16());
}

bool parse_frame(const std::vector<uint8_t> &frame, FrameView &out) {
  if (frame.size() < kPreambleSize + 1)
    return false;
  if (frame.front() != kFrameStart || frame.back() != kFrameEnd)
    return false;
  uint32_t hl = get_u32be(&frame[1]);
  uint32_t cl = get_u32be(&frame[5]);
  if ((uint64_t)kPreambleSize + hl + cl + 1 != frame.size())
    return false;
  out.header_len = hl;
  out.chunk_len = cl;
  out.header = frame.data() + kPreambleSize;
  out.chunk = out.header + hl;
  return true;
}

} // namespace highway
