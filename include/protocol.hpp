
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace highway {

constexpr uint8_t  kFrameStart    = 40;
constexpr uint8_t  kFrameEnd      = 41;
constexpr size_t   kPreambleSize  = 9;       // start marker + u32be head len + u32be chunk len
constexpr size_t   kChunkLimit    = 3000000;

constexpr uint32_t kHeadVersion   = 1;
constexpr uint32_t kDataFlag      = 4096;
constexpr uint32_t kLocaleId      = 2052;
constexpr const char* kUploadCommand = "PicUp.DataUp";

// Identity of the logged-in client, passed explicitly to every builder.
struct ClientIdentity {
    uint64_t uin{0};
    uint32_t sub_id{0};
    std::string imei;
};

struct UploadObject {
    std::vector<uint8_t> buf;
    std::vector<uint8_t> key;  // per-object ticket, copied into every head
    std::vector<uint8_t> md5;  // digest of the whole buf
};

UploadObject make_upload_object(std::vector<uint8_t> buf, std::vector<uint8_t> key);

// Emits one wire frame per chunk of obj.buf:
//   0x28 | u32be head_len | u32be chunk_len | head | chunk | 0x29
// The builder borrows both arguments; they must outlive it.
class FrameBuilder {
public:
    FrameBuilder(const ClientIdentity& id, const UploadObject& obj, uint32_t cmd, uint16_t first_seq);
    bool next(std::vector<uint8_t>& frame);
    size_t frame_count() const;
    uint16_t next_seq() const { return seq_; }
private:
    const ClientIdentity& id_;
    const UploadObject& obj_;
    uint32_t cmd_;
    uint16_t seq_;
    size_t offset_{0};
};

std::vector<std::vector<uint8_t>> build_upload_frames(const ClientIdentity& id, const UploadObject& obj,
                                                      uint32_t cmd, uint16_t first_seq);
std::vector<std::vector<uint8_t>> build_upload_frames(const ClientIdentity& id, const UploadObject& obj,
                                                      uint32_t cmd);

struct FrameView {
    uint32_t header_len{0};
    uint32_t chunk_len{0};
    const uint8_t* header{nullptr};
    const uint8_t* chunk{nullptr};
};

// Checks both markers and that the length fields cover the frame exactly.
bool parse_frame(const std::vector<uint8_t>& frame, FrameView& out);

} // namespace highway
