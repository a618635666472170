
#pragma once
#include <asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include "protocol.hpp"

namespace highway {

enum class HighwayOutcome {
    Completed,      // every frame was answered
    ClosedEarly,    // server closed before the last frame was answered
    TransportError  // connect, write or read failed
};

struct HighwayResult {
    HighwayOutcome outcome{HighwayOutcome::Completed};
    size_t frames_total{0};
    size_t frames_sent{0};
    size_t frames_acked{0};
    std::error_code ec;

    bool ok() const { return outcome == HighwayOutcome::Completed; }
};

using HighwayHandler = std::function<void(const HighwayResult&)>;

const char* to_string(HighwayOutcome o);

// Delivers the frames of one upload over one connection. Exactly one frame
// is in flight; any bytes from the server release the next one. The server
// reply is not interpreted. There is no socket timeout, callers that need
// one close the session through cancel().
class HighwaySession : public std::enable_shared_from_this<HighwaySession> {
public:
    using tcp = asio::ip::tcp;
    enum class State { Idle, Connecting, Sending, WaitingAck, Done, Failed };

    HighwaySession(asio::io_context& io, std::string host, uint16_t port,
                   std::deque<std::vector<uint8_t>> frames, HighwayHandler handler);
    void start();
    void cancel();
    State state() const { return state_; }

private:
    enum class Event { Connected, Written, Data, Closed, Error };

    void on_event(Event ev, std::error_code ec = {});
    void do_write();
    void do_read();
    void complete(HighwayOutcome outcome, std::error_code ec);

    asio::io_context& io_;
    std::string host_;
    uint16_t port_;
    tcp::resolver resolver_;
    tcp::socket sock_;
    std::deque<std::vector<uint8_t>> write_q_;
    std::vector<uint8_t> read_buf_;
    HighwayHandler handler_;
    State state_{State::Idle};
    HighwayResult result_;
};

// Builds the frames for obj and uploads them to address:port. The sequence
// starts at first_seq, or at a random value when it is not given. The
// address may be a packed little-endian IPv4 integer.
std::shared_ptr<HighwaySession> highway_upload(asio::io_context& io, const ClientIdentity& id,
                                               const std::string& address, uint16_t port,
                                               const UploadObject& obj, uint32_t cmd,
                                               HighwayHandler handler,
                                               std::optional<uint16_t> first_seq = std::nullopt);
std::shared_ptr<HighwaySession> highway_upload(asio::io_context& io, const ClientIdentity& id,
                                               uint32_t address, uint16_t port,
                                               const UploadObject& obj, uint32_t cmd,
                                               HighwayHandler handler,
                                               std::optional<uint16_t> first_seq = std::nullopt);

} // namespace highway
