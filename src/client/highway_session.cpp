
#include "highway_session.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace highway {

const char *to_string(HighwayOutcome o) {
  switch (o) {
  case HighwayOutcome::Completed:
    return "completed";
  case HighwayOutcome::ClosedEarly:
    return "closed early";
  case HighwayOutcome::TransportError:
    return "transport error";
  }
  return "unknown";
}

HighwaySession::HighwaySession(asio::io_context &io, std::string host,
                               uint16_t port,
                               std::deque<std::vector<uint8_t>> frames,
                               HighwayHandler handler)
    : io_(io), host_(std::move(host)), port_(port), resolver_(io), sock_(io),
      write_q_(std::move(frames)), read_buf_(4096),
      handler_(std::move(handler)) {
  result_.frames_total = write_q_.size();
}

void HighwaySession::start() {
  if (state_ != State::Idle)
    return;
  auto self = shared_from_this();
  if (write_q_.empty()) {
    state_ = State::Done;
    asio::post(io_, [this, self]() {
      auto h = std::move(handler_);
      if (h)
        h(result_);
    });
    return;
  }
  state_ = State::Connecting;
  resolver_.async_resolve(
      host_, std::to_string(port_),
      [this, self](std::error_code ec, tcp::resolver::results_type res) {
        if (ec) {
          on_event(Event::Error, ec);
          return;
        }
        asio::async_connect(
            sock_, res, [this, self](std::error_code ec, const tcp::endpoint &) {
              on_event(ec ? Event::Error : Event::Connected, ec);
            });
      });
}

void HighwaySession::cancel() {
  on_event(Event::Closed, asio::error::operation_aborted);
}

void HighwaySession::on_event(Event ev, std::error_code ec) {
  if (state_ == State::Done || state_ == State::Failed || state_ == State::Idle)
    return;

  if (ev == Event::Error) {
    Logger::instance().log(LogLevel::WARN, "highway %s:%u failed: %s",
                           host_.c_str(), (unsigned)port_,
                           ec.message().c_str());
    complete(HighwayOutcome::TransportError, ec);
    return;
  }
  if (ev == Event::Closed) {
    // an answer to the last frame moves us to Done before the close arrives
    Logger::instance().log(LogLevel::WARN,
                           "highway %s:%u closed after %zu/%zu frames",
                           host_.c_str(), (unsigned)port_,
                           result_.frames_acked, result_.frames_total);
    complete(HighwayOutcome::ClosedEarly, ec);
    return;
  }

  switch (state_) {
  case State::Connecting:
    if (ev == Event::Connected) {
      state_ = State::Sending;
      do_write();
    }
    break;
  case State::Sending:
    if (ev == Event::Written) {
      result_.frames_sent++;
      write_q_.pop_front();
      state_ = State::WaitingAck;
      do_read();
    }
    break;
  case State::WaitingAck:
    if (ev == Event::Data) {
      result_.frames_acked++;
      if (write_q_.empty()) {
        complete(HighwayOutcome::Completed, {});
      } else {
        state_ = State::Sending;
        do_write();
      }
    }
    break;
  default:
    break;
  }
}

void HighwaySession::do_write() {
  auto self = shared_from_this();
  auto &front = write_q_.front();
  Logger::instance().log(LogLevel::DEBUG, "highway frame %zu/%zu (%zu bytes)",
                         result_.frames_sent + 1, result_.frames_total,
                         front.size());
  asio::async_write(sock_, asio::buffer(front),
                    [this, self](std::error_code ec, std::size_t) {
                      on_event(ec ? Event::Error : Event::Written, ec);
                    });
}

void HighwaySession::do_read() {
  auto self = shared_from_this();
  sock_.async_read_some(asio::buffer(read_buf_),
                        [this, self](std::error_code ec, std::size_t n) {
                          if (!ec && n > 0)
                            on_event(Event::Data);
                          else if (ec == asio::error::eof ||
                                   ec == asio::error::connection_reset)
                            on_event(Event::Closed, ec);
                          else
                            on_event(Event::Error, ec);
                        });
}

void HighwaySession::complete(HighwayOutcome outcome, std::error_code ec) {
  state_ = outcome == HighwayOutcome::Completed ? State::Done : State::Failed;
  result_.outcome = outcome;
  result_.ec = ec;
  std::error_code ignored;
  resolver_.cancel();
  sock_.close(ignored);
  auto h = std::move(handler_);
  if (h)
    h(result_);
}

std::shared_ptr<HighwaySession>
highway_upload(asio::io_context &io, const ClientIdentity &id,
               const std::string &address, uint16_t port,
               const UploadObject &obj, uint32_t cmd, HighwayHandler handler,
               std::optional<uint16_t> first_seq) {
  Logger::instance().log(LogLevel::TRACE, "highway ip:%s port:%u",
                         address.c_str(), (unsigned)port);
  auto frames = first_seq ? build_upload_frames(id, obj, cmd, *first_seq)
                          : build_upload_frames(id, obj, cmd);
  auto s = std::make_shared<HighwaySession>(
      io, address, port,
      std::deque<std::vector<uint8_t>>(std::make_move_iterator(frames.begin()),
                                       std::make_move_iterator(frames.end())),
      std::move(handler));
  s->start();
  return s;
}

std::shared_ptr<HighwaySession>
highway_upload(asio::io_context &io, const ClientIdentity &id,
               uint32_t address, uint16_t port, const UploadObject &obj,
               uint32_t cmd, HighwayHandler handler,
               std::optional<uint16_t> first_seq) {
  return highway_upload(io, id, int32ip2str(address), port, obj, cmd,
                        std::move(handler), first_seq);
}

} // namespace highway
