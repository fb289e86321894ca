#ifndef QUICGATE_TESTS_TEST_HELPERS_HPP_
#define QUICGATE_TESTS_TEST_HELPERS_HPP_

#include "quicgate/framing.hpp"
#include "quicgate/handler.hpp"
#include "quicgate/messages.hpp"
#include "quicgate/scheduler.hpp"
#include "quicgate/transport.hpp"
#include "quicgate/ws_codec.hpp"

#include <cstdint>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace quicgate {
namespace test {

// ============================================================================
// Recording fakes
// ============================================================================

struct StreamWrite {
  uint64_t stream_id;
  std::string data;
  bool end_stream;
};

class RecordingTransport : public Transport {
 public:
  void send_stream_data(uint64_t stream_id, std::string_view data, bool end_stream) override {
    writes.push_back({stream_id, std::string(data), end_stream});
  }

  void transmit() override { ++transmits; }

  std::vector<StreamWrite> writes;
  int transmits = 0;
};

// One call on the framing, in call order
struct Frame {
  enum Kind { kHeaders, kData };

  Kind kind;
  uint64_t stream_id;
  HeaderList headers;
  std::string data;
  bool end_stream;

  std::string header(const std::string& name) const {
    for (const auto& h : headers) {
      if (h.name == name) return h.value;
    }
    return std::string();
  }
};

struct FramingRecord {
  std::vector<Frame> frames;
  std::vector<TransportEvent> events;

  std::vector<Frame> frames_for(uint64_t stream_id) const {
    std::vector<Frame> out;
    for (const auto& f : frames) {
      if (f.stream_id == stream_id) out.push_back(f);
    }
    return out;
  }
};

class RecordingFraming : public HttpFraming {
 public:
  RecordingFraming(FramingKind kind, std::shared_ptr<FramingRecord> record)
      : kind_(kind), record_(std::move(record)) {}

  FramingKind kind() const override { return kind_; }

  // Tests inject HTTP events directly; transport events are only recorded
  std::vector<HttpEvent> handle_event(const TransportEvent& event) override {
    record_->events.push_back(event);
    return {};
  }

  void send_headers(uint64_t stream_id, const HeaderList& headers) override {
    record_->frames.push_back({Frame::kHeaders, stream_id, headers, std::string(), false});
  }

  void send_data(uint64_t stream_id, std::string_view data, bool end_stream) override {
    record_->frames.push_back({Frame::kData, stream_id, HeaderList(), std::string(data), end_stream});
  }

 private:
  FramingKind kind_;
  std::shared_ptr<FramingRecord> record_;
};

inline FramingFactory recording_factory(std::shared_ptr<FramingRecord> record) {
  return [record](FramingKind kind, Transport&) -> std::unique_ptr<HttpFraming> {
    return std::make_unique<RecordingFraming>(kind, record);
  };
}

// ============================================================================
// Handler fixture
// ============================================================================

// Owns everything a handler borrows from its connection
struct HandlerFixture {
  std::shared_ptr<FramingRecord> record = std::make_shared<FramingRecord>();
  RecordingFraming framing{FramingKind::kH3, record};
  Scheduler scheduler;
  int transmits = 0;
  std::vector<uint64_t> finished;

  StreamContext context() {
    return StreamContext{framing, scheduler, [this]() { ++transmits; },
                         [this](uint64_t id) { finished.push_back(id); }, "quicgate"};
  }
};

// ============================================================================
// Application helpers
// ============================================================================

// Receives `count` messages into `out`, then runs `then`.
inline void receive_n(Receive receive, size_t count, std::shared_ptr<std::vector<InboundMessage>> out,
                      std::function<void()> then) {
  if (count == 0) {
    then();
    return;
  }
  receive([receive, count, out, then](InboundMessage message) {
    out->push_back(std::move(message));
    receive_n(receive, count - 1, out, then);
  });
}

// ============================================================================
// Header blocks and client frames
// ============================================================================

inline HeaderList request_headers(const std::string& method, const std::string& path) {
  return {{":method", method}, {":scheme", "https"}, {":authority", "localhost"}, {":path", path}};
}

inline HeaderList websocket_headers(const std::string& path, const std::string& subprotocols = std::string()) {
  HeaderList headers = {{":method", "CONNECT"},
                        {":protocol", "websocket"},
                        {":scheme", "https"},
                        {":authority", "localhost"},
                        {":path", path}};
  if (!subprotocols.empty()) {
    headers.push_back({"sec-websocket-protocol", subprotocols});
  }
  return headers;
}

// A masked client frame, as a browser would send it
inline std::string client_frame(ws::OpCode opcode, const std::string& payload, bool fin = true) {
  const uint8_t mask[4] = {0x37, 0xfa, 0x21, 0x3d};
  uint8_t header[14];
  size_t len = ws::encode_frame_header(header, opcode, payload.size(), true);
  if (!fin) {
    header[0] &= 0x7F;
  }
  std::string frame(reinterpret_cast<const char*>(header), len);
  frame.append(reinterpret_cast<const char*>(mask), 4);
  std::string body = payload;
  if (!body.empty()) {
    ws::apply_mask(&body[0], body.size(), mask);
  }
  frame += body;
  return frame;
}

inline std::string close_payload(uint16_t code, const std::string& reason = std::string()) {
  std::string payload;
  payload.push_back(static_cast<char>((code >> 8) & 0xFF));
  payload.push_back(static_cast<char>(code & 0xFF));
  payload += reason;
  return payload;
}

// Decode an unmasked server frame: opcode and payload
struct ServerFrame {
  ws::OpCode opcode;
  std::string payload;
};

inline std::vector<ServerFrame> parse_server_frames(std::string data) {
  std::vector<ServerFrame> frames;
  while (!data.empty()) {
    ws::FrameHeader header;
    size_t header_size = ws::parse_frame_header(data, header);
    if (header_size == 0 || data.size() < header_size + header.payload_len) break;
    frames.push_back({header.opcode, data.substr(header_size, static_cast<size_t>(header.payload_len))});
    data.erase(0, header_size + static_cast<size_t>(header.payload_len));
  }
  return frames;
}

}  // namespace test
}  // namespace quicgate

#endif  // QUICGATE_TESTS_TEST_HELPERS_HPP_
