/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_FRAMING_HPP_
#define QUICGATE_FRAMING_HPP_

#include "events.hpp"
#include "messages.hpp"
#include "transport.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace quicgate {

// ============================================================================
// Framing variants
// ============================================================================

enum class FramingKind : uint8_t {
  kH3,  // HTTP/3 framing
  kH0   // HTTP/0.9 over QUIC ("hq")
};

// Maps an ALPN token to its framing variant: "h3", "h3-<draft>" -> kH3,
// "hq-<draft>", "hq-interop" -> kH0. Anything else is not served.
optional<FramingKind> framing_for_alpn(std::string_view alpn);

// "3" for HTTP/3, "0.9" for HTTP/0.9.
const char* http_version_of(FramingKind kind);

// ============================================================================
// HttpFraming - turns transport events into HTTP events and back
// ============================================================================

class HttpFraming {
 public:
  virtual ~HttpFraming() = default;

  virtual FramingKind kind() const = 0;

  // Translate one transport event into zero or more HTTP events.
  virtual std::vector<HttpEvent> handle_event(const TransportEvent& event) = 0;

  virtual void send_headers(uint64_t stream_id, const HeaderList& headers) = 0;

  virtual void send_data(uint64_t stream_id, std::string_view data, bool end_stream) = 0;
};

// Creates the framing for the negotiated variant, or nullptr when the variant
// is not available in this build.
using FramingFactory = std::function<std::unique_ptr<HttpFraming>(FramingKind, Transport&)>;

// Serves kH0 with H0Framing. HTTP/3 framing (QPACK and frame codec) must be
// supplied by the integrator through a custom factory.
FramingFactory default_framing_factory();

// ============================================================================
// H0Framing - HTTP/0.9 request line on client bidirectional streams
// ============================================================================

class H0Framing : public HttpFraming {
 public:
  static constexpr size_t kMaxRequestLine = 8192;

  explicit H0Framing(Transport& transport) : transport_(transport) {}

  FramingKind kind() const override { return FramingKind::kH0; }

  std::vector<HttpEvent> handle_event(const TransportEvent& event) override;

  // HTTP/0.9 responses carry no header block.
  void send_headers(uint64_t /* stream_id */, const HeaderList& /* headers */) override {}

  void send_data(uint64_t stream_id, std::string_view data, bool end_stream) override;

  // Streams whose request state is still held
  size_t tracked_streams() const { return request_seen_.size() + rejected_.size(); }

 private:
  std::vector<HttpEvent> handle_stream_data(const StreamDataReceived& event);

  static bool is_client_bidi_stream(uint64_t stream_id) { return (stream_id % 4) == 0; }

  Transport& transport_;
  std::unordered_map<uint64_t, std::string> partial_lines_;
  std::unordered_set<uint64_t> request_seen_;
  std::unordered_set<uint64_t> rejected_;
};

}  // namespace quicgate

#endif  // QUICGATE_FRAMING_HPP_
