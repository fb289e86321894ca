#include "quicgate/framing.hpp"

#include "quicgate/log.hpp"

#include <utility>

namespace quicgate {

namespace {

constexpr std::string_view kLogName = "quicgate.h0";

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

}  // namespace

optional<FramingKind> framing_for_alpn(std::string_view alpn) {
  if (alpn == "h3" || starts_with(alpn, "h3-")) {
    return FramingKind::kH3;
  }
  if (alpn == "hq-interop" || starts_with(alpn, "hq-")) {
    return FramingKind::kH0;
  }
  return {};
}

const char* http_version_of(FramingKind kind) {
  switch (kind) {
    case FramingKind::kH3:
      return "3";
    case FramingKind::kH0:
      return "0.9";
  }
  return "3";
}

FramingFactory default_framing_factory() {
  return [](FramingKind kind, Transport& transport) -> std::unique_ptr<HttpFraming> {
    switch (kind) {
      case FramingKind::kH0:
        return std::make_unique<H0Framing>(transport);
      case FramingKind::kH3:
        QUICGATE_LOG_ERROR("quicgate.framing", "no HTTP/3 framing installed, use a custom FramingFactory");
        return nullptr;
    }
    return nullptr;
  };
}

// ============================================================================
// H0Framing
// ============================================================================

std::vector<HttpEvent> H0Framing::handle_event(const TransportEvent& event) {
  return std::visit(
      overloaded{
          [this](const StreamDataReceived& ev) { return handle_stream_data(ev); },
          [this](const StreamReset& ev) {
            std::vector<HttpEvent> out;
            bool known = request_seen_.count(ev.stream_id) > 0;
            partial_lines_.erase(ev.stream_id);
            request_seen_.erase(ev.stream_id);
            rejected_.erase(ev.stream_id);
            if (known) {
              out.emplace_back(StreamAborted{ev.stream_id});
            }
            return out;
          },
          [](const ProtocolNegotiated&) { return std::vector<HttpEvent>{}; },
          [](const HandshakeCompleted&) { return std::vector<HttpEvent>{}; },
          [](const ConnectionTerminated&) { return std::vector<HttpEvent>{}; },
      },
      event);
}

std::vector<HttpEvent> H0Framing::handle_stream_data(const StreamDataReceived& event) {
  std::vector<HttpEvent> out;
  const uint64_t sid = event.stream_id;

  if (!is_client_bidi_stream(sid)) {
    return out;
  }
  if (rejected_.count(sid) > 0) {
    if (event.end_stream) {
      rejected_.erase(sid);
    }
    return out;
  }

  if (request_seen_.count(sid) > 0) {
    out.emplace_back(DataReceived{sid, event.data, event.end_stream});
    return out;
  }

  // Accumulate until the request line is complete
  std::string& buffer = partial_lines_[sid];
  buffer.append(event.data);

  size_t eol = buffer.find('\n');
  if (eol == std::string::npos && !event.end_stream) {
    if (buffer.size() > kMaxRequestLine) {
      QUICGATE_LOG_WARN(kLogName, "request line too long on stream " + std::to_string(sid));
      partial_lines_.erase(sid);
      rejected_.insert(sid);
    }
    return out;
  }

  std::string line = eol == std::string::npos ? buffer : buffer.substr(0, eol);
  std::string rest = eol == std::string::npos ? std::string() : buffer.substr(eol + 1);
  partial_lines_.erase(sid);

  while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
    line.pop_back();
  }

  size_t space = line.find(' ');
  if (space == std::string::npos || space == 0) {
    QUICGATE_LOG_WARN(kLogName, "malformed request line on stream " + std::to_string(sid));
    if (!event.end_stream) {
      rejected_.insert(sid);
    }
    return out;
  }

  request_seen_.insert(sid);

  HeadersReceived headers;
  headers.stream_id = sid;
  headers.headers.push_back({":method", line.substr(0, space)});
  headers.headers.push_back({":path", line.substr(space + 1)});
  headers.stream_ended = false;
  out.emplace_back(std::move(headers));
  out.emplace_back(DataReceived{sid, std::move(rest), event.end_stream});
  return out;
}

void H0Framing::send_data(uint64_t stream_id, std::string_view data, bool end_stream) {
  if (end_stream) {
    // Response complete, nothing more to track for this stream
    request_seen_.erase(stream_id);
    rejected_.erase(stream_id);
  }
  transport_.send_stream_data(stream_id, data, end_stream);
}

}  // namespace quicgate
