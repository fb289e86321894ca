/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_TRANSPORT_HPP_
#define QUICGATE_TRANSPORT_HPP_

#include <cstdint>

#include <string_view>

namespace quicgate {

// One QUIC connection as seen from the HTTP layer.
class Transport {
 public:
  virtual ~Transport() = default;

  // Queue stream bytes; nothing leaves the host until transmit().
  virtual void send_stream_data(uint64_t stream_id, std::string_view data, bool end_stream) = 0;

  // Flush queued output. Must be cheap when nothing is queued.
  virtual void transmit() = 0;
};

}  // namespace quicgate

#endif  // QUICGATE_TRANSPORT_HPP_
