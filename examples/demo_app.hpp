/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_EXAMPLES_DEMO_APP_HPP_
#define QUICGATE_EXAMPLES_DEMO_APP_HPP_

#include "quicgate/messages.hpp"

namespace quicgate {
namespace demo {

// Routes:
//   GET /     small HTML page
//   /echo     responds with the request body
//   /ws       WebSocket echo, selects the first offered sub-protocol
// Anything else is a 404 (HTTP) or a refused upgrade (WebSocket).
Application make_demo_app();

}  // namespace demo
}  // namespace quicgate

#endif  // QUICGATE_EXAMPLES_DEMO_APP_HPP_
