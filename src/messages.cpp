#include "quicgate/messages.hpp"

namespace quicgate {

const char* message_type(const InboundMessage& message) {
  return std::visit(overloaded{
                        [](const HttpRequest&) { return "http.request"; },
                        [](const HttpDisconnect&) { return "http.disconnect"; },
                        [](const WebSocketConnect&) { return "websocket.connect"; },
                        [](const WebSocketReceiveText&) { return "websocket.receive"; },
                        [](const WebSocketReceiveBytes&) { return "websocket.receive"; },
                        [](const WebSocketDisconnect&) { return "websocket.disconnect"; },
                    },
                    message);
}

const char* message_type(const OutboundMessage& message) {
  return std::visit(overloaded{
                        [](const HttpResponseStart&) { return "http.response.start"; },
                        [](const HttpResponseBody&) { return "http.response.body"; },
                        [](const WebSocketAccept&) { return "websocket.accept"; },
                        [](const WebSocketClose&) { return "websocket.close"; },
                        [](const WebSocketSendText&) { return "websocket.send"; },
                        [](const WebSocketSendBytes&) { return "websocket.send"; },
                    },
                    message);
}

}  // namespace quicgate
