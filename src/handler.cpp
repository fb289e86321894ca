#include "quicgate/handler.hpp"

#include "quicgate/log.hpp"
#include "quicgate/utils.hpp"

#include <utility>

namespace quicgate {

namespace {

constexpr std::string_view kLogName = "quicgate.handler";

using SendResult = expected<void, ErrorCode>;

}  // namespace

// ============================================================================
// StreamHandler
// ============================================================================

HeaderList StreamHandler::base_response_headers(uint16_t status) const {
  HeaderList headers;
  headers.push_back({":status", std::to_string(status)});
  headers.push_back({"server", context_.server_name});
  headers.push_back({"date", http_date_now()});
  return headers;
}

void StreamHandler::run_application(const Application& app) {
  std::weak_ptr<StreamHandler> weak = shared_from_this();

  // The application only ever sees weak references to the handler
  Receive receive = [weak](ReceiveCallback callback) {
    if (auto self = weak.lock()) {
      self->receive(std::move(callback));
    }
  };

  Send send = [weak](OutboundMessage message) -> SendResult {
    auto self = weak.lock();
    if (!self || self->finished_) {
      return SendResult::error(ErrorCode::kConnectionClosed);
    }
    return self->send(message);
  };

  Done done = [weak](std::exception_ptr error) {
    auto self = weak.lock();
    if (!self) {
      if (error) {
        std::rethrow_exception(error);
      }
      return;
    }
    self->complete(std::move(error));
  };

  try {
    app(scope_, std::move(receive), std::move(send), std::move(done));
  } catch (...) {
    complete(std::current_exception());
  }
}

void StreamHandler::receive(ReceiveCallback callback) {
  std::weak_ptr<StreamHandler> weak = shared_from_this();
  mailbox_.pop([weak, callback = std::move(callback)](InboundMessage message) {
    try {
      callback(std::move(message));
    } catch (...) {
      auto self = weak.lock();
      if (!self) {
        throw;
      }
      self->complete(std::current_exception());
    }
  });
}

void StreamHandler::complete(std::exception_ptr error) {
  if (finished_) {
    if (error) {
      std::rethrow_exception(error);
    }
    QUICGATE_LOG_WARN(kLogName, "stream " + std::to_string(stream_id_) + " finished twice");
    return;
  }
  finished_ = true;

  auto self = shared_from_this();
  {
    ScopeGuard deregister([this]() {
      if (context_.on_finished) {
        context_.on_finished(stream_id_);
      }
    });
    on_application_finished(error != nullptr);
  }

  if (error) {
    std::rethrow_exception(error);
  }
}

// ============================================================================
// RequestHandler
// ============================================================================

void RequestHandler::handle_data(const DataReceived& event) {
  if (reset_ || request_complete_) {
    return;
  }
  if (state_ == RequestState::kAwaitingBody) {
    state_ = RequestState::kStreamingBody;
  }
  request_complete_ = event.stream_ended;
  mailbox_.push(HttpRequest{event.data, !event.stream_ended});
}

void RequestHandler::handle_reset() {
  if (reset_) {
    return;
  }
  reset_ = true;
  mailbox_.close(HttpDisconnect{});
}

SendResult RequestHandler::send(const OutboundMessage& message) {
  if (reset_ || state_ == RequestState::kHalfClosed || state_ == RequestState::kClosed) {
    return SendResult::error(ErrorCode::kConnectionClosed);
  }

  SendResult result = std::visit(
      overloaded{
          [this](const HttpResponseStart& start) {
            if (response_started_) {
              return SendResult::error(ErrorCode::kInvalidState);
            }
            HeaderList headers = base_response_headers(start.status);
            headers.insert(headers.end(), start.headers.begin(), start.headers.end());
            framing().send_headers(stream_id_, headers);
            response_started_ = true;
            return SendResult::success();
          },
          [this](const HttpResponseBody& body) {
            if (!response_started_) {
              return SendResult::error(ErrorCode::kInvalidState);
            }
            framing().send_data(stream_id_, body.body, false);
            return SendResult::success();
          },
          [](const auto&) { return SendResult::error(ErrorCode::kInvalidMessage); },
      },
      message);

  if (!result) {
    QUICGATE_LOG_DEBUG(kLogName, std::string("rejected ") + message_type(message) + " on stream " +
                                     std::to_string(stream_id_) + ": " + error_code_name(result.get_error()));
  }
  flush();
  return result;
}

void RequestHandler::on_application_finished(bool failed) {
  if (reset_ || failed) {
    // Nothing more goes out on this stream
    return;
  }
  state_ = RequestState::kHalfClosed;
  framing().send_data(stream_id_, "", true);
  state_ = RequestState::kClosed;
  flush();
}

}  // namespace quicgate
