/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file quicgate.hpp
 * @brief quicgate - HTTP/3 and WebSocket application bridge over QUIC
 *
 * Turns the streams of a QUIC connection into HTTP request/response
 * exchanges or WebSocket sessions, each driven by an application callback
 * with receive / send / done capabilities.
 *
 * Usage:
 *   #include "quicgate.hpp"
 *
 *   quicgate::Application app = [](const quicgate::Scope& scope, quicgate::Receive receive,
 *                                  quicgate::Send send, quicgate::Done done) {
 *     send(quicgate::HttpResponseStart{200, {{"content-type", "text/plain"}}});
 *     send(quicgate::HttpResponseBody{"hello"});
 *     done(nullptr);
 *   };
 *   return quicgate::serve(argc, argv, engine, app);
 *
 * @see RFC 9114: HTTP/3
 * @see RFC 9220: Bootstrapping WebSockets with HTTP/3
 */

#ifndef QUICGATE_HPP_
#define QUICGATE_HPP_

#include "quicgate/config.hpp"
#include "quicgate/connection.hpp"
#include "quicgate/event_log.hpp"
#include "quicgate/events.hpp"
#include "quicgate/framing.hpp"
#include "quicgate/handler.hpp"
#include "quicgate/log.hpp"
#include "quicgate/mailbox.hpp"
#include "quicgate/messages.hpp"
#include "quicgate/quic_engine.hpp"
#include "quicgate/scheduler.hpp"
#include "quicgate/server.hpp"
#include "quicgate/ticket_cache.hpp"
#include "quicgate/tls.hpp"
#include "quicgate/transport.hpp"
#include "quicgate/utils.hpp"
#include "quicgate/vocabulary.hpp"
#include "quicgate/ws_codec.hpp"

#endif  // QUICGATE_HPP_
