/*
 * 설명: Boost.Beast 기반 WebSocket(ws/wss) 전송 계층 생성을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/e2e/websocket_transport_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "client/transport.hpp"

namespace client {

struct TransportLimits {
  std::chrono::milliseconds connect_timeout{std::chrono::milliseconds(5000)};
  std::size_t max_queue_messages{64};
  std::size_t max_queue_bytes{1024 * 1024};
};

std::shared_ptr<Transport> MakeWebSocketTransport(boost::asio::io_context& ioc, boost::asio::ssl::context& ssl_ctx,
                                                  bool secure, const TransportLimits& limits);

}  // namespace client
