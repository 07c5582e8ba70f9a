/*
 * 설명: 클라이언트 런타임(io_context, 워커 스레드, TLS 컨텍스트)과 문서별 세션 생성을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/config_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "client/config.hpp"
#include "client/observability.hpp"
#include "client/session_controller.hpp"
#include "client/transport.hpp"
#include "client/websocket_transport.hpp"

namespace client {

class ClientApp {
 public:
  explicit ClientApp(const ClientConfig& config);
  ~ClientApp();

  void Start();
  void Stop(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

  std::shared_ptr<SessionController> OpenSession(const std::string& document_id, SessionCallbacks callbacks);
  SessionOptions MakeSessionOptions(const std::string& document_id) const;

  boost::asio::io_context& GetContext() { return ioc_; }
  const ClientConfig& GetConfig() const { return config_; }
  const Endpoint& GetEndpoint() const { return endpoint_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }
  std::size_t TrackedSessionCount();

 private:
  ClientConfig config_;
  Endpoint endpoint_;
  TransportLimits limits_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::ssl::context ssl_ctx_;
  std::shared_ptr<Observability> observability_;
  std::mutex mutex_;
  std::vector<std::weak_ptr<SessionController>> sessions_;
  std::thread worker_;
  std::atomic<bool> running_{false};
};

}  // namespace client
