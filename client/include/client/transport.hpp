/*
 * 설명: 협업 엔드포인트와의 양방향 메시지 채널 인터페이스와 연결 오류 분류를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/endpoint_test.cpp, client/tests/e2e/websocket_transport_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace client {

enum class ConnectError { kUnreachable, kAuthRejected, kProtocolError };

std::string_view ToString(ConnectError error);

struct ConnectResult {
  bool ok{false};
  ConnectError error{ConnectError::kUnreachable};
  std::string message;
};

struct Endpoint {
  bool secure{false};
  std::string host;
  std::string port;
  std::string target;

  std::string HostHeader() const;
};

std::optional<Endpoint> ParseEndpoint(std::string_view url);

struct TransportHandlers {
  std::function<void(const ConnectResult&)> on_connect;
  std::function<void(std::string)> on_message;
  std::function<void(const std::string&)> on_closed;
};

// Handlers may be invoked from the transport's own executor; the owner is
// responsible for moving them onto its strand.
class Transport {
 public:
  virtual ~Transport() = default;

  virtual void Connect(const Endpoint& endpoint, const std::string& auth_token, TransportHandlers handlers) = 0;
  virtual void Send(std::string message) = 0;
  virtual void Close() = 0;
};

using TransportFactory = std::function<std::shared_ptr<Transport>()>;

}  // namespace client
