/*
 * 설명: 엔드포인트 URL 해석과 연결 오류 이름을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/endpoint_test.cpp
 */
#include "client/transport.hpp"

#include <algorithm>
#include <cctype>

namespace client {

std::string_view ToString(ConnectError error) {
  switch (error) {
    case ConnectError::kUnreachable:
      return "unreachable";
    case ConnectError::kAuthRejected:
      return "auth_rejected";
    case ConnectError::kProtocolError:
      return "protocol_error";
  }
  return "protocol_error";
}

std::string Endpoint::HostHeader() const {
  const bool default_port = (secure && port == "443") || (!secure && port == "80");
  const std::string name = host.find(':') == std::string::npos ? host : "[" + host + "]";
  return default_port ? name : name + ":" + port;
}

std::optional<Endpoint> ParseEndpoint(std::string_view url) {
  Endpoint endpoint;
  auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos) {
    return std::nullopt;
  }
  std::string scheme(url.substr(0, scheme_end));
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (scheme == "ws" || scheme == "http") {
    endpoint.secure = false;
  } else if (scheme == "wss" || scheme == "https") {
    endpoint.secure = true;
  } else {
    return std::nullopt;
  }

  auto rest = url.substr(scheme_end + 3);
  auto path_start = rest.find('/');
  auto authority = rest.substr(0, path_start);
  endpoint.target = path_start == std::string_view::npos ? "/" : std::string(rest.substr(path_start));
  if (authority.empty()) {
    return std::nullopt;
  }

  std::string_view host_part = authority;
  std::string_view port_part;
  bool has_port = false;
  if (authority.front() == '[') {
    auto bracket = authority.find(']');
    if (bracket == std::string_view::npos) {
      return std::nullopt;
    }
    host_part = authority.substr(1, bracket - 1);
    if (bracket + 1 < authority.size()) {
      if (authority[bracket + 1] != ':') {
        return std::nullopt;
      }
      port_part = authority.substr(bracket + 2);
      has_port = true;
    }
  } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
    host_part = authority.substr(0, colon);
    port_part = authority.substr(colon + 1);
    has_port = true;
  }

  endpoint.host = std::string(host_part);
  if (has_port) {
    endpoint.port = std::string(port_part);
    if (endpoint.port.empty() ||
        !std::all_of(endpoint.port.begin(), endpoint.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
      return std::nullopt;
    }
  } else {
    endpoint.port = endpoint.secure ? "443" : "80";
  }
  if (endpoint.host.empty()) {
    return std::nullopt;
  }
  return endpoint;
}

}  // namespace client
