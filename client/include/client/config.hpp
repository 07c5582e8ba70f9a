/*
 * 설명: 클라이언트 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace client {

struct ClientConfig {
  std::string ws_url;
  std::string access_token;
  std::string user_id;
  std::string username;
  std::string document_id;
  std::string log_level;
  std::size_t connect_timeout_ms;
  std::size_t reconnect_base_ms;
  std::size_t reconnect_cap_ms;
  std::size_t reconnect_jitter_percent;
  std::size_t typing_idle_ms;
  std::size_t autosave_interval_ms;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  bool tls_verify_peer;
};

ClientConfig LoadConfigFromEnv();

}  // namespace client
