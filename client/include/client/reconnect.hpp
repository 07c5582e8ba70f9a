/*
 * 설명: 재연결 지연(지수 백오프 + 지터)을 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/reconnect_backoff_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace client {

struct BackoffConfig {
  std::chrono::milliseconds base{std::chrono::milliseconds(1000)};
  std::chrono::milliseconds cap{std::chrono::milliseconds(30000)};
  double jitter_ratio{0.2};
};

class ReconnectBackoff {
 public:
  ReconnectBackoff(const BackoffConfig& config, std::uint32_t seed);

  static std::chrono::milliseconds NominalDelay(const BackoffConfig& config, std::uint32_t attempt);

  std::chrono::milliseconds NextDelay();
  void Reset() { attempts_ = 0; }
  std::uint32_t Attempts() const { return attempts_; }
  const BackoffConfig& Config() const { return config_; }

 private:
  BackoffConfig config_;
  std::mt19937 gen_;
  std::uint32_t attempts_{0};
};

}  // namespace client
