/*
 * 설명: 시도 횟수에 따른 재연결 지연을 계산하고 지터를 적용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/reconnect_backoff_test.cpp
 */
#include "client/reconnect.hpp"

#include <algorithm>
#include <cmath>

namespace client {

ReconnectBackoff::ReconnectBackoff(const BackoffConfig& config, std::uint32_t seed) : config_(config), gen_(seed) {}

std::chrono::milliseconds ReconnectBackoff::NominalDelay(const BackoffConfig& config, std::uint32_t attempt) {
  const auto base = config.base.count();
  const auto cap = config.cap.count();
  if (base <= 0) {
    return std::chrono::milliseconds(0);
  }
  long long delay = base;
  for (std::uint32_t i = 0; i < attempt && delay < cap; ++i) {
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min<long long>(delay, cap));
}

std::chrono::milliseconds ReconnectBackoff::NextDelay() {
  auto nominal = NominalDelay(config_, attempts_);
  if (attempts_ < UINT32_MAX) {
    ++attempts_;
  }
  const double ratio = std::clamp(config_.jitter_ratio, 0.0, 1.0);
  if (ratio == 0.0 || nominal.count() == 0) {
    return nominal;
  }
  std::uniform_real_distribution<double> dist(-ratio, ratio);
  const double jittered = static_cast<double>(nominal.count()) * (1.0 + dist(gen_));
  const auto clamped = std::clamp(static_cast<long long>(std::llround(jittered)), 0LL,
                                  static_cast<long long>(config_.cap.count()));
  return std::chrono::milliseconds(clamped);
}

}  // namespace client
