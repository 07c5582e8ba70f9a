/*
 * 설명: 구조화 로그와 클라이언트 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace client {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view value);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> user_id;
  std::optional<std::string> document_id;
  std::string name;
  LogLevel level{LogLevel::kInfo};
  nlohmann::json detail;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t messages_sent{0};
  std::uint64_t messages_received{0};
  std::uint64_t payloads_dropped{0};
  std::uint64_t reconnect_attempts{0};
  std::uint64_t active_sessions{0};
};

class Observability {
 public:
  explicit Observability(LogLevel threshold = LogLevel::kInfo) : threshold_(threshold) {}

  std::string NextTraceId();
  void IncrementSent() { messages_sent_.fetch_add(1); }
  void IncrementReceived() { messages_received_.fetch_add(1); }
  void IncrementDropped() { payloads_dropped_.fetch_add(1); }
  void IncrementReconnect() { reconnect_attempts_.fetch_add(1); }
  void SessionOpened() { active_sessions_.fetch_add(1); }
  void SessionClosed() { active_sessions_.fetch_sub(1); }
  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= threshold_; }
  nlohmann::json Format(const LogContext& ctx) const;
  void Log(const LogContext& ctx) const;

 private:
  LogLevel threshold_;
  std::atomic<std::uint64_t> messages_sent_{0};
  std::atomic<std::uint64_t> messages_received_{0};
  std::atomic<std::uint64_t> payloads_dropped_{0};
  std::atomic<std::uint64_t> reconnect_attempts_{0};
  std::atomic<std::uint64_t> active_sessions_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace client
