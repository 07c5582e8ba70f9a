/*
 * 설명: 구조화 로그와 클라이언트 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/observability_test.cpp
 */
#include "client/observability.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>

namespace client {
namespace {
std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.messages_sent = messages_sent_.load();
  snapshot.messages_received = messages_received_.load();
  snapshot.payloads_dropped = payloads_dropped_.load();
  snapshot.reconnect_attempts = reconnect_attempts_.load();
  snapshot.active_sessions = active_sessions_.load();
  return snapshot;
}

nlohmann::json Observability::Format(const LogContext& ctx) const {
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["level"] = ToString(ctx.level);
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (ctx.document_id) {
    log_json["documentId"] = *ctx.document_id;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  return log_json;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  auto line = Format(ctx).dump();
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << line << std::endl;
}

}  // namespace client
