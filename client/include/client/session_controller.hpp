/*
 * 설명: 문서 하나에 대한 실시간 협업 세션의 상태 머신, 재연결, 프레즌스/동기화 연결을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/session_controller_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <nlohmann/json.hpp>

#include "client/activity_broadcaster.hpp"
#include "client/envelope.hpp"
#include "client/idle_timer.hpp"
#include "client/observability.hpp"
#include "client/presence.hpp"
#include "client/protocol.hpp"
#include "client/reconnect.hpp"
#include "client/sync_engine.hpp"
#include "client/transport.hpp"

namespace client {

enum class ConnectionState { kDisconnected, kConnecting, kConnected, kClosed };

std::string_view ToString(ConnectionState state);

enum class NoticeKind { kSyncDegraded, kAuthFailed, kServerError, kUserJoined, kUserLeft };

std::string_view ToString(NoticeKind kind);

struct SessionNotice {
  NoticeKind kind;
  std::string message;
  std::optional<std::string> user_id;
};

struct SessionIdentity {
  std::string token;
  std::string user_id;
  std::string username;
};

struct SessionOptions {
  std::string document_id;
  SessionIdentity identity;
  Endpoint endpoint;
  BackoffConfig backoff;
  std::uint32_t backoff_seed{0};
  std::chrono::milliseconds join_timeout{std::chrono::milliseconds(5000)};
  std::chrono::milliseconds typing_idle{std::chrono::milliseconds(1000)};
  std::chrono::milliseconds autosave_interval{std::chrono::milliseconds(3000)};
};

struct SessionCallbacks {
  std::function<void(ConnectionState)> on_status_change;
  std::function<void(const std::string& content, std::int64_t version)> on_document_update;
  std::function<void(const std::vector<PresenceEntry>&)> on_presence_change;
  std::function<void(const SessionNotice&)> on_notice;
  std::function<void(const std::string& content, std::int64_t version)> on_save_requested;
};

struct SessionSnapshot {
  std::string document_id;
  std::string user_id;
  ConnectionState state{ConnectionState::kDisconnected};
  std::int64_t version{0};
  std::string content;
  std::string title;
  DocumentPermission permission{DocumentPermission::kUnknown};
  std::vector<PresenceEntry> online_users;
  bool local_typing{false};
  std::optional<std::chrono::system_clock::time_point> last_sync_time;
  std::uint32_t reconnect_attempts{0};
  std::optional<std::chrono::milliseconds> next_retry_delay;
};

class SessionController : public std::enable_shared_from_this<SessionController> {
 public:
  SessionController(boost::asio::io_context& ioc, SessionOptions options, TransportFactory transport_factory,
                    SessionCallbacks callbacks, std::shared_ptr<Observability> observability);

  // Releases the transport without raising callbacks when dropped without Close().
  ~SessionController();

  SessionController(const SessionController&) = delete;
  SessionController& operator=(const SessionController&) = delete;

  // All public operations are posted onto the session strand and return immediately.
  void Open();
  void Close();
  void NotifyContentChanged(std::string content, std::optional<int> cursor = std::nullopt);
  void NotifySelectionChanged(const Selection& selection);
  void RequestSave();

  SessionSnapshot Snapshot() const;
  const std::string& DocumentId() const { return options_.document_id; }

 private:
  void DoOpen();
  void DoClose();
  void Shutdown();
  void StartConnect();
  TransportHandlers MakeHandlers(std::uint64_t generation);
  void ReleaseTransport();

  void OnTransportConnect(std::uint64_t generation, const ConnectResult& result);
  void OnTransportMessage(std::uint64_t generation, const std::string& raw);
  void OnTransportClosed(std::uint64_t generation, const std::string& reason);
  void OnJoinTimeout();
  void OnReconnectTimer();

  void HandleFailure(const std::string& reason);
  void HandleAuthRejected(const std::string& message);
  void ScheduleReconnect();

  void HandleEvent(const WsEnvelope& env);
  void HandleDocumentJoined(const nlohmann::json& payload);
  void HandleUserJoined(const nlohmann::json& payload);
  void HandleUserLeft(const nlohmann::json& payload);
  void HandleOnlineUsers(const nlohmann::json& payload);
  void HandleTextChanged(const nlohmann::json& payload);
  void HandleCursorMoved(const nlohmann::json& payload);
  void HandleTypingChanged(const nlohmann::json& payload);
  void HandleServerError(const nlohmann::json& payload);

  void OnLocalContent(const std::string& content);
  void OnLocalTyping(bool is_typing);
  void OnLocalSelection(const Selection& selection);
  void ScheduleAutosave();
  void FireSave();

  bool SendEvent(std::string_view event, const nlohmann::json& payload);
  void SetState(ConnectionState state);
  void PublishSnapshot();
  void PublishPresence();
  void EmitNotice(NoticeKind kind, std::string message, std::optional<std::string> user_id = std::nullopt);
  void DropPayload(std::string_view event, std::string_view reason);
  void Log(LogLevel level, const std::string& name, nlohmann::json detail = nullptr) const;

  Strand strand_;
  SessionOptions options_;
  TransportFactory transport_factory_;
  SessionCallbacks callbacks_;
  std::shared_ptr<Observability> observability_;
  std::string trace_id_;

  std::shared_ptr<Transport> transport_;
  std::uint64_t transport_generation_{0};
  ConnectionState state_{ConnectionState::kDisconnected};
  bool open_requested_{false};
  std::uint64_t seq_{0};

  SyncEngine sync_engine_;
  PresenceTracker presence_;
  ActivityBroadcaster broadcaster_;
  ReconnectBackoff backoff_;
  IdleTimer reconnect_timer_;
  IdleTimer join_timer_;
  IdleTimer autosave_timer_;

  DocumentPermission permission_{DocumentPermission::kUnknown};
  std::string title_;
  bool unsaved_changes_{false};
  std::optional<int> pending_cursor_;
  std::optional<std::chrono::system_clock::time_point> last_sync_time_;
  std::optional<std::chrono::milliseconds> next_retry_delay_;

  mutable std::mutex snapshot_mutex_;
  SessionSnapshot published_;
};

}  // namespace client
