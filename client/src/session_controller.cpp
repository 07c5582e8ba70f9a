/*
 * 설명: 세션 상태 전이, 조인 핸드셰이크, 백오프 재연결, 수신 이벤트 분배와 로컬 편집 전송을 조율한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/session_controller_test.cpp
 */
#include "client/session_controller.hpp"

#include <boost/asio/post.hpp>

namespace client {

std::string_view ToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::kDisconnected:
      return "disconnected";
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kConnected:
      return "connected";
    case ConnectionState::kClosed:
      return "closed";
  }
  return "disconnected";
}

std::string_view ToString(NoticeKind kind) {
  switch (kind) {
    case NoticeKind::kSyncDegraded:
      return "sync_degraded";
    case NoticeKind::kAuthFailed:
      return "auth_failed";
    case NoticeKind::kServerError:
      return "server_error";
    case NoticeKind::kUserJoined:
      return "user_joined";
    case NoticeKind::kUserLeft:
      return "user_left";
  }
  return "server_error";
}

SessionController::SessionController(boost::asio::io_context& ioc, SessionOptions options,
                                     TransportFactory transport_factory, SessionCallbacks callbacks,
                                     std::shared_ptr<Observability> observability)
    : strand_(boost::asio::make_strand(ioc)),
      options_(std::move(options)),
      transport_factory_(std::move(transport_factory)),
      callbacks_(std::move(callbacks)),
      observability_(observability ? std::move(observability) : std::make_shared<Observability>()),
      trace_id_(observability_->NextTraceId()),
      sync_engine_(options_.identity.user_id),
      presence_(options_.identity.user_id, options_.typing_idle),
      broadcaster_(strand_, options_.typing_idle,
                   ActivitySinks{[this](bool is_typing) { OnLocalTyping(is_typing); },
                                 [this](const std::string& content) { OnLocalContent(content); },
                                 [this](const Selection& selection) { OnLocalSelection(selection); }}),
      backoff_(options_.backoff, options_.backoff_seed),
      reconnect_timer_(strand_, options_.backoff.base),
      join_timer_(strand_, options_.join_timeout),
      autosave_timer_(strand_, options_.autosave_interval) {
  published_.document_id = options_.document_id;
  published_.user_id = options_.identity.user_id;
}

SessionController::~SessionController() {
  reconnect_timer_.Cancel();
  join_timer_.Cancel();
  autosave_timer_.Cancel();
  broadcaster_.Reset();
  if (transport_) {
    if (state_ == ConnectionState::kConnected) {
      SendEvent(events::kLeaveDocument, BuildLeaveDocument(options_.document_id));
    }
    ++transport_generation_;
    transport_->Close();
    transport_.reset();
  }
  if (open_requested_) {
    observability_->SessionClosed();
  }
}

void SessionController::Open() {
  boost::asio::post(strand_, [self = shared_from_this()]() { self->DoOpen(); });
}

void SessionController::Close() {
  boost::asio::post(strand_, [self = shared_from_this()]() { self->DoClose(); });
}

void SessionController::NotifyContentChanged(std::string content, std::optional<int> cursor) {
  boost::asio::post(strand_, [self = shared_from_this(), content = std::move(content), cursor]() {
    if (self->state_ == ConnectionState::kClosed) {
      return;
    }
    self->pending_cursor_ = cursor;
    self->broadcaster_.OnContentChanged(content);
  });
}

void SessionController::NotifySelectionChanged(const Selection& selection) {
  boost::asio::post(strand_, [self = shared_from_this(), selection]() {
    if (self->state_ == ConnectionState::kClosed) {
      return;
    }
    self->pending_cursor_ = selection.start;
    self->broadcaster_.OnSelectionChanged(selection);
  });
}

void SessionController::RequestSave() {
  boost::asio::post(strand_, [self = shared_from_this()]() {
    if (self->state_ == ConnectionState::kClosed) {
      return;
    }
    self->autosave_timer_.Cancel();
    self->unsaved_changes_ = true;
    self->FireSave();
  });
}

SessionSnapshot SessionController::Snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  SessionSnapshot snapshot = published_;
  ExpireTyping(snapshot.online_users, options_.typing_idle, std::chrono::steady_clock::now());
  return snapshot;
}

void SessionController::DoOpen() {
  if (state_ == ConnectionState::kClosed) {
    Log(LogLevel::kWarn, "session_reopen_rejected");
    return;
  }
  if (open_requested_) {
    return;
  }
  open_requested_ = true;
  observability_->SessionOpened();
  Log(LogLevel::kInfo, "session_open", {{"endpoint", options_.endpoint.HostHeader() + options_.endpoint.target}});
  StartConnect();
}

void SessionController::DoClose() {
  if (state_ == ConnectionState::kClosed) {
    return;
  }
  if (state_ == ConnectionState::kConnected) {
    SendEvent(events::kLeaveDocument, BuildLeaveDocument(options_.document_id));
  }
  if (unsaved_changes_) {
    autosave_timer_.Cancel();
    FireSave();
  }
  Log(LogLevel::kInfo, "session_close");
  Shutdown();
}

void SessionController::Shutdown() {
  reconnect_timer_.Cancel();
  join_timer_.Cancel();
  autosave_timer_.Cancel();
  broadcaster_.Reset();
  ReleaseTransport();
  presence_.Clear();
  next_retry_delay_.reset();
  if (open_requested_) {
    observability_->SessionClosed();
  }
  open_requested_ = false;
  SetState(ConnectionState::kClosed);
  callbacks_ = SessionCallbacks{};
}

void SessionController::StartConnect() {
  SetState(ConnectionState::kConnecting);
  transport_ = transport_factory_ ? transport_factory_() : nullptr;
  if (!transport_) {
    HandleFailure("transport_unavailable");
    return;
  }
  const auto generation = ++transport_generation_;
  Log(LogLevel::kDebug, "transport_connect", {{"generation", generation}});
  transport_->Connect(options_.endpoint, options_.identity.token, MakeHandlers(generation));
}

TransportHandlers SessionController::MakeHandlers(std::uint64_t generation) {
  std::weak_ptr<SessionController> weak = weak_from_this();
  TransportHandlers handlers;
  handlers.on_connect = [weak, generation, strand = strand_](const ConnectResult& result) {
    boost::asio::post(strand, [weak, generation, result]() {
      if (auto self = weak.lock()) {
        self->OnTransportConnect(generation, result);
      }
    });
  };
  handlers.on_message = [weak, generation, strand = strand_](std::string raw) {
    boost::asio::post(strand, [weak, generation, raw = std::move(raw)]() {
      if (auto self = weak.lock()) {
        self->OnTransportMessage(generation, raw);
      }
    });
  };
  handlers.on_closed = [weak, generation, strand = strand_](const std::string& reason) {
    boost::asio::post(strand, [weak, generation, reason]() {
      if (auto self = weak.lock()) {
        self->OnTransportClosed(generation, reason);
      }
    });
  };
  return handlers;
}

void SessionController::ReleaseTransport() {
  if (!transport_) {
    return;
  }
  ++transport_generation_;
  transport_->Close();
  transport_.reset();
}

void SessionController::OnTransportConnect(std::uint64_t generation, const ConnectResult& result) {
  if (generation != transport_generation_ || state_ != ConnectionState::kConnecting) {
    return;
  }
  if (!result.ok) {
    Log(LogLevel::kWarn, "transport_connect_failed",
        {{"error", ToString(result.error)}, {"message", result.message}});
    if (result.error == ConnectError::kAuthRejected) {
      HandleAuthRejected(result.message.empty() ? "인증이 거부되었습니다. 다시 로그인해 주세요." : result.message);
      return;
    }
    HandleFailure(std::string(ToString(result.error)));
    return;
  }
  Log(LogLevel::kInfo, "transport_opened");
  SendEvent(events::kJoinDocument, BuildJoinDocument(options_.document_id, options_.identity.token));
  std::weak_ptr<SessionController> weak = weak_from_this();
  join_timer_.Restart(options_.join_timeout, [weak]() {
    if (auto self = weak.lock()) {
      self->OnJoinTimeout();
    }
  });
}

void SessionController::OnTransportMessage(std::uint64_t generation, const std::string& raw) {
  if (generation != transport_generation_ || state_ == ConnectionState::kClosed) {
    return;
  }
  observability_->IncrementReceived();
  auto env = ParseWsEnvelope(raw);
  if (!env) {
    DropPayload("", "invalid_envelope");
    return;
  }
  if (env->type == "error") {
    HandleServerError(env->payload);
    return;
  }
  HandleEvent(*env);
}

void SessionController::OnTransportClosed(std::uint64_t generation, const std::string& reason) {
  if (generation != transport_generation_ || state_ == ConnectionState::kClosed) {
    return;
  }
  Log(LogLevel::kWarn, "transport_closed", {{"reason", reason}});
  HandleFailure(reason);
}

void SessionController::OnJoinTimeout() {
  if (state_ != ConnectionState::kConnecting) {
    return;
  }
  Log(LogLevel::kWarn, "join_timeout", {{"timeoutMs", options_.join_timeout.count()}});
  HandleFailure("join_timeout");
}

void SessionController::OnReconnectTimer() {
  if (state_ != ConnectionState::kDisconnected || !open_requested_) {
    return;
  }
  next_retry_delay_.reset();
  StartConnect();
}

void SessionController::HandleFailure(const std::string& reason) {
  join_timer_.Cancel();
  ReleaseTransport();
  const bool had_presence = presence_.Size() > 0;
  presence_.Clear();
  SetState(ConnectionState::kDisconnected);
  if (had_presence) {
    PublishPresence();
  }
  EmitNotice(NoticeKind::kSyncDegraded, "실시간 연결에 실패했습니다. 잠시 후 다시 연결합니다. (" + reason + ")");
  ScheduleReconnect();
}

void SessionController::HandleAuthRejected(const std::string& message) {
  Log(LogLevel::kError, "auth_rejected", {{"message", message}});
  EmitNotice(NoticeKind::kAuthFailed, message);
  Shutdown();
}

void SessionController::ScheduleReconnect() {
  if (!open_requested_ || state_ == ConnectionState::kClosed) {
    return;
  }
  const auto delay = backoff_.NextDelay();
  next_retry_delay_ = delay;
  observability_->IncrementReconnect();
  Log(LogLevel::kInfo, "reconnect_scheduled", {{"attempt", backoff_.Attempts()}, {"delayMs", delay.count()}});
  PublishSnapshot();
  std::weak_ptr<SessionController> weak = weak_from_this();
  reconnect_timer_.Restart(delay, [weak]() {
    if (auto self = weak.lock()) {
      self->OnReconnectTimer();
    }
  });
}

void SessionController::HandleEvent(const WsEnvelope& env) {
  const auto& event = env.event;
  if (event == events::kDocumentJoined) {
    HandleDocumentJoined(env.payload);
  } else if (event == events::kUserJoined) {
    HandleUserJoined(env.payload);
  } else if (event == events::kUserLeft) {
    HandleUserLeft(env.payload);
  } else if (event == events::kOnlineUsers) {
    HandleOnlineUsers(env.payload);
  } else if (event == events::kTextChanged) {
    HandleTextChanged(env.payload);
  } else if (event == events::kCursorMoved) {
    HandleCursorMoved(env.payload);
  } else if (event == events::kTypingStatusChanged) {
    HandleTypingChanged(env.payload);
  } else if (event == events::kError) {
    HandleServerError(env.payload);
  } else {
    Log(LogLevel::kDebug, "unknown_event", {{"event", event}});
  }
}

void SessionController::HandleDocumentJoined(const nlohmann::json& payload) {
  if (state_ != ConnectionState::kConnecting && state_ != ConnectionState::kConnected) {
    return;
  }
  auto joined = ParseDocumentJoined(payload);
  if (!joined) {
    DropPayload(events::kDocumentJoined, "malformed");
    return;
  }
  if (joined->document_id != options_.document_id) {
    DropPayload(events::kDocumentJoined, "document_mismatch");
    return;
  }
  join_timer_.Cancel();
  backoff_.Reset();
  next_retry_delay_.reset();
  if (joined->version < sync_engine_.CurrentVersion()) {
    Log(LogLevel::kWarn, "server_version_behind",
        {{"local", sync_engine_.CurrentVersion()}, {"server", joined->version}});
  }
  if (sync_engine_.LocalEditsSinceSync() > 0) {
    Log(LogLevel::kWarn, "local_edits_replaced", {{"count", sync_engine_.LocalEditsSinceSync()}});
  }
  sync_engine_.Reset(DocumentSyncState{joined->version, joined->content});
  permission_ = joined->permission;
  title_ = joined->title;
  last_sync_time_ = std::chrono::system_clock::now();
  Log(LogLevel::kInfo, "document_joined",
      {{"version", sync_engine_.CurrentVersion()}, {"permission", ToString(permission_)}});
  SetState(ConnectionState::kConnected);
  PublishSnapshot();
  if (callbacks_.on_document_update) {
    callbacks_.on_document_update(sync_engine_.Content(), sync_engine_.CurrentVersion());
  }
}

void SessionController::HandleUserJoined(const nlohmann::json& payload) {
  auto user = ParseUserEvent(payload);
  if (!user) {
    DropPayload(events::kUserJoined, "malformed_presence");
    return;
  }
  const auto user_id = user->user_id;
  const auto name = user->display_name.empty() ? user_id : user->display_name;
  if (!presence_.ApplyJoin(std::move(*user))) {
    return;
  }
  PublishPresence();
  EmitNotice(NoticeKind::kUserJoined, name + "님이 참여했습니다.", user_id);
}

void SessionController::HandleUserLeft(const nlohmann::json& payload) {
  auto user = ParseUserEvent(payload);
  if (!user) {
    DropPayload(events::kUserLeft, "malformed_presence");
    return;
  }
  if (!presence_.ApplyLeave(user->user_id)) {
    return;
  }
  PublishPresence();
  const auto name = user->display_name.empty() ? user->user_id : user->display_name;
  EmitNotice(NoticeKind::kUserLeft, name + "님이 나갔습니다.", user->user_id);
}

void SessionController::HandleOnlineUsers(const nlohmann::json& payload) {
  auto users = ParseOnlineUsers(payload);
  if (!users) {
    DropPayload(events::kOnlineUsers, "malformed_presence");
    return;
  }
  presence_.ApplyBulkSync(std::move(*users));
  PublishPresence();
}

void SessionController::HandleTextChanged(const nlohmann::json& payload) {
  if (state_ != ConnectionState::kConnected) {
    Log(LogLevel::kDebug, "text_changed_before_join");
    return;
  }
  auto changed = ParseTextChanged(payload);
  if (!changed) {
    DropPayload(events::kTextChanged, "malformed");
    return;
  }
  const auto result = sync_engine_.ApplyRemote(changed->operation);
  switch (result) {
    case SyncResult::kApplied:
      last_sync_time_ = std::chrono::system_clock::now();
      Log(LogLevel::kDebug, "remote_applied",
          {{"version", sync_engine_.CurrentVersion()}, {"author", changed->author.user_id}});
      PublishSnapshot();
      if (callbacks_.on_document_update) {
        callbacks_.on_document_update(sync_engine_.Content(), sync_engine_.CurrentVersion());
      }
      break;
    case SyncResult::kStale:
      Log(LogLevel::kDebug, "remote_stale",
          {{"version", changed->operation.version}, {"local", sync_engine_.CurrentVersion()}});
      break;
    case SyncResult::kRejected:
      observability_->IncrementDropped();
      Log(LogLevel::kWarn, "remote_rejected",
          {{"version", changed->operation.version}, {"type", ToString(changed->operation.kind)}});
      break;
  }
}

void SessionController::HandleCursorMoved(const nlohmann::json& payload) {
  auto moved = ParseCursorMoved(payload);
  if (!moved) {
    DropPayload(events::kCursorMoved, "malformed_presence");
    return;
  }
  if (presence_.ApplyCursor(moved->user_id, moved->position, moved->selection)) {
    PublishPresence();
  }
}

void SessionController::HandleTypingChanged(const nlohmann::json& payload) {
  auto typing = ParseTypingChanged(payload);
  if (!typing) {
    DropPayload(events::kTypingStatusChanged, "malformed_presence");
    return;
  }
  if (presence_.ApplyTyping(typing->user_id, typing->is_typing)) {
    PublishPresence();
  }
}

void SessionController::HandleServerError(const nlohmann::json& payload) {
  auto error = ParseServerError(payload);
  if (!error) {
    DropPayload(events::kError, "malformed");
    return;
  }
  Log(LogLevel::kWarn, "server_error", {{"code", error->code}, {"message", error->message}});
  if (error->code == "auth_rejected" || error->code == "unauthorized" || error->code == "forbidden") {
    HandleAuthRejected(error->message);
    return;
  }
  EmitNotice(NoticeKind::kServerError, error->message);
}

void SessionController::OnLocalContent(const std::string& content) {
  auto operation = sync_engine_.RecordLocalEdit(content, pending_cursor_.value_or(0));
  unsaved_changes_ = true;
  ScheduleAutosave();
  PublishSnapshot();
  if (state_ != ConnectionState::kConnected) {
    return;
  }
  if (!CanEdit(permission_)) {
    Log(LogLevel::kDebug, "local_edit_not_sent", {{"permission", ToString(permission_)}});
    return;
  }
  SendEvent(events::kTextChange, BuildTextChange(options_.document_id, operation));
}

void SessionController::OnLocalTyping(bool is_typing) {
  PublishSnapshot();
  if (state_ == ConnectionState::kConnected) {
    SendEvent(events::kTypingStatus, BuildTypingStatus(options_.document_id, is_typing));
  }
}

void SessionController::OnLocalSelection(const Selection& selection) {
  if (state_ == ConnectionState::kConnected) {
    SendEvent(events::kCursorPosition, BuildCursorPosition(options_.document_id, selection.start, selection));
  }
}

void SessionController::ScheduleAutosave() {
  if (options_.autosave_interval.count() <= 0) {
    return;
  }
  std::weak_ptr<SessionController> weak = weak_from_this();
  autosave_timer_.Restart(options_.autosave_interval, [weak]() {
    if (auto self = weak.lock()) {
      self->FireSave();
    }
  });
}

void SessionController::FireSave() {
  if (!unsaved_changes_) {
    return;
  }
  unsaved_changes_ = false;
  Log(LogLevel::kDebug, "save_requested", {{"version", sync_engine_.CurrentVersion()}});
  if (callbacks_.on_save_requested) {
    callbacks_.on_save_requested(sync_engine_.Content(), sync_engine_.CurrentVersion());
  }
}

bool SessionController::SendEvent(std::string_view event, const nlohmann::json& payload) {
  if (!transport_) {
    return false;
  }
  WsEnvelope env{.type = "event", .event = std::string(event), .seq = ++seq_, .payload = payload};
  transport_->Send(ToWsJson(env).dump());
  observability_->IncrementSent();
  return true;
}

void SessionController::SetState(ConnectionState state) {
  if (state_ == state) {
    return;
  }
  Log(LogLevel::kInfo, "status_change", {{"from", ToString(state_)}, {"to", ToString(state)}});
  state_ = state;
  PublishSnapshot();
  if (callbacks_.on_status_change) {
    callbacks_.on_status_change(state);
  }
}

void SessionController::PublishSnapshot() {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  published_.state = state_;
  published_.version = sync_engine_.CurrentVersion();
  published_.content = sync_engine_.Content();
  published_.title = title_;
  published_.permission = permission_;
  published_.online_users = presence_.Snapshot();
  published_.local_typing = broadcaster_.IsTyping();
  published_.last_sync_time = last_sync_time_;
  published_.reconnect_attempts = backoff_.Attempts();
  published_.next_retry_delay = next_retry_delay_;
}

void SessionController::PublishPresence() {
  PublishSnapshot();
  if (callbacks_.on_presence_change) {
    callbacks_.on_presence_change(presence_.Snapshot());
  }
}

void SessionController::EmitNotice(NoticeKind kind, std::string message, std::optional<std::string> user_id) {
  if (callbacks_.on_notice) {
    callbacks_.on_notice(SessionNotice{kind, std::move(message), std::move(user_id)});
  }
}

void SessionController::DropPayload(std::string_view event, std::string_view reason) {
  observability_->IncrementDropped();
  Log(LogLevel::kWarn, "payload_dropped", {{"event", event}, {"reason", reason}});
}

void SessionController::Log(LogLevel level, const std::string& name, nlohmann::json detail) const {
  if (!observability_->Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.trace_id = trace_id_;
  ctx.user_id = options_.identity.user_id;
  ctx.document_id = options_.document_id;
  ctx.name = name;
  ctx.level = level;
  ctx.detail = std::move(detail);
  observability_->Log(ctx);
}

}  // namespace client
