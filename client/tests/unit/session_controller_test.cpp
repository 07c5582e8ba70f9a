#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "client/envelope.hpp"
#include "client/session_controller.hpp"

namespace {
using namespace std::chrono_literals;
using client::ConnectionState;

class FakeTransport : public client::Transport {
 public:
  void Connect(const client::Endpoint& endpoint, const std::string& auth_token,
               client::TransportHandlers handlers) override {
    endpoint_ = endpoint;
    token_ = auth_token;
    handlers_ = std::move(handlers);
  }

  void Send(std::string message) override { sent_.push_back(nlohmann::json::parse(message)); }
  void Close() override { closed_ = true; }

  void Accept() { handlers_.on_connect(client::ConnectResult{true, client::ConnectError::kUnreachable, ""}); }
  void Fail(client::ConnectError error) { handlers_.on_connect(client::ConnectResult{false, error, ""}); }
  void Drop(const std::string& reason) { handlers_.on_closed(reason); }
  void Raw(const std::string& raw) { handlers_.on_message(raw); }
  void Deliver(std::string_view event, const nlohmann::json& payload) {
    client::WsEnvelope env{.type = "event", .event = std::string(event), .seq = ++seq_, .payload = payload};
    handlers_.on_message(client::ToWsJson(env).dump());
  }

  std::vector<std::string> SentEvents() const {
    std::vector<std::string> names;
    for (const auto& msg : sent_) {
      names.push_back(msg["event"].get<std::string>());
    }
    return names;
  }

  const std::vector<nlohmann::json>& Sent() const { return sent_; }
  const std::string& Token() const { return token_; }
  const client::Endpoint& ConnectedEndpoint() const { return endpoint_; }
  bool Closed() const { return closed_; }

 private:
  client::Endpoint endpoint_;
  std::string token_;
  client::TransportHandlers handlers_;
  std::vector<nlohmann::json> sent_;
  std::uint64_t seq_{0};
  bool closed_{false};
};

nlohmann::json User(const std::string& id, const std::string& name) { return {{"id", id}, {"username", name}}; }

nlohmann::json Joined(const std::string& doc, std::int64_t version, const std::string& content,
                      const std::string& permission = "editor") {
  return {{"document", {{"id", doc}, {"title", "회의록"}, {"content", content}, {"version", version}}},
          {"user", User("u1", "alice")},
          {"permission", permission}};
}

nlohmann::json TextChanged(std::int64_t version, const std::string& content, const std::string& author) {
  return {{"operation", {{"type", "insert"}, {"position", 0}, {"content", content}}},
          {"author", User(author, author)},
          {"version", version},
          {"timestamp", "2024-05-01T10:00:00Z"}};
}

class SessionControllerTest : public ::testing::Test {
 protected:
  void SetUp() override { observability_ = std::make_shared<client::Observability>(client::LogLevel::kError); }

  void TearDown() override {
    if (session_) {
      session_->Close();
      Drain();
      session_.reset();
      Drain();
    }
  }

  client::SessionOptions DefaultOptions() {
    client::SessionOptions options;
    options.document_id = "doc-1";
    options.identity = client::SessionIdentity{"token-abc", "u1", "alice"};
    options.endpoint = *client::ParseEndpoint("ws://127.0.0.1:3001/collaboration");
    options.backoff = client::BackoffConfig{1000ms, 30000ms, 0.0};
    options.backoff_seed = 1;
    return options;
  }

  void Start(client::SessionOptions options) {
    client::SessionCallbacks callbacks;
    callbacks.on_status_change = [this](ConnectionState state) { statuses_.push_back(state); };
    callbacks.on_document_update = [this](const std::string& content, std::int64_t version) {
      updates_.emplace_back(content, version);
    };
    callbacks.on_presence_change = [this](const std::vector<client::PresenceEntry>& users) {
      presence_.push_back(users);
    };
    callbacks.on_notice = [this](const client::SessionNotice& notice) { notices_.push_back(notice); };
    callbacks.on_save_requested = [this](const std::string& content, std::int64_t version) {
      saves_.emplace_back(content, version);
    };
    auto factory = [this]() {
      auto transport = std::make_shared<FakeTransport>();
      transports_.push_back(transport);
      return transport;
    };
    session_ = std::make_shared<client::SessionController>(ioc_, std::move(options), factory, std::move(callbacks),
                                                           observability_);
    session_->Open();
    Drain();
  }

  void Drain() {
    ioc_.restart();
    ioc_.poll();
  }

  void RunFor(std::chrono::milliseconds duration) {
    ioc_.restart();
    ioc_.run_for(duration);
  }

  void JoinAt(std::int64_t version, const std::string& content, const std::string& permission = "editor") {
    Start(DefaultOptions());
    transports_.back()->Accept();
    Drain();
    transports_.back()->Deliver(client::events::kDocumentJoined, Joined("doc-1", version, content, permission));
    Drain();
  }

  std::vector<client::NoticeKind> NoticeKinds() const {
    std::vector<client::NoticeKind> kinds;
    for (const auto& notice : notices_) {
      kinds.push_back(notice.kind);
    }
    return kinds;
  }

  boost::asio::io_context ioc_;
  std::shared_ptr<client::Observability> observability_;
  std::vector<std::shared_ptr<FakeTransport>> transports_;
  std::shared_ptr<client::SessionController> session_;
  std::vector<ConnectionState> statuses_;
  std::vector<std::pair<std::string, std::int64_t>> updates_;
  std::vector<std::vector<client::PresenceEntry>> presence_;
  std::vector<client::SessionNotice> notices_;
  std::vector<std::pair<std::string, std::int64_t>> saves_;
};
}  // namespace

TEST_F(SessionControllerTest, JoinHandshakeReachesConnected) {
  Start(DefaultOptions());
  ASSERT_EQ(transports_.size(), 1u);
  EXPECT_EQ(transports_[0]->Token(), "token-abc");
  EXPECT_EQ(transports_[0]->ConnectedEndpoint().target, "/collaboration");
  EXPECT_EQ(session_->Snapshot().state, ConnectionState::kConnecting);

  transports_[0]->Accept();
  Drain();
  ASSERT_EQ(transports_[0]->SentEvents(), std::vector<std::string>{"join-document"});
  const auto& join = transports_[0]->Sent()[0];
  EXPECT_EQ(join["t"], "event");
  EXPECT_EQ(join["p"]["documentId"], "doc-1");
  EXPECT_EQ(join["p"]["token"], "token-abc");
  EXPECT_EQ(session_->Snapshot().state, ConnectionState::kConnecting);

  transports_[0]->Deliver(client::events::kDocumentJoined, Joined("doc-1", 5, "hello"));
  Drain();
  auto snapshot = session_->Snapshot();
  EXPECT_EQ(snapshot.state, ConnectionState::kConnected);
  EXPECT_EQ(snapshot.version, 5);
  EXPECT_EQ(snapshot.content, "hello");
  EXPECT_EQ(snapshot.title, "회의록");
  EXPECT_EQ(snapshot.permission, client::DocumentPermission::kEditor);
  ASSERT_TRUE(snapshot.last_sync_time.has_value());
  ASSERT_EQ(updates_.size(), 1u);
  EXPECT_EQ(updates_[0].first, "hello");
  EXPECT_EQ(updates_[0].second, 5);
  EXPECT_EQ(statuses_, (std::vector<ConnectionState>{ConnectionState::kConnecting, ConnectionState::kConnected}));
}

TEST_F(SessionControllerTest, JoinForOtherDocumentIsIgnored) {
  Start(DefaultOptions());
  transports_[0]->Accept();
  Drain();
  transports_[0]->Deliver(client::events::kDocumentJoined, Joined("doc-2", 1, "x"));
  Drain();
  EXPECT_EQ(session_->Snapshot().state, ConnectionState::kConnecting);
  EXPECT_TRUE(updates_.empty());
  EXPECT_EQ(observability_->Snapshot().payloads_dropped, 1u);
}

TEST_F(SessionControllerTest, TextChangedBeforeJoinIsIgnored) {
  Start(DefaultOptions());
  transports_[0]->Accept();
  Drain();
  transports_[0]->Deliver(client::events::kTextChanged, TextChanged(3, "early", "u2"));
  Drain();
  EXPECT_TRUE(updates_.empty());
  EXPECT_EQ(session_->Snapshot().version, 0);
}

TEST_F(SessionControllerTest, RemoteEditReplacesContent) {
  JoinAt(4, "draft");
  transports_[0]->Deliver(client::events::kTextChanged, TextChanged(5, "final text", "u2"));
  Drain();
  auto snapshot = session_->Snapshot();
  EXPECT_EQ(snapshot.version, 5);
  EXPECT_EQ(snapshot.content, "final text");
  ASSERT_EQ(updates_.size(), 2u);
  EXPECT_EQ(updates_[1].first, "final text");
  EXPECT_EQ(updates_[1].second, 5);

  transports_[0]->Deliver(client::events::kTextChanged, TextChanged(5, "replayed", "u2"));
  Drain();
  EXPECT_EQ(updates_.size(), 2u);
  EXPECT_EQ(session_->Snapshot().content, "final text");
}

TEST_F(SessionControllerTest, SelfEchoIsSuppressed) {
  JoinAt(4, "draft");
  transports_[0]->Deliver(client::events::kTextChanged, TextChanged(9, "echo", "u1"));
  Drain();
  EXPECT_EQ(updates_.size(), 1u);
  EXPECT_EQ(session_->Snapshot().version, 4);
}

TEST_F(SessionControllerTest, ReconnectsWithExponentialBackoffAndRejoins) {
  JoinAt(4, "draft");
  transports_[0]->Drop("network");
  Drain();
  auto snapshot = session_->Snapshot();
  EXPECT_EQ(snapshot.state, ConnectionState::kDisconnected);
  EXPECT_EQ(snapshot.next_retry_delay, std::optional<std::chrono::milliseconds>(1000ms));
  EXPECT_TRUE(transports_[0]->Closed());
  EXPECT_EQ(NoticeKinds(), std::vector<client::NoticeKind>{client::NoticeKind::kSyncDegraded});

  RunFor(900ms);
  EXPECT_EQ(transports_.size(), 1u);
  RunFor(300ms);
  ASSERT_EQ(transports_.size(), 2u);
  EXPECT_EQ(session_->Snapshot().state, ConnectionState::kConnecting);

  transports_[1]->Fail(client::ConnectError::kUnreachable);
  Drain();
  snapshot = session_->Snapshot();
  EXPECT_EQ(snapshot.state, ConnectionState::kDisconnected);
  EXPECT_EQ(snapshot.next_retry_delay, std::optional<std::chrono::milliseconds>(2000ms));
  EXPECT_EQ(snapshot.reconnect_attempts, 2u);

  RunFor(1800ms);
  EXPECT_EQ(transports_.size(), 2u);
  RunFor(400ms);
  ASSERT_EQ(transports_.size(), 3u);

  transports_[2]->Accept();
  Drain();
  EXPECT_EQ(transports_[2]->SentEvents(), std::vector<std::string>{"join-document"});
  EXPECT_EQ(session_->Snapshot().state, ConnectionState::kConnecting);

  transports_[2]->Deliver(client::events::kDocumentJoined, Joined("doc-1", 6, "server copy"));
  Drain();
  snapshot = session_->Snapshot();
  EXPECT_EQ(snapshot.state, ConnectionState::kConnected);
  EXPECT_EQ(snapshot.version, 6);
  EXPECT_EQ(snapshot.content, "server copy");
  EXPECT_EQ(snapshot.reconnect_attempts, 0u);
  EXPECT_FALSE(snapshot.next_retry_delay.has_value());
}

TEST_F(SessionControllerTest, EventsFromReplacedTransportAreIgnored) {
  JoinAt(4, "draft");
  auto old = transports_[0];
  old->Drop("network");
  Drain();
  old->Deliver(client::events::kTextChanged, TextChanged(8, "late", "u2"));
  old->Deliver(client::events::kUserJoined, {{"user", User("u5", "eve")}});
  Drain();
  EXPECT_EQ(session_->Snapshot().version, 4);
  EXPECT_TRUE(session_->Snapshot().online_users.empty());
}

TEST_F(SessionControllerTest, AuthRejectionIsTerminal) {
  Start(DefaultOptions());
  transports_[0]->Fail(client::ConnectError::kAuthRejected);
  Drain();
  EXPECT_EQ(session_->Snapshot().state, ConnectionState::kClosed);
  EXPECT_EQ(NoticeKinds(), std::vector<client::NoticeKind>{client::NoticeKind::kAuthFailed});
  RunFor(1500ms);
  EXPECT_EQ(transports_.size(), 1u);
}

TEST_F(SessionControllerTest, ServerAuthErrorClosesSession) {
  JoinAt(1, "x");
  transports_[0]->Deliver(client::events::kError, {{"code", "unauthorized"}, {"message", "토큰 만료"}});
  Drain();
  EXPECT_EQ(session_->Snapshot().state, ConnectionState::kClosed);
  ASSERT_FALSE(notices_.empty());
  EXPECT_EQ(notices_.back().kind, client::NoticeKind::kAuthFailed);
  EXPECT_EQ(notices_.back().message, "토큰 만료");
}

TEST_F(SessionControllerTest, OtherServerErrorsAreNotices) {
  JoinAt(1, "x");
  transports_[0]->Raw(R"({"t":"error","event":null,"seq":1,"p":{"code":"rate_limited","message":"잠시 후 다시 시도"}})");
  Drain();
  EXPECT_EQ(session_->Snapshot().state, ConnectionState::kConnected);
  ASSERT_FALSE(notices_.empty());
  EXPECT_EQ(notices_.back().kind, client::NoticeKind::kServerError);
}

TEST_F(SessionControllerTest, JoinTimeoutCountsAsFailure) {
  auto options = DefaultOptions();
  options.join_timeout = 100ms;
  Start(options);
  transports_[0]->Accept();
  Drain();
  RunFor(300ms);
  EXPECT_EQ(session_->Snapshot().state, ConnectionState::kDisconnected);
  EXPECT_TRUE(transports_[0]->Closed());
  EXPECT_EQ(NoticeKinds(), std::vector<client::NoticeKind>{client::NoticeKind::kSyncDegraded});
}

TEST_F(SessionControllerTest, CloseLeavesDocumentAndStopsCallbacks) {
  JoinAt(2, "x");
  session_->Close();
  Drain();
  EXPECT_EQ(transports_[0]->SentEvents().back(), "leave-document");
  EXPECT_TRUE(transports_[0]->Closed());
  EXPECT_EQ(session_->Snapshot().state, ConnectionState::kClosed);
  EXPECT_EQ(statuses_.back(), ConnectionState::kClosed);

  const auto updates = updates_.size();
  transports_[0]->Deliver(client::events::kTextChanged, TextChanged(9, "after", "u2"));
  Drain();
  EXPECT_EQ(updates_.size(), updates);

  session_->Open();
  Drain();
  EXPECT_EQ(transports_.size(), 1u);
  EXPECT_EQ(session_->Snapshot().state, ConnectionState::kClosed);
}

TEST_F(SessionControllerTest, CloseCancelsPendingReconnect) {
  JoinAt(2, "x");
  transports_[0]->Drop("network");
  Drain();
  session_->Close();
  Drain();
  RunFor(1500ms);
  EXPECT_EQ(transports_.size(), 1u);
  EXPECT_EQ(session_->Snapshot().state, ConnectionState::kClosed);
}

TEST_F(SessionControllerTest, LocalEditSendsTypingThenTextChange) {
  JoinAt(3, "abc");
  session_->NotifyContentChanged("abcd", 4);
  Drain();
  EXPECT_EQ(transports_[0]->SentEvents(),
            (std::vector<std::string>{"join-document", "typing-status", "text-change"}));
  const auto& typing = transports_[0]->Sent()[1];
  EXPECT_EQ(typing["p"]["isTyping"], true);
  const auto& change = transports_[0]->Sent()[2];
  EXPECT_EQ(change["p"]["documentId"], "doc-1");
  EXPECT_EQ(change["p"]["version"], 3);
  EXPECT_EQ(change["p"]["operation"]["type"], "insert");
  EXPECT_EQ(change["p"]["operation"]["position"], 4);
  EXPECT_EQ(change["p"]["operation"]["content"], "abcd");
  EXPECT_EQ(session_->Snapshot().content, "abcd");
  EXPECT_TRUE(session_->Snapshot().local_typing);
  EXPECT_GT(change["seq"].get<std::uint64_t>(), typing["seq"].get<std::uint64_t>());
}

TEST_F(SessionControllerTest, ViewerEditsStayLocal) {
  JoinAt(3, "abc", "viewer");
  session_->NotifyContentChanged("abcd");
  Drain();
  EXPECT_EQ(transports_[0]->SentEvents(), (std::vector<std::string>{"join-document", "typing-status"}));
  EXPECT_EQ(session_->Snapshot().content, "abcd");
}

TEST_F(SessionControllerTest, SelectionSendsCursorPosition) {
  JoinAt(3, "abcdef");
  session_->NotifySelectionChanged(client::Selection{1, 4});
  Drain();
  ASSERT_EQ(transports_[0]->SentEvents().back(), "cursor-position");
  const auto& cursor = transports_[0]->Sent().back();
  EXPECT_EQ(cursor["p"]["position"], 1);
  EXPECT_EQ(cursor["p"]["selection"]["end"], 4);
}

TEST_F(SessionControllerTest, OfflineEditsAreReplacedOnJoin) {
  Start(DefaultOptions());
  session_->NotifyContentChanged("offline");
  Drain();
  EXPECT_TRUE(transports_[0]->Sent().empty());
  EXPECT_EQ(session_->Snapshot().content, "offline");

  transports_[0]->Accept();
  Drain();
  transports_[0]->Deliver(client::events::kDocumentJoined, Joined("doc-1", 2, "server"));
  Drain();
  EXPECT_EQ(session_->Snapshot().content, "server");
}

TEST_F(SessionControllerTest, PresenceTracksCollaborators) {
  JoinAt(1, "x");
  nlohmann::json users = nlohmann::json::array({User("u1", "alice"), User("u2", "bob"), User("u3", "carol")});
  transports_[0]->Deliver(client::events::kOnlineUsers, {{"users", users}});
  Drain();
  ASSERT_FALSE(presence_.empty());
  EXPECT_EQ(presence_.back().size(), 3u);

  transports_[0]->Deliver(client::events::kTypingStatusChanged, {{"user", User("u2", "bob")}, {"isTyping", true}});
  transports_[0]->Deliver(client::events::kCursorMoved, {{"user", User("u2", "bob")}, {"position", 7}});
  Drain();
  auto snapshot = session_->Snapshot();
  bool found = false;
  for (const auto& user : snapshot.online_users) {
    if (user.user_id == "u2") {
      found = true;
      EXPECT_TRUE(user.is_typing);
      EXPECT_EQ(user.cursor_position, 7);
    }
  }
  EXPECT_TRUE(found);

  transports_[0]->Deliver(client::events::kUserLeft, {{"user", User("u3", "carol")}});
  Drain();
  EXPECT_EQ(presence_.back().size(), 2u);
  ASSERT_FALSE(notices_.empty());
  EXPECT_EQ(notices_.back().kind, client::NoticeKind::kUserLeft);
  EXPECT_EQ(notices_.back().user_id, std::optional<std::string>("u3"));

  transports_[0]->Drop("network");
  Drain();
  EXPECT_TRUE(presence_.back().empty());
  EXPECT_TRUE(session_->Snapshot().online_users.empty());
}

TEST_F(SessionControllerTest, UserJoinedRaisesNotice) {
  JoinAt(1, "x");
  transports_[0]->Deliver(client::events::kUserJoined, {{"user", User("u7", "grace")}});
  Drain();
  ASSERT_FALSE(notices_.empty());
  EXPECT_EQ(notices_.back().kind, client::NoticeKind::kUserJoined);
  EXPECT_EQ(notices_.back().user_id, std::optional<std::string>("u7"));
  ASSERT_EQ(session_->Snapshot().online_users.size(), 1u);
}

TEST_F(SessionControllerTest, MalformedPayloadsAreDropped) {
  JoinAt(1, "x");
  transports_[0]->Raw("{not json");
  transports_[0]->Deliver(client::events::kUserJoined, {{"nobody", true}});
  transports_[0]->Deliver(client::events::kTextChanged, {{"operation", "bad"}});
  Drain();
  EXPECT_EQ(observability_->Snapshot().payloads_dropped, 3u);
  EXPECT_EQ(session_->Snapshot().state, ConnectionState::kConnected);
  EXPECT_EQ(session_->Snapshot().version, 1);
}

TEST_F(SessionControllerTest, AutosaveAfterQuietPeriod) {
  auto options = DefaultOptions();
  options.autosave_interval = 100ms;
  Start(options);
  transports_[0]->Accept();
  Drain();
  transports_[0]->Deliver(client::events::kDocumentJoined, Joined("doc-1", 1, "a"));
  Drain();

  session_->NotifyContentChanged("ab");
  Drain();
  EXPECT_TRUE(saves_.empty());
  RunFor(300ms);
  ASSERT_EQ(saves_.size(), 1u);
  EXPECT_EQ(saves_[0].first, "ab");
  EXPECT_EQ(saves_[0].second, 1);

  session_->RequestSave();
  Drain();
  EXPECT_EQ(saves_.size(), 2u);
}

TEST_F(SessionControllerTest, CloseFlushesUnsavedChanges) {
  JoinAt(1, "a");
  session_->NotifyContentChanged("unsaved");
  Drain();
  session_->Close();
  Drain();
  ASSERT_EQ(saves_.size(), 1u);
  EXPECT_EQ(saves_[0].first, "unsaved");
}

TEST_F(SessionControllerTest, DroppingSessionReleasesTransport) {
  JoinAt(2, "x");
  auto transport = transports_[0];
  const auto statuses = statuses_.size();
  EXPECT_EQ(observability_->Snapshot().active_sessions, 1u);

  session_.reset();
  Drain();
  EXPECT_TRUE(transport->Closed());
  EXPECT_EQ(transport->SentEvents().back(), "leave-document");
  EXPECT_EQ(observability_->Snapshot().active_sessions, 0u);
  EXPECT_EQ(statuses_.size(), statuses);

  transport->Deliver(client::events::kTextChanged, TextChanged(9, "after", "u2"));
  Drain();
  EXPECT_EQ(updates_.size(), 1u);
}

TEST_F(SessionControllerTest, DroppingSessionCancelsReconnect) {
  JoinAt(2, "x");
  transports_[0]->Drop("network");
  Drain();
  session_.reset();
  Drain();
  RunFor(1500ms);
  EXPECT_EQ(transports_.size(), 1u);
  EXPECT_EQ(observability_->Snapshot().active_sessions, 0u);
}
