/*
 * 설명: 환경설정으로 협업 세션 하나를 열고 표준 입력의 각 줄을 문서 전체 내용으로 전송하는 CLI 진입점.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <csignal>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include <unistd.h>

#include <boost/asio/signal_set.hpp>

#include "client/app.hpp"
#include "client/line_reader.hpp"

namespace {
struct ShutdownSignal {
  std::promise<void> promise;
  std::once_flag once;

  void Fire() {
    std::call_once(once, [this]() { promise.set_value(); });
  }
};

// Returns false once the user asked to quit.
bool DispatchLine(client::SessionController& session, std::string line) {
  if (line == "/quit") {
    return false;
  }
  if (line == "/save") {
    session.RequestSave();
    return true;
  }
  const auto cursor = static_cast<int>(line.size());
  session.NotifyContentChanged(std::move(line), cursor);
  return true;
}
}  // namespace

int main() {
  using namespace client;
  try {
    ClientConfig config = LoadConfigFromEnv();
    if (config.document_id.empty() || config.user_id.empty()) {
      std::cerr << "COLLAB_DOCUMENT_ID, COLLAB_USER_ID 환경변수가 필요합니다\n";
      return 1;
    }
    ClientApp app(config);
    auto observability = app.GetObservability();
    auto shutdown = std::make_shared<ShutdownSignal>();
    auto shutdown_done = shutdown->promise.get_future();

    auto log_event = [observability, doc = config.document_id](const std::string& name, nlohmann::json detail) {
      LogContext ctx;
      ctx.trace_id = observability->NextTraceId();
      ctx.document_id = doc;
      ctx.name = name;
      ctx.detail = std::move(detail);
      observability->Log(ctx);
    };

    SessionCallbacks callbacks;
    callbacks.on_status_change = [log_event, shutdown](ConnectionState state) {
      log_event("cli_status", {{"status", ToString(state)}});
      if (state == ConnectionState::kClosed) {
        shutdown->Fire();
      }
    };
    callbacks.on_document_update = [log_event](const std::string& content, std::int64_t version) {
      log_event("cli_document", {{"version", version}, {"length", content.size()}});
    };
    callbacks.on_presence_change = [log_event](const std::vector<PresenceEntry>& users) {
      nlohmann::json list = nlohmann::json::array();
      for (const auto& user : users) {
        list.push_back(nlohmann::json{{"id", user.user_id},
                                      {"username", user.display_name},
                                      {"color", user.color},
                                      {"isTyping", user.is_typing}});
      }
      log_event("cli_presence", {{"users", list}});
    };
    callbacks.on_notice = [log_event](const SessionNotice& notice) {
      log_event("cli_notice", {{"kind", ToString(notice.kind)}, {"message", notice.message}});
    };
    callbacks.on_save_requested = [log_event](const std::string& content, std::int64_t version) {
      log_event("cli_save_requested", {{"version", version}, {"length", content.size()}});
    };

    boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
    signals.async_wait([shutdown](const boost::system::error_code& ec, int /*signal*/) {
      if (!ec) {
        shutdown->Fire();
      }
    });

    app.Start();
    auto session = app.OpenSession(config.document_id, std::move(callbacks));

    LineReader input(
        STDIN_FILENO, [&session](std::string line) { return DispatchLine(*session, std::move(line)); },
        [shutdown]() { shutdown->Fire(); });
    input.Start();

    shutdown_done.wait();
    input.Stop();
    signals.cancel();
    app.Stop();
  } catch (const std::exception& ex) {
    std::cerr << "클라이언트 시작 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
