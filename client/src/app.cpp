/*
 * 설명: 클라이언트 런타임 수명주기와 세션 생성, 환경설정 로딩을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/config_test.cpp
 */
#include "client/app.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <random>
#include <stdexcept>

namespace client {

ClientApp::ClientApp(const ClientConfig& config)
    : config_(config),
      ioc_(1),
      work_guard_(boost::asio::make_work_guard(ioc_)),
      ssl_ctx_(boost::asio::ssl::context::tls_client),
      observability_(std::make_shared<Observability>(ParseLogLevel(config.log_level))) {
  auto endpoint = ParseEndpoint(config_.ws_url);
  if (!endpoint) {
    throw std::invalid_argument("잘못된 COLLAB_WS_URL 입니다: " + config_.ws_url);
  }
  endpoint_ = *endpoint;
  limits_.connect_timeout = std::chrono::milliseconds(config_.connect_timeout_ms);
  limits_.max_queue_messages = config_.ws_queue_limit_messages;
  limits_.max_queue_bytes = config_.ws_queue_limit_bytes;

  ssl_ctx_.set_default_verify_paths();
  ssl_ctx_.set_verify_mode(config_.tls_verify_peer ? boost::asio::ssl::verify_peer : boost::asio::ssl::verify_none);
}

ClientApp::~ClientApp() { Stop(); }

void ClientApp::Start() {
  if (running_.exchange(true)) {
    return;
  }
  worker_ = std::thread([this]() {
    try {
      ioc_.run();
    } catch (const std::exception& ex) {
      std::cerr << "클라이언트 실행 중 예외: " << ex.what() << "\n";
    }
  });
}

void ClientApp::Stop(std::chrono::milliseconds grace) {
  if (!running_.exchange(false)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& weak : sessions_) {
      if (auto session = weak.lock()) {
        session->Close();
      }
    }
    sessions_.clear();
  }
  work_guard_.reset();
  const auto deadline = std::chrono::steady_clock::now() + grace;
  while (!ioc_.stopped() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  ioc_.stop();
  if (worker_.joinable()) {
    worker_.join();
  }
}

SessionOptions ClientApp::MakeSessionOptions(const std::string& document_id) const {
  SessionOptions options;
  options.document_id = document_id;
  options.identity = SessionIdentity{config_.access_token, config_.user_id, config_.username};
  options.endpoint = endpoint_;
  options.backoff.base = std::chrono::milliseconds(config_.reconnect_base_ms);
  options.backoff.cap = std::chrono::milliseconds(config_.reconnect_cap_ms);
  options.backoff.jitter_ratio = static_cast<double>(config_.reconnect_jitter_percent) / 100.0;
  options.backoff_seed = std::random_device{}();
  options.join_timeout = std::chrono::milliseconds(config_.connect_timeout_ms);
  options.typing_idle = std::chrono::milliseconds(config_.typing_idle_ms);
  options.autosave_interval = std::chrono::milliseconds(config_.autosave_interval_ms);
  return options;
}

std::shared_ptr<SessionController> ClientApp::OpenSession(const std::string& document_id,
                                                          SessionCallbacks callbacks) {
  auto factory = [this]() { return MakeWebSocketTransport(ioc_, ssl_ctx_, endpoint_.secure, limits_); };
  auto session = std::make_shared<SessionController>(ioc_, MakeSessionOptions(document_id), factory,
                                                     std::move(callbacks), observability_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [](const std::weak_ptr<SessionController>& weak) { return weak.expired(); }),
                    sessions_.end());
    sessions_.push_back(session);
  }
  session->Open();
  return session;
}

std::size_t ClientApp::TrackedSessionCount() {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

ClientConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  ClientConfig cfg;
  cfg.ws_url = get_env("COLLAB_WS_URL", "ws://localhost:3001/collaboration");
  cfg.access_token = get_env("COLLAB_ACCESS_TOKEN", "");
  cfg.user_id = get_env("COLLAB_USER_ID", "");
  cfg.username = get_env("COLLAB_USERNAME", "");
  cfg.document_id = get_env("COLLAB_DOCUMENT_ID", "");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.connect_timeout_ms = static_cast<std::size_t>(std::stoul(get_env("CONNECT_TIMEOUT_MS", "5000")));
  cfg.reconnect_base_ms = static_cast<std::size_t>(std::stoul(get_env("RECONNECT_BASE_MS", "1000")));
  cfg.reconnect_cap_ms = static_cast<std::size_t>(std::stoul(get_env("RECONNECT_CAP_MS", "30000")));
  cfg.reconnect_jitter_percent = static_cast<std::size_t>(std::stoul(get_env("RECONNECT_JITTER_PERCENT", "20")));
  cfg.typing_idle_ms = static_cast<std::size_t>(std::stoul(get_env("TYPING_IDLE_MS", "1000")));
  cfg.autosave_interval_ms = static_cast<std::size_t>(std::stoul(get_env("AUTOSAVE_INTERVAL_MS", "3000")));
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "64")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "1048576")));
  cfg.tls_verify_peer = get_env("TLS_VERIFY_PEER", "1") != "0";
  return cfg;
}

}  // namespace client
