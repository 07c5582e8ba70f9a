/*
 * 설명: WebSocket 엔벨로프를 직렬화하고 수신 프레임을 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/json_envelope_test.cpp
 */
#include "client/envelope.hpp"

namespace client {

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  if (env.type == "event") {
    j["event"] = env.event;
  } else {
    j["event"] = nullptr;
  }
  j["p"] = env.payload;
  return j;
}

std::optional<WsEnvelope> ParseWsEnvelope(std::string_view raw) {
  auto message = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    return std::nullopt;
  }
  auto type_it = message.find("t");
  if (type_it == message.end() || !type_it->is_string()) {
    return std::nullopt;
  }
  WsEnvelope env{.type = type_it->get<std::string>(), .event = "", .seq = 0, .payload = nlohmann::json::object()};
  if (env.type != "event" && env.type != "error") {
    return std::nullopt;
  }
  auto seq_it = message.find("seq");
  if (seq_it != message.end() && seq_it->is_number_unsigned()) {
    env.seq = seq_it->get<std::uint64_t>();
  }
  auto event_it = message.find("event");
  if (env.type == "event") {
    if (event_it == message.end() || !event_it->is_string()) {
      return std::nullopt;
    }
    env.event = event_it->get<std::string>();
  }
  auto payload_it = message.find("p");
  if (payload_it != message.end()) {
    if (!payload_it->is_object()) {
      return std::nullopt;
    }
    env.payload = *payload_it;
  }
  return env;
}

}  // namespace client
