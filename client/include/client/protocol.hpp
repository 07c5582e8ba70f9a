/*
 * 설명: 협업 서버와 주고받는 이벤트 이름, 페이로드 생성 및 해석을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/protocol_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "client/presence.hpp"
#include "client/sync_engine.hpp"

namespace client {

namespace events {
inline constexpr std::string_view kJoinDocument = "join-document";
inline constexpr std::string_view kLeaveDocument = "leave-document";
inline constexpr std::string_view kTextChange = "text-change";
inline constexpr std::string_view kCursorPosition = "cursor-position";
inline constexpr std::string_view kTypingStatus = "typing-status";

inline constexpr std::string_view kDocumentJoined = "document-joined";
inline constexpr std::string_view kUserJoined = "user-joined";
inline constexpr std::string_view kUserLeft = "user-left";
inline constexpr std::string_view kOnlineUsers = "online-users";
inline constexpr std::string_view kTextChanged = "text-changed";
inline constexpr std::string_view kCursorMoved = "cursor-moved";
inline constexpr std::string_view kTypingStatusChanged = "typing-status-changed";
inline constexpr std::string_view kError = "error";
}  // namespace events

enum class DocumentPermission { kOwner, kEditor, kViewer, kUnknown };

DocumentPermission ParsePermission(std::string_view value);
std::string_view ToString(DocumentPermission permission);
bool CanEdit(DocumentPermission permission);

struct DocumentJoined {
  std::string document_id;
  std::string title;
  std::string content;
  std::int64_t version{0};
  PresenceEntry user;
  DocumentPermission permission{DocumentPermission::kUnknown};
};

struct TextChanged {
  Operation operation;
  PresenceEntry author;
  std::string timestamp;
};

struct CursorMoved {
  std::string user_id;
  int position{0};
  std::optional<Selection> selection;
};

struct TypingChanged {
  std::string user_id;
  bool is_typing{false};
};

struct ServerError {
  std::string code;
  std::string message;
};

nlohmann::json OperationToJson(const Operation& operation);
std::optional<Operation> ParseOperation(const nlohmann::json& payload);

nlohmann::json BuildJoinDocument(const std::string& document_id, const std::string& token);
nlohmann::json BuildLeaveDocument(const std::string& document_id);
nlohmann::json BuildTextChange(const std::string& document_id, const Operation& operation);
nlohmann::json BuildCursorPosition(const std::string& document_id, int position,
                                   const std::optional<Selection>& selection);
nlohmann::json BuildTypingStatus(const std::string& document_id, bool is_typing);

std::optional<PresenceEntry> ParseUser(const nlohmann::json& payload);
std::optional<std::vector<PresenceEntry>> ParseOnlineUsers(const nlohmann::json& payload);
std::optional<DocumentJoined> ParseDocumentJoined(const nlohmann::json& payload);
std::optional<PresenceEntry> ParseUserEvent(const nlohmann::json& payload);
std::optional<TextChanged> ParseTextChanged(const nlohmann::json& payload);
std::optional<CursorMoved> ParseCursorMoved(const nlohmann::json& payload);
std::optional<TypingChanged> ParseTypingChanged(const nlohmann::json& payload);
std::optional<ServerError> ParseServerError(const nlohmann::json& payload);

}  // namespace client
