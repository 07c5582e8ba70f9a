/*
 * 설명: 협업 이벤트 페이로드를 만들고 수신 페이로드를 검증하여 타입으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/protocol_test.cpp
 */
#include "client/protocol.hpp"

#include <limits>

namespace client {
namespace {
std::optional<std::string> ReadId(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<std::int64_t>());
  }
  return std::nullopt;
}

std::optional<int> ReadInt(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number_integer()) {
    return std::nullopt;
  }
  auto value = it->get<std::int64_t>();
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

std::optional<std::int64_t> ReadVersion(const nlohmann::json& obj) {
  auto it = obj.find("version");
  if (it == obj.end() || !it->is_number_integer()) {
    return std::nullopt;
  }
  return it->get<std::int64_t>();
}

std::string ReadString(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

// nullopt: field absent or null. Malformed selection makes the whole payload invalid.
bool ReadSelection(const nlohmann::json& obj, std::optional<Selection>& out) {
  out.reset();
  auto it = obj.find("selection");
  if (it == obj.end() || it->is_null()) {
    return true;
  }
  if (!it->is_object()) {
    return false;
  }
  auto start = ReadInt(*it, "start");
  auto end = ReadInt(*it, "end");
  if (!start || !end) {
    return false;
  }
  out = Selection{*start, *end};
  return true;
}

nlohmann::json SelectionToJson(const std::optional<Selection>& selection) {
  if (!selection) {
    return nullptr;
  }
  return {{"start", selection->start}, {"end", selection->end}};
}
}  // namespace

DocumentPermission ParsePermission(std::string_view value) {
  if (value == "owner") {
    return DocumentPermission::kOwner;
  }
  if (value == "editor") {
    return DocumentPermission::kEditor;
  }
  if (value == "viewer") {
    return DocumentPermission::kViewer;
  }
  return DocumentPermission::kUnknown;
}

std::string_view ToString(DocumentPermission permission) {
  switch (permission) {
    case DocumentPermission::kOwner:
      return "owner";
    case DocumentPermission::kEditor:
      return "editor";
    case DocumentPermission::kViewer:
      return "viewer";
    case DocumentPermission::kUnknown:
      return "unknown";
  }
  return "unknown";
}

bool CanEdit(DocumentPermission permission) {
  return permission == DocumentPermission::kOwner || permission == DocumentPermission::kEditor;
}

nlohmann::json OperationToJson(const Operation& operation) {
  nlohmann::json j{{"type", ToString(operation.kind)}, {"position", operation.position}};
  if (operation.content) {
    j["content"] = *operation.content;
  }
  if (operation.length) {
    j["length"] = *operation.length;
  }
  return j;
}

std::optional<Operation> ParseOperation(const nlohmann::json& payload) {
  if (!payload.is_object()) {
    return std::nullopt;
  }
  auto type_it = payload.find("type");
  if (type_it == payload.end() || !type_it->is_string()) {
    return std::nullopt;
  }
  auto kind = ParseOperationKind(type_it->get<std::string>());
  auto position = ReadInt(payload, "position");
  if (!kind || !position) {
    return std::nullopt;
  }
  Operation op;
  op.kind = *kind;
  op.position = *position;
  auto content_it = payload.find("content");
  if (content_it != payload.end() && !content_it->is_null()) {
    if (!content_it->is_string()) {
      return std::nullopt;
    }
    op.content = content_it->get<std::string>();
  }
  if (payload.contains("length") && !payload["length"].is_null()) {
    op.length = ReadInt(payload, "length");
    if (!op.length) {
      return std::nullopt;
    }
  }
  return op;
}

nlohmann::json BuildJoinDocument(const std::string& document_id, const std::string& token) {
  return {{"documentId", document_id}, {"token", token}};
}

nlohmann::json BuildLeaveDocument(const std::string& document_id) { return {{"documentId", document_id}}; }

nlohmann::json BuildTextChange(const std::string& document_id, const Operation& operation) {
  return {{"documentId", document_id}, {"operation", OperationToJson(operation)}, {"version", operation.version}};
}

nlohmann::json BuildCursorPosition(const std::string& document_id, int position,
                                   const std::optional<Selection>& selection) {
  nlohmann::json j{{"documentId", document_id}, {"position", position}};
  if (selection) {
    j["selection"] = SelectionToJson(selection);
  }
  return j;
}

nlohmann::json BuildTypingStatus(const std::string& document_id, bool is_typing) {
  return {{"documentId", document_id}, {"isTyping", is_typing}};
}

std::optional<PresenceEntry> ParseUser(const nlohmann::json& payload) {
  if (!payload.is_object() || !payload.contains("id")) {
    return std::nullopt;
  }
  auto id = ReadId(payload["id"]);
  if (!id || id->empty()) {
    return std::nullopt;
  }
  auto entry = MakePresenceEntry(*id, ReadString(payload, "username"));
  auto typing_it = payload.find("isTyping");
  if (typing_it != payload.end() && typing_it->is_boolean()) {
    entry.is_typing = typing_it->get<bool>();
  }
  entry.cursor_position = ReadInt(payload, "cursorPosition");
  return entry;
}

std::optional<std::vector<PresenceEntry>> ParseOnlineUsers(const nlohmann::json& payload) {
  auto users_it = payload.find("users");
  if (!payload.is_object() || users_it == payload.end() || !users_it->is_array()) {
    return std::nullopt;
  }
  std::vector<PresenceEntry> users;
  users.reserve(users_it->size());
  for (const auto& item : *users_it) {
    auto user = ParseUser(item);
    if (!user) {
      return std::nullopt;
    }
    users.push_back(std::move(*user));
  }
  return users;
}

std::optional<DocumentJoined> ParseDocumentJoined(const nlohmann::json& payload) {
  if (!payload.is_object()) {
    return std::nullopt;
  }
  auto doc_it = payload.find("document");
  if (doc_it == payload.end() || !doc_it->is_object() || !doc_it->contains("id")) {
    return std::nullopt;
  }
  auto id = ReadId((*doc_it)["id"]);
  auto version = ReadVersion(*doc_it);
  auto content_it = doc_it->find("content");
  if (!id || !version || content_it == doc_it->end() || !content_it->is_string()) {
    return std::nullopt;
  }
  DocumentJoined joined;
  joined.document_id = *id;
  joined.title = ReadString(*doc_it, "title");
  joined.content = content_it->get<std::string>();
  joined.version = *version;
  joined.permission = ParsePermission(ReadString(payload, "permission"));
  if (payload.contains("user")) {
    auto user = ParseUser(payload["user"]);
    if (user) {
      joined.user = std::move(*user);
    }
  }
  return joined;
}

std::optional<PresenceEntry> ParseUserEvent(const nlohmann::json& payload) {
  if (!payload.is_object() || !payload.contains("user")) {
    return std::nullopt;
  }
  return ParseUser(payload["user"]);
}

std::optional<TextChanged> ParseTextChanged(const nlohmann::json& payload) {
  if (!payload.is_object() || !payload.contains("operation") || !payload.contains("author")) {
    return std::nullopt;
  }
  auto operation = ParseOperation(payload["operation"]);
  auto version = ReadVersion(payload);
  auto author = ParseUser(payload["author"]);
  if (!operation || !version || !author) {
    return std::nullopt;
  }
  TextChanged changed;
  changed.operation = std::move(*operation);
  changed.operation.version = *version;
  changed.operation.author_id = author->user_id;
  changed.author = std::move(*author);
  changed.timestamp = ReadString(payload, "timestamp");
  return changed;
}

std::optional<CursorMoved> ParseCursorMoved(const nlohmann::json& payload) {
  auto user = ParseUserEvent(payload);
  auto position = payload.is_object() ? ReadInt(payload, "position") : std::nullopt;
  if (!user || !position) {
    return std::nullopt;
  }
  CursorMoved moved;
  moved.user_id = user->user_id;
  moved.position = *position;
  if (!ReadSelection(payload, moved.selection)) {
    return std::nullopt;
  }
  return moved;
}

std::optional<TypingChanged> ParseTypingChanged(const nlohmann::json& payload) {
  auto user = ParseUserEvent(payload);
  if (!user) {
    return std::nullopt;
  }
  auto typing_it = payload.find("isTyping");
  if (typing_it == payload.end() || !typing_it->is_boolean()) {
    return std::nullopt;
  }
  return TypingChanged{user->user_id, typing_it->get<bool>()};
}

std::optional<ServerError> ParseServerError(const nlohmann::json& payload) {
  if (!payload.is_object()) {
    return std::nullopt;
  }
  auto message_it = payload.find("message");
  if (message_it == payload.end() || !message_it->is_string()) {
    return std::nullopt;
  }
  return ServerError{ReadString(payload, "code"), message_it->get<std::string>()};
}

}  // namespace client
