/*
 * 설명: 원격 연산의 중복/자기 에코를 걸러내고 로컬 편집을 전체 내용 연산으로 포장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/sync_engine_test.cpp
 */
#include "client/sync_engine.hpp"

#include <algorithm>

namespace client {

std::string_view ToString(OperationKind kind) {
  switch (kind) {
    case OperationKind::kInsert:
      return "insert";
    case OperationKind::kDelete:
      return "delete";
    case OperationKind::kRetain:
      return "retain";
  }
  return "insert";
}

std::optional<OperationKind> ParseOperationKind(std::string_view value) {
  if (value == "insert") {
    return OperationKind::kInsert;
  }
  if (value == "delete") {
    return OperationKind::kDelete;
  }
  if (value == "retain") {
    return OperationKind::kRetain;
  }
  return std::nullopt;
}

std::string_view ToString(SyncResult result) {
  switch (result) {
    case SyncResult::kApplied:
      return "applied";
    case SyncResult::kStale:
      return "stale";
    case SyncResult::kRejected:
      return "rejected";
  }
  return "rejected";
}

SyncEngine::SyncEngine(std::string local_user_id) : local_user_id_(std::move(local_user_id)) {}

void SyncEngine::Reset(const DocumentSyncState& state) {
  state_.content = state.content;
  state_.version = std::max(state_.version, state.version);
  local_edits_since_sync_ = 0;
}

SyncResult SyncEngine::ApplyRemote(const Operation& operation) {
  if (operation.author_id == local_user_id_) {
    return SyncResult::kStale;
  }
  if (operation.version <= state_.version) {
    return SyncResult::kStale;
  }
  if (!operation.content || operation.position < 0) {
    return SyncResult::kRejected;
  }
  state_.version = operation.version;
  state_.content = *operation.content;
  return SyncResult::kApplied;
}

Operation SyncEngine::RecordLocalEdit(const std::string& content, int position) {
  state_.content = content;
  ++local_edits_since_sync_;
  Operation op;
  op.kind = OperationKind::kInsert;
  op.position = std::max(position, 0);
  op.content = content;
  op.author_id = local_user_id_;
  op.version = state_.version;
  return op;
}

}  // namespace client
