/*
 * 설명: 문서 버전 카운터를 소유하고 로컬 편집과 원격 연산을 조정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/sync_engine_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace client {

enum class OperationKind { kInsert, kDelete, kRetain };

std::string_view ToString(OperationKind kind);
std::optional<OperationKind> ParseOperationKind(std::string_view value);

struct Operation {
  OperationKind kind{OperationKind::kInsert};
  int position{0};
  std::optional<std::string> content;
  std::optional<int> length;
  std::string author_id;
  std::int64_t version{0};
};

enum class SyncResult { kApplied, kStale, kRejected };

std::string_view ToString(SyncResult result);

struct DocumentSyncState {
  std::int64_t version{0};
  std::string content;
};

// Full-replace reconciliation: an applied operation's content becomes the whole
// document; structural fields travel on the wire but are not interpreted.
class SyncEngine {
 public:
  explicit SyncEngine(std::string local_user_id);

  void Reset(const DocumentSyncState& state);
  SyncResult ApplyRemote(const Operation& operation);
  Operation RecordLocalEdit(const std::string& content, int position = 0);

  std::int64_t CurrentVersion() const { return state_.version; }
  const std::string& Content() const { return state_.content; }
  DocumentSyncState State() const { return state_; }
  std::uint64_t LocalEditsSinceSync() const { return local_edits_since_sync_; }

 private:
  std::string local_user_id_;
  DocumentSyncState state_;
  std::uint64_t local_edits_since_sync_{0};
};

}  // namespace client
