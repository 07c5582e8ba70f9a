/*
 * 설명: 온라인 협업자 목록과 타이핑/커서 상태를 추적한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/presence_tracker_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace client {

struct Selection {
  int start{0};
  int end{0};

  bool operator==(const Selection& other) const = default;
};

struct PresenceEntry {
  std::string user_id;
  std::string display_name;
  std::string color;
  bool is_typing{false};
  std::optional<int> cursor_position;
  std::optional<Selection> selection;
  std::chrono::steady_clock::time_point last_seen{};
  std::chrono::steady_clock::time_point typing_refreshed_at{};
};

// Same identity always maps to the same palette entry on every client.
std::string ColorForUser(std::string_view identity);

PresenceEntry MakePresenceEntry(std::string user_id, std::string display_name);

// Typing flags not refreshed within `idle` read as stopped.
void ExpireTyping(std::vector<PresenceEntry>& entries, std::chrono::milliseconds idle,
                  std::chrono::steady_clock::time_point now);

class PresenceTracker {
 public:
  PresenceTracker(std::string local_user_id, std::chrono::milliseconds typing_idle);

  bool ApplyJoin(PresenceEntry entry);
  bool ApplyLeave(const std::string& user_id);
  void ApplyBulkSync(std::vector<PresenceEntry> entries);
  bool ApplyCursor(const std::string& user_id, int position, const std::optional<Selection>& selection);
  bool ApplyTyping(const std::string& user_id, bool is_typing);
  void Clear();

  std::vector<PresenceEntry> Snapshot() const;
  std::vector<PresenceEntry> Snapshot(std::chrono::steady_clock::time_point now) const;
  std::size_t Size() const { return entries_.size(); }
  bool Contains(const std::string& user_id) const { return index_.count(user_id) > 0; }
  const std::string& LocalUserId() const { return local_user_id_; }
  std::chrono::milliseconds TypingIdle() const { return typing_idle_; }

 private:
  bool IsSelf(const std::string& user_id) const { return user_id == local_user_id_; }

  std::string local_user_id_;
  std::chrono::milliseconds typing_idle_;
  std::list<PresenceEntry> entries_;
  std::unordered_map<std::string, std::list<PresenceEntry>::iterator> index_;
};

}  // namespace client
