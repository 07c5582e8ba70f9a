/*
 * 설명: 협업자 입장/퇴장, 일괄 동기화, 커서/타이핑 갱신을 처리하고 스냅샷을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/presence_tracker_test.cpp
 */
#include "client/presence.hpp"

#include <array>
#include <cstdint>
#include <iterator>

namespace client {
namespace {
constexpr std::array<const char*, 17> kPalette{
    "#ef4444", "#f97316", "#f59e0b", "#eab308", "#84cc16", "#22c55e", "#10b981", "#14b8a6", "#06b6d4",
    "#0ea5e9", "#3b82f6", "#6366f1", "#8b5cf6", "#a855f7", "#d946ef", "#ec4899", "#f43f5e"};
}  // namespace

std::string ColorForUser(std::string_view identity) {
  std::int32_t hash = 0;
  for (unsigned char ch : identity) {
    hash = static_cast<std::int32_t>(static_cast<std::uint32_t>(hash) * 31u + ch);
  }
  std::int64_t magnitude = hash < 0 ? -static_cast<std::int64_t>(hash) : hash;
  return kPalette[static_cast<std::size_t>(magnitude % static_cast<std::int64_t>(kPalette.size()))];
}

PresenceEntry MakePresenceEntry(std::string user_id, std::string display_name) {
  PresenceEntry entry;
  entry.color = ColorForUser(user_id.empty() ? display_name : user_id);
  entry.user_id = std::move(user_id);
  entry.display_name = std::move(display_name);
  entry.last_seen = std::chrono::steady_clock::now();
  return entry;
}

void ExpireTyping(std::vector<PresenceEntry>& entries, std::chrono::milliseconds idle,
                  std::chrono::steady_clock::time_point now) {
  for (auto& entry : entries) {
    if (entry.is_typing && now - entry.typing_refreshed_at > idle) {
      entry.is_typing = false;
    }
  }
}

PresenceTracker::PresenceTracker(std::string local_user_id, std::chrono::milliseconds typing_idle)
    : local_user_id_(std::move(local_user_id)), typing_idle_(typing_idle) {}

bool PresenceTracker::ApplyJoin(PresenceEntry entry) {
  if (entry.user_id.empty() || IsSelf(entry.user_id)) {
    return false;
  }
  entry.last_seen = std::chrono::steady_clock::now();
  if (entry.is_typing) {
    entry.typing_refreshed_at = entry.last_seen;
  }
  auto it = index_.find(entry.user_id);
  if (it != index_.end()) {
    *it->second = std::move(entry);
    return true;
  }
  entries_.push_back(std::move(entry));
  index_[entries_.back().user_id] = std::prev(entries_.end());
  return true;
}

bool PresenceTracker::ApplyLeave(const std::string& user_id) {
  if (IsSelf(user_id)) {
    return false;
  }
  auto it = index_.find(user_id);
  if (it == index_.end()) {
    return false;
  }
  entries_.erase(it->second);
  index_.erase(it);
  return true;
}

void PresenceTracker::ApplyBulkSync(std::vector<PresenceEntry> entries) {
  Clear();
  auto now = std::chrono::steady_clock::now();
  for (auto& entry : entries) {
    if (entry.user_id.empty()) {
      continue;
    }
    entry.last_seen = now;
    if (entry.is_typing) {
      entry.typing_refreshed_at = now;
    }
    auto it = index_.find(entry.user_id);
    if (it != index_.end()) {
      *it->second = std::move(entry);
      continue;
    }
    entries_.push_back(std::move(entry));
    index_[entries_.back().user_id] = std::prev(entries_.end());
  }
}

bool PresenceTracker::ApplyCursor(const std::string& user_id, int position,
                                  const std::optional<Selection>& selection) {
  if (IsSelf(user_id)) {
    return false;
  }
  auto it = index_.find(user_id);
  if (it == index_.end()) {
    return false;
  }
  auto& entry = *it->second;
  entry.cursor_position = position;
  entry.selection = selection;
  entry.last_seen = std::chrono::steady_clock::now();
  return true;
}

bool PresenceTracker::ApplyTyping(const std::string& user_id, bool is_typing) {
  if (IsSelf(user_id)) {
    return false;
  }
  auto it = index_.find(user_id);
  if (it == index_.end()) {
    return false;
  }
  auto& entry = *it->second;
  auto now = std::chrono::steady_clock::now();
  entry.is_typing = is_typing;
  entry.last_seen = now;
  if (is_typing) {
    entry.typing_refreshed_at = now;
  }
  return true;
}

void PresenceTracker::Clear() {
  entries_.clear();
  index_.clear();
}

std::vector<PresenceEntry> PresenceTracker::Snapshot() const { return Snapshot(std::chrono::steady_clock::now()); }

std::vector<PresenceEntry> PresenceTracker::Snapshot(std::chrono::steady_clock::time_point now) const {
  std::vector<PresenceEntry> out(entries_.begin(), entries_.end());
  ExpireTyping(out, typing_idle_, now);
  return out;
}

}  // namespace client
