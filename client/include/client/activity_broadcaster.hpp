/*
 * 설명: 로컬 편집/선택 변화를 관찰하여 타이핑 상태와 변경 신호를 내보낸다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/activity_broadcaster_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "client/idle_timer.hpp"
#include "client/presence.hpp"

namespace client {

struct ActivitySinks {
  std::function<void(bool)> on_typing;
  std::function<void(const std::string&)> on_content;
  std::function<void(const Selection&)> on_selection;
};

// Must be driven from the strand it was constructed with.
class ActivityBroadcaster {
 public:
  ActivityBroadcaster(const Strand& strand, std::chrono::milliseconds typing_idle, ActivitySinks sinks);

  void OnContentChanged(const std::string& content);
  void OnSelectionChanged(const Selection& selection);
  void Reset();

  bool IsTyping() const { return typing_; }

 private:
  void OnTypingIdle();

  IdleTimer typing_timer_;
  ActivitySinks sinks_;
  bool typing_{false};
};

}  // namespace client
