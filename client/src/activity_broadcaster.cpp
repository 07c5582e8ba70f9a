/*
 * 설명: 첫 입력에서 타이핑 시작을 보내고 유휴 시간 경과 후 타이핑 종료를 보낸다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/activity_broadcaster_test.cpp
 */
#include "client/activity_broadcaster.hpp"

namespace client {

ActivityBroadcaster::ActivityBroadcaster(const Strand& strand, std::chrono::milliseconds typing_idle,
                                         ActivitySinks sinks)
    : typing_timer_(strand, typing_idle), sinks_(std::move(sinks)) {}

void ActivityBroadcaster::OnContentChanged(const std::string& content) {
  if (!typing_) {
    typing_ = true;
    if (sinks_.on_typing) {
      sinks_.on_typing(true);
    }
  }
  typing_timer_.Restart([this]() { OnTypingIdle(); });
  if (sinks_.on_content) {
    sinks_.on_content(content);
  }
}

void ActivityBroadcaster::OnSelectionChanged(const Selection& selection) {
  if (sinks_.on_selection) {
    sinks_.on_selection(selection);
  }
}

void ActivityBroadcaster::Reset() {
  typing_timer_.Cancel();
  typing_ = false;
}

void ActivityBroadcaster::OnTypingIdle() {
  if (!typing_) {
    return;
  }
  typing_ = false;
  if (sinks_.on_typing) {
    sinks_.on_typing(false);
  }
}

}  // namespace client
