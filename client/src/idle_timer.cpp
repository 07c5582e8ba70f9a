/*
 * 설명: 세대 번호로 취소된 만료 콜백을 무시하는 유휴 타이머를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/activity_broadcaster_test.cpp
 */
#include "client/idle_timer.hpp"

#include <boost/asio/bind_executor.hpp>

namespace client {

IdleTimer::IdleTimer(const Strand& strand, std::chrono::milliseconds interval)
    : strand_(strand), timer_(strand), interval_(interval), state_(std::make_shared<State>()) {}

IdleTimer::~IdleTimer() {
  ++state_->generation;
  state_->armed = false;
}

void IdleTimer::Restart(std::function<void()> on_expire) { Restart(interval_, std::move(on_expire)); }

void IdleTimer::Restart(std::chrono::milliseconds interval, std::function<void()> on_expire) {
  const auto generation = ++state_->generation;
  state_->armed = true;
  timer_.expires_after(interval);
  timer_.async_wait(boost::asio::bind_executor(
      strand_, [state = state_, generation, on_expire = std::move(on_expire)](const boost::system::error_code& ec) {
        if (ec || state->generation != generation) {
          return;
        }
        state->armed = false;
        on_expire();
      }));
}

void IdleTimer::Cancel() {
  ++state_->generation;
  state_->armed = false;
  timer_.cancel();
}

}  // namespace client
