/*
 * 설명: 스트랜드 위에서 동작하는 재시작 가능한 유휴 타이머를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/activity_broadcaster_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

namespace client {

using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

class IdleTimer {
 public:
  IdleTimer(const Strand& strand, std::chrono::milliseconds interval);
  ~IdleTimer();

  IdleTimer(const IdleTimer&) = delete;
  IdleTimer& operator=(const IdleTimer&) = delete;

  // Each call cancels the previous countdown; only the latest one may fire.
  void Restart(std::function<void()> on_expire);
  void Restart(std::chrono::milliseconds interval, std::function<void()> on_expire);
  void Cancel();
  bool Armed() const { return state_->armed; }
  std::chrono::milliseconds Interval() const { return interval_; }

 private:
  struct State {
    std::uint64_t generation{0};
    bool armed{false};
  };

  Strand strand_;
  boost::asio::steady_timer timer_;
  std::chrono::milliseconds interval_;
  std::shared_ptr<State> state_;
};

}  // namespace client
