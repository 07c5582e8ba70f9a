/*
 * 설명: 파일 디스크립터에서 줄 단위 입력을 읽는 중단 가능한 리더 스레드.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/line_reader_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace client {

// The reader thread polls with a bounded wait, so Stop() always joins it.
class LineReader {
 public:
  // on_line returns false to stop reading. on_end runs once when the thread finishes.
  LineReader(int fd, std::function<bool(std::string)> on_line, std::function<void()> on_end,
             std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
  ~LineReader();

  LineReader(const LineReader&) = delete;
  LineReader& operator=(const LineReader&) = delete;

  void Start();
  void Stop();

 private:
  void Run();

  int fd_;
  std::function<bool(std::string)> on_line_;
  std::function<void()> on_end_;
  std::chrono::milliseconds poll_interval_;
  std::atomic<bool> stop_{false};
  std::thread thread_;
};

}  // namespace client
