/*
 * 설명: poll 기반으로 입력을 읽어 줄마다 콜백을 호출하고 중단 요청 시 스레드를 합류시킨다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/line_reader_test.cpp
 */
#include "client/line_reader.hpp"

#include <cerrno>

#include <poll.h>
#include <unistd.h>

namespace client {

LineReader::LineReader(int fd, std::function<bool(std::string)> on_line, std::function<void()> on_end,
                       std::chrono::milliseconds poll_interval)
    : fd_(fd), on_line_(std::move(on_line)), on_end_(std::move(on_end)), poll_interval_(poll_interval) {}

LineReader::~LineReader() { Stop(); }

void LineReader::Start() {
  if (thread_.joinable()) {
    return;
  }
  stop_ = false;
  thread_ = std::thread([this]() { Run(); });
}

void LineReader::Stop() {
  stop_ = true;
  if (thread_.joinable()) {
    thread_.join();
  }
}

void LineReader::Run() {
  std::string pending;
  char buffer[4096];
  bool running = true;
  while (running && !stop_.load()) {
    pollfd pfd{fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(poll_interval_.count()));
    if (ready < 0 && errno == EINTR) {
      continue;
    }
    if (ready <= 0) {
      running = ready == 0;
      continue;
    }
    const auto n = ::read(fd_, buffer, sizeof(buffer));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    pending.append(buffer, static_cast<std::size_t>(n));
    for (auto pos = pending.find('\n'); running && pos != std::string::npos; pos = pending.find('\n')) {
      std::string line = pending.substr(0, pos);
      pending.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      running = !on_line_ || on_line_(std::move(line));
    }
  }
  if (on_end_) {
    on_end_();
  }
}

}  // namespace client
