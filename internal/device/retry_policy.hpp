#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

namespace fieldgate::device {

// Injected so retry timing can be driven without real sleeps.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper ThreadSleeper() {
  return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

/*
  Read retry:
    attempt 1 runs immediately, every further attempt waits `delay`.
    max_attempts counts all attempts, not only retries.
*/
struct ReadRetryPolicy {
  uint32_t                  max_attempts = 2;
  std::chrono::milliseconds delay{2000};
};

/*
  Reconnect:
    once consecutive errors reach error_threshold the link is torn down and
    rebuilt before the next read; at most max_attempts connects per
    reconnect, each preceded by `backoff`.
*/
struct ReconnectPolicy {
  uint32_t                  max_attempts = 3;
  std::chrono::milliseconds backoff{1000};
  uint32_t                  error_threshold = 3;
};

} // namespace fieldgate::device
