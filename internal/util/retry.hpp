#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace localdisk::util {

/*
  Optimistic concurrency helper.

  An attempt snapshots shared state, decides, and writes. When it notices
  that another actor got in between (a file vanished, a row moved on) it
  throws RaceLost and the whole attempt is run again after a backoff.

  max_attempts == 0 retries forever. Once the budget is spent the last
  RaceLost propagates.
*/
struct RetryPolicy {
  std::chrono::milliseconds backoff{100};
  uint32_t                  max_attempts = 0;
};

template <typename Attempt>
auto RetryOnRace(const RetryPolicy& policy, std::string_view what, Attempt&& attempt) -> decltype(attempt()) {
  for (uint32_t tries = 1;; ++tries) {
    try {
      return attempt();
    } catch (const RaceLost& e) {
      if (policy.max_attempts != 0 && tries >= policy.max_attempts) {
        throw;
      }
      LOCALDISK_LOG_DEBUG("Lost race, retrying",
                          {observability::StringField("operation", what), observability::StringField("reason", e.what()),
                           observability::IntField("attempt", tries)});
    }
    std::this_thread::sleep_for(policy.backoff);
  }
}

} // namespace localdisk::util
