#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace localdisk::persistence {

/*
  Snapshot of one queue entry at claim time.

  Produced only by Queue::ReceiveMessages, consumed by Queue::DeleteMessage.
  delete_token is the proof of the claim; it goes stale as soon as the
  visibility timeout lapses and another reader claims the entry.
*/
struct Message {
  std::string     message_id;
  std::string     content;
  std::string     delete_token;
  util::TimePoint visibility_timeout;
  int64_t         dequeue_count = 0;
};

} // namespace localdisk::persistence
