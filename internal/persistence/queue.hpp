#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/persistence/message.hpp"

namespace localdisk::persistence {

/*
  Work queue abstraction with at-least-once delivery.

  A received message is hidden from other readers for the visibility
  timeout. Unless it is deleted with its delete token before that, it
  becomes receivable again with a higher dequeue count.

  No FIFO guarantee.
*/
class Queue {
 public:
  virtual ~Queue() = default;

  virtual void SendMessage(const std::string& message) = 0;

  /*
    Claim up to max_messages visible messages. Messages claimed by a
    concurrent reader in the meantime are skipped, so fewer may come back.
  */
  virtual std::vector<Message> ReceiveMessages(uint32_t max_messages, std::chrono::seconds visibility_timeout) = 0;

  // Throws MessageNotFound if the message is gone or the token is stale.
  virtual void DeleteMessage(const Message& message) = 0;

  virtual void DeleteQueue() = 0;
};

using QueuePtr = std::shared_ptr<Queue>;

} // namespace localdisk::persistence
