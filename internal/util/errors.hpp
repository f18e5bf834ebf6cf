#pragma once

#include <stdexcept>
#include <string>

namespace localdisk::util {

/*
  Central error types.

  Everything a Blob/Queue caller can observe is one of these,
  RaceLost stays internal to the stores.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LeaseConflict : public std::runtime_error {
 public:
  explicit LeaseConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A lease id was presented but no lease exists for the blob.
class LeaseNotFound : public std::runtime_error {
 public:
  explicit LeaseNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Acknowledgement with an unknown id or a stale delete token.
class MessageNotFound : public std::runtime_error {
 public:
  explicit MessageNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  A concurrent actor changed shared state between our read and our write.
  Thrown by an attempt passed to RetryOnRace, never surfaced on purpose.
*/
class RaceLost : public std::runtime_error {
 public:
  explicit RaceLost(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace localdisk::util
