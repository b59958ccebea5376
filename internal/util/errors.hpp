#pragma once

#include <stdexcept>
#include <string>

namespace chunkcam::util {

/*
  Central error types.

  Queue internals translate these into item state transitions, the recorder
  funnels them to its error callback. Nothing here crosses a timer boundary.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Not enough local space to admit a new recording.
class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Another chunkcam process owns the queue and recordings.
class InstanceLocked : public InvalidState {
 public:
  explicit InstanceLocked(const std::string& msg) : InvalidState(msg) {
  }
};

class AlreadyRecordingError : public InvalidState {
 public:
  explicit AlreadyRecordingError(const std::string& msg) : InvalidState(msg) {
  }
};

// A finalized chunk could not be made durable (move failed, file missing or empty).
class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The capture device could not start or stop a take.
class CaptureError : public std::runtime_error {
 public:
  explicit CaptureError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UploadError : public std::runtime_error {
 public:
  UploadError(const std::string& msg, bool retryable) : std::runtime_error(msg), retryable_(retryable) {
  }

  bool retryable() const {
    return retryable_;
  }

 private:
  bool retryable_;
};

class InvalidSetting : public std::invalid_argument {
 public:
  explicit InvalidSetting(const std::string& msg) : std::invalid_argument(msg) {
  }
};

} // namespace chunkcam::util
