#pragma once

#include <stdexcept>
#include <string>

namespace seawatch::util {

/*
  Central error types.

  Store reads throw StoreUnavailable on backend failure; writes report
  through db::Result instead.
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

// Lost a conditional write or a commit to a concurrent writer.
class WriteConflict : public std::runtime_error {
 public:
  explicit WriteConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace seawatch::util
