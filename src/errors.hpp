#pragma once

#include <stddef.h>

#include <stdexcept>
#include <string>

namespace mdtable {

class Error : public std::runtime_error {
 public:
  explicit Error(const std::string &message) : std::runtime_error(message) {}
};

// A row does not have the table's established width.
class InvalidRowLength : public Error {
 public:
  InvalidRowLength(size_t expected, size_t actual);

  size_t expected() const { return expected_; }
  size_t actual() const { return actual_; }

 private:
  size_t expected_;
  size_t actual_;
};

// A table was created with neither a header nor any rows, so it has no width.
class NoRowsSpecified : public Error {
 public:
  NoRowsSpecified();
};

}  // namespace mdtable
