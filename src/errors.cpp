#include "errors.hpp"

#include <format>

namespace mdtable {

InvalidRowLength::InvalidRowLength(size_t expected, size_t actual)
    : Error(std::format("Invalid row length, expected {} got {}.", expected,
                        actual)),
      expected_(expected), actual_(actual) {}

NoRowsSpecified::NoRowsSpecified()
    : Error("Length of rows must be at least 1 when creating a table.") {}

}  // namespace mdtable
