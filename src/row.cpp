#include "row.hpp"

#include <algorithm>

namespace mdtable {

size_t text_length(std::string_view text) {
  // UTF-8 continuation bytes look like 10xxxxxx.
  return static_cast<size_t>(std::ranges::count_if(text, [](char c) {
    return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
  }));
}

size_t Row::cell_length(size_t column) const {
  return text_length(cells_.at(column));
}

}  // namespace mdtable
