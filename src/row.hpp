#pragma once

#include <stddef.h>

#include <concepts>
#include <format>
#include <initializer_list>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace mdtable {

// Number of code points in a UTF-8 string. Cells are padded by this count,
// not by rendered terminal width.
size_t text_length(std::string_view text);

class Row {
 public:
  Row() = default;
  explicit Row(std::vector<std::string> cells) : cells_(std::move(cells)) {}
  Row(std::initializer_list<std::string> cells) : cells_(cells) {}

  size_t size() const { return cells_.size(); }
  const std::string &at(size_t column) const { return cells_.at(column); }
  const std::vector<std::string> &cells() const { return cells_; }

  // Length of the cell at `column` in code points.
  size_t cell_length(size_t column) const;

  bool operator==(const Row &) const = default;

 private:
  std::vector<std::string> cells_;
};

// A value with a default text conversion through std::format.
template <typename T>
concept displayable =
    std::default_initializable<std::formatter<std::remove_cvref_t<T>, char>>;

// A range of displayable values. Strings are cells, not ranges of characters.
template <typename R>
concept displayable_range =
    std::ranges::input_range<const R> &&
    !std::convertible_to<const R &, std::string_view> &&
    displayable<std::ranges::range_reference_t<const R>>;

// A caller type mapped to a row by an ADL-visible `to_row` function:
//
//   Row to_row(const User &user) {
//     return Row{user.name, std::to_string(user.age)};
//   }
template <typename T>
concept has_to_row = requires(const T &value) {
  { to_row(value) } -> std::convertible_to<Row>;
};

template <typename T>
concept row_like = std::same_as<std::remove_cvref_t<T>, Row> ||
                   has_to_row<std::remove_cvref_t<T>> ||
                   displayable_range<std::remove_cvref_t<T>>;

template <typename R>
concept row_range =
    std::ranges::input_range<const R> &&
    row_like<std::ranges::range_reference_t<const R>>;

template <row_like T>
Row make_row(const T &value) {
  if constexpr (std::same_as<T, Row>) {
    return value;
  } else if constexpr (has_to_row<T>) {
    return Row(to_row(value));
  } else {
    std::vector<std::string> cells;
    if constexpr (std::ranges::sized_range<const T>) {
      cells.reserve(std::ranges::size(value));
    }
    for (const auto &element : value) {
      cells.push_back(std::format("{}", element));
    }
    return Row(std::move(cells));
  }
}

}  // namespace mdtable
