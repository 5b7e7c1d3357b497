#pragma once

#include <stddef.h>

#include <concepts>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "row.hpp"

namespace mdtable {

// A markdown table: an optional header followed by data rows, all of the same
// width. The width is fixed on construction: the header's cell count, or the
// first row's when there is no header.
//
//   Table t({"Name", "Age"}, {{"Jessica", "28"}, {"Dennis", "22"}});
//   t.add_row({"Ann", "31"});
//   std::cout << t;
//
// Constructors and add_row throw InvalidRowLength on a row of the wrong width.
class Table {
 public:
  // Throws NoRowsSpecified when there is neither a header nor a row.
  Table(std::optional<Row> header, std::vector<Row> rows);
  Table(Row header, std::vector<Row> rows)
      : Table(std::optional<Row>(std::move(header)), std::move(rows)) {}

  template <row_range Rows>
    requires(!std::same_as<Rows, std::vector<Row>>)
  Table(std::optional<Row> header, const Rows &rows)
      : Table(std::move(header), make_rows(rows)) {}

  // Appends a row. On error the table is left unchanged.
  void add_row(Row row);

  template <row_like T>
    requires(!std::same_as<T, Row>)
  void add_row(const T &row) {
    add_row(make_row(row));
  }

  const std::optional<Row> &header() const { return header_; }
  const std::vector<Row> &rows() const { return rows_; }
  size_t row_count() const { return rows_.size(); }
  size_t width() const { return width_; }

  // Padding width of a column, or nullopt if `column` is out of range.
  std::optional<size_t> column_width(size_t column) const;

  std::string to_string() const;

 private:
  std::optional<Row> header_;
  std::vector<Row> rows_;
  size_t width_;

  template <row_range Rows>
  static std::vector<Row> make_rows(const Rows &rows) {
    std::vector<Row> res;
    for (const auto &row : rows) {
      res.push_back(make_row(row));
    }
    return res;
  }

  void validate_row_length(const Row &row) const;
  std::vector<size_t> column_widths() const;
};

std::ostream &operator<<(std::ostream &out, const Table &table);

}  // namespace mdtable
