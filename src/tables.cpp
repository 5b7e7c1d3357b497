#include "tables.hpp"

#include <assert.h>

#include <algorithm>
#include <format>

#include "errors.hpp"
#include "log.hpp"

namespace mdtable {

namespace {

void append_cell(std::string &res, std::string_view text, size_t width) {
  res.append("| ");
  res.append(text);
  res.append(1 + width - text_length(text), ' ');
}

void append_row(std::string &res, const Row &row,
                const std::vector<size_t> &widths) {
  assert(row.size() == widths.size() ||
         log(std::format("row of {} cells in table of width {}", row.size(),
                         widths.size())));
  for (size_t i = 0; i < widths.size(); i++) {
    append_cell(res, row.at(i), widths.at(i));
  }
  res.append("|\n");
}

}  // namespace

Table::Table(std::optional<Row> header, std::vector<Row> rows)
    : header_(std::move(header)), rows_(std::move(rows)) {
  if (header_) {
    width_ = header_->size();
  } else if (!rows_.empty()) {
    width_ = rows_.front().size();
  } else {
    log("table without header and rows");
    throw NoRowsSpecified();
  }
  for (const auto &row : rows_) {
    validate_row_length(row);
  }
  log(std::format("create table: {} columns, {} rows", width_, rows_.size()));
}

void Table::add_row(Row row) {
  validate_row_length(row);
  rows_.push_back(std::move(row));
}

void Table::validate_row_length(const Row &row) const {
  if (row.size() != width_) {
    log(std::format("reject row: expected {} cells, got {}", width_,
                    row.size()));
    throw InvalidRowLength(width_, row.size());
  }
}

std::optional<size_t> Table::column_width(size_t column) const {
  if (column >= width_) {
    return std::nullopt;
  }
  size_t res = header_ ? header_->cell_length(column) : 0;
  for (const auto &row : rows_) {
    res = std::max(res, row.cell_length(column));
  }
  return res;
}

std::vector<size_t> Table::column_widths() const {
  std::vector<size_t> widths(width_, 0);
  if (header_) {
    for (size_t i = 0; i < width_; i++) {
      widths.at(i) = header_->cell_length(i);
    }
  }
  for (const auto &row : rows_) {
    for (size_t i = 0; i < width_; i++) {
      widths.at(i) = std::max(widths.at(i), row.cell_length(i));
    }
  }
  return widths;
}

std::string Table::to_string() const {
  auto widths = column_widths();
  std::string res;
  if (header_) {
    append_row(res, *header_, widths);
    for (size_t w : widths) {
      append_cell(res, std::string(w, '-'), w);
    }
    res.append("|\n");
  }
  for (const auto &row : rows_) {
    append_row(res, row, widths);
  }
  return res;
}

std::ostream &operator<<(std::ostream &out, const Table &table) {
  return out << table.to_string();
}

}  // namespace mdtable
