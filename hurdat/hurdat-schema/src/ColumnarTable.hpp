// Ticket: 0005_columnar_dataset

#ifndef HURDAT_SCHEMA_COLUMNAR_TABLE_HPP
#define HURDAT_SCHEMA_COLUMNAR_TABLE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hurdat_schema
{

enum class ColumnType
{
  Integer,    // 64-bit signed
  Real,       // IEEE double
  Text,       // UTF-8
  Timestamp,  // UTC seconds since 1970-01-01, held as a 64-bit integer
};

[[nodiscard]] std::string_view toString(ColumnType type);

[[nodiscard]] std::optional<ColumnType> parseColumnType(std::string_view name);

/**
 * @brief Declared name, type and nullability of one column
 */
struct ColumnSpec
{
  std::string name;
  ColumnType type{ColumnType::Text};
  bool nullable{false};

  bool operator==(const ColumnSpec&) const = default;
};

/**
 * @brief One cell. std::monostate is the missing marker.
 *
 * Integer and Timestamp columns hold int64_t, Real columns double and Text
 * columns std::string.
 */
using CellValue = std::variant<std::monostate, std::int64_t, double, std::string>;

/**
 * @brief Ordered, column-major table with a declared schema
 *
 * Every appended row is checked against the schema: one cell per column,
 * the alternative matching the column type, and missing cells only in
 * nullable columns. Row order is insertion order.
 *
 * @ticket 0005_columnar_dataset
 */
class ColumnarTable
{
public:
  /**
   * @throws std::invalid_argument on an empty or duplicate column name
   */
  explicit ColumnarTable(std::vector<ColumnSpec> schema);

  /**
   * @throws std::invalid_argument if the row does not fit the schema
   */
  void appendRow(std::vector<CellValue> row);

  [[nodiscard]] const std::vector<ColumnSpec>& schema() const
  {
    return schema_;
  }

  [[nodiscard]] std::size_t rowCount() const
  {
    return rowCount_;
  }

  [[nodiscard]] std::size_t columnCount() const
  {
    return schema_.size();
  }

  [[nodiscard]] std::optional<std::size_t> columnIndex(
    std::string_view name) const;

  /**
   * @throws std::out_of_range for an unknown column
   */
  [[nodiscard]] const std::vector<CellValue>& column(
    std::string_view name) const;

  [[nodiscard]] const std::vector<CellValue>& column(std::size_t index) const;

  [[nodiscard]] std::vector<CellValue> row(std::size_t index) const;

  bool operator==(const ColumnarTable&) const = default;

private:
  std::vector<ColumnSpec> schema_;
  std::vector<std::vector<CellValue>> columns_;
  std::size_t rowCount_{0};
};

/**
 * @brief Whether a non-missing cell holds the alternative a column type needs
 */
[[nodiscard]] bool holdsType(const CellValue& cell, ColumnType type);

}  // namespace hurdat_schema

#endif  // HURDAT_SCHEMA_COLUMNAR_TABLE_HPP
