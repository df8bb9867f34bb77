// Ticket: 0005_columnar_dataset

#include "hurdat-schema/src/ColumnarTable.hpp"

#include <stdexcept>
#include <unordered_set>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace hurdat_schema
{

std::string_view toString(ColumnType type)
{
  switch (type)
  {
    case ColumnType::Integer:
      return "INTEGER";
    case ColumnType::Real:
      return "REAL";
    case ColumnType::Text:
      return "TEXT";
    case ColumnType::Timestamp:
      return "TIMESTAMP";
  }
  return "TEXT";
}

std::optional<ColumnType> parseColumnType(std::string_view name)
{
  for (auto const type : {ColumnType::Integer,
                          ColumnType::Real,
                          ColumnType::Text,
                          ColumnType::Timestamp})
  {
    if (toString(type) == name)
    {
      return type;
    }
  }
  return std::nullopt;
}

bool holdsType(const CellValue& cell, ColumnType type)
{
  switch (type)
  {
    case ColumnType::Integer:
    case ColumnType::Timestamp:
      return std::holds_alternative<std::int64_t>(cell);
    case ColumnType::Real:
      return std::holds_alternative<double>(cell);
    case ColumnType::Text:
      return std::holds_alternative<std::string>(cell);
  }
  return false;
}

ColumnarTable::ColumnarTable(std::vector<ColumnSpec> schema)
  : schema_{std::move(schema)}, columns_(schema_.size())
{
  std::unordered_set<std::string> names;
  for (const auto& spec : schema_)
  {
    if (spec.name.empty())
    {
      throw std::invalid_argument("Column name must not be empty");
    }
    if (!names.insert(spec.name).second)
    {
      throw std::invalid_argument("Duplicate column name: " + spec.name);
    }
  }
}

void ColumnarTable::appendRow(std::vector<CellValue> row)
{
  if (row.size() != schema_.size())
  {
    throw std::invalid_argument(
      fmt::format("Row has {} cells, schema declares {} columns",
                  row.size(),
                  schema_.size()));
  }

  for (std::size_t i = 0; i < row.size(); ++i)
  {
    const auto& spec = schema_[i];
    if (std::holds_alternative<std::monostate>(row[i]))
    {
      if (!spec.nullable)
      {
        throw std::invalid_argument(
          fmt::format("Missing value in non-nullable column '{}'", spec.name));
      }
      continue;
    }
    if (!holdsType(row[i], spec.type))
    {
      throw std::invalid_argument(
        fmt::format("Value in column '{}' is not of type {}",
                    spec.name,
                    toString(spec.type)));
    }
  }

  for (std::size_t i = 0; i < row.size(); ++i)
  {
    columns_[i].push_back(std::move(row[i]));
  }
  ++rowCount_;
}

std::optional<std::size_t> ColumnarTable::columnIndex(
  std::string_view name) const
{
  for (std::size_t i = 0; i < schema_.size(); ++i)
  {
    if (schema_[i].name == name)
    {
      return i;
    }
  }
  return std::nullopt;
}

const std::vector<CellValue>& ColumnarTable::column(std::string_view name) const
{
  auto const index = columnIndex(name);
  if (!index)
  {
    throw std::out_of_range("No column named " + std::string{name});
  }
  return columns_[*index];
}

const std::vector<CellValue>& ColumnarTable::column(std::size_t index) const
{
  return columns_.at(index);
}

std::vector<CellValue> ColumnarTable::row(std::size_t index) const
{
  if (index >= rowCount_)
  {
    throw std::out_of_range(
      fmt::format("Row {} out of range ({} rows)", index, rowCount_));
  }

  std::vector<CellValue> cells;
  cells.reserve(columns_.size());
  for (const auto& column : columns_)
  {
    cells.push_back(column[index]);
  }
  return cells;
}

}  // namespace hurdat_schema
