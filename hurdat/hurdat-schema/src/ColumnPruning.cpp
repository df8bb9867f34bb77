// Ticket: 0006_uninformative_columns

#include "hurdat-schema/src/ColumnPruning.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace hurdat_schema
{

std::vector<std::string> findUninformativeColumns(const ColumnarTable& table)
{
  std::vector<std::string> names;
  if (table.rowCount() == 0)
  {
    return names;
  }

  for (std::size_t i = 0; i < table.columnCount(); ++i)
  {
    const auto& cells = table.column(i);
    const auto& first = cells.front();
    bool const constant = std::all_of(cells.begin(),
                                      cells.end(),
                                      [&first](const CellValue& cell)
                                      { return cell == first; });
    if (constant)
    {
      names.push_back(table.schema()[i].name);
    }
  }
  return names;
}

ColumnarTable dropColumns(const ColumnarTable& table,
                          std::span<const std::string> names)
{
  std::set<std::size_t> dropped;
  for (const auto& name : names)
  {
    auto const index = table.columnIndex(name);
    if (!index)
    {
      throw std::out_of_range("Cannot drop unknown column " + name);
    }
    dropped.insert(*index);
  }

  std::vector<std::size_t> kept;
  std::vector<ColumnSpec> schema;
  for (std::size_t i = 0; i < table.columnCount(); ++i)
  {
    if (!dropped.contains(i))
    {
      kept.push_back(i);
      schema.push_back(table.schema()[i]);
    }
  }

  ColumnarTable result{std::move(schema)};
  for (std::size_t r = 0; r < table.rowCount(); ++r)
  {
    std::vector<CellValue> row;
    row.reserve(kept.size());
    for (auto const i : kept)
    {
      row.push_back(table.column(i)[r]);
    }
    result.appendRow(std::move(row));
  }
  return result;
}

}  // namespace hurdat_schema
