// Ticket: 0006_uninformative_columns

#ifndef HURDAT_SCHEMA_COLUMN_PRUNING_HPP
#define HURDAT_SCHEMA_COLUMN_PRUNING_HPP

#include <span>
#include <string>
#include <vector>

#include "hurdat-schema/src/ColumnarTable.hpp"

namespace hurdat_schema
{

/**
 * @brief Names of columns holding at most one distinct value
 *
 * Dataset-level analysis, separate from parsing: on a file covering a single
 * basin this flags "basin". Missing counts as a value of its own. A table
 * without rows flags nothing.
 */
[[nodiscard]] std::vector<std::string> findUninformativeColumns(
  const ColumnarTable& table);

/**
 * @brief Copy of the table without the named columns
 *
 * @throws std::out_of_range if a name is not a column of the table
 */
[[nodiscard]] ColumnarTable dropColumns(const ColumnarTable& table,
                                        std::span<const std::string> names);

}  // namespace hurdat_schema

#endif  // HURDAT_SCHEMA_COLUMN_PRUNING_HPP
