// Ticket: 0007_columnar_store

#ifndef HURDAT_DB_COLUMNAR_TABLE_STORE_HPP
#define HURDAT_DB_COLUMNAR_TABLE_STORE_HPP

#include <string>
#include <vector>

#include "hurdat-db/src/Database.hpp"
#include "hurdat-schema/src/ColumnarTable.hpp"

namespace hurdat_db
{

/**
 * @brief Persists ColumnarTables to SQLite with their declared schema
 *
 * write() produces two tables:
 * - `<name>` with an explicit `row_index` primary key followed by one
 *   column per ColumnSpec (NOT NULL where the spec is not nullable)
 * - `<name>_schema` listing (position, name, type, nullable)
 *
 * read() rebuilds the schema from `<name>_schema` and returns rows ordered by
 * row_index, so a written table reads back equal: same column order, types,
 * nulls and bit-identical doubles.
 *
 * The store borrows the Database; the Database must outlive it.
 *
 * @ticket 0007_columnar_store
 */
class ColumnarTableStore
{
public:
  explicit ColumnarTableStore(Database& database);

  /**
   * @brief Replace `<name>` and `<name>_schema` with the table contents
   *
   * Runs in a single transaction.
   *
   * @throws std::invalid_argument if the name is not a plain identifier
   * @throws std::runtime_error on any SQLite failure (nothing is written)
   */
  void write(const std::string& name, const hurdat_schema::ColumnarTable& table);

  /**
   * @throws std::runtime_error if the table or its schema is missing or the
   *         stored schema is not readable
   */
  [[nodiscard]] hurdat_schema::ColumnarTable read(const std::string& name);

  [[nodiscard]] std::vector<hurdat_schema::ColumnSpec> readSchema(
    const std::string& name);

  [[nodiscard]] bool exists(const std::string& name);

private:
  Database& database_;
};

}  // namespace hurdat_db

#endif  // HURDAT_DB_COLUMNAR_TABLE_STORE_HPP
