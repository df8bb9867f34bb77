// Ticket: 0007_columnar_store

#include "hurdat-db/src/ColumnarTableStore.hpp"

#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <variant>

#include <spdlog/fmt/fmt.h>

namespace hurdat_db
{

namespace
{

using hurdat_schema::CellValue;
using hurdat_schema::ColumnSpec;
using hurdat_schema::ColumnType;

constexpr std::string_view kSchemaSuffix = "_schema";
constexpr std::string_view kRowIndexColumn = "row_index";

bool isIdentifier(std::string_view name)
{
  if (name.empty())
  {
    return false;
  }
  auto const isAlpha = [](char c)
  { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_'; };
  auto const isDigit = [](char c) { return c >= '0' && c <= '9'; };

  if (!isAlpha(name.front()))
  {
    return false;
  }
  for (char const c : name)
  {
    if (!isAlpha(c) && !isDigit(c))
    {
      return false;
    }
  }
  return true;
}

void requireIdentifier(std::string_view name)
{
  if (!isIdentifier(name))
  {
    throw std::invalid_argument(
      fmt::format("'{}' is not a valid table or column name", name));
  }
}

std::string quote(std::string_view identifier)
{
  return fmt::format("\"{}\"", identifier);
}

std::string_view storageType(ColumnType type)
{
  switch (type)
  {
    case ColumnType::Integer:
    case ColumnType::Timestamp:
      return "INTEGER";
    case ColumnType::Real:
      return "REAL";
    case ColumnType::Text:
      return "TEXT";
  }
  return "TEXT";
}

void bindCell(Database& database,
              sqlite3_stmt* stmt,
              int position,
              const CellValue& cell)
{
  int rc = SQLITE_OK;
  if (std::holds_alternative<std::monostate>(cell))
  {
    rc = sqlite3_bind_null(stmt, position);
  }
  else if (const auto* integer = std::get_if<std::int64_t>(&cell))
  {
    rc = sqlite3_bind_int64(stmt, position, *integer);
  }
  else if (const auto* real = std::get_if<double>(&cell))
  {
    rc = sqlite3_bind_double(stmt, position, *real);
  }
  else
  {
    const auto& text = std::get<std::string>(cell);
    rc = sqlite3_bind_text(stmt,
                           position,
                           text.c_str(),
                           static_cast<int>(text.size()),
                           SQLITE_TRANSIENT);
  }

  if (rc != SQLITE_OK)
  {
    throw std::runtime_error("Failed to bind value: " + database.lastError());
  }
}

CellValue readCell(sqlite3_stmt* stmt, int position, ColumnType type)
{
  if (sqlite3_column_type(stmt, position) == SQLITE_NULL)
  {
    return std::monostate{};
  }

  switch (type)
  {
    case ColumnType::Integer:
    case ColumnType::Timestamp:
      return static_cast<std::int64_t>(sqlite3_column_int64(stmt, position));
    case ColumnType::Real:
      return sqlite3_column_double(stmt, position);
    case ColumnType::Text:
      break;
  }

  const auto* text =
    reinterpret_cast<const char*>(sqlite3_column_text(stmt, position));
  int const size = sqlite3_column_bytes(stmt, position);
  return std::string(text, static_cast<std::size_t>(size));
}

}  // namespace

ColumnarTableStore::ColumnarTableStore(Database& database)
  : database_{database}
{
}

void ColumnarTableStore::write(const std::string& name,
                               const hurdat_schema::ColumnarTable& table)
{
  requireIdentifier(name);
  for (const auto& spec : table.schema())
  {
    requireIdentifier(spec.name);
    if (spec.name == kRowIndexColumn)
    {
      throw std::invalid_argument("Column name 'row_index' is reserved");
    }
  }

  std::string const schemaName = name + std::string{kSchemaSuffix};

  database_.withTransaction(
    [&]()
    {
      database_.execute("DROP TABLE IF EXISTS " + quote(name) + ";");
      database_.execute("DROP TABLE IF EXISTS " + quote(schemaName) + ";");

      database_.execute("CREATE TABLE " + quote(schemaName) +
                        " (position INTEGER PRIMARY KEY, name TEXT NOT NULL, "
                        "type TEXT NOT NULL, nullable INTEGER NOT NULL);");

      std::string createSql = "CREATE TABLE " + quote(name) + " (" +
                              std::string{kRowIndexColumn} +
                              " INTEGER PRIMARY KEY";
      std::string insertColumns = std::string{kRowIndexColumn};
      std::string placeholders = "?";
      for (const auto& spec : table.schema())
      {
        createSql += ", " + quote(spec.name) + " " +
                     std::string{storageType(spec.type)};
        if (!spec.nullable)
        {
          createSql += " NOT NULL";
        }
        insertColumns += ", " + quote(spec.name);
        placeholders += ", ?";
      }
      createSql += ");";
      database_.execute(createSql);

      auto schemaInsert = database_.prepare(
        "INSERT INTO " + quote(schemaName) +
        " (position, name, type, nullable) VALUES (?, ?, ?, ?);");
      for (std::size_t i = 0; i < table.columnCount(); ++i)
      {
        const auto& spec = table.schema()[i];
        sqlite3_reset(schemaInsert.get());
        bindCell(database_, schemaInsert.get(), 1, static_cast<std::int64_t>(i));
        bindCell(database_, schemaInsert.get(), 2, spec.name);
        bindCell(database_,
                 schemaInsert.get(),
                 3,
                 std::string{hurdat_schema::toString(spec.type)});
        bindCell(database_,
                 schemaInsert.get(),
                 4,
                 static_cast<std::int64_t>(spec.nullable ? 1 : 0));
        if (sqlite3_step(schemaInsert.get()) != SQLITE_DONE)
        {
          throw std::runtime_error("Failed to write schema row: " +
                                   database_.lastError());
        }
      }

      auto rowInsert = database_.prepare("INSERT INTO " + quote(name) + " (" +
                                         insertColumns + ") VALUES (" +
                                         placeholders + ");");
      for (std::size_t r = 0; r < table.rowCount(); ++r)
      {
        sqlite3_reset(rowInsert.get());
        bindCell(database_, rowInsert.get(), 1, static_cast<std::int64_t>(r));
        for (std::size_t c = 0; c < table.columnCount(); ++c)
        {
          bindCell(database_,
                   rowInsert.get(),
                   static_cast<int>(c) + 2,
                   table.column(c)[r]);
        }
        if (sqlite3_step(rowInsert.get()) != SQLITE_DONE)
        {
          throw std::runtime_error(fmt::format(
            "Failed to write row {}: {}", r, database_.lastError()));
        }
      }
    });

  database_.getLogger()->info("Wrote {} rows x {} columns to table {}",
                              table.rowCount(),
                              table.columnCount(),
                              name);
}

std::vector<ColumnSpec> ColumnarTableStore::readSchema(const std::string& name)
{
  requireIdentifier(name);
  if (!exists(name))
  {
    throw std::runtime_error("No stored table named " + name);
  }

  auto stmt = database_.prepare("SELECT name, type, nullable FROM " +
                                quote(name + std::string{kSchemaSuffix}) +
                                " ORDER BY position;");

  std::vector<ColumnSpec> schema;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
  {
    const auto* columnName =
      reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
    const auto* typeName =
      reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1));
    if (!columnName || !typeName)
    {
      throw std::runtime_error("Corrupt schema row in " + name);
    }

    auto const type = hurdat_schema::parseColumnType(typeName);
    if (!type)
    {
      throw std::runtime_error(
        fmt::format("Unknown column type '{}' in schema of {}", typeName, name));
    }

    schema.push_back(
      ColumnSpec{columnName, *type, sqlite3_column_int(stmt.get(), 2) != 0});
  }

  if (rc != SQLITE_DONE)
  {
    throw std::runtime_error("Failed to read schema: " + database_.lastError());
  }
  return schema;
}

hurdat_schema::ColumnarTable ColumnarTableStore::read(const std::string& name)
{
  auto schema = readSchema(name);

  std::string columns;
  for (const auto& spec : schema)
  {
    if (!columns.empty())
    {
      columns += ", ";
    }
    columns += quote(spec.name);
  }

  // A table pruned down to no columns still carries its row count
  if (columns.empty())
  {
    columns = std::string{kRowIndexColumn};
  }

  hurdat_schema::ColumnarTable table{schema};
  auto stmt = database_.prepare("SELECT " + columns + " FROM " + quote(name) +
                                " ORDER BY " + std::string{kRowIndexColumn} +
                                ";");

  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
  {
    std::vector<CellValue> row;
    row.reserve(schema.size());
    for (std::size_t c = 0; c < schema.size(); ++c)
    {
      row.push_back(readCell(stmt.get(), static_cast<int>(c), schema[c].type));
    }
    table.appendRow(std::move(row));
  }

  if (rc != SQLITE_DONE)
  {
    throw std::runtime_error("Failed to read rows: " + database_.lastError());
  }

  database_.getLogger()->info("Read {} rows x {} columns from table {}",
                              table.rowCount(),
                              table.columnCount(),
                              name);
  return table;
}

bool ColumnarTableStore::exists(const std::string& name)
{
  requireIdentifier(name);

  auto stmt = database_.prepare(
    "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name IN (?, ?);");
  bindCell(database_, stmt.get(), 1, name);
  bindCell(database_, stmt.get(), 2, name + std::string{kSchemaSuffix});

  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
  {
    throw std::runtime_error("Failed to query sqlite_master: " +
                             database_.lastError());
  }
  return sqlite3_column_int(stmt.get(), 0) == 2;
}

}  // namespace hurdat_db
