// Ticket: 0007_columnar_store

#ifndef HURDAT_DB_DATABASE_HPP
#define HURDAT_DB_DATABASE_HPP

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace hurdat_db
{

/*!
 * @brief Flags passed to sqlite3_open_v2
 */
enum class DBOpenCondition : int
{
  OpenReadOnly = SQLITE_OPEN_READONLY,
  OpenReadWrite = SQLITE_OPEN_READWRITE,
  OpenCreate = SQLITE_OPEN_CREATE | SQLITE_OPEN_READWRITE,
};

/**
 * @brief Finalizes a prepared statement when it goes out of scope
 */
struct StatementDeleter
{
  void operator()(sqlite3_stmt* stmt) const
  {
    if (stmt)
    {
      sqlite3_finalize(stmt);
    }
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/**
 * @brief Owning SQLite connection that reports through an injected logger
 *
 * Two calling conventions coexist: executeQuery() and the transaction
 * primitives return false and log, while prepare(), execute() and
 * withTransaction() throw std::runtime_error carrying the SQLite message.
 */
class Database
{
public:
  /**
   * @brief Open (or create) the database at dbUrl
   *
   * @param dbUrl Path to the SQLite file, or ":memory:"
   * @param logger Receives connection and SQL diagnostics, must not be null
   * @param openCond Open flags
   * @throws std::invalid_argument if logger is null
   * @throws std::runtime_error if SQLite cannot open the file
   */
  Database(std::string dbUrl,
           std::shared_ptr<spdlog::logger> logger,
           DBOpenCondition openCond = DBOpenCondition::OpenReadWrite);

  ~Database();

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  Database(Database&& other) noexcept;
  Database& operator=(Database&& other) noexcept;

  sqlite3* getRawDb() const
  {
    return handle_.get();
  }

  /**
   * @brief Run one or more SQL statements without result rows
   *
   * @return false on failure, after logging the SQLite message
   */
  bool executeQuery(const std::string& query);

  /**
   * @brief executeQuery() that throws instead of returning false
   *
   * @throws std::runtime_error on failure
   */
  void execute(const std::string& query);

  /**
   * @brief Compile a single statement for binding and stepping
   *
   * @throws std::runtime_error if SQLite rejects the statement
   */
  [[nodiscard]] Statement prepare(const std::string& sql);

  bool beginTransaction();
  bool commitTransaction();
  bool rollbackTransaction();

  /**
   * @brief Run fn between BEGIN and COMMIT
   *
   * An exception from fn rolls the transaction back and propagates.
   *
   * @throws std::runtime_error if BEGIN or COMMIT fails
   */
  template <typename Fn>
  void withTransaction(Fn&& fn)
  {
    if (!beginTransaction())
    {
      throw std::runtime_error("Failed to begin transaction on " + dbUrl_ +
                               ": " + lastError());
    }

    try
    {
      fn();
    }
    catch (...)
    {
      abandonTransaction();
      throw;
    }

    if (!commitTransaction())
    {
      std::string const reason = lastError();
      abandonTransaction();
      throw std::runtime_error("Failed to commit transaction on " + dbUrl_ +
                               ": " + reason);
    }
  }

  /**
   * @brief Message of the most recent SQLite failure on this connection
   */
  std::string lastError() const;

  std::shared_ptr<spdlog::logger> getLogger() const
  {
    return logger_;
  }

  const std::string& getUrl() const
  {
    return dbUrl_;
  }

private:
  struct ConnectionCloser
  {
    void operator()(sqlite3* db) const
    {
      if (db)
      {
        sqlite3_close(db);
      }
    }
  };

  using Handle = std::unique_ptr<sqlite3, ConnectionCloser>;

  static Handle openHandle(const std::string& dbUrl,
                           DBOpenCondition openCond,
                           spdlog::logger& logger);

  // Rollback after a failed body or commit; failure here is only logged
  void abandonTransaction();

  std::shared_ptr<spdlog::logger> logger_;
  std::string dbUrl_;
  Handle handle_;
};

/**
 * @brief Open a database with a colored stdout logger
 *
 * The logger is looked up in the spdlog registry first, so the same file
 * can be opened more than once per process.
 *
 * @param dbUrl Path to the SQLite file
 * @param openCond Open flags
 * @param loggerName Registry name, "db-<filename>" when omitted
 * @return std::nullopt if the logger or the connection cannot be created
 */
std::optional<Database> buildDatabase(
  const std::string& dbUrl,
  DBOpenCondition openCond = DBOpenCondition::OpenCreate,
  std::optional<std::string> loggerName = std::nullopt);

}  // namespace hurdat_db

#endif  // HURDAT_DB_DATABASE_HPP
