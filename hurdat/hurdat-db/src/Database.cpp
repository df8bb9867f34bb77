// Ticket: 0007_columnar_store

#include "hurdat-db/src/Database.hpp"

#include <filesystem>
#include <iostream>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace hurdat_db
{

Database::Handle Database::openHandle(const std::string& dbUrl,
                                      DBOpenCondition openCond,
                                      spdlog::logger& logger)
{
  sqlite3* raw = nullptr;
  int const rc =
    sqlite3_open_v2(dbUrl.c_str(), &raw, static_cast<int>(openCond), nullptr);

  // sqlite3_open_v2 may hand back a handle even on failure
  Handle handle{raw};
  if (rc != SQLITE_OK)
  {
    std::string const reason =
      handle ? sqlite3_errmsg(handle.get()) : sqlite3_errstr(rc);
    logger.error("Cannot open {}: {}", dbUrl, reason);
    throw std::runtime_error("Failed to open database " + dbUrl + ": " +
                             reason);
  }
  return handle;
}

Database::Database(std::string dbUrl,
                   std::shared_ptr<spdlog::logger> logger,
                   DBOpenCondition openCond)
  : logger_{std::move(logger)}, dbUrl_{std::move(dbUrl)}
{
  if (!logger_)
  {
    throw std::invalid_argument("Database requires a logger");
  }

  handle_ = openHandle(dbUrl_, openCond, *logger_);
  logger_->info("Opened database {}", dbUrl_);
}

Database::~Database()
{
  if (handle_ && logger_)
  {
    logger_->debug("Closing database {}", dbUrl_);
  }
}

Database::Database(Database&& other) noexcept
  : logger_{std::move(other.logger_)},
    dbUrl_{std::move(other.dbUrl_)},
    handle_{std::move(other.handle_)}
{
}

Database& Database::operator=(Database&& other) noexcept
{
  if (this != &other)
  {
    handle_ = std::move(other.handle_);
    logger_ = std::move(other.logger_);
    dbUrl_ = std::move(other.dbUrl_);
  }
  return *this;
}

bool Database::executeQuery(const std::string& query)
{
  logger_->trace("SQL: {}", query);

  char* rawMessage = nullptr;
  int const rc =
    sqlite3_exec(handle_.get(), query.c_str(), nullptr, nullptr, &rawMessage);
  if (rc == SQLITE_OK)
  {
    return true;
  }

  std::unique_ptr<char, decltype(&sqlite3_free)> message{rawMessage,
                                                         &sqlite3_free};
  logger_->error("SQL failed on {}: {}",
                 dbUrl_,
                 message ? message.get() : sqlite3_errstr(rc));
  return false;
}

void Database::execute(const std::string& query)
{
  if (!executeQuery(query))
  {
    throw std::runtime_error("SQL failed on " + dbUrl_ + ": " + lastError());
  }
}

Statement Database::prepare(const std::string& sql)
{
  sqlite3_stmt* raw = nullptr;
  int const rc =
    sqlite3_prepare_v2(handle_.get(), sql.c_str(), -1, &raw, nullptr);
  Statement stmt{raw};
  if (rc != SQLITE_OK)
  {
    logger_->error("Cannot prepare '{}': {}", sql, lastError());
    throw std::runtime_error("Failed to prepare statement: " + lastError());
  }
  return stmt;
}

bool Database::beginTransaction()
{
  return executeQuery("BEGIN TRANSACTION;");
}

bool Database::commitTransaction()
{
  return executeQuery("COMMIT;");
}

bool Database::rollbackTransaction()
{
  logger_->debug("Rolling back transaction on {}", dbUrl_);
  return executeQuery("ROLLBACK;");
}

void Database::abandonTransaction()
{
  if (!rollbackTransaction())
  {
    logger_->error("Rollback failed on {}: {}", dbUrl_, lastError());
  }
}

std::string Database::lastError() const
{
  return handle_ ? sqlite3_errmsg(handle_.get()) : "no open connection";
}

std::optional<Database> buildDatabase(const std::string& dbUrl,
                                      DBOpenCondition openCond,
                                      std::optional<std::string> loggerName)
{
  std::string const name =
    loggerName.value_or("db-" + std::filesystem::path{dbUrl}.filename().string());

  try
  {
    auto logger = spdlog::get(name);
    if (!logger)
    {
      logger = spdlog::stdout_color_mt(name);
      logger->set_level(spdlog::level::info);
    }
    return Database{dbUrl, std::move(logger), openCond};
  }
  catch (const spdlog::spdlog_ex& e)
  {
    std::cerr << "Cannot create logger " << name << ": " << e.what() << '\n';
  }
  catch (const std::runtime_error& e)
  {
    std::cerr << e.what() << '\n';
  }
  return std::nullopt;
}

}  // namespace hurdat_db
