// Ticket: 0008_ingest_pipeline

#include "hurdat-ingest/src/IngestPipeline.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

#include <spdlog/fmt/ranges.h>

#include "hurdat-db/src/ColumnarTableStore.hpp"
#include "hurdat-db/src/Database.hpp"
#include "hurdat-schema/src/ColumnPruning.hpp"
#include "hurdat-schema/src/TrackDataset.hpp"

namespace hurdat_ingest
{

IngestPipeline::IngestPipeline(Config config)
  : config_{std::move(config)}
{
}

IngestResult IngestPipeline::run()
{
  spdlog::info("Ingesting best-track file {}", config_.inputPath);
  return run(std::make_unique<hurdat_parse::FileLineCursor>(config_.inputPath));
}

IngestResult IngestPipeline::run(
  std::unique_ptr<hurdat_parse::LineCursor> cursor)
{
  hurdat_parse::RecordAssembler assembler{std::move(cursor), config_.assembler};
  auto const records = assembler.drain();

  auto report = hurdat_parse::validateCounts(records);
  if (config_.failOnUnexpectedMismatch)
  {
    hurdat_parse::enforceExpectedCounts(report);
  }

  hurdat_schema::SchemaNormalizer const normalizer{config_.normalizer};
  auto const points = normalizer.normalizeAll(records);

  IngestResult result{hurdat_schema::buildTrackTable(points),
                      std::move(report),
                      {},
                      assembler.blocksRead(),
                      points.size()};

  if (config_.dropUninformativeColumns)
  {
    result.droppedColumns = hurdat_schema::findUninformativeColumns(result.table);
    if (!result.droppedColumns.empty() &&
        result.droppedColumns.size() == result.table.columnCount())
    {
      spdlog::warn("Every one of the {} columns is uninformative over {} rows; "
                   "keeping the table unpruned",
                   result.table.columnCount(),
                   result.table.rowCount());
      result.droppedColumns.clear();
    }
    else if (!result.droppedColumns.empty())
    {
      spdlog::info("Dropping {} uninformative columns: {}",
                   result.droppedColumns.size(),
                   fmt::join(result.droppedColumns, ", "));
      result.table =
        hurdat_schema::dropColumns(result.table, result.droppedColumns);
    }
  }

  if (!config_.databasePath.empty())
  {
    store(result.table);
  }

  spdlog::info("Ingest complete: {} storms, {} rows, {} count mismatches "
               "({} expected)",
               result.storms,
               result.records,
               result.report.mismatches.size(),
               result.report.expectedCount());
  return result;
}

void IngestPipeline::store(const hurdat_schema::ColumnarTable& table) const
{
  std::optional<hurdat_db::Database> database;
  if (config_.databaseLogger)
  {
    database.emplace(config_.databasePath,
                     config_.databaseLogger,
                     hurdat_db::DBOpenCondition::OpenCreate);
  }
  else
  {
    database = hurdat_db::buildDatabase(config_.databasePath);
    if (!database)
    {
      throw std::runtime_error("Failed to open output database: " +
                               config_.databasePath);
    }
  }

  hurdat_db::ColumnarTableStore tableStore{*database};
  tableStore.write(config_.tableName, table);
}

}  // namespace hurdat_ingest
