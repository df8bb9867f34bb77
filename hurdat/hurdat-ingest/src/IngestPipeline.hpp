// Ticket: 0008_ingest_pipeline

#ifndef HURDAT_INGEST_INGEST_PIPELINE_HPP
#define HURDAT_INGEST_INGEST_PIPELINE_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "hurdat-parse/src/CountValidator.hpp"
#include "hurdat-parse/src/LineCursor.hpp"
#include "hurdat-parse/src/RecordAssembler.hpp"
#include "hurdat-schema/src/ColumnarTable.hpp"
#include "hurdat-schema/src/SchemaNormalizer.hpp"

namespace hurdat_ingest
{

struct IngestResult
{
  hurdat_schema::ColumnarTable table;
  hurdat_parse::ValidationReport report;
  std::vector<std::string> droppedColumns;  // Empty unless pruning was asked for
  std::size_t storms{0};                    // Header blocks read
  std::size_t records{0};                   // Rows produced
};

/**
 * @brief Best-track file to typed columnar dataset
 *
 * Stages, strictly sequential over one cursor:
 *   RecordAssembler -> CountValidator -> SchemaNormalizer -> ColumnarTable
 *   -> optional uninformative-column pruning -> optional SQLite store
 *
 * @ticket 0008_ingest_pipeline
 */
class IngestPipeline
{
public:
  /**
   * @brief Configuration for one ingest run
   */
  struct Config
  {
    std::string inputPath;     // Best-track text file
    std::string databasePath;  // SQLite output, empty to skip storing
    std::string tableName{"track_points"};
    hurdat_parse::AssemblerOptions assembler{};
    hurdat_schema::NormalizerOptions normalizer{};
    bool failOnUnexpectedMismatch{false};
    bool dropUninformativeColumns{false};
    // Logger for the database; a "db-<file>" stdout logger when null
    std::shared_ptr<spdlog::logger> databaseLogger;
  };

  explicit IngestPipeline(Config config);

  /**
   * @brief Read Config::inputPath
   *
   * @throws std::runtime_error if the input or database cannot be opened
   * @throws hurdat_parse::ParseError subclasses on structural failures
   */
  IngestResult run();

  /**
   * @brief Read from a supplied cursor instead of Config::inputPath
   */
  IngestResult run(std::unique_ptr<hurdat_parse::LineCursor> cursor);

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  void store(const hurdat_schema::ColumnarTable& table) const;

  Config config_;
};

}  // namespace hurdat_ingest

#endif  // HURDAT_INGEST_INGEST_PIPELINE_HPP
