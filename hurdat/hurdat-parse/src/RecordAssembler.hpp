// Ticket: 0002_record_assembler

#ifndef HURDAT_PARSE_RECORD_ASSEMBLER_HPP
#define HURDAT_PARSE_RECORD_ASSEMBLER_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "hurdat-parse/src/CompositeRecord.hpp"
#include "hurdat-parse/src/HeaderLineParser.hpp"
#include "hurdat-parse/src/LineCursor.hpp"

namespace hurdat_parse
{

struct AssemblerOptions
{
  // Reject data lines that end before the radius of maximum wind column
  bool requireRadiusMaxWind{true};
};

/**
 * @brief Pairs each header line with its declared run of data lines
 *
 * Pull-based: every call to next() yields the following composite record in
 * source order. The assembler owns the cursor and is its only mutator, so the
 * sequence it produces is lazy, finite and cannot be restarted.
 *
 * Scan rules:
 * - A line that parses as a header opens a block of declaredEntries data lines.
 * - Any other line between blocks (blank lines, trailing notes) is skipped.
 * - Inside a block every line must be a well-formed data line.
 *
 * @ticket 0002_record_assembler
 */
class RecordAssembler
{
public:
  explicit RecordAssembler(std::unique_ptr<LineCursor> cursor,
                           AssemblerOptions options = {});

  RecordAssembler(const RecordAssembler&) = delete;
  RecordAssembler& operator=(const RecordAssembler&) = delete;
  RecordAssembler(RecordAssembler&&) noexcept = default;
  RecordAssembler& operator=(RecordAssembler&&) noexcept = default;
  ~RecordAssembler() = default;

  /**
   * @brief Produce the next composite record
   *
   * @return The record, or nullopt once the input is exhausted
   * @throws TruncatedStormError if input ends inside a block
   * @throws MalformedDataLineError if a line inside a block is too short or
   *         holds an unparseable year or coordinate
   * @throws InvalidHemisphereError on a bad hemisphere character
   */
  std::optional<CompositeRecord> next();

  /**
   * @brief Consume the rest of the input
   */
  std::vector<CompositeRecord> drain();

  [[nodiscard]] std::size_t blocksRead() const
  {
    return blocksRead_;
  }

  [[nodiscard]] std::size_t recordsEmitted() const
  {
    return recordsEmitted_;
  }

  [[nodiscard]] std::size_t linesSkipped() const
  {
    return linesSkipped_;
  }

private:
  // Advance past non-header lines until a block with entries is open.
  // Returns false at end of input.
  bool openNextBlock();

  CompositeRecord assemble(const std::string& line);

  std::unique_ptr<LineCursor> cursor_;
  AssemblerOptions options_;

  std::optional<HeaderRecord> header_;
  std::size_t headerLine_{0};
  int remaining_{0};
  std::size_t entryIndex_{0};

  std::size_t blocksRead_{0};
  std::size_t recordsEmitted_{0};
  std::size_t linesSkipped_{0};
};

}  // namespace hurdat_parse

#endif  // HURDAT_PARSE_RECORD_ASSEMBLER_HPP
