// Ticket: 0002_record_assembler

#include "hurdat-parse/src/RecordAssembler.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "hurdat-parse/src/CoordinateConverter.hpp"
#include "hurdat-parse/src/DataLineParser.hpp"
#include "hurdat-parse/src/FixedWidthField.hpp"
#include "hurdat-parse/src/ParseErrors.hpp"

namespace hurdat_parse
{

RecordAssembler::RecordAssembler(std::unique_ptr<LineCursor> cursor,
                                 AssemblerOptions options)
  : cursor_{std::move(cursor)}, options_{options}
{
  if (!cursor_)
  {
    throw std::invalid_argument("RecordAssembler requires a line cursor");
  }
}

std::optional<CompositeRecord> RecordAssembler::next()
{
  if (remaining_ == 0 && !openNextBlock())
  {
    return std::nullopt;
  }

  auto line = cursor_->next();
  if (!line)
  {
    auto const consumed = static_cast<int>(entryIndex_);
    throw TruncatedStormError{
      fmt::format("header on line {} declares {} entries, input ended after {}",
                  headerLine_,
                  consumed + remaining_,
                  consumed),
      cursor_->lineNumber(),
      header_->identity()};
  }

  auto record = assemble(*line);
  --remaining_;
  ++entryIndex_;
  ++recordsEmitted_;
  return record;
}

std::vector<CompositeRecord> RecordAssembler::drain()
{
  std::vector<CompositeRecord> records;
  while (auto record = next())
  {
    records.push_back(std::move(*record));
  }

  spdlog::info("Assembled {} records from {} storm blocks ({} lines skipped)",
               recordsEmitted_,
               blocksRead_,
               linesSkipped_);
  return records;
}

bool RecordAssembler::openNextBlock()
{
  while (remaining_ == 0)
  {
    auto line = cursor_->next();
    if (!line)
    {
      return false;
    }

    auto header = tryParseHeaderLine(*line, cursor_->lineNumber());
    if (!header)
    {
      ++linesSkipped_;
      spdlog::debug("Skipping non-header line {}", cursor_->lineNumber());
      continue;
    }

    // A block declaring zero entries leaves remaining_ at 0 and the loop
    // moves straight on to the next line
    header_ = std::move(header);
    headerLine_ = cursor_->lineNumber();
    remaining_ = header_->declaredEntries;
    entryIndex_ = 0;
    ++blocksRead_;
  }
  return true;
}

CompositeRecord RecordAssembler::assemble(const std::string& line)
{
  std::size_t const lineNumber = cursor_->lineNumber();

  try
  {
    CompositeRecord record{};
    record.point =
      parseDataLine(line, lineNumber, options_.requireRadiusMaxWind);

    auto const year = parseInteger(record.point.year);
    if (!year)
    {
      throw MalformedDataLineError{
        fmt::format("observation year '{}' is not an integer",
                    record.point.year),
        lineNumber};
    }
    record.observationYear = *year;

    record.latitude = toSignedDegrees(record.point.latitudeMagnitude,
                                      record.point.latitudeHemisphere,
                                      CoordinateAxis::Latitude);
    record.longitude = toSignedDegrees(record.point.longitudeMagnitude,
                                       record.point.longitudeHemisphere,
                                       CoordinateAxis::Longitude);

    record.header = *header_;
    record.lineNumber = lineNumber;
    record.blockIndex = blocksRead_ - 1;
    record.entryIndex = entryIndex_;
    return record;
  }
  catch (const InvalidHemisphereError& e)
  {
    throw InvalidHemisphereError{e.detail(), lineNumber, header_->identity()};
  }
  catch (const MalformedDataLineError& e)
  {
    throw MalformedDataLineError{e.detail(), lineNumber, header_->identity()};
  }
}

}  // namespace hurdat_parse
