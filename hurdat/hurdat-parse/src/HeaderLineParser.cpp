// Ticket: 0001_best_track_parser

#include "hurdat-parse/src/HeaderLineParser.hpp"

#include <algorithm>

#include <spdlog/fmt/fmt.h>

#include "hurdat-parse/src/FixedWidthField.hpp"
#include "hurdat-parse/src/ParseErrors.hpp"

namespace hurdat_parse
{

namespace
{

bool isBasinCode(std::string_view text)
{
  return text.size() == header_layout::kBasin.width() &&
         std::all_of(text.begin(),
                     text.end(),
                     [](char c) { return c >= 'A' && c <= 'Z'; });
}

}  // namespace

StormIdentity HeaderRecord::identity() const
{
  return StormIdentity{basin, cycloneNumber, year, name};
}

std::string HeaderRecord::uniqueId() const
{
  return fmt::format("{}{}{}", year, basin, cycloneNumber);
}

HeaderRecord parseHeaderLine(std::string_view line, std::size_t lineNumber)
{
  using namespace header_layout;

  if (line.size() < kMinLength)
  {
    throw MalformedHeaderError{
      fmt::format("header line has {} characters, at least {} required",
                  line.size(),
                  kMinLength),
      lineNumber};
  }

  HeaderRecord header{};

  auto const basin = extractField(line, kBasin);
  if (!isBasinCode(basin))
  {
    throw MalformedHeaderError{
      fmt::format("basin code '{}' is not two uppercase letters", basin),
      lineNumber};
  }
  header.basin = std::string{basin};

  auto const number = extractField(line, kCycloneNumber);
  if (number.size() != kCycloneNumber.width() || !isAllDigits(number))
  {
    throw MalformedHeaderError{
      fmt::format("cyclone number '{}' is not two digits", number), lineNumber};
  }
  header.cycloneNumber = std::string{number};

  auto const yearText = extractField(line, kYear);
  auto const year = isAllDigits(yearText) ? parseInteger(yearText) : std::nullopt;
  if (yearText.size() != kYear.width() || !year ||
      *year < kMinimumHeaderYear || *year > kMaximumHeaderYear)
  {
    throw MalformedHeaderError{
      fmt::format("year '{}' is not a plausible four digit year", yearText),
      lineNumber};
  }
  header.year = *year;

  header.name = std::string{extractField(line, kName)};

  auto const countText = extractField(line, kEntryCount);
  auto const count =
    isAllDigits(countText) ? parseInteger(countText) : std::nullopt;
  if (!count)
  {
    throw MalformedHeaderError{
      fmt::format("entry count '{}' is not a non-negative integer", countText),
      lineNumber};
  }
  header.declaredEntries = *count;

  return header;
}

std::optional<HeaderRecord> tryParseHeaderLine(std::string_view line,
                                               std::size_t lineNumber)
{
  try
  {
    return parseHeaderLine(line, lineNumber);
  }
  catch (const MalformedHeaderError&)
  {
    return std::nullopt;
  }
}

}  // namespace hurdat_parse
