// Ticket: 0001_best_track_parser

#ifndef HURDAT_PARSE_HEADER_LINE_PARSER_HPP
#define HURDAT_PARSE_HEADER_LINE_PARSER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "hurdat-parse/src/StormIdentity.hpp"

namespace hurdat_parse
{

/**
 * @brief One storm header: identity plus the number of data lines that follow
 */
struct HeaderRecord
{
  std::string basin;
  std::string cycloneNumber;
  int year{0};
  std::string name;
  int declaredEntries{0};

  /**
   * @brief Identity keyed on the header (season) year
   */
  [[nodiscard]] StormIdentity identity() const;

  /**
   * @brief Storm key: year, basin and cyclone number, e.g. "1851AL01"
   */
  [[nodiscard]] std::string uniqueId() const;

  bool operator==(const HeaderRecord&) const = default;
};

// Accepted season years. Anything outside is treated as a non-header line.
inline constexpr int kMinimumHeaderYear = 1800;
inline constexpr int kMaximumHeaderYear = 2200;

/**
 * @brief Parse a fixed-width header line
 *
 * A line is a header when it is long enough to hold every header field, the
 * basin is two uppercase letters, the cyclone number two digits, the year
 * four digits in [kMinimumHeaderYear, kMaximumHeaderYear], and the entry count
 * a non-negative integer. The basin is not restricted to a fixed set.
 *
 * @param line Raw line without its terminator
 * @param lineNumber 1-based source line, reported in errors (0 if unknown)
 * @throws MalformedHeaderError on any failed check
 */
[[nodiscard]] HeaderRecord parseHeaderLine(std::string_view line,
                                           std::size_t lineNumber = 0);

/**
 * @brief Structural header detection
 *
 * @return The parsed header, or nullopt when parseHeaderLine() would throw
 */
[[nodiscard]] std::optional<HeaderRecord> tryParseHeaderLine(
  std::string_view line,
  std::size_t lineNumber = 0);

}  // namespace hurdat_parse

#endif  // HURDAT_PARSE_HEADER_LINE_PARSER_HPP
