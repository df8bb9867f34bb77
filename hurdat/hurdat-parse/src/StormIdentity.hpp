// Ticket: 0001_best_track_parser

#ifndef HURDAT_PARSE_STORM_IDENTITY_HPP
#define HURDAT_PARSE_STORM_IDENTITY_HPP

#include <compare>
#include <string>

namespace hurdat_parse
{

/**
 * @brief Tuple identifying one storm grouping in the best-track file
 *
 * (basin, cyclone number, year, name). Used as the grouping key when
 * reconciling declared and observed entry counts, and attached to parse
 * errors so a failure can be traced back to its storm.
 */
struct StormIdentity
{
  std::string basin;          // Two-letter basin code, e.g. "AL"
  std::string cycloneNumber;  // Two-digit number within the season, e.g. "01"
  int year{0};
  std::string name;  // Trimmed storm name, "UNNAMED" for early storms

  /**
   * @brief Human readable form, e.g. "AL01 1851 UNNAMED"
   */
  [[nodiscard]] std::string toString() const;

  auto operator<=>(const StormIdentity&) const = default;
  bool operator==(const StormIdentity&) const = default;
};

}  // namespace hurdat_parse

#endif  // HURDAT_PARSE_STORM_IDENTITY_HPP
