// Ticket: 0002_record_assembler

#ifndef HURDAT_PARSE_COMPOSITE_RECORD_HPP
#define HURDAT_PARSE_COMPOSITE_RECORD_HPP

#include <cstddef>

#include "hurdat-parse/src/DataLineParser.hpp"
#include "hurdat-parse/src/HeaderLineParser.hpp"
#include "hurdat-parse/src/StormIdentity.hpp"

namespace hurdat_parse
{

/**
 * @brief One data line merged with the header of the block it belongs to
 *
 * Coordinates are already converted to signed degrees; every other data
 * field is still raw text.
 */
struct CompositeRecord
{
  HeaderRecord header;
  RawTrackPoint point;
  double latitude{0.0};   // [deg], north positive
  double longitude{0.0};  // [deg], east positive
  int observationYear{0};  // Parsed year of the data line

  std::size_t lineNumber{0};   // 1-based source line of the data line
  std::size_t blockIndex{0};   // 0-based ordinal of the header block
  std::size_t entryIndex{0};   // 0-based position within the block

  /**
   * @brief Identity used for count reconciliation
   *
   * Keyed on the observation year, so a block whose observations run past
   * 31 December falls into two identities.
   */
  [[nodiscard]] StormIdentity identity() const
  {
    return StormIdentity{
      header.basin, header.cycloneNumber, observationYear, header.name};
  }
};

}  // namespace hurdat_parse

#endif  // HURDAT_PARSE_COMPOSITE_RECORD_HPP
