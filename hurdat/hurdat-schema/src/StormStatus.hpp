// Ticket: 0004_schema_normalizer

#ifndef HURDAT_SCHEMA_STORM_STATUS_HPP
#define HURDAT_SCHEMA_STORM_STATUS_HPP

#include <array>
#include <optional>
#include <string_view>

namespace hurdat_schema
{

/**
 * @brief System status at an observation
 */
enum class StormStatus
{
  TD,  // Tropical depression
  TS,  // Tropical storm
  HU,  // Hurricane
  EX,  // Extratropical cyclone
  SD,  // Subtropical depression
  SS,  // Subtropical storm
  LO,  // Low that is none of the above
  WV,  // Tropical wave
  DB,  // Disturbance
};

inline constexpr std::array<StormStatus, 9> kAllStormStatuses{StormStatus::TD,
                                                              StormStatus::TS,
                                                              StormStatus::HU,
                                                              StormStatus::EX,
                                                              StormStatus::SD,
                                                              StormStatus::SS,
                                                              StormStatus::LO,
                                                              StormStatus::WV,
                                                              StormStatus::DB};

/**
 * @brief Two-letter code as it appears in the file
 */
[[nodiscard]] std::string_view toCode(StormStatus status);

/**
 * @brief Map a two-letter code to its status
 * @return nullopt for any other text
 */
[[nodiscard]] std::optional<StormStatus> parseStormStatus(std::string_view code);

}  // namespace hurdat_schema

#endif  // HURDAT_SCHEMA_STORM_STATUS_HPP
