// Ticket: 0004_schema_normalizer

#ifndef HURDAT_SCHEMA_SCHEMA_NORMALIZER_HPP
#define HURDAT_SCHEMA_SCHEMA_NORMALIZER_HPP

#include <chrono>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "hurdat-parse/src/CompositeRecord.hpp"
#include "hurdat-schema/src/TrackPoint.hpp"

namespace hurdat_schema
{

/**
 * @brief What to do with a value that cannot be typed
 */
enum class FailurePolicy
{
  Fail,         // Throw the matching ParseError
  MarkMissing,  // Log a warning and store a missing marker
};

/**
 * @brief How reserved "no measurement" numbers are stored
 */
enum class SentinelPolicy
{
  MarkMissing,      // Sentinel becomes an empty optional
  PreserveLiteral,  // Sentinel is kept as the negative number in the file
};

struct NormalizerOptions
{
  FailurePolicy unknownStatus{FailurePolicy::Fail};
  FailurePolicy invalidDate{FailurePolicy::Fail};
  SentinelPolicy sentinels{SentinelPolicy::MarkMissing};
  // Wind uses -99, pressure and radii use -999
  std::vector<int> sentinelValues{-99, -999};
};

/**
 * @brief Casts composite records into typed TrackPoints
 *
 * - Date and time parts are parsed as integers; an unparseable part is
 *   always an InvalidDateError.
 * - year/month/day/hour/minute compose a UTC timestamp; an impossible
 *   calendar instant follows NormalizerOptions::invalidDate.
 * - The status code maps onto StormStatus; an unknown code follows
 *   NormalizerOptions::unknownStatus.
 * - Measurements that are blank, non-numeric or sentinel become missing
 *   (sentinels per NormalizerOptions::sentinels).
 *
 * @ticket 0004_schema_normalizer
 */
class SchemaNormalizer
{
public:
  explicit SchemaNormalizer(NormalizerOptions options = {});

  /**
   * @throws hurdat_parse::UnknownStatusError
   * @throws hurdat_parse::InvalidDateError
   */
  [[nodiscard]] TrackPoint normalize(
    const hurdat_parse::CompositeRecord& record) const;

  [[nodiscard]] std::vector<TrackPoint> normalizeAll(
    std::span<const hurdat_parse::CompositeRecord> records) const;

  /**
   * @brief Numeric coercion with the configured sentinel policy
   */
  [[nodiscard]] std::optional<int> coerceMeasurement(
    std::string_view text) const;

  /**
   * @brief Compose a UTC instant
   * @return nullopt when the parts do not name a real calendar instant
   */
  [[nodiscard]] static std::optional<std::chrono::sys_seconds> composeTimestamp(
    int year,
    int month,
    int day,
    int hour,
    int minute);

private:
  [[nodiscard]] bool isSentinel(int value) const;

  NormalizerOptions options_;
};

}  // namespace hurdat_schema

#endif  // HURDAT_SCHEMA_SCHEMA_NORMALIZER_HPP
