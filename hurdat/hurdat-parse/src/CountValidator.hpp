// Ticket: 0003_count_validator

#ifndef HURDAT_PARSE_COUNT_VALIDATOR_HPP
#define HURDAT_PARSE_COUNT_VALIDATOR_HPP

#include <cstddef>
#include <map>
#include <set>
#include <span>
#include <vector>

#include "hurdat-parse/src/CompositeRecord.hpp"
#include "hurdat-parse/src/StormIdentity.hpp"

namespace hurdat_parse
{

/**
 * @brief A storm identity whose observed record count differs from the
 * count declared by its header block(s)
 */
struct CountMismatch
{
  StormIdentity identity;
  std::size_t declared{0};
  std::size_t observed{0};
  // True when the difference is explained by the storm crossing a calendar
  // year boundary, i.e. the pair of adjacent-year identities reconciles
  bool expected{false};

  bool operator==(const CountMismatch&) const = default;
};

struct ValidationReport
{
  std::vector<CountMismatch> mismatches;  // In order of first appearance
  std::size_t identitiesChecked{0};

  [[nodiscard]] bool clean() const
  {
    return mismatches.empty();
  }

  [[nodiscard]] std::vector<CountMismatch> unexpected() const;

  [[nodiscard]] std::size_t expectedCount() const;
};

/**
 * @brief Reconciles declared and observed entry counts per storm identity
 *
 * Records are grouped by CompositeRecord::identity(). The declared count of
 * a group is the sum of declaredEntries over the distinct header blocks that
 * contributed to it.
 *
 * A mismatching group is marked expected when it has a mismatching neighbour
 * (same basin, cyclone number and name, year one apart) and the two together
 * reconcile: total observed equals the sum of declared entries over the union
 * of their blocks. Both shapes of a year-boundary storm satisfy this, one
 * block whose observations spill into January and two consecutive blocks.
 *
 * Mismatches are reported, never thrown; see enforceExpectedCounts().
 *
 * @ticket 0003_count_validator
 */
class CountValidator
{
public:
  void observe(const CompositeRecord& record);

  /**
   * @brief Classify and log every mismatch seen so far
   */
  [[nodiscard]] ValidationReport report() const;

private:
  struct Group
  {
    std::map<std::size_t, std::size_t> declaredByBlock;
    std::size_t observed{0};
  };

  std::map<StormIdentity, Group> groups_;
  std::vector<StormIdentity> firstSeen_;
};

/**
 * @brief Validate a complete record sequence
 */
[[nodiscard]] ValidationReport validateCounts(
  std::span<const CompositeRecord> records);

/**
 * @brief Caller-side policy: turn unexpected mismatches into an error
 *
 * @throws CountMismatchError naming the first unexpected mismatch
 */
void enforceExpectedCounts(const ValidationReport& report);

}  // namespace hurdat_parse

#endif  // HURDAT_PARSE_COUNT_VALIDATOR_HPP
