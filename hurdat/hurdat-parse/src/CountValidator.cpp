// Ticket: 0003_count_validator

#include "hurdat-parse/src/CountValidator.hpp"

#include <algorithm>
#include <iterator>

#include <spdlog/spdlog.h>

#include "hurdat-parse/src/ParseErrors.hpp"

namespace hurdat_parse
{

namespace
{

std::size_t sumDeclared(const std::map<std::size_t, std::size_t>& blocks)
{
  std::size_t total{0};
  for (const auto& [block, declared] : blocks)
  {
    total += declared;
  }
  return total;
}

bool isNeighbour(const StormIdentity& a, const StormIdentity& b)
{
  return a.basin == b.basin && a.cycloneNumber == b.cycloneNumber &&
         a.name == b.name && (a.year - b.year == 1 || b.year - a.year == 1);
}

}  // namespace

std::vector<CountMismatch> ValidationReport::unexpected() const
{
  std::vector<CountMismatch> result;
  std::copy_if(mismatches.begin(),
               mismatches.end(),
               std::back_inserter(result),
               [](const CountMismatch& m) { return !m.expected; });
  return result;
}

std::size_t ValidationReport::expectedCount() const
{
  return static_cast<std::size_t>(
    std::count_if(mismatches.begin(),
                  mismatches.end(),
                  [](const CountMismatch& m) { return m.expected; }));
}

void CountValidator::observe(const CompositeRecord& record)
{
  auto identity = record.identity();
  auto [it, inserted] = groups_.try_emplace(identity);
  if (inserted)
  {
    firstSeen_.push_back(std::move(identity));
  }

  auto& group = it->second;
  group.declaredByBlock[record.blockIndex] =
    static_cast<std::size_t>(record.header.declaredEntries);
  ++group.observed;
}

ValidationReport CountValidator::report() const
{
  ValidationReport report{};
  report.identitiesChecked = groups_.size();

  auto isMismatched = [](const Group& g)
  { return g.observed != sumDeclared(g.declaredByBlock); };

  for (const auto& identity : firstSeen_)
  {
    const auto& group = groups_.at(identity);
    if (!isMismatched(group))
    {
      continue;
    }

    CountMismatch mismatch{};
    mismatch.identity = identity;
    mismatch.declared = sumDeclared(group.declaredByBlock);
    mismatch.observed = group.observed;

    for (const auto& [otherIdentity, other] : groups_)
    {
      if (!isNeighbour(identity, otherIdentity) || !isMismatched(other))
      {
        continue;
      }

      auto blocks = group.declaredByBlock;
      blocks.insert(other.declaredByBlock.begin(), other.declaredByBlock.end());
      if (group.observed + other.observed == sumDeclared(blocks))
      {
        mismatch.expected = true;
        break;
      }
    }

    if (mismatch.expected)
    {
      spdlog::info("Count mismatch for {} (declared {}, observed {}) "
                   "reconciles across the year boundary",
                   identity.toString(),
                   mismatch.declared,
                   mismatch.observed);
    }
    else
    {
      spdlog::warn("Count mismatch for {}: declared {}, observed {}",
                   identity.toString(),
                   mismatch.declared,
                   mismatch.observed);
    }

    report.mismatches.push_back(std::move(mismatch));
  }

  return report;
}

ValidationReport validateCounts(std::span<const CompositeRecord> records)
{
  CountValidator validator;
  for (const auto& record : records)
  {
    validator.observe(record);
  }
  return validator.report();
}

void enforceExpectedCounts(const ValidationReport& report)
{
  auto const unexpected = report.unexpected();
  if (unexpected.empty())
  {
    return;
  }

  const auto& first = unexpected.front();
  throw CountMismatchError{
    fmt::format("declared {} entries, observed {} ({} unexpected mismatches)",
                first.declared,
                first.observed,
                unexpected.size()),
    0,
    first.identity};
}

}  // namespace hurdat_parse
