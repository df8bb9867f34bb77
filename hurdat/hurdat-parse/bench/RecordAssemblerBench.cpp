// Ticket: 0002_record_assembler

#include <benchmark/benchmark.h>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "hurdat-parse/src/CountValidator.hpp"
#include "hurdat-parse/src/RecordAssembler.hpp"
#include "hurdat-parse/test/Helpers/HurdatLineBuilder.hpp"
#include "hurdat-schema/src/SchemaNormalizer.hpp"
#include "hurdat-schema/src/TrackDataset.hpp"

using namespace hurdat_parse;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

// Synthetic season: stormCount blocks of 40 six-hourly observations each
std::vector<std::string> generateSeason(std::size_t stormCount)
{
  constexpr int kEntriesPerStorm = 40;

  std::vector<std::string> lines;
  lines.reserve(stormCount * (kEntriesPerStorm + 1));
  for (std::size_t s = 0; s < stormCount; ++s)
  {
    lines.push_back(test::makeHeaderLine("AL",
                                         fmt::format("{:02}", s % 100),
                                         "2004",
                                         "SYNTHETIC",
                                         std::to_string(kEntriesPerStorm)));
    for (int i = 0; i < kEntriesPerStorm; ++i)
    {
      test::DataLineFields fields{};
      fields.date = fmt::format("200408{:02}", 1 + i / 4);
      fields.time = fmt::format("{:02}00", (i % 4) * 6);
      fields.latitude = fmt::format("{:.1f}", 15.0 + 0.3 * i);
      fields.longitude = fmt::format("{:.1f}", 40.0 + 0.9 * i);
      fields.maxWind = std::to_string(30 + i);
      fields.minPressure = std::to_string(1010 - i);
      lines.push_back(test::makeDataLine(fields));
    }
  }
  return lines;
}

}  // namespace

// ============================================================================
// Assembly Benchmarks
// ============================================================================

/**
 * @brief Header/data line assembly and coordinate conversion
 *
 * @ticket 0002_record_assembler
 */
static void BM_RecordAssembler_Drain(benchmark::State& state)
{
  spdlog::set_level(spdlog::level::warn);
  auto const lines = generateSeason(static_cast<std::size_t>(state.range(0)));

  for (auto _ : state)
  {
    RecordAssembler assembler{std::make_unique<MemoryLineCursor>(lines)};
    auto records = assembler.drain();
    benchmark::DoNotOptimize(records);
  }

  state.SetItemsProcessed(state.iterations() *
                          static_cast<int64_t>(lines.size()));
}
BENCHMARK(BM_RecordAssembler_Drain)->Arg(10)->Arg(100)->Arg(1000);

/**
 * @brief Assembly through to the typed columnar table
 *
 * @ticket 0005_columnar_dataset
 */
static void BM_AssembleValidateNormalize(benchmark::State& state)
{
  spdlog::set_level(spdlog::level::warn);
  auto const lines = generateSeason(static_cast<std::size_t>(state.range(0)));
  hurdat_schema::SchemaNormalizer const normalizer{};

  for (auto _ : state)
  {
    RecordAssembler assembler{std::make_unique<MemoryLineCursor>(lines)};
    auto const records = assembler.drain();
    auto report = validateCounts(records);
    auto table =
      hurdat_schema::buildTrackTable(normalizer.normalizeAll(records));
    benchmark::DoNotOptimize(report);
    benchmark::DoNotOptimize(table);
  }
}
BENCHMARK(BM_AssembleValidateNormalize)->Arg(100)->Arg(1000);

BENCHMARK_MAIN();
