// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Classification of cloud seeding activity. Each sample is assigned
// one event derived from the difference between its cumulative flare
// counters and those of the immediately preceding sample, and from
// its generator flags. Priority is BIP > Eject > Generator > None:
//   bip delta > 0          -> BIP, count = bip delta
//   else eject delta > 0   -> Eject, count = eject delta
//   else a generator is on -> Generator, count = 1 (meaning "on")
//   else                   -> None, count = 0
// A counter jumping by more than one between two samples yields a
// single event with the aggregate count.

#pragma once

#include <string>
#include <vector>

namespace seedtrack {

struct RawSample;

enum class SeedingType
{
    bip,
    eject,
    generator,
    none,
};

struct SeedingEvent
{
    SeedingType type { SeedingType::none };
    int count {};
    auto operator==(const SeedingEvent&) const -> bool = default;
};

// Running state of the classification: the counters of the previous
// sample. For the first sample it is initialized with that sample's
// own counters so that both deltas are zero.
struct CounterState
{
    double bip {};
    double eject {};
};

// Result of classifying a whole flight
struct SeedingSequence
{
    // One event per sample, in sample order
    std::vector<SeedingEvent> events {};
    // Number of times a counter went down
    int n_resets {};
};

// Name used in the track artifact: BIP, Eject, Generator, or None
[[nodiscard]] auto seedingTypeToString(const SeedingType type) -> std::string;

// Classify one sample given the counters of the previous sample.
// Negative deltas (counter reset) do not count as drops.
[[nodiscard]] auto classifySeeding(const CounterState& previous,
                                   const RawSample& current) -> SeedingEvent;

// Left fold over the time-ordered samples, carrying the previous
// counters as the running state.
[[nodiscard]] auto classifySamples(const std::vector<RawSample>& samples)
  -> SeedingSequence;

} // namespace seedtrack
