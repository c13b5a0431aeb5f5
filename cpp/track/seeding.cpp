// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "seeding.h"

#include "sensor_log.h"

#include <limits>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace seedtrack {

[[nodiscard]] auto seedingTypeToString(const SeedingType type) -> std::string
{
    switch (type) {
    case SeedingType::bip:
        return "BIP";
    case SeedingType::eject:
        return "Eject";
    case SeedingType::generator:
        return "Generator";
    case SeedingType::none:
        return "None";
    default:
        throw std::invalid_argument { "invalid seeding type" };
    }
}

// Number of whole flares between two counter readings. The
// difference is truncated toward zero and saturates at the int range.
[[nodiscard]] static auto flareDelta(const double previous,
                                     const double current) -> int
{
    const double delta { current - previous };
    if (!(delta >= 1.0)) {
        return 0;
    }
    if (delta >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(delta);
}

[[nodiscard]] auto classifySeeding(const CounterState& previous,
                                   const RawSample& current) -> SeedingEvent
{
    const int bip_delta { flareDelta(previous.bip, current.bip_count) };
    if (bip_delta > 0) {
        return { SeedingType::bip, bip_delta };
    }
    const int eject_delta { flareDelta(previous.eject, current.eject_count) };
    if (eject_delta > 0) {
        return { SeedingType::eject, eject_delta };
    }
    if (current.right_generator || current.left_generator) {
        return { SeedingType::generator, 1 };
    }
    return { SeedingType::none, 0 };
}

[[nodiscard]] auto classifySamples(const std::vector<RawSample>& samples)
  -> SeedingSequence
{
    SeedingSequence sequence {};
    if (samples.empty()) {
        return sequence;
    }
    sequence.events.reserve(samples.size());
    CounterState state { samples.front().bip_count,
                         samples.front().eject_count };
    for (const RawSample& sample : samples) {
        sequence.events.push_back(classifySeeding(state, sample));
        // A counter that went down was reset. The new value is the
        // baseline for the next delta.
        if (sample.bip_count < state.bip || sample.eject_count < state.eject) {
            ++sequence.n_resets;
            spdlog::debug("Seeding counter reset at {}",
                          formatIso(sample.timestamp));
        }
        state = { sample.bip_count, sample.eject_count };
    }
    return sequence;
}

} // namespace seedtrack
