// Symbolic duration codes ("4", "8.", ...) and their lengths in reference ticks.

#ifndef STYLEC_CORE_DURATION_TABLE_H
#define STYLEC_CORE_DURATION_TABLE_H

#include <cstddef>
#include <optional>
#include <string_view>

#include "core/basic_types.h"

namespace stylec {

// ---------------------------------------------------------------------------
// Duration constants (quarter = 1 time-unit = kTicksPerBeat at 60 BPM)
// ---------------------------------------------------------------------------

namespace duration {

constexpr Tick kHalfNote = kTicksPerBeat * 2;                       // 960
constexpr Tick kDottedQuarter = kTicksPerBeat + kTicksPerBeat / 2;  // 720
constexpr Tick kQuarterNote = kTicksPerBeat;                        // 480
constexpr Tick kDottedEighth = kTicksPerBeat / 2 + kTicksPerBeat / 4;  // 360
constexpr Tick kEighthNote = kTicksPerBeat / 2;                     // 240
constexpr Tick kSixteenthNote = kTicksPerBeat / 4;                  // 120

}  // namespace duration

/// One row of the duration table.
struct DurationEntry {
  const char* code;
  Tick ticks;
};

/// Every supported duration code. A dotted code is always 1.5x its undotted
/// counterpart; new rows must keep that ratio.
constexpr DurationEntry kDurationTable[] = {
    {"2", duration::kHalfNote},
    {"4", duration::kQuarterNote},
    {"4.", duration::kDottedQuarter},
    {"8", duration::kEighthNote},
    {"8.", duration::kDottedEighth},
    {"16", duration::kSixteenthNote},
};

constexpr size_t kDurationTableSize = sizeof(kDurationTable) / sizeof(kDurationTable[0]);

/// @brief Look up a duration code.
/// @param code Symbolic code as written in the track descriptor.
/// @return Length in reference ticks, or nullopt for an unknown code.
std::optional<Tick> lookupDuration(std::string_view code);

}  // namespace stylec

#endif  // STYLEC_CORE_DURATION_TABLE_H
