// Timeline layout: note entries replayed back to back into timed note events.

#ifndef STYLEC_TRACK_TIMELINE_BUILDER_H
#define STYLEC_TRACK_TIMELINE_BUILDER_H

#include <vector>

#include "core/basic_types.h"
#include "instrument/instrument_definition.h"
#include "track/track_definition.h"

namespace stylec {

/// @brief Lay out a note sequence on a timeline, repeated loop_count times.
///
/// The cursor starts at tick 0 and advances by each entry's duration once per
/// entry. Every pitch of a chord entry gets its own event at the same start
/// tick and duration. Repetitions follow each other with no gap.
///
/// @param notes Note entries in playback order.
/// @param instrument Instrument used to resolve pitch tokens.
/// @param loop_count Number of repetitions (kDefaultLoopCount in normal runs).
/// @param tick_limit Last tick a note may end on (see maxReferenceTick()).
/// @param events Receives the events in emission order (cleared first).
/// @param error Receives UnknownDuration, UnknownPitch or TimelineTooLong.
/// @return True on success.
bool buildTimeline(const std::vector<NoteEntry>& notes, const InstrumentDefinition& instrument,
                   int loop_count, Tick tick_limit, std::vector<NoteEvent>& events,
                   CompileError& error);

}  // namespace stylec

#endif  // STYLEC_TRACK_TIMELINE_BUILDER_H
