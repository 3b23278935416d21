/// @file
/// @brief Timeline layout of note entries.

#include "track/timeline_builder.h"

#include <algorithm>
#include <string>

#include "core/duration_table.h"
#include "core/pitch_resolver.h"

namespace stylec {

bool buildTimeline(const std::vector<NoteEntry>& notes, const InstrumentDefinition& instrument,
                   int loop_count, Tick tick_limit, std::vector<NoteEvent>& events,
                   CompileError& error) {
  events.clear();

  size_t events_per_loop = 0;
  for (const auto& entry : notes) events_per_loop += entry.pitches.size();
  if (loop_count > 0) {
    events.reserve(events_per_loop * static_cast<size_t>(std::min(loop_count, kMaxLoopCount)));
  }

  // 64-bit so a long pattern cannot wrap before the limit check sees it.
  uint64_t cursor = 0;
  for (int loop = 0; loop < loop_count; ++loop) {
    for (const auto& entry : notes) {
      auto length = lookupDuration(entry.duration);
      if (!length) {
        return fail(error, ErrorKind::UnknownDuration,
                    "Unknown note duration: '" + entry.duration + "'");
      }

      if (cursor + *length > tick_limit) {
        return fail(error, ErrorKind::TimelineTooLong,
                    "Timeline too long: loop " + std::to_string(loop + 1) + " of " +
                        std::to_string(loop_count) + " ends past the last MIDI tick");
      }

      for (const auto& token : entry.pitches) {
        NoteEvent note;
        if (!resolvePitch(token, instrument, note.pitch, error)) {
          return false;
        }
        note.start_tick = static_cast<Tick>(cursor);
        note.duration = *length;
        events.push_back(note);
      }

      cursor += *length;
    }
  }
  return true;
}

}  // namespace stylec
