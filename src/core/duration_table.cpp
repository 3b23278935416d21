// Duration table lookups.

#include "core/duration_table.h"

namespace stylec {

std::optional<Tick> lookupDuration(std::string_view code) {
  for (const auto& entry : kDurationTable) {
    if (code == entry.code) return entry.ticks;
  }
  return std::nullopt;
}

}  // namespace stylec
