// Score model derived quantities.

#include "core/score.h"

namespace tunescript {

int Score::totalBars() const {
  int total = 0;
  for (const auto& section : sections) {
    total += section.bars;
  }
  return total;
}

Beat Score::totalBeats() const {
  return static_cast<Beat>(totalBars()) * kBeatsPerBar;
}

double Score::durationSeconds() const {
  if (tempo <= 0) return 0.0;
  return totalBeats() / static_cast<double>(tempo) * 60.0;
}

bool Score::hasDrumHits() const {
  for (const auto& section : sections) {
    if (section.hasDrumHits()) return true;
  }
  return false;
}

void Score::assignStartBars() {
  int bar = 0;
  for (auto& section : sections) {
    section.start_bar = bar;
    bar += section.bars;
  }
}

}  // namespace tunescript
