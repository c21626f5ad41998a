// Console synthesizer backend.

#include "playback/synth_backend.h"

namespace tunescript {

void ConsoleSynthBackend::noteOn(uint8_t channel, uint8_t pitch, uint8_t velocity) {
  std::fprintf(out_, "note_on  ch=%2u pitch=%3u vel=%3u\n", unsigned{channel}, unsigned{pitch},
               unsigned{velocity});
}

void ConsoleSynthBackend::noteOff(uint8_t channel, uint8_t pitch) {
  std::fprintf(out_, "note_off ch=%2u pitch=%3u\n", unsigned{channel}, unsigned{pitch});
}

void ConsoleSynthBackend::programChange(uint8_t channel, uint8_t program) {
  std::fprintf(out_, "program  ch=%2u program=%u\n", unsigned{channel}, unsigned{program});
}

void ConsoleSynthBackend::controlChange(uint8_t channel, uint8_t controller, uint8_t value) {
  std::fprintf(out_, "control  ch=%2u cc=%u value=%u\n", unsigned{channel}, unsigned{controller},
               unsigned{value});
}

void ConsoleSynthBackend::allNotesOff() {
  std::fprintf(out_, "all_notes_off\n");
  std::fflush(out_);
}

}  // namespace tunescript
