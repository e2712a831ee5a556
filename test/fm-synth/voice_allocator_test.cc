#include <cmath>
#include <cstdio>
#include <cstring>
#include "common/midi_helper.h"
#include "fm-synth/dsp/voice_allocator.h"

using namespace dsp;

static FmPatch MakePatch() {
  FmPatch patch;
  memset(&patch, 0, sizeof(patch));
  strncpy(patch.name, "Test", sizeof(patch.name) - 1);
  patch.algorithm = 0;
  for (uint8_t n = 0; n < kNumOperators; ++n) {
    patch.ops[n].wave = WaveTable::SHAPE_SINE;
    patch.ops[n].detune = 1.0f;
    patch.ops[n].volume = 0.5f;
    patch.ops[n].env = {0, 0, 1.0f, 48000};
  }
  return patch;
}

static float Pitch(uint8_t note) {
  float hz = 0.0f;
  common::MidiHelper::NoteToPitch(note, &hz);
  return hz;
}

static void RenderAll(VoiceAllocator& alloc) {
  float buf[16];
  for (uint8_t v = 0; v < alloc.polyphony(); ++v) {
    alloc.GetVoiceMutable(v).Render(buf, 16);
  }
}

static bool Plays(const VoiceAllocator& alloc, uint8_t v, uint8_t note) {
  const FmVoice& voice = alloc.GetVoice(v);
  return voice.has_last_pitch() && voice.last_pitch() == Pitch(note);
}

int main() {
  static WaveBank bank;
  bank.Init();
  const FmPatch patch = MakePatch();

  // Polyphony bounds
  {
    static VoiceAllocator alloc;
    if (alloc.Init(0, patch, bank, 48000.0f) ||
        alloc.Init(VoiceAllocator::kMaxVoices + 1, patch, bank, 48000.0f) ||
        !alloc.Init(VoiceAllocator::kMaxVoices, patch, bank, 48000.0f)) {
      std::fprintf(stderr, "FAIL: polyphony range check\n");
      return 1;
    }
  }

  // Notes without a pitch are ignored
  {
    static VoiceAllocator alloc;
    alloc.Init(4, patch, bank, 48000.0f);
    alloc.NoteOn(200, 100);
    alloc.NoteOn(11, 100);
    alloc.NoteOn(120, 100);
    for (uint8_t pos = 0; pos < 4; ++pos) {
      if (alloc.lru(pos) != pos || alloc.GetVoice(pos).has_last_pitch()) {
        std::fprintf(stderr, "FAIL: unmapped note changed the pool\n");
        return 1;
      }
    }
    alloc.NoteOff(200, 0);
  }

  // Stealing takes the least recently used voice
  {
    static VoiceAllocator alloc;
    alloc.Init(2, patch, bank, 48000.0f);
    alloc.NoteOn(60, 100);
    alloc.NoteOn(64, 100);
    if (!Plays(alloc, 0, 60) || !Plays(alloc, 1, 64)) {
      std::fprintf(stderr, "FAIL: free voices not used in order\n");
      return 1;
    }
    alloc.NoteOn(67, 100);
    if (!Plays(alloc, 0, 67) || !Plays(alloc, 1, 64)) {
      std::fprintf(stderr, "FAIL: note 67 did not steal the voice holding 60\n");
      return 1;
    }
    if (alloc.lru(0) != 1 || alloc.lru(1) != 0) {
      std::fprintf(stderr, "FAIL: LRU order after stealing\n");
      return 1;
    }
  }

  // Released voices are taken before held ones
  {
    static VoiceAllocator alloc;
    alloc.Init(3, patch, bank, 48000.0f);
    alloc.NoteOn(60, 100);
    alloc.NoteOn(62, 100);
    alloc.NoteOn(64, 100);
    RenderAll(alloc);
    alloc.NoteOff(62, 0);
    if (!alloc.GetVoice(1).IsReleased() || alloc.GetVoice(1).IsSilent()) {
      std::fprintf(stderr, "FAIL: voice 1 not in release\n");
      return 1;
    }
    alloc.NoteOn(65, 100);
    if (!Plays(alloc, 1, 65) || !Plays(alloc, 0, 60)) {
      std::fprintf(stderr, "FAIL: released voice was not preferred\n");
      return 1;
    }
  }

  // A stale note-off does not release the note that replaced it
  {
    static VoiceAllocator alloc;
    alloc.Init(1, patch, bank, 48000.0f);
    alloc.NoteOn(60, 100);
    alloc.NoteOn(64, 100);
    RenderAll(alloc);
    alloc.NoteOff(60, 0);
    if (alloc.GetVoice(0).IsReleased() || !Plays(alloc, 0, 64)) {
      std::fprintf(stderr, "FAIL: stale note-off released the new note\n");
      return 1;
    }
    alloc.NoteOff(64, 0);
    if (!alloc.GetVoice(0).IsReleased()) {
      std::fprintf(stderr, "FAIL: note-off did not release\n");
      return 1;
    }
  }

  // Sustain pedal defers note-offs until it is lifted
  {
    static VoiceAllocator alloc;
    alloc.Init(2, patch, bank, 48000.0f);
    alloc.Sustain(32);
    if (alloc.IsSustained()) {
      std::fprintf(stderr, "FAIL: pedal value 32 counts as down\n");
      return 1;
    }
    alloc.Sustain(127);
    alloc.NoteOn(60, 100);
    alloc.NoteOn(64, 100);
    RenderAll(alloc);
    alloc.NoteOff(60, 0);
    const FmEnvelope::State held = alloc.GetVoice(0).op(0).envelope().GetState();
    if (held != FmEnvelope::STATE_SUSTAIN || !alloc.IsDeferred(60) || alloc.IsDeferred(64)) {
      std::fprintf(stderr, "FAIL: note-off under sustain changed the voice (state=%d)\n", held);
      return 1;
    }
    alloc.Sustain(0);
    if (!alloc.GetVoice(0).IsReleased() || alloc.GetVoice(1).IsReleased()) {
      std::fprintf(stderr, "FAIL: pedal release did not release exactly the deferred note\n");
      return 1;
    }
    if (alloc.IsDeferred(60) || alloc.sustain_level() != 0) {
      std::fprintf(stderr, "FAIL: deferred set not cleared\n");
      return 1;
    }
  }

  // A note played again while held by the pedal is no longer deferred
  {
    static VoiceAllocator alloc;
    alloc.Init(2, patch, bank, 48000.0f);
    alloc.Sustain(100);
    alloc.NoteOn(60, 100);
    alloc.NoteOff(60, 0);
    alloc.NoteOn(60, 100);
    if (alloc.IsDeferred(60) || !Plays(alloc, 0, 60) || !alloc.GetVoice(1).IsSilent()) {
      std::fprintf(stderr, "FAIL: retriggered note still deferred or moved voice\n");
      return 1;
    }
    alloc.Sustain(0);
    if (alloc.GetVoice(0).IsReleased()) {
      std::fprintf(stderr, "FAIL: pedal release cut a retriggered note\n");
      return 1;
    }
  }

  // A key struck again retriggers the voice already playing it
  {
    static VoiceAllocator alloc;
    alloc.Init(4, patch, bank, 48000.0f);
    alloc.NoteOn(60, 100);
    alloc.NoteOn(64, 100);
    RenderAll(alloc);
    alloc.NoteOn(60, 100);
    if (alloc.VoicesPlaying(60) != 1 || !Plays(alloc, 0, 60) ||
        !alloc.GetVoice(2).IsSilent() || !alloc.GetVoice(3).IsSilent()) {
      std::fprintf(stderr, "FAIL: note 60 on %d voices after a repeat\n",
                   alloc.VoicesPlaying(60));
      return 1;
    }
    if (alloc.lru(3) != 0 || alloc.lru(2) != 1) {
      std::fprintf(stderr, "FAIL: retriggered voice not most recently used\n");
      return 1;
    }
    RenderAll(alloc);
    if (alloc.GetVoice(0).op(0).envelope().GetState() != FmEnvelope::STATE_SUSTAIN) {
      std::fprintf(stderr, "FAIL: retriggered voice did not restart its envelope\n");
      return 1;
    }

    // One note-off ends the note; the repeat is then a no-op
    alloc.NoteOff(60, 0);
    if (!alloc.GetVoice(0).IsReleased() || alloc.VoicesPlaying(60) != 0 ||
        alloc.GetVoice(1).IsReleased()) {
      std::fprintf(stderr, "FAIL: note-off after a repeat\n");
      return 1;
    }
    alloc.NoteOff(60, 0);
    if (alloc.GetVoice(1).IsReleased() || !Plays(alloc, 1, 64)) {
      std::fprintf(stderr, "FAIL: second note-off reached another voice\n");
      return 1;
    }

    // Repeats never take more than one voice, even past the polyphony
    for (int k = 0; k < 8; ++k) {
      alloc.NoteOn(67, 100);
    }
    if (alloc.VoicesPlaying(67) != 1 || !Plays(alloc, 1, 64)) {
      std::fprintf(stderr, "FAIL: repeated note stole other voices\n");
      return 1;
    }
  }

  // Pitch bend reaches every voice
  {
    static VoiceAllocator alloc;
    alloc.Init(3, patch, bank, 48000.0f);
    alloc.PitchBend(16383);
    const float expected = std::pow(2.0f, (2.0f * 8191.0f / 8192.0f) / 12.0f);
    for (uint8_t v = 0; v < 3; ++v) {
      if (std::fabs(alloc.GetVoice(v).op(0).pitch_ratio() - expected) > 1e-5f) {
        std::fprintf(stderr, "FAIL: voice %d bend ratio %f\n", v,
                     alloc.GetVoice(v).op(0).pitch_ratio());
        return 1;
      }
    }
    alloc.PitchBend(common::kPitchBendCenter);
    if (alloc.GetVoice(2).op(3).pitch_ratio() != 1.0f) {
      std::fprintf(stderr, "FAIL: centred bend is not 1.0\n");
      return 1;
    }
  }

  // All notes off resets the pool and bumps the generation
  {
    static VoiceAllocator alloc;
    alloc.Init(4, patch, bank, 48000.0f);
    const uint32_t generation = alloc.generation();
    alloc.Sustain(127);
    alloc.NoteOn(60, 100);
    alloc.NoteOn(62, 100);
    alloc.NoteOn(64, 100);
    RenderAll(alloc);
    alloc.NoteOff(62, 0);
    alloc.AllNotesOff();
    if (alloc.generation() != generation + 1) {
      std::fprintf(stderr, "FAIL: generation not bumped\n");
      return 1;
    }
    for (uint8_t v = 0; v < 4; ++v) {
      if (!alloc.GetVoice(v).IsSilent() || alloc.GetVoice(v).has_last_pitch() ||
          alloc.lru(v) != v) {
        std::fprintf(stderr, "FAIL: voice %d not reset\n", v);
        return 1;
      }
    }
    if (alloc.IsDeferred(62)) {
      std::fprintf(stderr, "FAIL: deferred notes survived all notes off\n");
      return 1;
    }
  }

  std::printf("voice allocator tests passed\n");
  return 0;
}
