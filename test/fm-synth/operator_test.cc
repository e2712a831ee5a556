#include <cmath>
#include <cstdio>
#include "fm-synth/dsp/fm_operator.h"
#include "fm-synth/dsp/wavetable.h"

using dsp::FmEnvelope;
using dsp::FmOperator;
using dsp::WaveTable;

static const FmEnvelope::Params kFlat = {0, 0, 1.0f, 0};

// 375 Hz at 48kHz advances a 2048 table by exactly 16 samples
static const float kPitch = 375.0f;
static const float kRate = 48000.0f;

int main() {
  static WaveTable sine;
  sine.Init(WaveTable::SHAPE_SINE);

  float zeros[256] = {0};
  float out[256];

  // Table sanity: quarter cycle of the sine is full scale, guard == first
  if (sine.sample(512) != 32767 || sine.sample(WaveTable::kSize) != sine.sample(0)) {
    std::fprintf(stderr, "FAIL: sine table shape\n");
    return 1;
  }

  // Phase wraps back to exactly 0 after one cycle, whatever the block split
  const uint32_t splits[][2] = {{128, 0}, {50, 78}, {1, 127}, {64, 64}};
  for (const auto& split : splits) {
    FmOperator op;
    op.Init(&sine, kRate, kFlat, 1.0f);
    op.NoteOn(kPitch, 1.0f);
    op.Render(zeros, out, split[0]);
    if (split[1] > 0) {
      op.Render(zeros, out, split[1]);
    }
    if (op.phase() != 0.0f) {
      std::fprintf(stderr, "FAIL: phase after %u+%u samples is %f\n",
                   split[0], split[1], op.phase());
      return 1;
    }
  }

  // A silent operator writes zeros and keeps its phase
  {
    FmOperator op;
    op.Init(&sine, kRate, kFlat, 1.0f);
    for (int i = 0; i < 64; ++i) out[i] = 1.0f;
    op.Render(zeros, out, 64);
    for (int i = 0; i < 64; ++i) {
      if (out[i] != 0.0f) {
        std::fprintf(stderr, "FAIL: silent operator wrote %f at %d\n", out[i], i);
        return 1;
      }
    }
    if (op.phase() != 0.0f || !op.IsSilent()) {
      std::fprintf(stderr, "FAIL: silent operator moved phase\n");
      return 1;
    }
  }

  // Note-on is deferred to the next render but already counts as sounding
  {
    FmOperator op;
    op.Init(&sine, kRate, kFlat, 1.0f);
    op.NoteOn(kPitch, 1.0f);
    if (!op.pending_reset() || op.IsSilent() || op.IsReleased() ||
        op.envelope().GetState() != FmEnvelope::STATE_IDLE) {
      std::fprintf(stderr, "FAIL: pending note-on state\n");
      return 1;
    }
    op.Render(zeros, out, 1);
    if (op.pending_reset() || op.envelope().GetState() == FmEnvelope::STATE_IDLE) {
      std::fprintf(stderr, "FAIL: render did not apply the note-on\n");
      return 1;
    }
  }

  // A note-off arriving before the first render is not lost
  {
    FmOperator op;
    op.Init(&sine, kRate, {0, 0, 1.0f, 4800}, 1.0f);
    op.NoteOn(kPitch, 1.0f);
    op.NoteOff(kPitch, 0.0f);
    if (op.pending_reset() || op.envelope().GetState() != FmEnvelope::STATE_RELEASE ||
        !op.IsReleased()) {
      std::fprintf(stderr, "FAIL: note-off with pending note-on\n");
      return 1;
    }
  }

  // Output is scaled by envelope, velocity and volume
  {
    FmOperator op;
    op.Init(&sine, kRate, kFlat, 0.5f);
    op.NoteOn(kPitch, 0.5f);
    op.Render(zeros, out, 64);
    // Sample 32 reads table index 512, the positive peak
    if (std::fabs(out[32] - 0.25f) > 1e-4f || std::fabs(out[0]) > 1e-6f) {
      std::fprintf(stderr, "FAIL: scaled output out[0]=%f out[32]=%f\n", out[0], out[32]);
      return 1;
    }
  }

  // A modulation input of 1.0 shifts the read head by one whole cycle
  {
    FmOperator a;
    FmOperator b;
    a.Init(&sine, kRate, kFlat, 1.0f);
    b.Init(&sine, kRate, kFlat, 1.0f);
    a.NoteOn(kPitch, 1.0f);
    b.NoteOn(kPitch, 1.0f);

    float ones[128];
    float out_b[128];
    for (int i = 0; i < 128; ++i) ones[i] = 1.0f;
    a.Render(zeros, out, 128);
    b.Render(ones, out_b, 128);
    for (int i = 0; i < 128; ++i) {
      if (std::fabs(out[i] - out_b[i]) > 1e-5f) {
        std::fprintf(stderr, "FAIL: full-cycle modulation changed sample %d\n", i);
        return 1;
      }
    }

    // Half a cycle inverts the sine
    float halves[128];
    for (int i = 0; i < 128; ++i) halves[i] = -0.5f;
    FmOperator c;
    c.Init(&sine, kRate, kFlat, 1.0f);
    c.NoteOn(kPitch, 1.0f);
    c.Render(halves, out_b, 128);
    if (std::fabs(out_b[32] + out[32]) > 1e-4f) {
      std::fprintf(stderr, "FAIL: half-cycle modulation out=%f ref=%f\n", out_b[32], out[32]);
      return 1;
    }
  }

  // Pitch ratio scales the phase increment
  {
    FmOperator op;
    op.Init(&sine, kRate, kFlat, 1.0f);
    op.NoteOn(kPitch, 1.0f);
    op.SetPitchRatio(2.0f);
    op.Render(zeros, out, 64);
    if (op.phase() != 0.0f || op.pitch_ratio() != 2.0f) {
      std::fprintf(stderr, "FAIL: doubled pitch phase=%f\n", op.phase());
      return 1;
    }
  }

  std::printf("operator tests passed\n");
  return 0;
}
