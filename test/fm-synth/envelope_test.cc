#include <cmath>
#include <cstdio>
#include "fm-synth/dsp/fm_envelope.h"

using dsp::FmEnvelope;

static bool Near(float a, float b) {
  return std::fabs(a - b) < 1e-6f;
}

static void AdvanceN(FmEnvelope& env, int n) {
  for (int i = 0; i < n; ++i) {
    env.Advance();
  }
}

int main() {
  FmEnvelope env;
  env.Init({48, 10, 0.5f, 20});

  if (!env.IsSilent() || env.Advance() != 0.0f) {
    std::fprintf(stderr, "FAIL: fresh envelope is not idle at level 0\n");
    return 1;
  }

  // Attack ramps linearly from idle
  env.NoteOn();
  if (env.IsSilent() || env.IsReleased()) {
    std::fprintf(stderr, "FAIL: triggered envelope reports silent or released\n");
    return 1;
  }
  AdvanceN(env, 24);
  if (!Near(env.level(), 0.5f) || env.GetState() != FmEnvelope::STATE_ATTACK) {
    std::fprintf(stderr, "FAIL: half-way through attack level=%f state=%d\n",
                 env.level(), env.GetState());
    return 1;
  }
  AdvanceN(env, 24);
  if (env.level() != 1.0f || env.GetState() != FmEnvelope::STATE_DECAY) {
    std::fprintf(stderr, "FAIL: end of attack level=%f state=%d\n",
                 env.level(), env.GetState());
    return 1;
  }

  // Decay settles on the sustain level and holds there
  AdvanceN(env, 10);
  if (!Near(env.level(), 0.5f) || env.GetState() != FmEnvelope::STATE_SUSTAIN) {
    std::fprintf(stderr, "FAIL: end of decay level=%f state=%d\n",
                 env.level(), env.GetState());
    return 1;
  }
  AdvanceN(env, 1000);
  if (!Near(env.level(), 0.5f) || env.GetState() != FmEnvelope::STATE_SUSTAIN) {
    std::fprintf(stderr, "FAIL: sustain did not hold\n");
    return 1;
  }

  // Release ramps from the level at release time
  env.NoteOff();
  if (!env.IsReleased() || env.IsSilent()) {
    std::fprintf(stderr, "FAIL: released envelope state wrong\n");
    return 1;
  }
  AdvanceN(env, 10);
  if (!Near(env.level(), 0.25f)) {
    std::fprintf(stderr, "FAIL: half-way through release level=%f\n", env.level());
    return 1;
  }

  // Retrigger mid-release keeps the level
  env.NoteOn();
  if (!Near(env.level(), 0.25f) || env.GetState() != FmEnvelope::STATE_ATTACK) {
    std::fprintf(stderr, "FAIL: retrigger jumped level to %f\n", env.level());
    return 1;
  }
  AdvanceN(env, 24);
  if (!Near(env.level(), 0.625f)) {
    std::fprintf(stderr, "FAIL: retrigger attack level=%f, expected 0.625\n", env.level());
    return 1;
  }

  // Release to idle
  env.NoteOff();
  AdvanceN(env, 20);
  if (!env.IsSilent() || env.level() != 0.0f) {
    std::fprintf(stderr, "FAIL: release did not end idle at 0\n");
    return 1;
  }

  // Note-off during attack releases from the partial level
  env.NoteOn();
  AdvanceN(env, 12);
  env.NoteOff();
  if (env.GetState() != FmEnvelope::STATE_RELEASE || !Near(env.level(), 0.25f)) {
    std::fprintf(stderr, "FAIL: note-off during attack state=%d level=%f\n",
                 env.GetState(), env.level());
    return 1;
  }

  // Zero-length segments are instantaneous
  FmEnvelope fast;
  fast.Init({0, 0, 0.7f, 0});
  fast.NoteOn();
  if (fast.Advance() != 1.0f || fast.GetState() != FmEnvelope::STATE_DECAY) {
    std::fprintf(stderr, "FAIL: zero attack was not instantaneous\n");
    return 1;
  }
  if (!Near(fast.Advance(), 0.7f) || fast.GetState() != FmEnvelope::STATE_SUSTAIN) {
    std::fprintf(stderr, "FAIL: zero decay was not instantaneous\n");
    return 1;
  }
  fast.NoteOff();
  if (fast.Advance() != 0.0f || !fast.IsSilent()) {
    std::fprintf(stderr, "FAIL: zero release was not instantaneous\n");
    return 1;
  }

  // Sustain level is clamped to 0..1
  FmEnvelope clamped;
  clamped.Init({0, 0, 1.5f, 0});
  if (clamped.params().sustain != 1.0f) {
    std::fprintf(stderr, "FAIL: sustain level not clamped\n");
    return 1;
  }

  // Reset returns to idle from anywhere
  env.NoteOn();
  AdvanceN(env, 30);
  env.Reset();
  if (!env.IsSilent() || env.level() != 0.0f) {
    std::fprintf(stderr, "FAIL: reset did not return to idle\n");
    return 1;
  }

  std::printf("envelope tests passed\n");
  return 0;
}
