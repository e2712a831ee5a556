#pragma once

// Lightweight DSP helpers shared across the engine.

#include <math.h>
#include <stdint.h>

#ifndef PMSYNTH_ALWAYS_INLINE
#define PMSYNTH_ALWAYS_INLINE __attribute__((always_inline)) static inline
#endif

// Full-scale value of a signed 16-bit sample, symmetrical on the + and - side.
#define PMSYNTH_INT16_MAX 32767

PMSYNTH_ALWAYS_INLINE float clampf(float x, float mn, float mx) {
  return (x < mn) ? mn : (x > mx) ? mx : x;
}

// Hard clip to the representable sample range.
PMSYNTH_ALWAYS_INLINE float saturatef(float x) {
  return clampf(x, -1.0f, 1.0f);
}

PMSYNTH_ALWAYS_INLINE float lerp(float a, float b, float t) {
  return a + (b - a) * t;
}

// Wrap x into [0, size). Handles negative values and values several
// periods away, which phase modulation produces routinely.
PMSYNTH_ALWAYS_INLINE float wrapf(float x, float size) {
  if (x >= 0.0f && x < size) return x;
  x -= floorf(x / size) * size;
  // floorf rounding can land exactly on size for tiny negative inputs
  return (x >= size) ? 0.0f : x;
}

// These make finiteness testing safe even after -ffast-math.
PMSYNTH_ALWAYS_INLINE bool is_finitef(float x) {
  return (-HUGE_VALF < x) && (x < HUGE_VALF);
}

PMSYNTH_ALWAYS_INLINE int16_t float_to_s16(float x) {
  return static_cast<int16_t>(lrintf(saturatef(x) * PMSYNTH_INT16_MAX));
}
