/**
 * @file wavetable.cc
 * @brief Wavetable generation
 */

#include "wavetable.h"
#include "../../common/dsp_utils.h"

#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace dsp {

namespace {

constexpr double kTau = 2.0 * M_PI;

int16_t ToSample(double value) {
    return static_cast<int16_t>(lround(PMSYNTH_INT16_MAX * value));
}

}  // namespace

WaveTable::WaveTable()
    : shape_(SHAPE_SINE)
    , samples_()
{
}

void WaveTable::Init(Shape shape) {
    shape_ = shape;
    const double n = static_cast<double>(kSize);
    const uint32_t half = kSize / 2;

    for (uint32_t i = 0; i < kSize; ++i) {
        const double t = static_cast<double>(i) / n;
        switch (shape) {
            case SHAPE_SINE12:
                samples_[i] = ToSample(0.5 * sin(t * kTau) + 0.5 * sin(2.0 * t * kTau));
                break;
            case SHAPE_SAW:
                // Rises 0 -> +1 over the first half, then -1 -> 0 over the second
                samples_[i] = (i < half)
                    ? ToSample(2.0 * t)
                    : ToSample(-1.0 + 2.0 * (static_cast<double>(i - half) / n));
                break;
            case SHAPE_PULSE:
                samples_[i] = (i < half) ? PMSYNTH_INT16_MAX : -PMSYNTH_INT16_MAX;
                break;
            case SHAPE_SINE:
            default:
                samples_[i] = ToSample(sin(t * kTau));
                break;
        }
    }
    samples_[kSize] = samples_[0];  // Guard sample
}

void WaveBank::Init() {
    for (uint8_t s = 0; s < WaveTable::SHAPE_COUNT; ++s) {
        tables_[s].Init(static_cast<WaveTable::Shape>(s));
    }
}

}  // namespace dsp
