/**
 * @file wavetable.h
 * @brief Single-cycle int16 wavetables shared by all operators
 *
 * Tables are computed once at engine start-up and are read-only afterwards.
 * Each table stores kSize samples plus one guard sample (a copy of sample 0)
 * so linear interpolation never needs to wrap the second index.
 */

#pragma once

#include <cstdint>

namespace dsp {

class WaveTable {
public:
    static constexpr uint32_t kSize = 2048;

    enum Shape {
        SHAPE_SINE = 0,     // Pure sine
        SHAPE_SINE12,       // Sine plus its first harmonic, equal parts
        SHAPE_SAW,          // Sawtooth, in phase with the sine
        SHAPE_PULSE,        // 50% pulse, in phase with the sine
        SHAPE_COUNT
    };

    WaveTable();

    void Init(Shape shape);

    Shape shape() const { return shape_; }

    /**
     * @brief Read the table at a fractional index
     * @param index Position in [0, kSize)
     * @return Linearly interpolated sample, -1.0 to 1.0
     */
    float Read(float index) const {
        const uint32_t i = static_cast<uint32_t>(index);
        const float frac = index - static_cast<float>(i);
        const float a = static_cast<float>(samples_[i]);
        const float b = static_cast<float>(samples_[i + 1]);
        return (a + (b - a) * frac) * kInt16ToFloat;
    }

    int16_t sample(uint32_t i) const { return samples_[i]; }

private:
    static constexpr float kInt16ToFloat = 1.0f / 32767.0f;

    Shape shape_;
    int16_t samples_[kSize + 1];
};

/**
 * @brief One table per shape, built together
 */
class WaveBank {
public:
    void Init();

    const WaveTable& Get(uint8_t shape) const {
        return tables_[shape < WaveTable::SHAPE_COUNT ? shape : 0];
    }

private:
    WaveTable tables_[WaveTable::SHAPE_COUNT];
};

}  // namespace dsp
