/**
 * @file fm_algorithm.h
 * @brief Operator routing graphs
 *
 * Operators are numbered 1-4 and stored at index 0-3. Operator 4 is always
 * rendered first and is the deepest modulator; an operator can only be
 * modulated by operators with a higher number, so rendering 4, 3, 2, 1 in
 * order always has every modulation input ready.
 *
 *   id  graph                        carriers
 *   0   4 > 3 > 2 > 1                1
 *   1   4 > 3 > 1, 2 > 1             1
 *   2   4 > 3 > 1, 4 > 2 > 1         1
 *   3   4 > 2 > 1, 3 > 2             1
 *   4   4 > 3, 2 > 1                 1 3
 *   5   4 > 1, 4 > 2, 4 > 3          1 2 3
 *   6   4 > 3                        1 2 3
 *   7   4 > 3 > 1, 3 > 2             1 2
 *   8   4 > 2 > 1                    1 3
 *   9   4 > 3 > 2                    1 2
 *   10  4 > 1                        1 2 3
 *   11  (none)                       1 2 3 4
 */

#pragma once

#include <cstdint>

namespace dsp {

static constexpr uint8_t kNumOperators = 4;
static constexpr uint8_t kNumAlgorithms = 12;

// Algorithm used for ids outside 0..kNumAlgorithms-1
static constexpr uint8_t kParallelAlgorithm = 11;

/**
 * @brief One routing graph
 *
 * Bit n of a mask stands for operator n+1.
 */
struct FmAlgorithm {
    uint8_t modulators[kNumOperators];  // Operators summed into each operator's phase input
    uint8_t carriers;                   // Operators summed into the voice output
};

/**
 * @brief Look up a routing graph
 * @param id Algorithm id; unknown ids get the parallel algorithm
 */
const FmAlgorithm& GetAlgorithm(uint8_t id);

inline bool IsCarrier(const FmAlgorithm& algorithm, uint8_t op) {
    return (algorithm.carriers >> op) & 1;
}

}  // namespace dsp
