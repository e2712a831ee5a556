/**
 * @file fm_algorithm.cc
 * @brief Operator routing table
 */

#include "fm_algorithm.h"

namespace dsp {

namespace {

constexpr uint8_t OP1 = 1 << 0;
constexpr uint8_t OP2 = 1 << 1;
constexpr uint8_t OP3 = 1 << 2;
constexpr uint8_t OP4 = 1 << 3;

// {op1, op2, op3, op4} modulators, carriers
const FmAlgorithm kAlgorithms[kNumAlgorithms] = {
    /*  0 */ {{OP2,       OP3,       OP4, 0}, OP1},
    /*  1 */ {{OP2 | OP3, 0,         OP4, 0}, OP1},
    /*  2 */ {{OP2 | OP3, OP4,       OP4, 0}, OP1},
    /*  3 */ {{OP2,       OP3 | OP4, 0,   0}, OP1},
    /*  4 */ {{OP2,       0,         OP4, 0}, OP1 | OP3},
    /*  5 */ {{OP4,       OP4,       OP4, 0}, OP1 | OP2 | OP3},
    /*  6 */ {{0,         0,         OP4, 0}, OP1 | OP2 | OP3},
    /*  7 */ {{OP3,       OP3,       OP4, 0}, OP1 | OP2},
    /*  8 */ {{OP2,       OP4,       0,   0}, OP1 | OP3},
    /*  9 */ {{0,         OP3,       OP4, 0}, OP1 | OP2},
    /* 10 */ {{OP4,       0,         0,   0}, OP1 | OP2 | OP3},
    /* 11 */ {{0,         0,         0,   0}, OP1 | OP2 | OP3 | OP4},
};

}  // namespace

const FmAlgorithm& GetAlgorithm(uint8_t id) {
    return kAlgorithms[id < kNumAlgorithms ? id : kParallelAlgorithm];
}

}  // namespace dsp
