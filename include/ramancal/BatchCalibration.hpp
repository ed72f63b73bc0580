#pragma once
#include "Calibrator.hpp"
#include <string>
#include <vector>

namespace ramancal {

/* one excitation / emission pair to calibrate */
struct CalibrationPair {
    std::string name;
    Vector      excitation;
    Vector      emission;
};

/**
 * Calibrate independent pairs on `nthreads` workers (0 == hardware
 * concurrency).  Returns one run per pair in input order; a failing pair
 * yields a Failed run and does not affect the others, whether it fails
 * calibration or is rejected as invalid input.
 */
std::vector<CalibrationRun> calibrate_batch(const std::vector<CalibrationPair>& pairs,
                                            const CalibrationConfig&            config,
                                            unsigned                            nthreads = 0);

} // namespace ramancal
