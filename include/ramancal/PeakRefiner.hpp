#pragma once
#include "Types.hpp"
#include "Diagnostics.hpp"
#include <string>

namespace ramancal {

enum class RefinementMethod { None, Parabolic, Gaussian };

const char* to_string(RefinementMethod method);

/* "none" | "parabolic" | "gaussian" (case-insensitive), anything else throws */
RefinementMethod parse_refinement_method(const std::string& name);

/* window used when a caller passes window ≤ 0 */
int default_refinement_window(RefinementMethod method);

struct RefinedPeak {
    Real        position = 0.0;   // sub-pixel index
    Real        height   = 0.0;   // model value at `position`
    Diagnostics diagnostics;      // non-empty == fell back to integer peak
};

struct RefinedPeaks {
    Vector      positions;
    Vector      heights;
    Diagnostics diagnostics;
};

/**
 * Three-point parabolic interpolation
 *
 *     x* = i + (y[i-1] − y[i+1]) / (2·(y[i-1] − 2·y[i] + y[i+1]))
 *
 * Falls back to (i, y[i]) with a RefinementOutOfBounds diagnostic when the
 * peak sits on the first/last sample, the curvature vanishes or x* leaves
 * the open interval (i−1, i+1).
 */
RefinedPeak refine_peak_parabolic(Eigen::Index peak_index, const Vector& signal);

/**
 * Least-squares fit of  A·exp(−(x−μ)²/(2σ²))  to the `window` samples
 * centred on `peak_index`, seeded with A = 1, μ = peak_index, σ = 1.
 *
 * Throws RefinementOutOfBounds when the window leaves the signal and
 * OptimizerDidNotConverge when the fit fails.  There is no fallback.
 */
RefinedPeak refine_peak_gaussian(Eigen::Index peak_index,
                                 const Vector& signal,
                                 int           window = 9);

/* dispatch on `method`; window ≤ 0 selects default_refinement_window() */
RefinedPeak refine_peak(Eigen::Index     peak_index,
                        const Vector&    signal,
                        RefinementMethod method,
                        int              window = 0);

/* refine_peak() over a whole PeakSet, diagnostics concatenated */
RefinedPeaks refine_peaks(const IndexVector& peaks,
                          const Vector&      signal,
                          RefinementMethod   method,
                          int                window = 0);

} // namespace ramancal
