#pragma once
#include "Types.hpp"
#include "Diagnostics.hpp"

namespace ramancal {

struct PeakSearchResult {
    IndexVector peaks;                  // ascending detector indices
    Real        final_prominence = 0.0; // threshold that produced `peaks`
    int         iterations       = 0;   // threshold increments performed
    Diagnostics diagnostics;            // empty == target count reached
};

/*  Indices of all local maxima, ascending.  A flat top counts once, at the
 *  (rounded-down) middle of the plateau.  End samples are never maxima.    */
IndexVector local_maxima(const Vector& signal);

/*  Topographic prominence of every entry of `peaks`:  height above the
 *  higher of the two lowest points that separate the peak from higher
 *  terrain (or from the signal boundary).                                  */
Vector peak_prominences(const Vector& signal, const IndexVector& peaks);

/* all local maxima with prominence ≥ min_prominence */
IndexVector find_peaks(const Vector& signal, Real min_prominence = 0.0);

/**
 * Find `num_peaks` most prominent peaks.
 *
 * Starts from all maxima (prominence ≥ 0) and raises the prominence
 * threshold by `prominence_increment` until exactly `num_peaks` survive or
 * `max_iterations` increments have been tried.  Never throws for a count
 * that cannot be met.  The best available set is returned together with a
 * diagnostic:
 *
 *   InsufficientPeaksFound  fewer maxima than requested to begin with
 *   PeakSearchNotConverged  iteration cap hit, still too many peaks
 *   PeakSearchOvershot      one increment removed too many peaks
 */
PeakSearchResult find_n_most_prominent_peaks(const Vector& signal,
                                             int           num_peaks,
                                             Real          prominence_increment = 0.005,
                                             int           max_iterations       = 500);

} // namespace ramancal
