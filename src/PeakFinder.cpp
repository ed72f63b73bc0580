#include "ramancal/PeakFinder.hpp"
#include <stdexcept>
#include <sstream>
#include <string>
#include <algorithm>

namespace ramancal {

namespace {
constexpr const char* TAG = "PeakFinder";

void check_signal(const Vector& signal, const char* fn)
{
    if (!signal.allFinite())
        throw std::invalid_argument(std::string(fn) + "(): signal contains NaN/Inf");
}

IndexVector select_by_prominence(const IndexVector& maxima,
                                 const Vector&      prominences,
                                 Real               threshold)
{
    IndexVector kept;
    kept.reserve(maxima.size());
    for (std::size_t k = 0; k < maxima.size(); ++k)
        if (prominences[static_cast<Eigen::Index>(k)] >= threshold)
            kept.push_back(maxima[k]);
    return kept;
}
} // unnamed namespace

/* ---------------------------------------------------------------------- */
IndexVector local_maxima(const Vector& x)
{
    IndexVector peaks;
    const Eigen::Index i_max = x.size() - 1;

    Eigen::Index i = 1;
    while (i < i_max) {
        if (x[i - 1] < x[i]) {
            /* walk over a possible plateau */
            Eigen::Index ahead = i + 1;
            while (ahead < i_max && x[ahead] == x[i]) ++ahead;

            if (x[ahead] < x[i]) {
                const Eigen::Index left  = i;
                const Eigen::Index right = ahead - 1;
                peaks.push_back((left + right) / 2);
                i = ahead;              // skip the plateau
            }
        }
        ++i;
    }
    return peaks;
}

/* ---------------------------------------------------------------------- */
Vector peak_prominences(const Vector& x, const IndexVector& peaks)
{
    const Eigen::Index n = x.size();
    Vector prom(static_cast<Eigen::Index>(peaks.size()));

    for (std::size_t k = 0; k < peaks.size(); ++k) {
        const Eigen::Index p = peaks[k];
        if (p < 0 || p >= n)
            throw std::out_of_range("peak_prominences(): peak index " +
                                    std::to_string(p) + " outside signal");
        const Real height = x[p];

        // left: lowest point before reaching higher terrain or the boundary
        Real left_min = height;
        for (Eigen::Index i = p; i >= 0 && x[i] <= height; --i)
            left_min = std::min(left_min, x[i]);

        // right: same towards the end of the signal
        Real right_min = height;
        for (Eigen::Index i = p; i < n && x[i] <= height; ++i)
            right_min = std::min(right_min, x[i]);

        prom[static_cast<Eigen::Index>(k)] = height - std::max(left_min, right_min);
    }
    return prom;
}

/* ---------------------------------------------------------------------- */
IndexVector find_peaks(const Vector& signal, Real min_prominence)
{
    check_signal(signal, "find_peaks");
    const IndexVector maxima = local_maxima(signal);
    return select_by_prominence(maxima, peak_prominences(signal, maxima), min_prominence);
}

/* ---------------------------------------------------------------------- */
PeakSearchResult find_n_most_prominent_peaks(const Vector& signal,
                                             int           num_peaks,
                                             Real          prominence_increment,
                                             int           max_iterations)
{
    check_signal(signal, "find_n_most_prominent_peaks");
    if (num_peaks < 0)
        throw std::invalid_argument("find_n_most_prominent_peaks(): num_peaks < 0");
    if (!(prominence_increment > 0.0))
        throw std::invalid_argument("find_n_most_prominent_peaks(): prominence increment "
                                    "must be > 0");
    if (max_iterations < 0)
        throw std::invalid_argument("find_n_most_prominent_peaks(): max_iterations < 0");

    /* prominence does not depend on the threshold: compute it once */
    const IndexVector maxima      = local_maxima(signal);
    const Vector      prominences = peak_prominences(signal, maxima);
    const auto        target      = static_cast<std::size_t>(num_peaks);

    PeakSearchResult res;
    res.peaks = select_by_prominence(maxima, prominences, 0.0);

    if (res.peaks.size() < target) {
        std::ostringstream msg;
        msg << "The number of peaks found with minimal prominence (" << res.peaks.size()
            << ") is less than the specified number of peaks (" << num_peaks << ").";
        warn(res.diagnostics, DiagnosticCode::InsufficientPeaksFound, TAG, msg.str());
        return res;
    }

    Real prominence = 0.0;
    while (res.peaks.size() > target && res.iterations < max_iterations) {
        prominence += prominence_increment;
        ++res.iterations;
        res.peaks = select_by_prominence(maxima, prominences, prominence);
    }
    res.final_prominence = prominence;

    if (res.peaks.size() > target) {
        std::ostringstream msg;
        msg << "Max iterations (" << max_iterations << ") reached with " << res.peaks.size()
            << " peaks left instead of " << num_peaks
            << ". Try increasing max_iterations or the prominence increment.";
        warn(res.diagnostics, DiagnosticCode::PeakSearchNotConverged, TAG, msg.str());
    } else if (res.peaks.size() < target) {
        std::ostringstream msg;
        msg << "The number of peaks found (" << res.peaks.size()
            << ") is less than the specified number of peaks (" << num_peaks
            << "). Try decreasing the prominence increment so that peaks with similar "
               "prominences are not skipped over.";
        warn(res.diagnostics, DiagnosticCode::PeakSearchOvershot, TAG, msg.str());
    }
    return res;
}

} // namespace ramancal
