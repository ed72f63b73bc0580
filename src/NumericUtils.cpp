#include "ramancal/NumericUtils.hpp"
#include <boost/math/statistics/univariate_statistics.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>
#include <cmath>

namespace ramancal {

/* ---------------------------------------------------------------------- */
Real calculate_raman_shift(Real emission_nm, Real excitation_nm)
{
    return (1.0 / excitation_nm - 1.0 / emission_nm) * 1e7;
}

Vector calculate_raman_shift(const Vector& emission_nm, Real excitation_nm)
{
    if (!(excitation_nm > 0.0) || !std::isfinite(excitation_nm))
        throw std::invalid_argument(
            "calculate_raman_shift(): excitation wavelength must be positive and finite");

    return ((1.0 / excitation_nm) - emission_nm.array().inverse()).matrix() * 1e7;
}

/* ---------------------------------------------------------------------- */
Real interpolate_between_two_values(Real x0, Real x1, Real fraction)
{
    return x0 + fraction * (x1 - x0);
}

Vector interpolate_between_two_values(const Vector& x0,
                                      const Vector& x1,
                                      const Vector& fraction)
{
    if (x0.size() != x1.size() || x0.size() != fraction.size())
        throw std::invalid_argument(
            "interpolate_between_two_values(): inputs differ in length");

    return (x0.array() + fraction.array() * (x1 - x0).array()).matrix();
}

/* ---------------------------------------------------------------------- */
Vector median_filter(const Vector& signal, int kernel_size)
{
    if (kernel_size < 1 || kernel_size % 2 == 0)
        throw std::invalid_argument("median_filter(): kernel size must be a positive odd "
                                    "integer, got " + std::to_string(kernel_size));

    const Eigen::Index n    = signal.size();
    const Eigen::Index half = kernel_size / 2;
    if (kernel_size == 1 || n == 0) return signal;

    Vector out(n);
    std::vector<Real> window(static_cast<std::size_t>(kernel_size));

    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index k = -half; k <= half; ++k) {
            const Eigen::Index j = i + k;
            window[static_cast<std::size_t>(k + half)] =
                (j < 0 || j >= n) ? 0.0 : signal[j];        // zero padding
        }
        /* median() reorders its argument, window is rebuilt every pass */
        out[i] = boost::math::statistics::median(window);
    }
    return out;
}

/* ---------------------------------------------------------------------- */
Vector min_max_normalize(const Vector& signal)
{
    if (signal.size() == 0)
        throw std::invalid_argument("min_max_normalize(): empty signal");

    const Real lo = signal.minCoeff();
    const Real hi = signal.maxCoeff();
    if (!(hi > lo))
        throw std::invalid_argument("min_max_normalize(): signal is constant, "
                                    "cannot scale to [0, 1]");

    return ((signal.array() - lo) / (hi - lo)).matrix();
}

Vector index_axis(Eigen::Index n)
{
    if (n <= 0) return Vector();
    return Vector::LinSpaced(n, 0.0, static_cast<Real>(n - 1));
}

bool all_finite(const Vector& v)
{
    return v.allFinite();
}

/* ------------------------------------------------------------------ */

Vector interp_linear(const Vector& x_in,
                     const Vector& y_in,
                     const Vector& x_out)
{
    const Eigen::Index n_in  = x_in.size();
    const Eigen::Index n_out = x_out.size();

    if (n_in != y_in.size() || n_in < 2)
        throw std::invalid_argument("interp_linear(): invalid input table");

    Vector out(n_out);

    for (Eigen::Index k = 0; k < n_out; ++k) {
        const double x = x_out[k];

        if (x <= x_in[0])        { out[k] = y_in[0];        continue; }
        if (x >= x_in[n_in - 1]) { out[k] = y_in[n_in - 1]; continue; }

        // binary search for x_in[lo] ≤ x < x_in[hi]
        const auto* first = x_in.data();
        const auto* it    = std::upper_bound(first, first + n_in, x);
        const Eigen::Index hi = static_cast<Eigen::Index>(it - first);
        const Eigen::Index lo = hi - 1;

        const double dx = x_in[hi] - x_in[lo];
        const double t  = (std::abs(dx) < 1e-12) ? 0.0 : (x - x_in[lo]) / dx;
        out[k] = y_in[lo] + t * (y_in[hi] - y_in[lo]);
    }
    return out;
}

} // namespace ramancal
