#include "ramancal/PeakRefiner.hpp"
#include "ramancal/Errors.hpp"
#include "ramancal/SimpleLM.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace ramancal {

namespace {
constexpr const char* TAG = "PeakRefiner";

RefinedPeak unrefined(Eigen::Index i, const Vector& y)
{
    RefinedPeak out;
    out.position = static_cast<Real>(i);
    out.height   = y[i];
    return out;
}

RefinedPeak fallback(Eigen::Index i, const Vector& y, const std::string& why)
{
    RefinedPeak out = unrefined(i, y);
    std::ostringstream msg;
    msg << "Parabolic interpolation of peak " << i << " failed: " << why
        << " Keeping the integer position.";
    warn(out.diagnostics, DiagnosticCode::RefinementOutOfBounds, TAG, msg.str());
    return out;
}

void check_index(Eigen::Index i, const Vector& y, const char* fn)
{
    if (i < 0 || i >= y.size())
        throw std::out_of_range(std::string(fn) + "(): peak index " + std::to_string(i) +
                                " outside signal of size " + std::to_string(y.size()));
}
} // unnamed namespace

/* ---------------------------------------------------------------------- */
const char* to_string(RefinementMethod method)
{
    switch (method) {
        case RefinementMethod::None:      return "none";
        case RefinementMethod::Parabolic: return "parabolic";
        case RefinementMethod::Gaussian:  return "gaussian";
    }
    return "unknown";
}

RefinementMethod parse_refinement_method(const std::string& name)
{
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "none")      return RefinementMethod::None;
    if (key == "parabolic") return RefinementMethod::Parabolic;
    if (key == "gaussian")  return RefinementMethod::Gaussian;
    throw std::invalid_argument("Unknown peak refinement method '" + name +
                                "' (expected none, parabolic or gaussian)");
}

int default_refinement_window(RefinementMethod method)
{
    switch (method) {
        case RefinementMethod::Gaussian:  return 9;
        case RefinementMethod::Parabolic: return 3;
        case RefinementMethod::None:      return 1;
    }
    return 1;
}

/* ---------------------------------------------------------------------- */
RefinedPeak refine_peak_parabolic(Eigen::Index i, const Vector& y)
{
    check_index(i, y, "refine_peak_parabolic");

    if (i == 0 || i == y.size() - 1)
        return fallback(i, y, "peak index is at the edge of the signal.");

    const Real y_l = y[i - 1];
    const Real y_c = y[i];
    const Real y_r = y[i + 1];

    const Real curvature = y_l - 2.0 * y_c + y_r;
    const Real scale     = std::max({std::abs(y_l), std::abs(y_c), std::abs(y_r), Real(1)});
    if (std::abs(curvature) <= 1e-12 * scale)
        return fallback(i, y, "the three samples are collinear.");

    const Real delta = 0.5 * (y_l - y_r) / curvature;
    if (!(delta > -1.0 && delta < 1.0))
        return fallback(i, y, "interpolated position is out of bounds.");

    RefinedPeak out;
    out.position = static_cast<Real>(i) + delta;
    out.height   = y_c - 0.25 * (y_l - y_r) * delta;
    return out;
}

/* ---------------------------------------------------------------------- */
RefinedPeak refine_peak_gaussian(Eigen::Index i, const Vector& y, int window)
{
    check_index(i, y, "refine_peak_gaussian");
    if (window < 3)
        throw std::invalid_argument("refine_peak_gaussian(): window must hold at least "
                                    "3 samples, got " + std::to_string(window));

    /* an even window is extended by one on the right */
    const Eigen::Index half_l = (window - 1) / 2;
    const Eigen::Index half_r = window / 2;
    if (i - half_l < 0 || i + half_r >= y.size())
        throw RefinementOutOfBounds(i, window, y.size());

    const Eigen::Index first = i - half_l;
    const Eigen::Index m     = half_l + half_r + 1;
    const Vector xs = Vector::LinSpaced(m, static_cast<Real>(first),
                                        static_cast<Real>(first + m - 1));
    const Vector ys = y.segment(first, m);

    /* p = [A, μ, σ] */
    auto model = [&xs, &ys](const Eigen::VectorXd& p,
                            Eigen::VectorXd*       r,
                            Eigen::MatrixXd*       J)
    {
        const double A = p[0], mu = p[1], s = p[2];
        r->resize(xs.size());
        J->resize(xs.size(), 3);
        for (Eigen::Index k = 0; k < xs.size(); ++k) {
            const double d = xs[k] - mu;
            const double e = std::exp(-d * d / (2.0 * s * s));
            const double f = A * e;
            (*r)[k]     = f - ys[k];
            (*J)(k, 0)  = e;
            (*J)(k, 1)  = f * d / (s * s);
            (*J)(k, 2)  = f * d * d / (s * s * s);
        }
    };

    Eigen::VectorXd p(3);
    p << 1.0, static_cast<double>(i), 1.0;

    const std::vector<double> lower = {-std::numeric_limits<double>::infinity(),
                                       -std::numeric_limits<double>::infinity(),
                                       1e-6};                                   // σ > 0
    LMSolverOptions opt;
    opt.max_iterations = 400;

    const LMSolverSummary summ = levenberg_marquardt(model, p, lower, {}, opt);

    std::ostringstream why;
    if (!summ.converged) {
        why << "Gaussian fit of peak " << i << " did not converge ("
            << to_string(summ.termination) << " after " << summ.iterations << " iterations)";
    } else if (!p.allFinite()) {
        why << "Gaussian fit of peak " << i << " produced non-finite parameters";
    } else if (p[1] < xs[0] || p[1] > xs[m - 1]) {
        why << "Gaussian fit of peak " << i << " placed the mean at " << p[1]
            << ", outside the fitting window [" << xs[0] << ", " << xs[m - 1] << "]";
    } else if (std::abs(p[1] - static_cast<double>(i)) >= 1.0) {
        why << "Gaussian fit of peak " << i << " moved the mean to " << p[1]
            << ", a full pixel or more from the local maximum";
    }
    if (!why.str().empty())
        throw OptimizerDidNotConverge(why.str(), summ.iterations, summ.final_chi2);

    RefinedPeak out;
    out.position = p[1];
    out.height   = p[0];
    return out;
}

/* ---------------------------------------------------------------------- */
RefinedPeak refine_peak(Eigen::Index     peak_index,
                        const Vector&    signal,
                        RefinementMethod method,
                        int              window)
{
    if (window <= 0) window = default_refinement_window(method);

    switch (method) {
        case RefinementMethod::Parabolic:
            return refine_peak_parabolic(peak_index, signal);
        case RefinementMethod::Gaussian:
            return refine_peak_gaussian(peak_index, signal, window);
        case RefinementMethod::None:
            break;
    }
    check_index(peak_index, signal, "refine_peak");
    return unrefined(peak_index, signal);
}

RefinedPeaks refine_peaks(const IndexVector& peaks,
                          const Vector&      signal,
                          RefinementMethod   method,
                          int                window)
{
    const auto n = static_cast<Eigen::Index>(peaks.size());
    RefinedPeaks out;
    out.positions.resize(n);
    out.heights.resize(n);

    for (Eigen::Index k = 0; k < n; ++k) {
        RefinedPeak rp = refine_peak(peaks[static_cast<std::size_t>(k)], signal, method, window);
        out.positions[k] = rp.position;
        out.heights[k]   = rp.height;
        append_diagnostics(out.diagnostics, rp.diagnostics);
    }
    return out;
}

} // namespace ramancal
