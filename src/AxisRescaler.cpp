#include "ramancal/AxisRescaler.hpp"
#include "ramancal/Errors.hpp"
#include <Eigen/QR>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <cmath>

namespace ramancal {

namespace {
/* [dmin, dmax] → [−1, 1]  as  t = offset + scale·x ; identity for a point */
std::pair<Real, Real> domain_to_window(Real dmin, Real dmax)
{
    if (!(dmax > dmin)) return {0.0, 1.0};
    return {-(dmax + dmin) / (dmax - dmin), 2.0 / (dmax - dmin)};
}
} // unnamed namespace

/* ====================================================================== */
/*  Polynomial                                                            */
/* ====================================================================== */
Polynomial::Polynomial(Vector coefficients, Real domain_min, Real domain_max)
    : coef_(std::move(coefficients))
    , dmin_(domain_min)
    , dmax_(domain_max)
{
    if (coef_.size() == 0)
        throw std::invalid_argument("Polynomial: needs at least one coefficient");

    std::tie(offset_, scale_) = domain_to_window(dmin_, dmax_);
}

Real Polynomial::operator()(Real x) const
{
    const Real t = map(x);
    Real acc = 0.0;
    for (Eigen::Index k = coef_.size() - 1; k >= 0; --k)   // Horner
        acc = acc * t + coef_[k];
    return acc;
}

Vector Polynomial::operator()(const Vector& x) const
{
    Vector out(x.size());
    for (Eigen::Index i = 0; i < x.size(); ++i) out[i] = (*this)(x[i]);
    return out;
}

Vector Polynomial::power_basis_coefficients() const
{
    /* Σ c_k (offset + scale·x)^k  →  Σ a_j x^j  via binomial expansion */
    const Eigen::Index n = coef_.size();
    Vector a = Vector::Zero(n);

    for (Eigen::Index k = 0; k < n; ++k) {
        Real binom = 1.0;                                    // C(k, j)
        for (Eigen::Index j = 0; j <= k; ++j) {
            a[j] += coef_[k] * binom
                  * std::pow(offset_, static_cast<Real>(k - j))
                  * std::pow(scale_,  static_cast<Real>(j));
            binom = binom * static_cast<Real>(k - j) / static_cast<Real>(j + 1);
        }
    }
    return a;
}

/* ====================================================================== */
/*  least squares                                                         */
/* ====================================================================== */
PolynomialFit fit_polynomial(const Vector& x, const Vector& y, int degree)
{
    if (degree < 0)
        throw std::invalid_argument("fit_polynomial(): degree must be ≥ 0");
    if (x.size() != y.size())
        throw std::invalid_argument("fit_polynomial(): observed (" + std::to_string(x.size()) +
                                    ") and ground-truth (" + std::to_string(y.size()) +
                                    ") positions differ in length");
    if (!x.allFinite() || !y.allFinite())
        throw std::invalid_argument("fit_polynomial(): input contains NaN/Inf");
    if (x.size() <= degree)
        throw FitUnderdetermined(x.size(), degree);

    const Real dmin = x.minCoeff();
    const Real dmax = x.maxCoeff();
    if (degree > 0 && !(dmax > dmin))
        throw FitUnderdetermined(x.size(), degree, "all observed positions coincide");

    const auto [offset, scale] = domain_to_window(dmin, dmax);

    /* ---------- Vandermonde in the scaled variable -------------------- */
    const Eigen::Index m = x.size();
    Matrix V(m, degree + 1);
    for (Eigen::Index i = 0; i < m; ++i) {
        const Real t = offset + scale * x[i];
        Real p = 1.0;
        for (int k = 0; k <= degree; ++k) { V(i, k) = p; p *= t; }
    }

    Eigen::ColPivHouseholderQR<Matrix> qr(V);
    if (qr.rank() < degree + 1)
        throw FitUnderdetermined(m, degree,
                                 "only " + std::to_string(qr.rank()) +
                                 " independent observed position(s)");

    const Vector coef = qr.solve(y);

    PolynomialFit fit;
    fit.polynomial              = Polynomial(coef, dmin, dmax);
    fit.residual_sum_of_squares = (V * coef - y).squaredNorm();
    fit.rank                    = qr.rank();
    return fit;
}

/* ---------------------------------------------------------------------- */
AxisRescaleResult rescale_axis_via_least_squares_fit(const Vector& axis,
                                                     const Vector& observed,
                                                     const Vector& groundtruth,
                                                     int           degree)
{
    if (!axis.allFinite())
        throw std::invalid_argument("rescale_axis_via_least_squares_fit(): axis contains NaN/Inf");

    PolynomialFit fit = fit_polynomial(observed, groundtruth, degree);

    AxisRescaleResult res;
    res.axis       = fit.polynomial(axis);
    res.fitness    = fit.residual_sum_of_squares;
    res.polynomial = std::move(fit.polynomial);
    return res;
}

} // namespace ramancal
