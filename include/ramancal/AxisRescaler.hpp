#pragma once
#include "Types.hpp"

namespace ramancal {

/*
 * Polynomial in a scaled variable  t = offset + scale·x  that maps the fit
 * domain [domain_min, domain_max] onto [−1, 1].  Keeps the Vandermonde
 * matrix well conditioned for pixel indices in the thousands.
 */
class Polynomial {
public:
    Polynomial() = default;
    Polynomial(Vector coefficients, Real domain_min, Real domain_max);

    Real   operator()(Real x) const;
    Vector operator()(const Vector& x) const;

    int           degree()       const { return static_cast<int>(coef_.size()) - 1; }
    const Vector& coefficients() const { return coef_; }   // in t
    Real          domain_min()   const { return dmin_; }
    Real          domain_max()   const { return dmax_; }

    /* c₀ + c₁·x + c₂·x² + …  in the unscaled variable */
    Vector power_basis_coefficients() const;

private:
    Real map(Real x) const { return offset_ + scale_ * x; }

    Vector coef_;
    Real   dmin_   = -1.0;
    Real   dmax_   =  1.0;
    Real   offset_ =  0.0;
    Real   scale_  =  1.0;
};

struct PolynomialFit {
    Polynomial   polynomial;
    Real         residual_sum_of_squares = 0.0;
    Eigen::Index rank = 0;
};

/* least-squares y ≈ p(x); throws FitUnderdetermined / std::invalid_argument */
PolynomialFit fit_polynomial(const Vector& x, const Vector& y, int degree);

struct AxisRescaleResult {
    Vector     axis;            // polynomial applied to every input sample
    Real       fitness = 0.0;   // residual sum of squares of the fit
    Polynomial polynomial;
};

/**
 * Fit the polynomial that maps `observed` onto `groundtruth` (pairs by
 * index) and evaluate it over every element of `axis`.
 *
 * The fitness is the residual sum of squares at the correspondences, not
 * over the transformed axis.  Fails with FitUnderdetermined if
 * observed.size() ≤ degree and with std::invalid_argument for length
 * mismatches or non-finite input.
 */
AxisRescaleResult rescale_axis_via_least_squares_fit(const Vector& axis,
                                                     const Vector& observed,
                                                     const Vector& groundtruth,
                                                     int           degree = 1);

} // namespace ramancal
