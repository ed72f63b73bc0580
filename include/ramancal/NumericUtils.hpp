#pragma once
#include "Types.hpp"

namespace ramancal {

/**
 * Raman shift (cm⁻¹) of scattered light at `emission_nm` for a source at
 * `excitation_nm`:
 *
 *     shift = (1/λ_exc − 1/λ_em) · 1e7
 */
Real   calculate_raman_shift(Real emission_nm, Real excitation_nm = 532.0);
Vector calculate_raman_shift(const Vector& emission_nm, Real excitation_nm = 532.0);

/* x0 + fraction·(x1 − x0), element-wise for the vector form */
Real   interpolate_between_two_values(Real x0, Real x1, Real fraction);
Vector interpolate_between_two_values(const Vector& x0,
                                      const Vector& x1,
                                      const Vector& fraction);

/**
 * Sliding-window median with an odd `kernel_size`.  The signal is padded
 * with zeros at both ends, so the first/last kernel_size/2 samples are
 * pulled towards zero.  kernel_size == 1 returns the input unchanged.
 */
Vector median_filter(const Vector& signal, int kernel_size);

/* (x − min) / (max − min); throws for a constant signal */
Vector min_max_normalize(const Vector& signal);

/* 0, 1, …, n−1 as reals */
Vector index_axis(Eigen::Index n);

/**
 * Simple linear interpolation y(x_out)  (no extrapolation; values
 * outside [x_in.front, x_in.back] are clamped to the end points).
 * x_in must be ascending, x_out may be in any order.
 */
Vector interp_linear(const Vector& x_in,
                     const Vector& y_in,
                     const Vector& x_out);

bool all_finite(const Vector& v);

} // namespace ramancal
