#pragma once
#include "Types.hpp"
#include <cstdint>
#include <vector>

namespace ramancal {

/* wavelength = start + nm_per_pixel · pixel */
struct LinearDispersion {
    Real wavelength_start_nm = 555.0;
    Real nm_per_pixel        = 0.05;

    Real wavelength_nm(Real pixel) const { return wavelength_start_nm + nm_per_pixel * pixel; }
    Real pixel(Real wavelength_nm) const { return (wavelength_nm - wavelength_start_nm) / nm_per_pixel; }

    /* detector position of a Raman line for the given laser */
    Real pixel_of_shift(Real shift_cm1, Real excitation_nm) const;
};

struct SyntheticLine {
    Real center_px = 0.0;
    Real amplitude = 1.0;
};

struct SyntheticTraceOptions {
    Eigen::Index  n_pixels      = 2048;
    Real          line_sigma_px = 2.0;
    Real          baseline      = 0.05;
    Real          noise_sigma   = 0.0;    // additive Gaussian noise
    std::uint32_t seed          = 1;
};

/* baseline + Σ A·exp(−(p−c)²/(2σ²)) + noise, on pixels 0 … n−1 */
Vector render_lines(const std::vector<SyntheticLine>& lines,
                    const SyntheticTraceOptions&      opt);

/* deterministic line strengths in [0.4, 1.0] so no two neighbours match */
Real line_amplitude(std::size_t k);

/* neon lamp trace for `lines_nm` (default: built-in neon table) */
Vector synthetic_neon_trace(const LinearDispersion&      disp,
                            const SyntheticTraceOptions& opt,
                            const Vector&                lines_nm);
Vector synthetic_neon_trace(const LinearDispersion&      disp,
                            const SyntheticTraceOptions& opt);

/* Raman trace of a standard with lines at `shifts_cm1` */
Vector synthetic_raman_trace(const LinearDispersion&      disp,
                             Real                         excitation_nm,
                             const SyntheticTraceOptions& opt,
                             const Vector&                shifts_cm1);

/* acetonitrile standard (built-in table) */
Vector synthetic_acetonitrile_trace(const LinearDispersion&      disp,
                                    Real                         excitation_nm,
                                    const SyntheticTraceOptions& opt);

} // namespace ramancal
