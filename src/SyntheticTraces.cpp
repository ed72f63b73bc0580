#include "ramancal/SyntheticTraces.hpp"
#include "ramancal/ReferenceTables.hpp"
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

namespace ramancal {

Real LinearDispersion::pixel_of_shift(Real shift_cm1, Real excitation_nm) const
{
    const Real inv = 1.0 / excitation_nm - shift_cm1 * 1e-7;
    if (!(inv > 0.0))
        throw std::invalid_argument("pixel_of_shift(): shift " + std::to_string(shift_cm1) +
                                    " cm^-1 is not reachable from " +
                                    std::to_string(excitation_nm) + " nm");
    return pixel(1.0 / inv);
}

Vector render_lines(const std::vector<SyntheticLine>& lines,
                    const SyntheticTraceOptions&      opt)
{
    if (opt.n_pixels <= 0)
        throw std::invalid_argument("render_lines(): n_pixels must be positive");
    if (!(opt.line_sigma_px > 0.0))
        throw std::invalid_argument("render_lines(): line width must be positive");

    Vector y = Vector::Constant(opt.n_pixels, opt.baseline);
    const Real inv2s2 = 1.0 / (2.0 * opt.line_sigma_px * opt.line_sigma_px);

    for (const auto& l : lines)
        for (Eigen::Index p = 0; p < opt.n_pixels; ++p) {
            const Real d = static_cast<Real>(p) - l.center_px;
            y[p] += l.amplitude * std::exp(-d * d * inv2s2);
        }

    if (opt.noise_sigma > 0.0) {
        std::mt19937 rng(opt.seed);
        std::normal_distribution<Real> noise(0.0, opt.noise_sigma);
        for (Eigen::Index p = 0; p < opt.n_pixels; ++p) y[p] += noise(rng);
    }
    return y;
}

Real line_amplitude(std::size_t k)
{
    return 0.4 + 0.15 * static_cast<Real>((k * 3) % 5);
}

Vector synthetic_neon_trace(const LinearDispersion&      disp,
                            const SyntheticTraceOptions& opt,
                            const Vector&                lines_nm)
{
    std::vector<SyntheticLine> lines;
    for (Eigen::Index k = 0; k < lines_nm.size(); ++k)
        lines.push_back({disp.pixel(lines_nm[k]), line_amplitude(static_cast<std::size_t>(k))});
    return render_lines(lines, opt);
}

Vector synthetic_neon_trace(const LinearDispersion& disp, const SyntheticTraceOptions& opt)
{
    return synthetic_neon_trace(disp, opt, neon_peaks_nm());
}

Vector synthetic_raman_trace(const LinearDispersion&      disp,
                             Real                         excitation_nm,
                             const SyntheticTraceOptions& opt,
                             const Vector&                shifts_cm1)
{
    std::vector<SyntheticLine> lines;
    for (Eigen::Index k = 0; k < shifts_cm1.size(); ++k)
        lines.push_back({disp.pixel_of_shift(shifts_cm1[k], excitation_nm),
                         line_amplitude(static_cast<std::size_t>(k))});
    return render_lines(lines, opt);
}

Vector synthetic_acetonitrile_trace(const LinearDispersion&      disp,
                                    Real                         excitation_nm,
                                    const SyntheticTraceOptions& opt)
{
    return synthetic_raman_trace(disp, excitation_nm, opt, acetonitrile_peaks_cm1());
}

} // namespace ramancal
