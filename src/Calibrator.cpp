#include "ramancal/Calibrator.hpp"
#include "ramancal/NumericUtils.hpp"
#include "ramancal/PeakFinder.hpp"
#include "ramancal/ReferenceTables.hpp"
#include <cmath>
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <utility>

namespace ramancal {

namespace {

/* peak indices as reals, for the pixel → nm fit */
Vector to_real(const IndexVector& idx)
{
    Vector v(static_cast<Eigen::Index>(idx.size()));
    for (std::size_t k = 0; k < idx.size(); ++k)
        v[static_cast<Eigen::Index>(k)] = static_cast<Real>(idx[k]);
    return v;
}

/* rough axis at a (possibly fractional) detector position */
Real sample_axis(const Vector& axis, Real position)
{
    const Real   base     = std::floor(position);
    const Real   fraction = position - base;
    const auto   i0       = static_cast<Eigen::Index>(base);

    if (i0 < 0 || i0 >= axis.size())
        throw std::out_of_range("sample_axis(): position " + std::to_string(position) +
                                " outside axis of size " + std::to_string(axis.size()));
    if (fraction == 0.0 || i0 + 1 >= axis.size())
        return axis[i0];
    return interpolate_between_two_values(axis[i0], axis[i0 + 1], fraction);
}

IndexVector locate_reference_peaks(const Vector&            trace,
                                   Eigen::Index             expected,
                                   CalibrationStage         stage,
                                   const CalibrationConfig& cfg,
                                   Diagnostics&             diags)
{
    PeakSearchResult search =
        find_n_most_prominent_peaks(trace, static_cast<int>(expected),
                                    cfg.prominence_increment, cfg.max_iterations);
    append_diagnostics(diags, search.diagnostics);

    if (static_cast<Eigen::Index>(search.peaks.size()) != expected)
        throw PeakCountMismatch(stage, search.peaks.size(),
                                static_cast<std::size_t>(expected));

    if (cfg.verbose)
        std::cout << "[Calibrator] " << to_string(stage) << ": " << search.peaks.size()
                  << " peaks at prominence " << std::setprecision(4)
                  << search.final_prominence << " (" << search.iterations
                  << " increments)\n";
    return std::move(search.peaks);
}

} // unnamed namespace

/* ====================================================================== */
/*  configuration                                                          */
/* ====================================================================== */
CalibrationConfig::CalibrationConfig(Real rough_threshold, Real fine_threshold)
    : rough_residuals_threshold(rough_threshold),
      fine_residuals_threshold(fine_threshold),
      rough_reference(neon_peaks_nm()),
      fine_reference(acetonitrile_peaks_cm1())
{}

void CalibrationConfig::validate() const
{
    auto fail = [](const std::string& what) {
        throw std::invalid_argument("CalibrationConfig: " + what);
    };

    if (!(std::isfinite(excitation_wavelength_nm) && excitation_wavelength_nm > 0.0))
        fail("excitation wavelength must be positive");
    if (kernel_size < 1 || kernel_size % 2 == 0)
        fail("kernel size must be an odd positive integer, got " + std::to_string(kernel_size));
    if (!(std::isfinite(rough_residuals_threshold) && rough_residuals_threshold >= 0.0))
        fail("rough residuals threshold must be finite and non-negative");
    if (!(std::isfinite(fine_residuals_threshold) && fine_residuals_threshold >= 0.0))
        fail("fine residuals threshold must be finite and non-negative");
    if (!(std::isfinite(prominence_increment) && prominence_increment > 0.0))
        fail("prominence increment must be positive");
    if (max_iterations < 0)
        fail("max iterations must be non-negative");
    if (rough_degree < 0 || fine_degree < 0)
        fail("polynomial degree must be non-negative");
    if (rough_reference.size() == 0 || !rough_reference.allFinite())
        fail("rough reference table must be non-empty and finite");
    if (fine_reference.size() == 0 || !fine_reference.allFinite())
        fail("fine reference table must be non-empty and finite");

    if (refinement_window > 0) {
        if (refinement_method == RefinementMethod::Parabolic && refinement_window != 3)
            fail("parabolic refinement uses exactly 3 samples");
        if (refinement_method == RefinementMethod::Gaussian && refinement_window < 3)
            fail("gaussian refinement window must be at least 3");
    }
}

const char* to_string(CalibrationState state)
{
    switch (state) {
        case CalibrationState::Uninitialized:   return "Uninitialized";
        case CalibrationState::RoughCalibrated: return "RoughCalibrated";
        case CalibrationState::FineCalibrated:  return "FineCalibrated";
        case CalibrationState::Failed:          return "Failed";
    }
    return "Unknown";
}

/* ====================================================================== */
/*  stages                                                                 */
/* ====================================================================== */
Vector preprocess_calibration_trace(const Vector& trace, int kernel_size)
{
    return min_max_normalize(median_filter(trace, kernel_size));
}

RoughCalibration calibrate_rough(const Vector&            excitation_trace,
                                 const CalibrationConfig& cfg)
{
    RoughCalibration out;
    out.trace = preprocess_calibration_trace(excitation_trace, cfg.kernel_size);

    out.peak_indices = locate_reference_peaks(out.trace, cfg.rough_reference.size(),
                                              CalibrationStage::Rough, cfg,
                                              out.diagnostics);

    AxisRescaleResult fit = rescale_axis_via_least_squares_fit(
        index_axis(out.trace.size()), to_real(out.peak_indices),
        cfg.rough_reference, cfg.rough_degree);

    out.fitness        = fit.fitness;
    out.polynomial     = std::move(fit.polynomial);
    out.wavelengths_nm = std::move(fit.axis);

    if (out.fitness > cfg.rough_residuals_threshold)
        throw ResidualThresholdExceeded(CalibrationStage::Rough, out.fitness,
                                        cfg.rough_residuals_threshold);

    out.wavenumbers_cm1 = calculate_raman_shift(out.wavelengths_nm,
                                                cfg.excitation_wavelength_nm);

    if (cfg.verbose)
        std::cout << "[Calibrator] rough fitness = " << std::setprecision(6)
                  << out.fitness << " (threshold " << cfg.rough_residuals_threshold << ")\n";
    return out;
}

FineCalibration calibrate_fine(const Vector&            emission_trace,
                               const Vector&            rough_cm1,
                               const CalibrationConfig& cfg)
{
    if (emission_trace.size() != rough_cm1.size())
        throw std::invalid_argument("calibrate_fine(): emission trace has " +
                                    std::to_string(emission_trace.size()) +
                                    " samples, rough axis " +
                                    std::to_string(rough_cm1.size()));

    FineCalibration out;
    out.trace = preprocess_calibration_trace(emission_trace, cfg.kernel_size);

    out.peak_indices = locate_reference_peaks(out.trace, cfg.fine_reference.size(),
                                              CalibrationStage::Fine, cfg,
                                              out.diagnostics);

    const bool refined = cfg.refinement_method != RefinementMethod::None;
    if (refined) {
        RefinedPeaks rp = refine_peaks(out.peak_indices, out.trace,
                                       cfg.refinement_method, cfg.refinement_window);
        append_diagnostics(out.diagnostics, rp.diagnostics);
        out.peak_positions = std::move(rp.positions);
    } else {
        out.peak_positions = to_real(out.peak_indices);
    }

    out.observed_cm1.resize(out.peak_positions.size());
    for (Eigen::Index k = 0; k < out.peak_positions.size(); ++k)
        out.observed_cm1[k] = sample_axis(rough_cm1, out.peak_positions[k]);

    AxisRescaleResult fit = rescale_axis_via_least_squares_fit(
        rough_cm1, out.observed_cm1, cfg.fine_reference, cfg.fine_degree);

    out.fitness         = fit.fitness;
    out.polynomial      = std::move(fit.polynomial);
    out.wavenumbers_cm1 = std::move(fit.axis);

    if (out.fitness > cfg.fine_residuals_threshold)
        throw ResidualThresholdExceeded(CalibrationStage::Fine, out.fitness,
                                        cfg.fine_residuals_threshold, refined);

    if (cfg.verbose)
        std::cout << "[Calibrator] fine fitness = " << std::setprecision(6)
                  << out.fitness << " (threshold " << cfg.fine_residuals_threshold
                  << ", refinement " << to_string(cfg.refinement_method) << ")\n";
    return out;
}

/* ====================================================================== */
/*  CalibrationRun / Calibrator                                            */
/* ====================================================================== */
Diagnostics CalibrationRun::diagnostics() const
{
    Diagnostics all;
    if (rough_) append_diagnostics(all, rough_->diagnostics);
    if (fine_)  append_diagnostics(all, fine_->diagnostics);
    return all;
}

const Vector& CalibrationRun::wavenumbers() const
{
    if (state_ == CalibrationState::Failed && error_)
        std::rethrow_exception(error_);
    if (!fine_)
        throw std::logic_error(std::string("CalibrationRun::wavenumbers(): run is ") +
                               to_string(state_));
    return fine_->wavenumbers_cm1;
}

Calibrator::Calibrator(CalibrationConfig config)
    : config_(std::move(config))
{
    config_.validate();
}

CalibrationRun Calibrator::run(const Vector& excitation_trace,
                               const Vector& emission_trace) const
{
    return run_(excitation_trace, emission_trace, false);
}

CalibrationRun Calibrator::run_(const Vector& excitation_trace,
                                const Vector& emission_trace,
                                bool          isolate_all) const
{
    CalibrationRun run;
    CalibrationStage stage = CalibrationStage::Rough;

    auto fail = [&run, &stage](const std::exception& e) {
        std::cerr << "[Calibrator] " << to_string(stage) << " stage failed: "
                  << e.what() << '\n';
        run.state_         = CalibrationState::Failed;
        run.failed_stage_  = stage;
        run.error_message_ = e.what();
        run.error_         = std::current_exception();
    };

    try {
        run.rough_ = calibrate_rough(excitation_trace, config_);
        run.state_ = CalibrationState::RoughCalibrated;

        stage = CalibrationStage::Fine;
        run.fine_ = calibrate_fine(emission_trace, run.rough_->wavenumbers_cm1, config_);
        run.state_ = CalibrationState::FineCalibrated;
    }
    catch (const CalibrationError& e) {
        fail(e);
    }
    catch (const std::exception& e) {
        if (!isolate_all) throw;
        fail(e);
    }
    return run;
}

Vector Calibrator::calibrate(const Vector& excitation_trace,
                             const Vector& emission_trace) const
{
    return run(excitation_trace, emission_trace).wavenumbers();
}

} // namespace ramancal
