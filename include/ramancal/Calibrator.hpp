#pragma once
#include "Types.hpp"
#include "Diagnostics.hpp"
#include "Errors.hpp"
#include "AxisRescaler.hpp"
#include "PeakRefiner.hpp"
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace ramancal {

struct CalibrationPair;

/*  Everything a calibration run depends on.  The two residual thresholds
 *  have no sensible default and must be given explicitly.                  */
struct CalibrationConfig
{
    CalibrationConfig(Real rough_threshold, Real fine_threshold);

    Real   excitation_wavelength_nm  = 532.0;  // laser line
    int    kernel_size               = 5;      // median filter, odd, 1 == off
    Real   rough_residuals_threshold;          // Σr² limit, pixel → nm fit
    Real   fine_residuals_threshold;           // Σr² limit, cm⁻¹ → cm⁻¹ fit

    Real   prominence_increment      = 0.005;  // peak search step
    int    max_iterations            = 500;    // peak search cap
    int    rough_degree              = 1;
    int    fine_degree               = 1;

    RefinementMethod refinement_method = RefinementMethod::None;
    int    refinement_window         = 0;      // ≤ 0: method default

    Vector rough_reference;                    // nm, default: neon lines
    Vector fine_reference;                     // cm⁻¹, default: acetonitrile

    bool   verbose                   = false;

    /* throws std::invalid_argument describing the first bad field */
    void validate() const;
};

/* -------------------------------------------------------------------- */
/*  stage results                                                        */
/* -------------------------------------------------------------------- */
struct RoughCalibration {
    Vector      trace;              // filtered + normalised excitation trace
    IndexVector peak_indices;
    Vector      wavelengths_nm;     // per pixel
    Vector      wavenumbers_cm1;    // per pixel, Raman shift
    Real        fitness = 0.0;
    Polynomial  polynomial;         // pixel → nm
    Diagnostics diagnostics;
};

struct FineCalibration {
    Vector      trace;              // filtered + normalised emission trace
    IndexVector peak_indices;
    Vector      peak_positions;     // sub-pixel when refined
    Vector      observed_cm1;       // rough axis sampled at peak_positions
    Vector      wavenumbers_cm1;    // final axis
    Real        fitness = 0.0;
    Polynomial  polynomial;         // rough cm⁻¹ → reference cm⁻¹
    Diagnostics diagnostics;
};

/* median filter, then min–max scaling to [0, 1] */
Vector preprocess_calibration_trace(const Vector& trace, int kernel_size);

/**
 * Stage 1: pixel index → wavelength from the excitation (neon) trace,
 * converted to Raman shift.  Throws PeakCountMismatch,
 * FitUnderdetermined or ResidualThresholdExceeded(Rough).
 */
RoughCalibration calibrate_rough(const Vector&            excitation_trace,
                                 const CalibrationConfig& config);

/**
 * Stage 2: rough cm⁻¹ → reference cm⁻¹ from the emission (acetonitrile)
 * trace.  With a refinement method the rough axis is interpolated at the
 * sub-pixel peak positions.  Throws like stage 1 with stage == Fine, and
 * RefinementOutOfBounds / OptimizerDidNotConverge for Gaussian refinement.
 */
FineCalibration calibrate_fine(const Vector&            emission_trace,
                               const Vector&            rough_wavenumbers_cm1,
                               const CalibrationConfig& config);

/* -------------------------------------------------------------------- */
/*  run bookkeeping                                                      */
/* -------------------------------------------------------------------- */
enum class CalibrationState { Uninitialized, RoughCalibrated, FineCalibrated, Failed };

const char* to_string(CalibrationState state);

class CalibrationRun {
public:
    CalibrationState state() const { return state_; }
    bool ok() const { return state_ == CalibrationState::FineCalibrated; }

    const std::optional<RoughCalibration>& rough() const { return rough_; }
    const std::optional<FineCalibration>&  fine()  const { return fine_; }

    /* rough + fine diagnostics, in pipeline order */
    Diagnostics diagnostics() const;

    /* populated for Failed runs only */
    std::optional<CalibrationStage> failed_stage() const { return failed_stage_; }
    const std::string&              error_message() const { return error_message_; }
    std::exception_ptr              error() const { return error_; }

    /* final axis; rethrows the stored error of a Failed run */
    const Vector& wavenumbers() const;

private:
    friend class Calibrator;

    CalibrationState                state_ = CalibrationState::Uninitialized;
    std::optional<RoughCalibration> rough_;
    std::optional<FineCalibration>  fine_;
    std::optional<CalibrationStage> failed_stage_;
    std::string                     error_message_;
    std::exception_ptr              error_;
};

class Calibrator {
public:
    explicit Calibrator(CalibrationConfig config);   // validates

    /* never throws a CalibrationError; those end up in a Failed run */
    CalibrationRun run(const Vector& excitation_trace,
                       const Vector& emission_trace) const;

    /* run() and return the final axis, rethrowing on failure */
    Vector calibrate(const Vector& excitation_trace,
                     const Vector& emission_trace) const;

    const CalibrationConfig& config() const { return config_; }

private:
    friend std::vector<CalibrationRun> calibrate_batch(const std::vector<CalibrationPair>&,
                                                       const CalibrationConfig&,
                                                       unsigned);

    /* with `isolate_all`, invalid input also ends up in a Failed run */
    CalibrationRun run_(const Vector& excitation_trace,
                        const Vector& emission_trace,
                        bool          isolate_all) const;

    CalibrationConfig config_;
};

} // namespace ramancal
