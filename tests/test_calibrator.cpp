#include <gtest/gtest.h>
#include "ramancal/Calibrator.hpp"
#include "ramancal/NumericUtils.hpp"
#include "ramancal/ReferenceTables.hpp"
#include "TestHelpers.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace ramancal_test {

using namespace ramancal;

// Final axis must reproduce the acetonitrile lines within this many cm⁻¹.
constexpr double FINE_CALIBRATION_TOLERANCE_CM1 = 4.0;

class CalibratorTest : public ::testing::Test {
protected:
    static constexpr Real LASER_NM = 532.0;

    LinearDispersion disp;            // 555 nm + 0.05 nm/px, 2048 px

    /* ---------- noisy traces with the built-in reference tables -------- */
    SyntheticTraceOptions noisy(std::uint32_t seed) const
    {
        SyntheticTraceOptions o;
        o.noise_sigma = 0.005;
        o.seed        = seed;
        return o;
    }
    Vector noisy_neon() const      { return synthetic_neon_trace(disp, noisy(11)); }
    Vector noisy_aceto() const     { return synthetic_acetonitrile_trace(disp, LASER_NM, noisy(12)); }

    static CalibrationConfig generous_config()
    {
        return CalibrationConfig(1.0, 1e4);   // nm², cm⁻²
    }

    /* ---------- lines at integer pixels with matching tables ----------- */
    static std::vector<Real> neon_pixels()
    {
        std::vector<Real> p;
        for (int k = 0; k < 15; ++k) p.push_back(100.0 + 120.0 * k);
        return p;
    }
    static std::vector<Real> emission_pixels() { return {150.0, 500.0, 850.0, 1200.0, 1550.0}; }

    static Vector lines_trace(const std::vector<Real>& px)
    {
        std::vector<SyntheticLine> lines;
        for (std::size_t k = 0; k < px.size(); ++k) lines.push_back({px[k], line_amplitude(k)});
        return render_lines(lines, SyntheticTraceOptions{});
    }

    CalibrationConfig exact_config() const
    {
        CalibrationConfig c(1e-6, 1e-6);
        const auto np = neon_pixels();
        const auto ep = emission_pixels();
        c.rough_reference.resize(static_cast<Eigen::Index>(np.size()));
        for (std::size_t k = 0; k < np.size(); ++k)
            c.rough_reference[static_cast<Eigen::Index>(k)] = disp.wavelength_nm(np[k]);
        c.fine_reference.resize(static_cast<Eigen::Index>(ep.size()));
        for (std::size_t k = 0; k < ep.size(); ++k)
            c.fine_reference[static_cast<Eigen::Index>(k)] =
                calculate_raman_shift(disp.wavelength_nm(ep[k]), LASER_NM);
        return c;
    }

    /* true Raman shift of detector pixel p */
    Real true_shift(Real p) const { return calculate_raman_shift(disp.wavelength_nm(p), LASER_NM); }
};

// ============================================================================
// Exact reconstruction
// ============================================================================

TEST_F(CalibratorTest, IntegerPixelLinesCalibrateExactly)
{
    const CalibrationRun run = Calibrator(exact_config())
                                   .run(lines_trace(neon_pixels()), lines_trace(emission_pixels()));

    ASSERT_TRUE(run.ok()) << run.error_message();
    EXPECT_EQ(run.state(), CalibrationState::FineCalibrated);
    EXPECT_TRUE(run.diagnostics().empty());

    const RoughCalibration& rough = *run.rough();
    ASSERT_EQ(rough.peak_indices.size(), 15u);
    for (std::size_t k = 0; k < 15; ++k)
        EXPECT_EQ(static_cast<Real>(rough.peak_indices[k]), neon_pixels()[k]);
    EXPECT_LT(rough.fitness, 1e-12);
    const Vector table = exact_config().rough_reference;
    for (std::size_t k = 0; k < 15; ++k)
        EXPECT_NEAR(rough.wavelengths_nm[rough.peak_indices[k]],
                    table[static_cast<Eigen::Index>(k)], 1e-9);

    const Vector& axis = run.wavenumbers();
    ASSERT_EQ(axis.size(), 2048);
    for (Eigen::Index p : {Eigen::Index(0), Eigen::Index(700), Eigen::Index(2047)})
        EXPECT_NEAR(axis[p], true_shift(static_cast<Real>(p)), 1e-6) << "pixel " << p;
    EXPECT_LT(run.fine()->fitness, 1e-9);
}

TEST_F(CalibratorTest, RoughAxisIsRamanShiftOfFittedWavelengths)
{
    const RoughCalibration rough = calibrate_rough(lines_trace(neon_pixels()), exact_config());
    ASSERT_EQ(rough.wavelengths_nm.size(), 2048);
    EXPECT_NEAR(rough.wavelengths_nm[0], 555.0, 1e-9);
    EXPECT_NEAR(rough.wavelengths_nm[2047], disp.wavelength_nm(2047.0), 1e-9);
    EXPECT_NEAR(rough.wavenumbers_cm1[1000],
                calculate_raman_shift(rough.wavelengths_nm[1000], LASER_NM), 1e-9);

    const Vector a = rough.polynomial.power_basis_coefficients();
    EXPECT_NEAR(a[0], 555.0, 1e-8);
    EXPECT_NEAR(a[1], 0.05, 1e-12);
}

TEST_F(CalibratorTest, PreprocessedTraceSpansUnitInterval)
{
    const Vector t = preprocess_calibration_trace(noisy_neon(), 5);
    EXPECT_DOUBLE_EQ(t.minCoeff(), 0.0);
    EXPECT_DOUBLE_EQ(t.maxCoeff(), 1.0);
}

// ============================================================================
// Realistic (noisy, fractional line positions)
// ============================================================================

TEST_F(CalibratorTest, NoisyTracesReproduceAcetonitrileLines)
{
    const CalibrationRun run = Calibrator(generous_config()).run(noisy_neon(), noisy_aceto());
    ASSERT_TRUE(run.ok()) << run.error_message();

    EXPECT_GT(run.rough()->fitness, 0.0);
    EXPECT_GT(run.fine()->fitness, 0.0);

    const FineCalibration& fine = *run.fine();
    const Vector& ref = acetonitrile_peaks_cm1();
    ASSERT_EQ(fine.peak_indices.size(), 5u);
    for (Eigen::Index k = 0; k < ref.size(); ++k) {
        const Real px = disp.pixel_of_shift(ref[k], LASER_NM);
        const Real calibrated = interp_linear(index_axis(2048), fine.wavenumbers_cm1,
                                              make_vector({px}))[0];
        EXPECT_NEAR(calibrated, ref[k], FINE_CALIBRATION_TOLERANCE_CM1) << "line " << ref[k];
    }
}

TEST_F(CalibratorTest, CalibrateReturnsFinalAxis)
{
    const Calibrator cal(generous_config());
    const Vector axis = cal.calibrate(noisy_neon(), noisy_aceto());
    const CalibrationRun run = cal.run(noisy_neon(), noisy_aceto());
    ASSERT_TRUE(run.ok());
    EXPECT_TRUE(axis.isApprox(run.wavenumbers()));
}

// ============================================================================
// Residual thresholds
// ============================================================================

TEST_F(CalibratorTest, RoughThresholdFailsRoughStage)
{
    const CalibrationRun ok = Calibrator(generous_config()).run(noisy_neon(), noisy_aceto());
    ASSERT_TRUE(ok.ok());

    CalibrationConfig cfg = generous_config();
    cfg.rough_residuals_threshold = ok.rough()->fitness / 100.0;

    const CalibrationRun run = Calibrator(cfg).run(noisy_neon(), noisy_aceto());
    EXPECT_EQ(run.state(), CalibrationState::Failed);
    ASSERT_TRUE(run.failed_stage().has_value());
    EXPECT_EQ(*run.failed_stage(), CalibrationStage::Rough);
    EXPECT_FALSE(run.rough().has_value());
    EXPECT_FALSE(run.error_message().empty());

    try {
        run.wavenumbers();
        FAIL() << "expected ResidualThresholdExceeded";
    } catch (const ResidualThresholdExceeded& e) {
        EXPECT_EQ(e.stage(), CalibrationStage::Rough);
        EXPECT_DOUBLE_EQ(e.fitness(), ok.rough()->fitness);
        EXPECT_DOUBLE_EQ(e.threshold(), cfg.rough_residuals_threshold);
    }

    EXPECT_THROW(calibrate_rough(noisy_neon(), cfg), ResidualThresholdExceeded);
}

TEST_F(CalibratorTest, FineThresholdFailsFineStage)
{
    const CalibrationRun ok = Calibrator(generous_config()).run(noisy_neon(), noisy_aceto());
    ASSERT_TRUE(ok.ok());

    CalibrationConfig cfg = generous_config();
    cfg.fine_residuals_threshold = ok.fine()->fitness / 100.0;

    const CalibrationRun run = Calibrator(cfg).run(noisy_neon(), noisy_aceto());
    EXPECT_EQ(run.state(), CalibrationState::Failed);
    ASSERT_TRUE(run.failed_stage().has_value());
    EXPECT_EQ(*run.failed_stage(), CalibrationStage::Fine);
    EXPECT_TRUE(run.rough().has_value());     // stage 1 result kept
    EXPECT_FALSE(run.fine().has_value());
    EXPECT_THROW(run.wavenumbers(), ResidualThresholdExceeded);
    EXPECT_THROW(Calibrator(cfg).calibrate(noisy_neon(), noisy_aceto()),
                 ResidualThresholdExceeded);
}

TEST_F(CalibratorTest, TightThresholdsAcceptExactFit)
{
    CalibrationConfig cfg = exact_config();
    cfg.rough_residuals_threshold = 1e-12;
    cfg.fine_residuals_threshold  = 1e-6;
    EXPECT_TRUE(Calibrator(cfg).run(lines_trace(neon_pixels()),
                                    lines_trace(emission_pixels())).ok());
}

// ============================================================================
// Peak count mismatches
// ============================================================================

TEST_F(CalibratorTest, MissingNeonLinesFailRoughStage)
{
    const Vector ten_lines = neon_peaks_nm().head(10);
    const Vector exc = synthetic_neon_trace(disp, SyntheticTraceOptions{}, ten_lines);

    const CalibrationRun run = Calibrator(generous_config()).run(exc, noisy_aceto());
    EXPECT_EQ(run.state(), CalibrationState::Failed);
    EXPECT_EQ(*run.failed_stage(), CalibrationStage::Rough);

    try {
        calibrate_rough(exc, generous_config());
        FAIL() << "expected PeakCountMismatch";
    } catch (const PeakCountMismatch& e) {
        EXPECT_EQ(e.stage(), CalibrationStage::Rough);
        EXPECT_EQ(e.found(), 10u);
        EXPECT_EQ(e.expected(), 15u);
    }
}

TEST_F(CalibratorTest, MissingAcetonitrileLinesFailFineStage)
{
    const Vector three = synthetic_raman_trace(disp, LASER_NM, SyntheticTraceOptions{},
                                               make_vector({918.0, 1376.0, 2249.0}));
    const CalibrationRun run = Calibrator(generous_config()).run(noisy_neon(), three);
    EXPECT_EQ(run.state(), CalibrationState::Failed);
    EXPECT_EQ(*run.failed_stage(), CalibrationStage::Fine);
    EXPECT_THROW(run.wavenumbers(), PeakCountMismatch);
}

// ============================================================================
// Sub-pixel refinement
// ============================================================================

TEST_F(CalibratorTest, ParabolicRefinementInterpolatesRoughAxis)
{
    CalibrationConfig cfg = generous_config();
    cfg.refinement_method = RefinementMethod::Parabolic;

    const CalibrationRun run = Calibrator(cfg).run(noisy_neon(), noisy_aceto());
    ASSERT_TRUE(run.ok()) << run.error_message();

    const FineCalibration& fine = *run.fine();
    const Vector& rough = run.rough()->wavenumbers_cm1;
    for (Eigen::Index k = 0; k < fine.peak_positions.size(); ++k) {
        const Real pos = fine.peak_positions[k];
        const auto idx = static_cast<Real>(fine.peak_indices[static_cast<std::size_t>(k)]);
        EXPECT_LT(std::abs(pos - idx), 1.0);

        const auto i0 = static_cast<Eigen::Index>(std::floor(pos));
        const Real expected = interpolate_between_two_values(rough[i0], rough[i0 + 1],
                                                             pos - std::floor(pos));
        EXPECT_NEAR(fine.observed_cm1[k], expected, 1e-9);
    }
}

TEST_F(CalibratorTest, GaussianRefinementStaysNearIntegerPeaks)
{
    CalibrationConfig cfg = generous_config();
    cfg.refinement_method = RefinementMethod::Gaussian;

    const CalibrationRun run = Calibrator(cfg).run(noisy_neon(), noisy_aceto());
    ASSERT_TRUE(run.ok()) << run.error_message();

    const FineCalibration& fine = *run.fine();
    for (Eigen::Index k = 0; k < fine.peak_positions.size(); ++k)
        EXPECT_LT(std::abs(fine.peak_positions[k] -
                           static_cast<Real>(fine.peak_indices[static_cast<std::size_t>(k)])),
                  1.5);
}

TEST_F(CalibratorTest, UnrefinedPositionsAreIntegerIndices)
{
    const CalibrationRun run = Calibrator(generous_config()).run(noisy_neon(), noisy_aceto());
    ASSERT_TRUE(run.ok());
    const FineCalibration& fine = *run.fine();
    for (Eigen::Index k = 0; k < fine.peak_positions.size(); ++k) {
        const auto idx = fine.peak_indices[static_cast<std::size_t>(k)];
        EXPECT_DOUBLE_EQ(fine.peak_positions[k], static_cast<Real>(idx));
        EXPECT_DOUBLE_EQ(fine.observed_cm1[k], run.rough()->wavenumbers_cm1[idx]);
    }
}

TEST_F(CalibratorTest, GaussianWindowAtDetectorEdgeFailsFineStage)
{
    // first acetonitrile line ≈ pixel 86; a 181 sample window runs off the detector
    CalibrationConfig cfg = generous_config();
    cfg.refinement_method = RefinementMethod::Gaussian;
    cfg.refinement_window = 181;

    const CalibrationRun run = Calibrator(cfg).run(noisy_neon(), noisy_aceto());
    EXPECT_EQ(run.state(), CalibrationState::Failed);
    EXPECT_EQ(*run.failed_stage(), CalibrationStage::Fine);
    EXPECT_THROW(run.wavenumbers(), RefinementOutOfBounds);
}

// ============================================================================
// Stage inputs / configuration
// ============================================================================

TEST_F(CalibratorTest, FineStageRejectsLengthMismatch)
{
    EXPECT_THROW(calibrate_fine(noisy_aceto(), Vector::Zero(100), generous_config()),
                 std::invalid_argument);
}

TEST_F(CalibratorTest, NonCalibrationErrorsPropagateFromRun)
{
    // a flat trace cannot be normalised: not a calibration failure
    EXPECT_THROW(Calibrator(generous_config()).run(Vector::Constant(2048, 1.0), noisy_aceto()),
                 std::invalid_argument);
}

TEST(CalibrationConfigTest, DefaultsUseBuiltInTables)
{
    const CalibrationConfig c(0.5, 10.0);
    EXPECT_DOUBLE_EQ(c.excitation_wavelength_nm, 532.0);
    EXPECT_EQ(c.kernel_size, 5);
    EXPECT_DOUBLE_EQ(c.rough_residuals_threshold, 0.5);
    EXPECT_DOUBLE_EQ(c.fine_residuals_threshold, 10.0);
    EXPECT_EQ(c.refinement_method, RefinementMethod::None);
    EXPECT_TRUE(c.rough_reference.isApprox(neon_peaks_nm()));
    EXPECT_TRUE(c.fine_reference.isApprox(acetonitrile_peaks_cm1()));
    EXPECT_NO_THROW(c.validate());
}

TEST(CalibrationConfigTest, InvalidFieldsRejectedAtConstruction)
{
    auto rejects = [](auto mutate) {
        CalibrationConfig c(1.0, 1.0);
        mutate(c);
        EXPECT_THROW(Calibrator{c}, std::invalid_argument);
    };
    rejects([](CalibrationConfig& c) { c.kernel_size = 4; });
    rejects([](CalibrationConfig& c) { c.kernel_size = 0; });
    rejects([](CalibrationConfig& c) { c.excitation_wavelength_nm = 0.0; });
    rejects([](CalibrationConfig& c) { c.rough_residuals_threshold = -1.0; });
    rejects([](CalibrationConfig& c) {
        c.fine_residuals_threshold = std::numeric_limits<double>::quiet_NaN();
    });
    rejects([](CalibrationConfig& c) { c.prominence_increment = 0.0; });
    rejects([](CalibrationConfig& c) { c.rough_reference = Vector(); });
    rejects([](CalibrationConfig& c) {
        c.refinement_method = RefinementMethod::Parabolic;
        c.refinement_window = 5;
    });
    rejects([](CalibrationConfig& c) {
        c.refinement_method = RefinementMethod::Gaussian;
        c.refinement_window = 2;
    });
}

TEST(CalibrationRunTest, UninitializedRunHasNoAxis)
{
    CalibrationRun run;
    EXPECT_EQ(run.state(), CalibrationState::Uninitialized);
    EXPECT_FALSE(run.ok());
    EXPECT_THROW(run.wavenumbers(), std::logic_error);
    EXPECT_STREQ(to_string(CalibrationState::Failed), "Failed");
}

} // namespace ramancal_test
