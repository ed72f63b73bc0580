#include <gtest/gtest.h>
#include "ramancal/PeakRefiner.hpp"
#include "ramancal/Errors.hpp"
#include "TestHelpers.hpp"
#include <cmath>
#include <stdexcept>

namespace ramancal_test {

using namespace ramancal;

class PeakRefinerTest : public ::testing::Test {
protected:
    /* exact samples of A·exp(−(x−μ)²/(2σ²)) on 0..n−1 */
    static Vector sampled_gaussian(Eigen::Index n, double A, double mu, double sigma)
    {
        Vector y(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            const double d = static_cast<double>(i) - mu;
            y[i] = A * std::exp(-d * d / (2.0 * sigma * sigma));
        }
        return y;
    }
};

// ============================================================================
// Method parsing
// ============================================================================

TEST(RefinementMethodNames, ParseIsCaseInsensitive)
{
    EXPECT_EQ(parse_refinement_method("none"),      RefinementMethod::None);
    EXPECT_EQ(parse_refinement_method("Parabolic"), RefinementMethod::Parabolic);
    EXPECT_EQ(parse_refinement_method("GAUSSIAN"),  RefinementMethod::Gaussian);
    EXPECT_STREQ(to_string(RefinementMethod::Gaussian), "gaussian");
}

TEST(RefinementMethodNames, UnknownMethodThrows)
{
    EXPECT_THROW(parse_refinement_method("lorentzian"), std::invalid_argument);
}

TEST(RefinementMethodNames, DefaultWindows)
{
    EXPECT_EQ(default_refinement_window(RefinementMethod::Gaussian),  9);
    EXPECT_EQ(default_refinement_window(RefinementMethod::Parabolic), 3);
}

// ============================================================================
// Parabolic
// ============================================================================

TEST_F(PeakRefinerTest, ParabolicSymmetricPeakStaysPut)
{
    const RefinedPeak p = refine_peak_parabolic(2, make_vector({3, 7, 12, 7, 3}));
    EXPECT_DOUBLE_EQ(p.position, 2.0);
    EXPECT_DOUBLE_EQ(p.height, 12.0);
    EXPECT_TRUE(p.diagnostics.empty());
}

TEST_F(PeakRefinerTest, ParabolicVertexOfAsymmetricPeak)
{
    // parabola through (1,4), (2,10), (3,8) peaks at x = 2.25, y = 10.25
    const RefinedPeak p = refine_peak_parabolic(2, make_vector({0, 4, 10, 8, 0}));
    EXPECT_NEAR(p.position, 2.25, 1e-12);
    EXPECT_NEAR(p.height, 10.25, 1e-12);
    EXPECT_TRUE(p.diagnostics.empty());
}

TEST_F(PeakRefinerTest, ParabolicEdgePeakFallsBack)
{
    const Vector y = make_vector({9, 4, 1});
    const RefinedPeak p = refine_peak_parabolic(0, y);
    EXPECT_DOUBLE_EQ(p.position, 0.0);
    EXPECT_DOUBLE_EQ(p.height, 9.0);
    EXPECT_TRUE(has_diagnostic(p.diagnostics, DiagnosticCode::RefinementOutOfBounds));
}

TEST_F(PeakRefinerTest, ParabolicCollinearFallsBack)
{
    const RefinedPeak p = refine_peak_parabolic(2, make_vector({1, 2, 3, 4, 5}));
    EXPECT_DOUBLE_EQ(p.position, 2.0);
    EXPECT_TRUE(has_diagnostic(p.diagnostics, DiagnosticCode::RefinementOutOfBounds));
}

TEST_F(PeakRefinerTest, ParabolicVertexOutsideNeighboursFallsBack)
{
    // convex triple: the vertex lies 2.5 samples to the left
    const RefinedPeak p = refine_peak_parabolic(1, make_vector({0.0, 1.0, 2.5, 3.0}));
    EXPECT_DOUBLE_EQ(p.position, 1.0);
    EXPECT_TRUE(has_diagnostic(p.diagnostics, DiagnosticCode::RefinementOutOfBounds));
}

TEST_F(PeakRefinerTest, ParabolicIndexOutsideSignalThrows)
{
    EXPECT_THROW(refine_peak_parabolic(7, make_vector({1, 2, 1})), std::out_of_range);
}

// ============================================================================
// Gaussian
// ============================================================================

TEST_F(PeakRefinerTest, GaussianShiftsTowardsHeavierShoulder)
{
    const RefinedPeak p = refine_peak_gaussian(2, make_vector({1, 6, 10, 8, 3}), 5);
    EXPECT_NEAR(p.position, 2.2, 0.1);
    EXPECT_TRUE(p.diagnostics.empty());
}

TEST_F(PeakRefinerTest, GaussianRecoversExactParameters)
{
    const Vector y = sampled_gaussian(21, 2.0, 10.3, 1.5);
    const RefinedPeak p = refine_peak_gaussian(10, y, 9);
    EXPECT_NEAR(p.position, 10.3, 1e-4);
    EXPECT_NEAR(p.height, 2.0, 1e-4);
}

TEST_F(PeakRefinerTest, GaussianMeanAPixelAwayIsRejected)
{
    // sample 10 sits on the flank; the fitted mean lands near 11.5
    const Vector y = sampled_gaussian(21, 1.0, 11.5, 1.5);
    EXPECT_THROW(refine_peak_gaussian(10, y, 9), OptimizerDidNotConverge);
    EXPECT_NEAR(refine_peak_gaussian(11, y, 9).position, 11.5, 1e-4);
}

TEST_F(PeakRefinerTest, GaussianWindowLeavingSignalThrows)
{
    const Vector y = sampled_gaussian(20, 1.0, 2.0, 1.0);
    EXPECT_THROW(refine_peak_gaussian(2, y, 9), RefinementOutOfBounds);
    EXPECT_THROW(refine_peak_gaussian(17, y, 9), RefinementOutOfBounds);
}

TEST_F(PeakRefinerTest, GaussianWindowTooSmallThrows)
{
    EXPECT_THROW(refine_peak_gaussian(2, make_vector({1, 6, 10, 8, 3}), 2),
                 std::invalid_argument);
}

TEST_F(PeakRefinerTest, GaussianEvenWindowExtendsRight)
{
    // window 4 around index 1 uses samples 0..3 and fits inside
    const Vector y = sampled_gaussian(4, 1.0, 1.4, 1.0);
    const RefinedPeak p = refine_peak_gaussian(1, y, 4);
    EXPECT_NEAR(p.position, 1.4, 1e-4);
    // the same window one sample further right overflows
    EXPECT_THROW(refine_peak_gaussian(2, y, 4), RefinementOutOfBounds);
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(PeakRefinerTest, NoneKeepsIntegerPosition)
{
    const RefinedPeak p = refine_peak(2, make_vector({0, 4, 10, 8, 0}), RefinementMethod::None);
    EXPECT_DOUBLE_EQ(p.position, 2.0);
    EXPECT_DOUBLE_EQ(p.height, 10.0);
}

TEST_F(PeakRefinerTest, RefinePeaksCollectsDiagnostics)
{
    const RefinedPeaks r = refine_peaks(IndexVector({0, 2}), make_vector({3, 7, 12, 7, 3}),
                                        RefinementMethod::Parabolic);
    ASSERT_EQ(r.positions.size(), 2);
    EXPECT_DOUBLE_EQ(r.positions[0], 0.0);
    EXPECT_DOUBLE_EQ(r.positions[1], 2.0);
    EXPECT_DOUBLE_EQ(r.heights[1], 12.0);
    EXPECT_EQ(r.diagnostics.size(), 1u);
}

TEST_F(PeakRefinerTest, GaussianFailurePropagatesFromRefinePeaks)
{
    const Vector y = sampled_gaussian(30, 1.0, 15.0, 2.0);
    EXPECT_THROW(refine_peaks(IndexVector({1, 15}), y, RefinementMethod::Gaussian),
                 RefinementOutOfBounds);
}

} // namespace ramancal_test
