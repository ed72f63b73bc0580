#include "ramancal/Errors.hpp"
#include "ramancal/Diagnostics.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>

namespace ramancal {

const char* to_string(CalibrationStage stage)
{
    switch (stage) {
        case CalibrationStage::Rough: return "rough";
        case CalibrationStage::Fine:  return "fine";
    }
    return "unknown";
}

const char* to_string(DiagnosticCode code)
{
    switch (code) {
        case DiagnosticCode::InsufficientPeaksFound: return "InsufficientPeaksFound";
        case DiagnosticCode::PeakSearchNotConverged: return "PeakSearchNotConverged";
        case DiagnosticCode::PeakSearchOvershot:     return "PeakSearchOvershot";
        case DiagnosticCode::RefinementOutOfBounds:  return "RefinementOutOfBounds";
    }
    return "Unknown";
}

void warn(Diagnostics&       diags,
          DiagnosticCode     code,
          const std::string& tag,
          const std::string& message)
{
    std::cerr << "[" << tag << "] Warning: " << message << '\n';
    diags.push_back(Diagnostic{code, message});
}

/* ------------------------------------------------------------------ */

static std::string underdetermined_msg(Eigen::Index n, int degree, const std::string& detail)
{
    std::ostringstream s;
    s << "Least-squares fit of degree " << degree << " is underdetermined: "
      << n << " correspondence point(s), at least " << (degree + 1) << " required";
    if (!detail.empty()) s << " (" << detail << ")";
    return s.str();
}

FitUnderdetermined::FitUnderdetermined(Eigen::Index n_points, int degree,
                                       const std::string& detail)
    : CalibrationError(underdetermined_msg(n_points, degree, detail))
    , n_points_(n_points)
    , degree_(degree)
{}

static std::string threshold_msg(CalibrationStage stage, double fitness,
                                 double threshold, bool refined)
{
    std::ostringstream s;
    s << "Sum of squared residuals during " << to_string(stage) << " calibration";
    if (refined) s << " with refined peaks";
    s << " > specified threshold (" << std::setprecision(2) << fitness
      << " > " << std::setprecision(6) << threshold << ").";
    return s.str();
}

ResidualThresholdExceeded::ResidualThresholdExceeded(CalibrationStage stage,
                                                     double fitness,
                                                     double threshold,
                                                     bool refined)
    : CalibrationError(threshold_msg(stage, fitness, threshold, refined))
    , stage_(stage)
    , fitness_(fitness)
    , threshold_(threshold)
{}

static std::string mismatch_msg(CalibrationStage stage, std::size_t found, std::size_t expected)
{
    std::ostringstream s;
    s << "Found " << found << " peak(s) during " << to_string(stage)
      << " calibration but the reference table has " << expected << " entries";
    return s.str();
}

PeakCountMismatch::PeakCountMismatch(CalibrationStage stage, std::size_t found,
                                     std::size_t expected)
    : CalibrationError(mismatch_msg(stage, found, expected))
    , stage_(stage)
    , found_(found)
    , expected_(expected)
{}

static std::string window_msg(Eigen::Index peak, int window, Eigen::Index size)
{
    std::ostringstream s;
    s << "Gaussian refinement window of " << window << " samples around index "
      << peak << " exceeds the signal bounds [0, " << size << ")";
    return s.str();
}

RefinementOutOfBounds::RefinementOutOfBounds(Eigen::Index peak_index, int window,
                                             Eigen::Index signal_size)
    : CalibrationError(window_msg(peak_index, window, signal_size))
{}

OptimizerDidNotConverge::OptimizerDidNotConverge(const std::string& what,
                                                 int iterations,
                                                 double final_chi2)
    : CalibrationError(what)
    , iterations_(iterations)
    , final_chi2_(final_chi2)
{}

} // namespace ramancal
