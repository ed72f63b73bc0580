#pragma once
#include <Eigen/Core>
#include <stdexcept>
#include <string>

namespace ramancal {

enum class CalibrationStage { Rough, Fine };

const char* to_string(CalibrationStage stage);

/* Base of every pipeline-aborting condition.  Calibrator::run() turns
 * exactly these into a Failed run; anything else propagates unchanged.   */
class CalibrationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/* polynomial fit with fewer correspondences than the degree requires */
class FitUnderdetermined : public CalibrationError {
public:
    FitUnderdetermined(Eigen::Index n_points, int degree, const std::string& detail = {});

    Eigen::Index n_points() const { return n_points_; }
    int          degree()   const { return degree_; }

private:
    Eigen::Index n_points_;
    int          degree_;
};

/* stage fit quality above its acceptance threshold */
class ResidualThresholdExceeded : public CalibrationError {
public:
    ResidualThresholdExceeded(CalibrationStage stage, double fitness, double threshold,
                              bool refined = false);

    CalibrationStage stage()     const { return stage_; }
    double           fitness()   const { return fitness_; }
    double           threshold() const { return threshold_; }

private:
    CalibrationStage stage_;
    double           fitness_;
    double           threshold_;
};

/* detected peaks cannot be paired with the reference table */
class PeakCountMismatch : public CalibrationError {
public:
    PeakCountMismatch(CalibrationStage stage, std::size_t found, std::size_t expected);

    CalibrationStage stage()    const { return stage_; }
    std::size_t      found()    const { return found_; }
    std::size_t      expected() const { return expected_; }

private:
    CalibrationStage stage_;
    std::size_t      found_;
    std::size_t      expected_;
};

/* Gaussian refinement window does not fit inside the signal */
class RefinementOutOfBounds : public CalibrationError {
public:
    RefinementOutOfBounds(Eigen::Index peak_index, int window, Eigen::Index signal_size);
};

/* Levenberg–Marquardt gave up (iteration cap, numerical failure, bad fit) */
class OptimizerDidNotConverge : public CalibrationError {
public:
    OptimizerDidNotConverge(const std::string& what, int iterations, double final_chi2);

    int    iterations() const { return iterations_; }
    double final_chi2() const { return final_chi2_; }

private:
    int    iterations_;
    double final_chi2_;
};

} // namespace ramancal
