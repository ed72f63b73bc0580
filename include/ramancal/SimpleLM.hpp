#pragma once
#include <Eigen/Core>
#include <Eigen/Dense>
#include <vector>
#include <iostream>
#include <iomanip>
#include <limits>
#include <cmath>

namespace ramancal {

/* ---------------------------  user visible bits  --------------------------- */
/*  A tolerance ≤ 0 means "derive from the first model evaluation".          */

struct LMSolverOptions {
    int    max_iterations        = 200;      // hard upper limit
    double gradient_tolerance    = 0;        // auto
    double step_tolerance        = 0;        // auto
    double chi2_tolerance        = 0;        // auto
    double initial_lambda        = 0;        // auto
    bool   verbose               = false;    // one line per iteration
};

enum class LMTermination {
    None,               // iteration cap reached
    SmallGradient,
    SmallStep,
    SmallReduction,
    NumericalFailure    // Inf/NaN in the normal equations
};

struct LMSolverSummary {
    int           iterations   = 0;
    double        initial_chi2 = 0.0;
    double        final_chi2   = 0.0;
    bool          converged    = false;
    LMTermination termination  = LMTermination::None;
    std::vector<double> param_uncertainties;   // 1-σ from (JᵀJ)⁻¹·χ²/dof
};

inline const char* to_string(LMTermination t)
{
    switch (t) {
        case LMTermination::None:             return "iteration limit";
        case LMTermination::SmallGradient:    return "gradient tolerance";
        case LMTermination::SmallStep:        return "step tolerance";
        case LMTermination::SmallReduction:   return "chi2 tolerance";
        case LMTermination::NumericalFailure: return "numerical failure";
    }
    return "unknown";
}

/* -------------------  Levenberg–Marquardt driver routine  ------------------ */
/*
 *  func(x, &r, &J) fills the residual vector r (size m) and the Jacobian
 *  J = ∂r/∂x (m × n).  `lower` / `upper` are optional box constraints
 *  (empty == unbounded); a trial step is projected onto the box.
 */
template<typename Functor>
LMSolverSummary
levenberg_marquardt(Functor&&                    func,
                    Eigen::VectorXd&             x,
                    const std::vector<double>&   lower    = {},
                    const std::vector<double>&   upper    = {},
                    const LMSolverOptions&       user_opt = {})
{
    LMSolverSummary summ;
    const Eigen::Index n = x.size();
    LMSolverOptions opt = user_opt;               // mutable copy

    /* --------------------------------------------------------------- */
    /*  first model evaluation                                         */
    /* --------------------------------------------------------------- */
    Eigen::VectorXd r;
    Eigen::MatrixXd J;
    func(x, &r, &J);

    const Eigen::Index m = r.size();
    double chi2 = r.squaredNorm();
    summ.initial_chi2 = chi2;

    if (!std::isfinite(chi2)) {
        summ.final_chi2  = chi2;
        summ.termination = LMTermination::NumericalFailure;
        return summ;
    }

    /* --------------------------------------------------------------- */
    /*  automatic tolerances and initial λ                             */
    /* --------------------------------------------------------------- */
    const double eps   = std::numeric_limits<double>::epsilon();
    Eigen::MatrixXd JTJ = J.transpose() * J;
    Eigen::VectorXd g   = J.transpose() * r;

    if (opt.gradient_tolerance <= 0.0) {
        const double gmax0 = g.cwiseAbs().maxCoeff();
        opt.gradient_tolerance = (gmax0 > 0.0) ? 1e-10 * gmax0 : 1e-12;
    }
    if (opt.step_tolerance <= 0.0)
        opt.step_tolerance = 1e-10 * std::max(1.0, x.lpNorm<Eigen::Infinity>());
    if (opt.chi2_tolerance <= 0.0)
        opt.chi2_tolerance = 1e-14 * std::max(1.0, chi2);
    if (opt.initial_lambda <= 0.0) {
        opt.initial_lambda = 1e-3 * JTJ.diagonal().maxCoeff();
        if (!(opt.initial_lambda > 0.0)) opt.initial_lambda = 1e-3;
    }
    double lambda = opt.initial_lambda;

    /* --------------------------------------------------------------- */
    /*  main iteration loop                                            */
    /* --------------------------------------------------------------- */
    for (int it = 0; it < opt.max_iterations; ++it) {
        summ.iterations = it + 1;

        g.noalias() = J.transpose() * r;
        if (g.cwiseAbs().maxCoeff() < opt.gradient_tolerance) {
            summ.converged   = true;
            summ.termination = LMTermination::SmallGradient;
            break;
        }

        JTJ.noalias() = J.transpose() * J;
        const Eigen::VectorXd diag_JTJ = JTJ.diagonal();

        /* ------- (JTJ + λ D) Δx = −g   (D = diag(JTJ)) -------------- */
        JTJ.diagonal().array() += lambda * (diag_JTJ.array() + 1e-20);   // Fletcher scaling
        Eigen::VectorXd dx = -JTJ.ldlt().solve(g);

        if (!dx.allFinite()) {
            std::cerr << "[LM] Warning: numerical failure, Inf/NaN in solver\n";
            summ.termination = LMTermination::NumericalFailure;
            break;
        }

        /* --------------------- candidate point ---------------------- */
        Eigen::VectorXd x_try = x + dx;
        for (Eigen::Index j = 0; j < n; ++j) {
            const auto js = static_cast<std::size_t>(j);
            if (!lower.empty()) x_try[j] = std::max(x_try[j], lower[js]);
            if (!upper.empty()) x_try[j] = std::min(x_try[j], upper[js]);
        }
        dx = x_try - x;                            // step actually taken

        if (dx.cwiseAbs().maxCoeff() < opt.step_tolerance) {
            summ.converged   = true;
            summ.termination = LMTermination::SmallStep;
            break;
        }

        Eigen::VectorXd r_try;
        Eigen::MatrixXd J_try;
        func(x_try, &r_try, &J_try);
        const double chi2_try = r_try.squaredNorm();

        /* ------------------- Powell's ρ test ------------------------ */
        double pred_red = 0.5 * dx.dot(lambda * (diag_JTJ.array() * dx.array()).matrix() - g);
        if (pred_red <= 0.0) pred_red = eps;

        const double rho    = (chi2 - chi2_try) / pred_red;
        const bool   accept = std::isfinite(chi2_try) && rho > 0.0 && chi2_try < chi2;

        if (accept) {
            x.swap(x_try);
            r.swap(r_try);
            J.swap(J_try);
            chi2 = chi2_try;

            /* adaptive λ (MINPACK style) */
            lambda *= std::max(1.0 / 3.0, 1.0 - std::pow(2.0 * rho - 1.0, 3.0));
            lambda  = std::max(lambda, 1e-18);

            if (opt.verbose)
                std::cout << "[LM]  iter " << it
                          << "  rho="  << std::setprecision(3) << rho
                          << "  chi2=" << std::setprecision(6) << chi2
                          << "  lambda=" << std::setprecision(3) << lambda
                          << "  (accepted)\n";

            if (std::abs(pred_red) < opt.chi2_tolerance) {
                summ.converged   = true;
                summ.termination = LMTermination::SmallReduction;
                break;
            }
        } else {
            lambda *= 2.0;
            if (opt.verbose)
                std::cout << "[LM]  iter " << it
                          << "  rho="  << std::setprecision(3) << rho
                          << "  lambda=" << std::setprecision(3) << lambda
                          << "  (rejected)\n";
        }
    }

    summ.final_chi2 = chi2;

    /* ---------------------  propagate uncertainties  ---------------- */
    summ.param_uncertainties.assign(static_cast<std::size_t>(n), 0.0);
    if (m > n) {
        JTJ.noalias() = J.transpose() * J;
        const double var = chi2 / static_cast<double>(m - n);      // σ² ≈ χ²/dof
        const Eigen::MatrixXd cov =
            JTJ.ldlt().solve(Eigen::MatrixXd::Identity(n, n)) * var;
        for (Eigen::Index j = 0; j < n; ++j)
            summ.param_uncertainties[static_cast<std::size_t>(j)] =
                std::sqrt(std::max(0.0, cov(j, j)));
    }
    return summ;
}

} // namespace ramancal
