#pragma once
#include "Types.hpp"
#include "Errors.hpp"
#include <Eigen/Core>
#include <Eigen/Dense>
#include <vector>
#include <string>
#include <iostream>
#include <iomanip>
#include <limits>
#include <cmath>

namespace seasonfit {

/* ---------------------------  user visible bits  --------------------------- */

enum class FitStatus {
    Converged,               // |Δχ²| < tolerance
    Diverged,                // χ² not finite, or no damping step improved it
    MaxIterationsReached     // tolerance not met within max_iterations
};

std::string to_string(FitStatus s);
FitStatus   fit_status_from_string(const std::string& s);

struct LMSolverOptions {
    int    max_iterations     = 20;      // outer (Jacobian) iterations
    double chi2_tolerance     = 1e-3;    // absolute |Δχ²|
    double initial_lambda     = 1e-3;    // Marquardt damping
    double lambda_factor      = 10.0;    // λ ÷ on success, × on failure
    int    max_damping_steps  = 10;      // consecutive rejections per iteration
    int    degrees_of_freedom = 0;       // ≤ 0 → rows − free parameters
    bool   verbose            = false;   // chatty?
};

struct LMSolverSummary {
    FitStatus status          = FitStatus::MaxIterationsReached;
    int    iterations         = 0;
    double initial_chi2       = 0.0;
    double final_chi2         = 0.0;
    std::vector<double> chi2_history;          // after every accepted step
    std::vector<double> param_uncertainties;   // 1-σ; 0 = fixed
};

/* --------------------  internal helpers  ----------------------------------- */

inline
void build_free_index(const std::vector<bool>& mask,
                      int                      n,
                      Eigen::VectorXi&         map_full_to_reduced,
                      int&                     n_free)
{
    map_full_to_reduced.resize(n);
    n_free = 0;
    for (int j = 0; j < n; ++j) {
        if (mask.empty() || mask[j])
            map_full_to_reduced[j] = n_free++;
        else
            map_full_to_reduced[j] = -1;
    }
}

/* outcome of one damped normal-equation solve */
enum class StepSolve { Solved, Singular };

/*  Eigen reports the factorisation state through ComputationInfo.  Only
 *  Success and NumericalIssue can come out of an LDLᵀ; anything else is
 *  surfaced to the caller instead of being folded into a FitStatus.     */
inline
StepSolve step_solve_from_info(Eigen::ComputationInfo info)
{
    switch (info) {
        case Eigen::Success:        return StepSolve::Solved;
        case Eigen::NumericalIssue: return StepSolve::Singular;
        default:
            throw UnknownSolverStatus("normal equations",
                                      static_cast<int>(info));
    }
}

/* JᵀJ of the free columns (lower rank update, mirrored) */
inline
void normal_matrix(const Matrix& Jf, Matrix& JTJ)
{
    const auto n_free = Jf.cols();
    JTJ.setZero(n_free, n_free);
    JTJ.selfadjointView<Eigen::Lower>().rankUpdate(Jf.adjoint(), 1.0);
    JTJ.template triangularView<Eigen::StrictlyUpper>() = JTJ.transpose();
}

/* ---------------  damped Gauss–Newton (Marquardt) driver  ------------------ */
/*
 *  Functor signature:
 *
 *      void func(const Vector& p, Vector* r, Matrix* J);
 *
 *  with r the (weighted) residual vector and J = ∂r/∂p.  χ² = |r|².
 *  Each outer iteration evaluates the Jacobian once and then tries
 *
 *      (JᵀJ + λ diag(JᵀJ)) Δp = −Jᵀr
 *
 *  with growing λ until χ² drops, at most max_damping_steps times.
 */
template<typename Functor>
LMSolverSummary
levenberg_marquardt(Functor&&                    func,
                    Vector&                      x,
                    const std::vector<bool>&     free_mask,
                    const LMSolverOptions&       opt = {})
{
    LMSolverSummary summ;
    const int n = static_cast<int>(x.size());

    /* --------------------------------------------------------------- */
    /*  map full parameter vector  ->  free (variable) parameters      */
    /* --------------------------------------------------------------- */
    Eigen::VectorXi col_index;
    int n_free = 0;
    build_free_index(free_mask, n, col_index, n_free);

    /* --------------------------------------------------------------- */
    /*  first model evaluation                                         */
    /* --------------------------------------------------------------- */
    Vector r;
    Matrix J;
    func(x, &r, &J);

    const Eigen::Index m = r.size();
    double chi2 = r.squaredNorm();
    summ.initial_chi2 = chi2;
    summ.final_chi2   = chi2;
    summ.param_uncertainties.assign(n, 0.0);

    if (!std::isfinite(chi2)) {
        std::cout << "[LM]  Warning: initial chi2 is not finite – "
                     "starting point unusable\n";
        summ.status = FitStatus::Diverged;
        return summ;
    }

    if (n_free == 0) {                            // nothing to fit
        std::cout << "[LM]  Warning: All parameters are frozen! There is nothing to fit..." << std::endl;
        summ.status = FitStatus::Converged;
        return summ;
    }

    double lambda = opt.initial_lambda > 0.0 ? opt.initial_lambda : 1e-3;
    const double fac = opt.lambda_factor > 1.0 ? opt.lambda_factor : 10.0;

    Matrix Jf(m, n_free), JTJ, A;
    Vector diag_JTJ, g, dx_free, dx(n);

    if (opt.verbose)
        std::cout << "[LM]  start  χ²=" << std::setprecision(6) << chi2
                  << "  λ=" << lambda << "  free=" << n_free << '\n';

    /* --------------------------------------------------------------- */
    /*  main iteration loop                                            */
    /* --------------------------------------------------------------- */
    bool finished = false;
    for (int it = 0; it < opt.max_iterations && !finished; ++it) {
        summ.iterations = it + 1;

        /* ----- build reduced Jacobian (copy only the free columns) -- */
        for (int j = 0; j < n; ++j) {
            int col = col_index[j];
            if (col >= 0) Jf.col(col).noalias() = J.col(j);
        }

        g.noalias() = Jf.transpose() * r;         // g = Jᵀ r
        normal_matrix(Jf, JTJ);
        diag_JTJ = JTJ.diagonal();

        bool accepted = false;
        for (int k = 0; k < opt.max_damping_steps; ++k) {

            /* ------- (JTJ + λ D) Δx = −g   (D = diag(JTJ)) ---------- */
            A = JTJ;
            A.diagonal().array() += lambda * (diag_JTJ.array() + 1e-20);

            Eigen::LDLT<Matrix> ldlt(A);
            if (step_solve_from_info(ldlt.info()) == StepSolve::Singular) {
                lambda *= fac;
                if (opt.verbose)
                    std::cout << "[LM]  iter " << it << "  singular normal matrix, λ="
                              << lambda << '\n';
                continue;
            }
            dx_free = -ldlt.solve(g);

            if (!dx_free.allFinite()) {
                lambda *= fac;
                if (opt.verbose)
                    std::cout << "[LM]  iter " << it << "  Inf/NaN step, λ="
                              << lambda << '\n';
                continue;
            }

            /* --------------- copy step into full parameter vector --- */
            dx.setZero();
            for (int j = 0; j < n; ++j) {
                int col = col_index[j];
                if (col >= 0) dx[j] = dx_free[col];
            }

            Vector x_try = x + dx;
            Vector r_try;
            Matrix J_try;
            func(x_try, &r_try, &J_try);
            const double chi2_try = r_try.squaredNorm();
            const double delta    = chi2 - chi2_try;

            const bool improved = delta > 0.0;
            const bool settled  = std::abs(delta) < opt.chi2_tolerance;

            if (improved) {
                x.swap(x_try);
                r.swap(r_try);
                J.swap(J_try);
                chi2 = chi2_try;
                summ.chi2_history.push_back(chi2);
                accepted = true;
                lambda /= fac;
                lambda  = std::max(lambda, 1e-18);
            }

            if (opt.verbose)
                std::cout << "[LM]  iter " << it
                          << "  χ²=" << std::setprecision(8) << chi2_try
                          << "  Δχ²=" << std::setprecision(3) << delta
                          << "  λ="  << std::setprecision(3) << lambda
                          << (improved ? "  (accepted)\n" : "  (rejected)\n");

            if (settled) {
                summ.status = FitStatus::Converged;
                accepted    = true;
                finished    = true;
                break;
            }
            if (improved) break;

            lambda *= fac;
        }

        if (!accepted) {
            std::cout << "[LM]  Warning: χ² did not improve after "
                      << opt.max_damping_steps
                      << " damping steps – giving up\n";
            summ.status = FitStatus::Diverged;
            finished    = true;
        }
    }

    if (!finished)
        summ.status = FitStatus::MaxIterationsReached;

    summ.final_chi2 = chi2;

    /* ---------------------  propagate uncertainties  ---------------- */
    for (int j = 0; j < n; ++j) {
        int col = col_index[j];
        if (col >= 0) Jf.col(col).noalias() = J.col(j);
    }
    normal_matrix(Jf, JTJ);

    const int dof = opt.degrees_of_freedom > 0
                        ? opt.degrees_of_freedom
                        : std::max<int>(static_cast<int>(m) - n_free, 1);
    const double var = chi2 / dof;                          // σ² ≈ χ²/dof

    Eigen::LDLT<Matrix> ldlt(JTJ);
    if (step_solve_from_info(ldlt.info()) == StepSolve::Solved) {
        Matrix cov = ldlt.solve(Matrix::Identity(n_free, n_free));
        cov *= var;
        for (int j = 0; j < n; ++j) {
            int col = col_index[j];
            if (col >= 0 && std::isfinite(cov(col, col)))
                summ.param_uncertainties[j] =
                    std::sqrt(std::max(0.0, cov(col, col)));
        }
    }

    if (opt.verbose)
        std::cout << "[LM]  done: " << to_string(summ.status)
                  << " after " << summ.iterations << " iterations, χ²="
                  << std::setprecision(8) << chi2 << '\n';
    return summ;
}

} // namespace seasonfit
