// cpp/gwalign/align/align_time.cpp
#include "align_time.hpp"
#include "alignment_window.hpp"
#include "../numerics/cubic_spline.hpp"
#include "../numerics/quadrature.hpp"
#include "../numerics/trust_region.hpp"
#include <cmath>
#include <vector>
#include <algorithm>
#include <iostream>
#include <omp.h>

namespace gwalign {

namespace {

// 残差 r_k = sqrt(w_k / N) * (norm_a(t_k) - norm_b(t_k + dt))
// 于是 sum r_k^2 = cost^2，最小二乘与最小化 cost 等价
struct NormMismatch {
    const CubicSpline* norm_b;
    std::vector<double> t_ref;
    std::vector<double> norm_a;
    std::vector<double> scale; // sqrt(w_k / normalization)

    double cost(double dt, gsl_interp_accel* acc) const {
        double sum = 0.0;
        for (std::size_t k = 0; k < t_ref.size(); ++k) {
            double r = scale[k] * (norm_a[k] - norm_b->eval(t_ref[k] + dt, acc));
            sum += r * r;
        }
        return std::sqrt(sum);
    }

    void residuals(double dt, gsl_interp_accel* acc, double* r) const {
        for (std::size_t k = 0; k < t_ref.size(); ++k) {
            r[k] = scale[k] * (norm_a[k] - norm_b->eval(t_ref[k] + dt, acc));
        }
    }

    void jacobian(double dt, gsl_interp_accel* acc, double* J) const {
        for (std::size_t k = 0; k < t_ref.size(); ++k) {
            J[k] = -scale[k] * norm_b->eval_deriv(t_ref[k] + dt, acc);
        }
    }
};

} // namespace

OptimizationResult align_time_full(const WaveformModes& wa,
                                   const WaveformModes& wb,
                                   double t1, double t2,
                                   const AlignConfig& config) {
    // 1. 先检查窗口，之前不做任何数值计算
    validate_window(wa, wb, t1, t2);
    GslErrorGuard gsl_guard;

    // 2. δt 的取值范围: 保证平移后的窗口仍在 wb 的采样范围内
    const double dt_lower = std::max(t1 - t2, wb.t_min() - t1);
    const double dt_upper = std::min(t2 - t1, wb.t_max() - t2);

    std::size_t n_brute_force = config.n_brute_force_dt;
    if (n_brute_force == 0) {
        n_brute_force = std::max(count_in_window(wa.t(), t1, t2),
                                 count_in_window(wb.t(), t1, t2));
    }
    if (n_brute_force < 1) n_brute_force = 1;
    const std::vector<double> dt_grid = linspace(dt_lower, dt_upper, n_brute_force);

    // 3. 代价函数
    const CubicSpline norm_b(wb.t(), wb.norm());
    const std::vector<double> norm_a_all = wa.norm();

    std::size_t k_begin, k_end;
    window_range(wa.t(), t1, t2, k_begin, k_end);

    NormMismatch mismatch;
    mismatch.norm_b = &norm_b;
    mismatch.t_ref.assign(wa.t().begin() + k_begin, wa.t().begin() + k_end);
    mismatch.norm_a.assign(norm_a_all.begin() + k_begin, norm_a_all.begin() + k_end);

    const std::vector<double> w = trapezoid_weights(mismatch.t_ref);
    double normalization = 0.0;
    for (std::size_t k = 0; k < w.size(); ++k) {
        normalization += w[k] * mismatch.norm_a[k] * mismatch.norm_a[k];
    }
    mismatch.scale.resize(w.size());
    for (std::size_t k = 0; k < w.size(); ++k) {
        mismatch.scale[k] = std::sqrt(w[k] / normalization);
    }

    // 4. 暴力搜索 (各候选独立，OpenMP 并行；每个线程自己的 accel)
    std::vector<double> cost_grid(dt_grid.size());
    #pragma omp parallel
    {
        InterpAccel acc;
        #pragma omp for schedule(static)
        for (std::size_t i = 0; i < dt_grid.size(); ++i) {
            cost_grid[i] = mismatch.cost(dt_grid[i], acc.get());
        }
    }
    const std::size_t i_best = argmin(cost_grid);

    OptimizationResult result;
    result.seed = {dt_grid[i_best]};
    result.n_brute_force = dt_grid.size();

    if (config.verbose) {
        std::cout << "[C++ Align] time: " << dt_grid.size() << " candidates in ["
                  << dt_lower << ", " << dt_upper << "], seed dt=" << dt_grid[i_best]
                  << " (cost=" << cost_grid[i_best] << ")" << std::endl;
    }

    if (mismatch.t_ref.empty()) {
        // 窗口里没有 wa 的采样点，无法细化
        result.x = result.seed;
        result.cost = std::nan("");
        result.message = "no samples of wa inside (t1, t2)";
        return result;
    }

    // 5. trust-region 细化
    InterpAccel acc;
    ResidualFunction f = [&](const std::vector<double>& x, std::vector<double>& r) {
        mismatch.residuals(x[0], acc.get(), r.data());
    };
    JacobianFunction df = [&](const std::vector<double>& x, std::vector<double>& J) {
        mismatch.jacobian(x[0], acc.get(), J.data());
    };

    TrustRegionOptions opts;
    opts.max_iter = config.max_iter;
    opts.xtol = config.xtol;
    opts.gtol = config.gtol;
    opts.ftol = config.ftol;

    TrustRegionResult tr = trust_region_solve(f, df, mismatch.t_ref.size(), result.seed,
                                              {{dt_lower, dt_upper, false}}, opts);

    result.x = tr.x;
    result.cost = tr.cost;
    result.converged = tr.converged;
    result.iterations = tr.iterations;
    result.status = tr.status;
    result.message = tr.message;

    if (config.verbose) {
        std::cout << "[C++ Align] time: dt=" << result.x[0] << " cost=" << result.cost
                  << " iter=" << result.iterations << " (" << result.message << ")" << std::endl;
    }
    return result;
}

double align_time(const WaveformModes& wa,
                  const WaveformModes& wb,
                  double t1, double t2,
                  std::size_t n_brute_force) {
    AlignConfig config;
    config.n_brute_force_dt = n_brute_force;
    return align_time_full(wa, wb, t1, t2, config).x[0];
}

} // namespace gwalign
