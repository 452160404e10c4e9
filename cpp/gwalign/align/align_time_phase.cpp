// cpp/gwalign/align/align_time_phase.cpp
#include "align_time_phase.hpp"
#include "alignment_window.hpp"
#include "../numerics/cubic_spline.hpp"
#include "../numerics/quadrature.hpp"
#include "../numerics/trust_region.hpp"
#include <cmath>
#include <complex>
#include <vector>
#include <set>
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <omp.h>

namespace gwalign {

namespace {

const double TWO_PI = 2.0 * M_PI;

// 每个线程一份的临时空间
struct MismatchScratch {
    InterpAccel acc;
    std::vector<std::complex<double>> a;
    std::vector<std::complex<double>> da;
    std::vector<std::complex<double>> rot;
};

// exp(i dphi)^m, m = -ell_max..ell_max
void fill_phase_table(double dphi, int ell_max, std::vector<std::complex<double>>& table) {
    table.resize(static_cast<std::size_t>(2 * ell_max + 1));
    for (int m = -ell_max; m <= ell_max; ++m) {
        table[static_cast<std::size_t>(m + ell_max)] = std::polar(1.0, m * dphi);
    }
}

// 残差按 (时间 k, 模式 j, 实/虚) 排列:
//   r = sqrt(w_k / N) * [A_j(t_k + dt) exp(i dphi)^{m_j} - B_j(t_k)]
struct ModeMismatch {
    const ModeInterpolant* modes_a;
    std::vector<double> t_ref;
    std::vector<std::complex<double>> modes_b; // t_ref.size() x n_cols
    std::vector<std::size_t> rot_index;        // 每列 m + ell_max
    std::vector<int> m_weights;
    std::vector<double> scale;
    std::size_t n_cols;
    int ell_max;

    std::size_t n_residuals() const { return 2 * t_ref.size() * n_cols; }

    void prepare(MismatchScratch& s) const {
        s.a.resize(n_cols);
        s.da.resize(n_cols);
    }

    double cost(double dt, double dphi, MismatchScratch& s) const {
        fill_phase_table(dphi, ell_max, s.rot);
        double sum = 0.0;
        for (std::size_t k = 0; k < t_ref.size(); ++k) {
            modes_a->eval(t_ref[k] + dt, s.acc.get(), s.a.data());
            const std::complex<double>* b = &modes_b[k * n_cols];
            double row = 0.0;
            for (std::size_t j = 0; j < n_cols; ++j) {
                row += std::norm(s.a[j] * s.rot[rot_index[j]] - b[j]);
            }
            sum += scale[k] * scale[k] * row;
        }
        return std::sqrt(sum);
    }

    void residuals(double dt, double dphi, MismatchScratch& s, double* r) const {
        fill_phase_table(dphi, ell_max, s.rot);
        for (std::size_t k = 0; k < t_ref.size(); ++k) {
            modes_a->eval(t_ref[k] + dt, s.acc.get(), s.a.data());
            const std::complex<double>* b = &modes_b[k * n_cols];
            double* rk = r + 2 * k * n_cols;
            for (std::size_t j = 0; j < n_cols; ++j) {
                std::complex<double> d = scale[k] * (s.a[j] * s.rot[rot_index[j]] - b[j]);
                rk[2 * j] = d.real();
                rk[2 * j + 1] = d.imag();
            }
        }
    }

    // J 为 n x 2 行优先: 第 0 列 d/d(dt)，第 1 列 d/d(dphi)
    void jacobian(double dt, double dphi, MismatchScratch& s, double* J) const {
        fill_phase_table(dphi, ell_max, s.rot);
        const std::complex<double> I(0.0, 1.0);
        for (std::size_t k = 0; k < t_ref.size(); ++k) {
            const double tk = t_ref[k] + dt;
            modes_a->eval(tk, s.acc.get(), s.a.data());
            modes_a->eval_deriv(tk, s.acc.get(), s.da.data());
            double* Jk = J + 4 * k * n_cols;
            for (std::size_t j = 0; j < n_cols; ++j) {
                const std::complex<double> rot = s.rot[rot_index[j]];
                std::complex<double> d_dt = scale[k] * s.da[j] * rot;
                std::complex<double> d_dphi = scale[k] * I * static_cast<double>(m_weights[j]) * s.a[j] * rot;
                Jk[4 * j + 0] = d_dt.real();
                Jk[4 * j + 1] = d_dphi.real();
                Jk[4 * j + 2] = d_dt.imag();
                Jk[4 * j + 3] = d_dphi.imag();
            }
        }
    }
};

} // namespace

std::pair<OptimizationResult, WaveformModes>
align_time_phase(const WaveformModes& wa,
                 const WaveformModes& wb,
                 double t1, double t2,
                 const AlignConfig& config) {
    // 1. 检查窗口，通过之后才拷贝
    validate_window(wa, wb, t1, t2);

    const int ell_max = std::min(wa.ell_max(), wb.ell_max());
    if (ell_max < 2 || wa.ell_min() > 2 || wb.ell_min() > 2) {
        throw std::invalid_argument("align_time_phase: both waveforms must contain the ell=2 modes "
                                    "(wa ell range (" + std::to_string(wa.ell_min()) + ", " +
                                    std::to_string(wa.ell_max()) + "), wb ell range (" +
                                    std::to_string(wb.ell_min()) + ", " +
                                    std::to_string(wb.ell_max()) + "))");
    }

    GslErrorGuard gsl_guard;

    WaveformModes wa_copy(wa);
    WaveformModes wb_copy(wb);

    // 2. δt 范围: wa 是被平移的那个
    const double dt_lower = std::max(t1 - t2, wa_copy.t_min() - t1);
    const double dt_upper = std::min(t2 - t1, wa_copy.t_max() - t2);

    // 3. 网格
    std::size_t n_dt = config.n_brute_force_dt;
    if (n_dt == 0) {
        n_dt = std::max(count_in_window(wa_copy.t(), t1, t2),
                        count_in_window(wb_copy.t(), t1, t2));
    }
    if (n_dt < 1) n_dt = 1;
    std::size_t n_dphi = config.n_brute_force_dphi;
    if (n_dphi == 0) {
        n_dphi = static_cast<std::size_t>(2 * wa_copy.ell_max() + 1);
    }
    const std::vector<double> dt_grid = linspace(dt_lower, dt_upper, n_dt);
    const std::vector<double> dphi_grid = linspace(0.0, TWO_PI, n_dphi, false);

    // 参考时间: 从离 t1 最近到离 t2 最近的 wa 采样
    const std::size_t i1 = nearest_index(wa_copy.t(), t1);
    const std::size_t i2 = nearest_index(wa_copy.t(), t2);

    // 4. 去掉不参与的模式
    if (!config.include_modes.empty()) {
        const std::set<std::pair<int, int>> keep(config.include_modes.begin(), config.include_modes.end());
        for (int L = 2; L <= ell_max; ++L) {
            for (int M = -L; M <= L; ++M) {
                if (keep.count(std::make_pair(L, M)) == 0) {
                    wa_copy.zero_mode(L, M);
                    wb_copy.zero_mode(L, M);
                }
            }
        }
    }

    // 5. 插值; wb 固定，只在参考时间上求值一次
    const std::size_t n_cols = static_cast<std::size_t>(LM_total_size(2, ell_max));
    const ModeInterpolant modes_a(wa_copy.t(), wa_copy.data(), wa_copy.n_modes(),
                                  wa_copy.index(2, -2), n_cols);

    ModeMismatch mismatch;
    mismatch.modes_a = &modes_a;
    mismatch.t_ref.assign(wa_copy.t().begin() + i1, wa_copy.t().begin() + i2 + 1);
    mismatch.n_cols = n_cols;
    mismatch.ell_max = ell_max;
    for (int L = 2; L <= ell_max; ++L) {
        for (int M = -L; M <= L; ++M) {
            mismatch.m_weights.push_back(M);
            mismatch.rot_index.push_back(static_cast<std::size_t>(M + ell_max));
        }
    }

    {
        const ModeInterpolant modes_b(wb_copy.t(), wb_copy.data(), wb_copy.n_modes(),
                                      wb_copy.index(2, -2), n_cols);
        InterpAccel acc;
        mismatch.modes_b.resize(mismatch.t_ref.size() * n_cols);
        for (std::size_t k = 0; k < mismatch.t_ref.size(); ++k) {
            modes_b.eval(mismatch.t_ref[k], acc.get(), &mismatch.modes_b[k * n_cols]);
        }
    }

    // 6. 归一化 ∫ Σ|B|² dt
    const std::vector<double> w = trapezoid_weights(mismatch.t_ref);
    double normalization = 0.0;
    for (std::size_t k = 0; k < w.size(); ++k) {
        double row = 0.0;
        for (std::size_t j = 0; j < n_cols; ++j) {
            row += std::norm(mismatch.modes_b[k * n_cols + j]);
        }
        normalization += w[k] * row;
    }
    mismatch.scale.resize(w.size());
    for (std::size_t k = 0; k < w.size(); ++k) {
        mismatch.scale[k] = std::sqrt(w[k] / normalization);
    }

    // 7. 暴力搜索 (δt 外层, δφ 内层)
    const std::size_t n_candidates = dt_grid.size() * dphi_grid.size();
    std::vector<double> cost_grid(n_candidates);
    #pragma omp parallel
    {
        MismatchScratch scratch;
        mismatch.prepare(scratch);
        #pragma omp for schedule(static)
        for (std::size_t c = 0; c < n_candidates; ++c) {
            cost_grid[c] = mismatch.cost(dt_grid[c / dphi_grid.size()],
                                         dphi_grid[c % dphi_grid.size()], scratch);
        }
    }
    const std::size_t c_best = argmin(cost_grid);

    OptimizationResult result;
    result.seed = {dt_grid[c_best / dphi_grid.size()], dphi_grid[c_best % dphi_grid.size()]};
    result.n_brute_force = n_candidates;

    if (config.verbose) {
        std::cout << "[C++ Align] time+phase: " << dt_grid.size() << " x " << dphi_grid.size()
                  << " candidates, ell_max=" << ell_max << ", seed (dt, dphi)=("
                  << result.seed[0] << ", " << result.seed[1] << ") cost="
                  << cost_grid[c_best] << std::endl;
    }

    // 8. trust-region 细化; δφ 是周期变量
    MismatchScratch scratch;
    mismatch.prepare(scratch);
    ResidualFunction f = [&](const std::vector<double>& x, std::vector<double>& r) {
        mismatch.residuals(x[0], x[1], scratch, r.data());
    };
    JacobianFunction df = [&](const std::vector<double>& x, std::vector<double>& J) {
        mismatch.jacobian(x[0], x[1], scratch, J.data());
    };

    TrustRegionOptions opts;
    opts.max_iter = config.max_iter;
    opts.xtol = config.xtol;
    opts.gtol = config.gtol;
    opts.ftol = config.ftol;

    TrustRegionResult tr = trust_region_solve(f, df, mismatch.n_residuals(), result.seed,
                                              {{dt_lower, dt_upper, false}, {0.0, TWO_PI, true}},
                                              opts);
    result.x = tr.x;
    result.cost = tr.cost;
    result.converged = tr.converged;
    result.iterations = tr.iterations;
    result.status = tr.status;
    result.message = tr.message;

    if (config.verbose) {
        std::cout << "[C++ Align] time+phase: dt=" << result.x[0] << " dphi=" << result.x[1]
                  << " cost=" << result.cost << " iter=" << result.iterations
                  << " (" << result.message << ")" << std::endl;
    }

    // 9. 用原始 (未过滤) 的 wa 构造变换后的波形:
    //    在 wa.t + δt 处重采样并乘相位，样本仍标在 wa.t 上，于是 wa_prime(t) ≈ wb(t)
    const double dt_opt = result.x[0];
    std::vector<std::complex<double>> rot;
    fill_phase_table(result.x[1], ell_max, rot);

    const ModeInterpolant modes_orig(wa.t(), wa.data(), wa.n_modes(), wa.index(2, -2), n_cols);
    std::vector<double> t_prime(wa.t());

    std::vector<std::complex<double>> data_prime(t_prime.size() * n_cols);
    InterpAccel acc;
    for (std::size_t i = 0; i < t_prime.size(); ++i) {
        std::complex<double>* row = &data_prime[i * n_cols];
        modes_orig.eval(t_prime[i] + dt_opt, acc.get(), row);
        for (std::size_t j = 0; j < n_cols; ++j) {
            row[j] *= rot[mismatch.rot_index[j]];
        }
    }

    WaveformModes wa_prime(std::move(t_prime), std::move(data_prime), 2, ell_max);
    return std::make_pair(result, std::move(wa_prime));
}

std::pair<OptimizationResult, WaveformModes>
align_time_phase(const WaveformModes& wa,
                 const WaveformModes& wb,
                 double t1, double t2,
                 std::size_t n_brute_force_dt,
                 std::size_t n_brute_force_dphi,
                 const std::vector<std::pair<int, int>>& include_modes) {
    AlignConfig config;
    config.n_brute_force_dt = n_brute_force_dt;
    config.n_brute_force_dphi = n_brute_force_dphi;
    config.include_modes = include_modes;
    return align_time_phase(wa, wb, t1, t2, config);
}

} // namespace gwalign
