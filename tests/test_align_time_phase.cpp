// 2-D time and phase alignment on the full mode content
#include "align/align_time_phase.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <complex>
#include <stdexcept>
#include <vector>

using namespace gwalign;

namespace {

const double kTwoPi = 2.0 * M_PI;

// 啁啾信号: h_lm(t) = c_lm A(t) exp(-i m Φ(t))
std::complex<double> chirpMode(int ell, int m, double t) {
    const double amp = 1.0 + 0.05 * t;
    const double phase = 0.5 * t + 0.02 * t * t;
    const double c = (ell == 2 ? 1.0 : 0.5) / (1.0 + std::abs(m));
    return c * amp * std::polar(1.0, -m * phase);
}

// wb(t) = wa(t + shift) exp(i rotation)^m，因此对齐结果应为 (shift, rotation)
WaveformModes makeChirp(int ell_min, int ell_max, double shift, double rotation,
                        double dt = 0.05, std::size_t n = 801) {
    const std::size_t n_modes = static_cast<std::size_t>(LM_total_size(ell_min, ell_max));
    std::vector<double> t(n);
    std::vector<std::complex<double>> data(n * n_modes);
    for (std::size_t i = 0; i < n; ++i) {
        t[i] = dt * static_cast<double>(i);
        std::size_t k = 0;
        for (int ell = ell_min; ell <= ell_max; ++ell) {
            for (int m = -ell; m <= ell; ++m, ++k) {
                data[i * n_modes + k] = chirpMode(ell, m, t[i] + shift) * std::polar(1.0, m * rotation);
            }
        }
    }
    return WaveformModes(t, data, ell_min, ell_max);
}

double phaseDistance(double a, double b) {
    double d = std::fmod(std::abs(a - b), kTwoPi);
    return std::min(d, kTwoPi - d);
}

}  // namespace

TEST(AlignTimePhaseTest, RecoversShiftAndRotation) {
    WaveformModes wa = makeChirp(2, 3, 0.0, 0.0);
    WaveformModes wb = makeChirp(2, 3, 0.8, 1.3);

    auto out = align_time_phase(wa, wb, 10.0, 30.0);
    const OptimizationResult& res = out.first;
    ASSERT_EQ(res.x.size(), 2u);
    EXPECT_NEAR(res.x[0], 0.8, 1e-3);
    EXPECT_NEAR(res.x[1], 1.3, 1e-3);
    EXPECT_LT(res.cost, 1e-3);
    // 默认 δt 网格点数 = 窗口内采样数，δφ 网格 5 个点
    EXPECT_EQ(res.n_brute_force % 5u, 0u);
    EXPECT_GE(res.n_brute_force, 400u * 5u);
}

TEST(AlignTimePhaseTest, RotationNearTwoPi) {
    WaveformModes wa = makeChirp(2, 3, 0.0, 0.0);
    WaveformModes wb = makeChirp(2, 3, -0.35, 6.1);

    AlignConfig config;
    config.n_brute_force_dt = 201;
    auto out = align_time_phase(wa, wb, 10.0, 30.0, config);
    EXPECT_NEAR(out.first.x[0], -0.35, 1e-3);
    EXPECT_LT(phaseDistance(out.first.x[1], 6.1), 1e-3);
    EXPECT_GE(out.first.x[1], 0.0);
    EXPECT_LT(out.first.x[1], kTwoPi);
}

TEST(AlignTimePhaseTest, IdenticalWaveformsGiveZero) {
    WaveformModes wa = makeChirp(2, 3, 0.0, 0.0);

    AlignConfig config;
    config.n_brute_force_dt = 201;
    auto out = align_time_phase(wa, wa, 12.0, 28.0, config);
    EXPECT_NEAR(out.first.x[0], 0.0, 1e-6);
    EXPECT_LT(phaseDistance(out.first.x[1], 0.0), 1e-6);
    EXPECT_NEAR(out.first.cost, 0.0, 1e-8);
}

TEST(AlignTimePhaseTest, RealignmentIsIdempotent) {
    WaveformModes wa = makeChirp(2, 3, 0.0, 0.0);
    WaveformModes wb = makeChirp(2, 3, 0.6, 2.2);

    AlignConfig config;
    config.n_brute_force_dt = 201;
    auto first = align_time_phase(wa, wb, 10.0, 30.0, config);
    auto second = align_time_phase(first.second, wb, 10.0, 30.0, config);

    EXPECT_NEAR(second.first.x[0], 0.0, 1e-3);
    EXPECT_LT(phaseDistance(second.first.x[1], 0.0), 1e-3);
    EXPECT_LT(second.first.cost, 1e-3);
}

TEST(AlignTimePhaseTest, TransformedWaveformMatchesTarget) {
    WaveformModes wa = makeChirp(2, 4, 0.0, 0.0);
    WaveformModes wb = makeChirp(2, 3, 0.4, 0.9);

    AlignConfig config;
    config.n_brute_force_dt = 201;
    auto out = align_time_phase(wa, wb, 10.0, 30.0, config);
    const WaveformModes& wa_prime = out.second;

    // ell_max 取两者较小值
    EXPECT_EQ(wa_prime.ell_min(), 2);
    EXPECT_EQ(wa_prime.ell_max(), 3);
    EXPECT_EQ(wa_prime.n_times(), wa.n_times());
    EXPECT_EQ(wa_prime.t(), wa.t());

    for (std::size_t i = 200; i <= 600; i += 50) {
        for (int m = -3; m <= 3; ++m) {
            std::complex<double> diff = wa_prime(i, wa_prime.index(3, m)) - wb(i, wb.index(3, m));
            EXPECT_LT(std::abs(diff), 1e-3) << "i=" << i << " m=" << m;
        }
    }
}

TEST(AlignTimePhaseTest, IncludeModesFiltersCostButNotOutput) {
    WaveformModes wa = makeChirp(2, 3, 0.0, 0.0);
    WaveformModes wb = makeChirp(2, 3, 0.5, 0.7);

    auto out = align_time_phase(wa, wb, 10.0, 30.0, 201, 5, {{2, 2}, {2, 1}});
    EXPECT_NEAR(out.first.x[0], 0.5, 1e-3);
    EXPECT_NEAR(out.first.x[1], 0.7, 1e-3);

    // 输出由未过滤的 wa 生成，被排除的模式仍然存在
    const WaveformModes& wa_prime = out.second;
    EXPECT_GT(std::abs(wa_prime(400, wa_prime.index(3, 3))), 0.01);
}

TEST(AlignTimePhaseTest, SingleIncludedModeDoesNotCrash) {
    WaveformModes wa = makeChirp(2, 3, 0.0, 0.0);
    WaveformModes wb = makeChirp(2, 3, 0.3, 0.4);

    AlignConfig config;
    config.n_brute_force_dt = 101;
    config.include_modes = {{3, 1}};
    auto out = align_time_phase(wa, wb, 10.0, 30.0, config);
    EXPECT_TRUE(std::isfinite(out.first.cost));
    EXPECT_TRUE(std::isfinite(out.first.x[0]));
    EXPECT_EQ(out.second.n_modes(), 12u);
}

TEST(AlignTimePhaseTest, AutomaticPhaseGrid) {
    WaveformModes wa = makeChirp(2, 3, 0.0, 0.0);
    WaveformModes wb = makeChirp(2, 3, 0.2, 0.3);

    AlignConfig config;
    config.n_brute_force_dt = 81;
    config.n_brute_force_dphi = 0;
    auto out = align_time_phase(wa, wb, 10.0, 30.0, config);
    EXPECT_EQ(out.first.n_brute_force, 81u * 7u);
    EXPECT_NEAR(out.first.x[0], 0.2, 1e-3);
}

TEST(AlignTimePhaseTest, FinerPhaseGridNeverWorse) {
    WaveformModes wa = makeChirp(2, 3, 0.0, 0.0);
    WaveformModes wb = makeChirp(2, 3, 0.3, 3.0);

    auto coarse = align_time_phase(wa, wb, 10.0, 30.0, 41, 1);
    auto fine = align_time_phase(wa, wb, 10.0, 30.0, 41, 8);
    EXPECT_LE(fine.first.cost, coarse.first.cost + 1e-9);
}

TEST(AlignTimePhaseTest, RejectsInvalidWindowBeforeWork) {
    WaveformModes wa = makeChirp(2, 3, 0.0, 0.0);
    WaveformModes wb = makeChirp(2, 3, 0.0, 0.0, 0.05, 401);

    EXPECT_THROW(align_time_phase(wa, wb, 30.0, 10.0), InvalidWindow);
    EXPECT_THROW(align_time_phase(wa, wb, 10.0, 25.0), InvalidWindow);
    EXPECT_THROW(align_time_phase(wa, wb, -1.0, 15.0), InvalidWindow);
}

TEST(AlignTimePhaseTest, RequiresQuadrupoleModes) {
    WaveformModes wa = makeChirp(3, 4, 0.0, 0.0);
    WaveformModes wb = makeChirp(2, 4, 0.0, 0.0);
    EXPECT_THROW(align_time_phase(wa, wb, 10.0, 30.0), std::invalid_argument);
}
