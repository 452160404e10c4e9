// cpp/gwalign/align/align_time_phase.hpp
#pragma once

#include <vector>
#include <utility>
#include <cstddef>
#include "../align_params.hpp"
#include "../waveform/waveform_modes.hpp"

namespace gwalign {

/// @brief 同时平移时间和相位的对齐 (2-D)
///
/// 对 wa 施加 (δt, δφ): h_{ℓm}(t) -> h_{ℓm}(t+δt) exp(iδφ)^m，
/// 使其与 wb 在 [t1, t2] 上的 L2 差 (对所有 2 <= ℓ <= ℓ_max 的模式求和) 最小。
/// 归一化为 ∫ Σ|wb|² dt。ℓ_max = min(wa.ell_max, wb.ell_max)。
///
/// 返回优化诊断以及变换后的 wa: 在 wa.t + δt 处重采样 (两端外推) 并乘以
/// exp(iδφ)^m，采样时间沿用 wa.t，ℓ 范围 [2, ℓ_max]。对它与 wb 再次对齐得到 ≈ (0, 0)。
/// 窗口不合法时抛 InvalidWindow，ℓ 范围不含 2 时抛 std::invalid_argument。
std::pair<OptimizationResult, WaveformModes>
align_time_phase(const WaveformModes& wa,
                 const WaveformModes& wb,
                 double t1, double t2,
                 const AlignConfig& config);

std::pair<OptimizationResult, WaveformModes>
align_time_phase(const WaveformModes& wa,
                 const WaveformModes& wb,
                 double t1, double t2,
                 std::size_t n_brute_force_dt = 0,
                 std::size_t n_brute_force_dphi = 5,
                 const std::vector<std::pair<int, int>>& include_modes = {});

} // namespace gwalign
