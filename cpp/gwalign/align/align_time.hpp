// cpp/gwalign/align/align_time.hpp
#pragma once

#include <cstddef>
#include "../align_params.hpp"
#include "../waveform/waveform_modes.hpp"

namespace gwalign {

/// @brief 只平移时间的对齐 (1-D)
///
/// 求使
///     sqrt( ∫ [‖wa(t)‖ - ‖wb(t+δt)‖]² dt / ∫ ‖wa(t)‖² dt )
/// 最小的 δt，积分区间 [t1, t2]。输入不被修改，结果可用于
///     wb = wb.time_shifted(-δt)
///
/// 先在 [δt_lower, δt_upper] 上暴力搜索初值 (避免偏心率等造成的局部极小)，
/// 再用带边界的 trust-region 最小二乘细化。
///
/// 窗口不合法时抛 InvalidWindow。
OptimizationResult align_time_full(const WaveformModes& wa,
                                   const WaveformModes& wb,
                                   double t1, double t2,
                                   const AlignConfig& config);

/// n_brute_force = 0 表示使用 [t1, t2] 内 wa、wb 采样数的较大者
double align_time(const WaveformModes& wa,
                  const WaveformModes& wb,
                  double t1, double t2,
                  std::size_t n_brute_force = 0);

} // namespace gwalign
