// cpp/gwalign/align/alignment_window.hpp
#pragma once

#include <vector>
#include <cstddef>
#include "../waveform/waveform_modes.hpp"

namespace gwalign {

/// 检查 t1 < t2 且 [t1, t2] 同时落在 wa 和 wb 的采样范围内，否则抛 InvalidWindow。
/// 只读时间轴端点，不触碰模式数据。
void validate_window(const WaveformModes& wa, const WaveformModes& wb, double t1, double t2);

/// t 中落在 [t1, t2] 的采样数
std::size_t count_in_window(const std::vector<double>& t, double t1, double t2);

/// t 中落在 [t1, t2] 的采样 (连续一段) 的首尾下标 [begin, end)
void window_range(const std::vector<double>& t, double t1, double t2,
                  std::size_t& begin, std::size_t& end);

/// 距离 x 最近的采样下标 (并列时取较小的)
std::size_t nearest_index(const std::vector<double>& t, double x);

} // namespace gwalign
