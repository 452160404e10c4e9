// cpp/gwalign/waveform/waveform_modes.hpp
#pragma once

#include <vector>
#include <complex>
#include <cstddef>

namespace gwalign {

/// 模式 (ell, m) 在 [ell_min, ell_max] 按 ell 升序、m 升序排列时的列号
inline int LM_index(int ell, int m, int ell_min) {
    return ell * ell - ell_min * ell_min + ell + m;
}

/// [ell_min, ell_max] 范围内的模式总数
inline int LM_total_size(int ell_min, int ell_max) {
    return (ell_max + 1) * (ell_max + 1) - ell_min * ell_min;
}

/// @brief 自旋加权球谐分解的波形模式容器
///
/// 数据按 (时间, 模式) 行优先存储，即 data[i * n_modes + k]。
/// 构造时检查时间严格递增、数据尺寸与 ell 范围一致。
/// 拷贝构造即深拷贝，对齐函数从不修改输入。
class WaveformModes {
public:
    WaveformModes(std::vector<double> t,
                  std::vector<std::complex<double>> data,
                  int ell_min, int ell_max);

    const std::vector<double>& t() const { return m_t; }
    const std::vector<std::complex<double>>& data() const { return m_data; }

    std::size_t n_times() const { return m_t.size(); }
    std::size_t n_modes() const { return m_n_modes; }
    int ell_min() const { return m_ell_min; }
    int ell_max() const { return m_ell_max; }
    double t_min() const { return m_t.front(); }
    double t_max() const { return m_t.back(); }

    /// (ell, m) 对应的列号，越界抛 std::out_of_range
    std::size_t index(int ell, int m) const;

    std::complex<double>& operator()(std::size_t i, std::size_t k) {
        return m_data[i * m_n_modes + k];
    }
    const std::complex<double>& operator()(std::size_t i, std::size_t k) const {
        return m_data[i * m_n_modes + k];
    }

    /// 单个模式随时间的序列
    std::vector<std::complex<double>> mode(int ell, int m) const;

    /// 球面上的 L2 范数 sqrt(sum_modes |h|^2)
    std::vector<double> norm() const;
    /// 总功率 sum_modes |h|^2 (norm 的平方)
    std::vector<double> power() const;

    /// 每一列的 m 值，相位旋转 exp(i dphi)^m 的指数
    std::vector<int> mode_weights() const;

    /// norm 最大处的时间 (对齐前先对齐峰值)
    double max_norm_time() const;

    /// 时间轴整体平移 dt 后的副本
    WaveformModes time_shifted(double dt) const;

    void zero_mode(int ell, int m);

private:
    std::vector<double> m_t;
    std::vector<std::complex<double>> m_data;
    int m_ell_min;
    int m_ell_max;
    std::size_t m_n_modes;
};

} // namespace gwalign
