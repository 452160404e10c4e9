// cpp/gwalign/numerics/cubic_spline.hpp
#pragma once

#include <vector>
#include <complex>
#include <memory>
#include <cstddef>
#include <gsl/gsl_interp.h>

namespace gwalign {

// gsl_interp_accel 的 RAII 包装。accel 不是线程安全的，每个线程各持一个。
class InterpAccel {
public:
    InterpAccel();
    ~InterpAccel();
    InterpAccel(const InterpAccel&) = delete;
    InterpAccel& operator=(const InterpAccel&) = delete;

    gsl_interp_accel* get() const { return m_acc; }

private:
    gsl_interp_accel* m_acc;
};

/// @brief 实数三次样条 (GSL natural cspline)
///
/// 区间外按首/末段三次多项式外推，与 scipy CubicSpline 默认行为一致，
/// 这样 t + dt 略微越界时不会触发 GSL 的 domain error。
class CubicSpline {
public:
    CubicSpline(const std::vector<double>& x, const std::vector<double>& y);

    double eval(double x, gsl_interp_accel* acc = nullptr) const;
    double eval_deriv(double x, gsl_interp_accel* acc = nullptr) const;

    double x_min() const { return m_x.front(); }
    double x_max() const { return m_x.back(); }

private:
    struct InterpDeleter {
        void operator()(gsl_interp* p) const { gsl_interp_free(p); }
    };

    // 端点处的 Taylor 系数 {y, y', y''/2, y'''/6}
    void edge_coeffs(std::size_t lo, std::size_t hi, double at, double c[4]) const;

    std::vector<double> m_x;
    std::vector<double> m_y;
    std::unique_ptr<gsl_interp, InterpDeleter> m_interp;
    double m_left[4];
    double m_right[4];
};

/// @brief 模式系数插值: 每个模式的实部、虚部各一条样条
///
/// 列范围 [col_begin, col_begin + n_cols) 取自行优先的 (时间, 模式) 缓冲。
class ModeInterpolant {
public:
    ModeInterpolant(const std::vector<double>& t,
                    const std::vector<std::complex<double>>& data,
                    std::size_t n_modes_total,
                    std::size_t col_begin, std::size_t n_cols);

    std::size_t n_cols() const { return m_re.size(); }

    /// out[k] = h_k(x), k = 0..n_cols-1
    void eval(double x, gsl_interp_accel* acc, std::complex<double>* out) const;
    void eval_deriv(double x, gsl_interp_accel* acc, std::complex<double>* out) const;

private:
    std::vector<CubicSpline> m_re;
    std::vector<CubicSpline> m_im;
};

} // namespace gwalign
