// cpp/gwalign/numerics/cubic_spline.cpp
#include "cubic_spline.hpp"
#include <stdexcept>
#include <new>
#include <string>
#include <gsl/gsl_errno.h>

namespace gwalign {

InterpAccel::InterpAccel() : m_acc(gsl_interp_accel_alloc()) {
    if (!m_acc) throw std::bad_alloc();
}

InterpAccel::~InterpAccel() {
    gsl_interp_accel_free(m_acc);
}

CubicSpline::CubicSpline(const std::vector<double>& x, const std::vector<double>& y)
    : m_x(x), m_y(y) {
    if (m_x.size() != m_y.size()) {
        throw std::invalid_argument("CubicSpline: x and y sizes differ");
    }
    if (m_x.size() < gsl_interp_type_min_size(gsl_interp_cspline)) {
        throw std::invalid_argument("CubicSpline: need at least " +
                                    std::to_string(gsl_interp_type_min_size(gsl_interp_cspline)) +
                                    " points, got " + std::to_string(m_x.size()));
    }

    m_interp.reset(gsl_interp_alloc(gsl_interp_cspline, m_x.size()));
    if (!m_interp) throw std::bad_alloc();

    int status = gsl_interp_init(m_interp.get(), m_x.data(), m_y.data(), m_x.size());
    if (status != GSL_SUCCESS) {
        throw std::invalid_argument(std::string("CubicSpline: gsl_interp_init failed: ") +
                                    gsl_strerror(status));
    }

    const std::size_t n = m_x.size();
    edge_coeffs(0, 1, m_x[0], m_left);
    edge_coeffs(n - 2, n - 1, m_x[n - 1], m_right);
}

void CubicSpline::edge_coeffs(std::size_t lo, std::size_t hi, double at, double c[4]) const {
    // 端段是一个三次多项式: y''' 由两端 y'' 之差给出
    double d2_lo = gsl_interp_eval_deriv2(m_interp.get(), m_x.data(), m_y.data(), m_x[lo], nullptr);
    double d2_hi = gsl_interp_eval_deriv2(m_interp.get(), m_x.data(), m_y.data(), m_x[hi], nullptr);
    double d3 = (d2_hi - d2_lo) / (m_x[hi] - m_x[lo]);

    c[0] = gsl_interp_eval(m_interp.get(), m_x.data(), m_y.data(), at, nullptr);
    c[1] = gsl_interp_eval_deriv(m_interp.get(), m_x.data(), m_y.data(), at, nullptr);
    c[2] = 0.5 * gsl_interp_eval_deriv2(m_interp.get(), m_x.data(), m_y.data(), at, nullptr);
    c[3] = d3 / 6.0;
}

double CubicSpline::eval(double x, gsl_interp_accel* acc) const {
    if (x < m_x.front()) {
        double d = x - m_x.front();
        return m_left[0] + d * (m_left[1] + d * (m_left[2] + d * m_left[3]));
    }
    if (x > m_x.back()) {
        double d = x - m_x.back();
        return m_right[0] + d * (m_right[1] + d * (m_right[2] + d * m_right[3]));
    }
    return gsl_interp_eval(m_interp.get(), m_x.data(), m_y.data(), x, acc);
}

double CubicSpline::eval_deriv(double x, gsl_interp_accel* acc) const {
    if (x < m_x.front()) {
        double d = x - m_x.front();
        return m_left[1] + d * (2.0 * m_left[2] + 3.0 * d * m_left[3]);
    }
    if (x > m_x.back()) {
        double d = x - m_x.back();
        return m_right[1] + d * (2.0 * m_right[2] + 3.0 * d * m_right[3]);
    }
    return gsl_interp_eval_deriv(m_interp.get(), m_x.data(), m_y.data(), x, acc);
}

ModeInterpolant::ModeInterpolant(const std::vector<double>& t,
                                 const std::vector<std::complex<double>>& data,
                                 std::size_t n_modes_total,
                                 std::size_t col_begin, std::size_t n_cols) {
    if (col_begin + n_cols > n_modes_total || data.size() != t.size() * n_modes_total) {
        throw std::invalid_argument("ModeInterpolant: column range out of bounds");
    }
    m_re.reserve(n_cols);
    m_im.reserve(n_cols);

    std::vector<double> re(t.size()), im(t.size());
    for (std::size_t k = 0; k < n_cols; ++k) {
        const std::size_t col = col_begin + k;
        for (std::size_t i = 0; i < t.size(); ++i) {
            re[i] = data[i * n_modes_total + col].real();
            im[i] = data[i * n_modes_total + col].imag();
        }
        m_re.emplace_back(t, re);
        m_im.emplace_back(t, im);
    }
}

// 所有列共用同一时间轴，所以一个 accel 可以在列之间复用
void ModeInterpolant::eval(double x, gsl_interp_accel* acc, std::complex<double>* out) const {
    for (std::size_t k = 0; k < m_re.size(); ++k) {
        out[k] = std::complex<double>(m_re[k].eval(x, acc), m_im[k].eval(x, acc));
    }
}

void ModeInterpolant::eval_deriv(double x, gsl_interp_accel* acc, std::complex<double>* out) const {
    for (std::size_t k = 0; k < m_re.size(); ++k) {
        out[k] = std::complex<double>(m_re[k].eval_deriv(x, acc), m_im[k].eval_deriv(x, acc));
    }
}

} // namespace gwalign
