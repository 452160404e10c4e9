// cpp/gwalign/numerics/quadrature.hpp
#pragma once

#include <vector>
#include <cmath>
#include <cstddef>
#include <limits>

namespace gwalign {

// 非均匀网格上的梯形积分权重: int f dt ≈ sum_k w_k f(t_k)
inline std::vector<double> trapezoid_weights(const std::vector<double>& t) {
    const std::size_t n = t.size();
    std::vector<double> w(n, 0.0);
    if (n < 2) return w;
    for (std::size_t k = 0; k + 1 < n; ++k) {
        double h = 0.5 * (t[k + 1] - t[k]);
        w[k] += h;
        w[k + 1] += h;
    }
    return w;
}

inline double trapezoid(const std::vector<double>& y, const std::vector<double>& t) {
    double sum = 0.0;
    for (std::size_t k = 0; k + 1 < t.size(); ++k) {
        sum += 0.5 * (y[k] + y[k + 1]) * (t[k + 1] - t[k]);
    }
    return sum;
}

// numpy.linspace 语义; endpoint=false 时不含 hi
inline std::vector<double> linspace(double lo, double hi, std::size_t num, bool endpoint = true) {
    std::vector<double> out(num);
    if (num == 0) return out;
    if (num == 1) {
        out[0] = lo;
        return out;
    }
    const double div = endpoint ? static_cast<double>(num - 1) : static_cast<double>(num);
    const double step = (hi - lo) / div;
    for (std::size_t i = 0; i < num; ++i) {
        out[i] = lo + static_cast<double>(i) * step;
    }
    if (endpoint) out[num - 1] = hi;
    return out;
}

// 第一个最小值的下标; NaN 被跳过，全部为 NaN 时返回 0
inline std::size_t argmin(const std::vector<double>& v) {
    std::size_t best = 0;
    double best_val = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (v[i] < best_val) {
            best_val = v[i];
            best = i;
        }
    }
    return best;
}

} // namespace gwalign
