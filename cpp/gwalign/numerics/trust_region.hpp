// cpp/gwalign/numerics/trust_region.hpp
#pragma once

#include <vector>
#include <string>
#include <functional>
#include <cstddef>
#include <gsl/gsl_errno.h>

namespace gwalign {

// 在作用域内关闭 GSL 的默认错误处理 (默认会 abort)，退出时恢复
class GslErrorGuard {
public:
    GslErrorGuard() : m_prev(gsl_set_error_handler_off()) {}
    ~GslErrorGuard() { gsl_set_error_handler(m_prev); }
    GslErrorGuard(const GslErrorGuard&) = delete;
    GslErrorGuard& operator=(const GslErrorGuard&) = delete;

private:
    gsl_error_handler_t* m_prev;
};

struct ParamBound {
    double lower;
    double upper;
    bool periodic; ///< true: 不约束，结果折回 [lower, upper)
};

struct TrustRegionOptions {
    std::size_t max_iter = 100;
    double xtol = 1e-10;
    double gtol = 1e-10;
    double ftol = 1e-12;
};

struct TrustRegionResult {
    std::vector<double> x;
    double cost = 0.0; ///< ||r||_2
    std::size_t iterations = 0;
    int status = GSL_CONTINUE;
    bool converged = false;
    std::string message;
};

/// r = f(x), 长度 n
using ResidualFunction = std::function<void(const std::vector<double>& x, std::vector<double>& r)>;
/// J = df/dx, n x p 行优先
using JacobianFunction = std::function<void(const std::vector<double>& x, std::vector<double>& J)>;

/// @brief 带边界的非线性最小二乘 (GSL multifit_nlinear trust-region)
///
/// GSL 本身不支持边界。非周期参数通过三角波反射映射到 [lower, upper]:
/// 内部变量 u 自由变化，x = reflect(u)，dx/du = ±1，因此在边界上梯度不会消失。
/// 周期参数直接自由优化，结果折回 [lower, upper)。
TrustRegionResult trust_region_solve(const ResidualFunction& f,
                                     const JacobianFunction& df,
                                     std::size_t n_residuals,
                                     const std::vector<double>& x0,
                                     const std::vector<ParamBound>& bounds,
                                     const TrustRegionOptions& opts);

/// 三角波反射, 供测试与调用方检查映射
double reflect_into_bounds(double u, double lower, double upper, double* dx_du = nullptr);

double wrap_periodic(double x, double lower, double upper);

} // namespace gwalign
