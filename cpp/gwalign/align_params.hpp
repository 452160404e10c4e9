// cpp/gwalign/align_params.hpp
#pragma once
#include <vector>
#include <string>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace gwalign {

// 1. 窗口错误: (t1, t2) 顺序不对或超出某个波形的采样范围
class InvalidWindow : public std::invalid_argument {
public:
    explicit InvalidWindow(const std::string& what_arg)
        : std::invalid_argument(what_arg) {}
};

// 2. 对齐配置 (对应 Python 侧的可选参数)
struct AlignConfig {
    // δt 网格点数，0 表示自动: max(wa, wb 在 [t1,t2] 内的采样数)
    std::size_t n_brute_force_dt;
    // δφ 网格点数，0 表示 2*ell_max+1 (完备但很慢)
    std::size_t n_brute_force_dphi;
    // 参与代价函数的 (ell, m)，为空表示全部
    std::vector<std::pair<int, int>> include_modes;

    // trust-region 停止条件
    std::size_t max_iter;
    double xtol;
    double gtol;
    double ftol;

    bool verbose;

    AlignConfig(); // 构造函数声明
};

// 3. 优化结果 (仅用于诊断，shift 本身总是可用)
struct OptimizationResult {
    std::vector<double> x;     ///< 最优 δt 或 (δt, δφ)
    std::vector<double> seed;  ///< 暴力搜索给出的初值
    double cost;               ///< 收敛时的 mismatch
    bool converged;
    std::size_t iterations;
    std::size_t n_brute_force; ///< 暴力搜索评估的候选数
    int status;                ///< GSL 状态码
    std::string message;

    OptimizationResult();
};

} // namespace gwalign
