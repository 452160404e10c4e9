// cpp/gwalign/align_params.cpp
#include "align_params.hpp"
#include <gsl/gsl_errno.h>

namespace gwalign {

AlignConfig::AlignConfig()
    : n_brute_force_dt(0)
    , n_brute_force_dphi(5)
    , include_modes()
    , max_iter(100)
    , xtol(1e-10)
    , gtol(1e-10)
    , ftol(1e-12)
    , verbose(false)
{
    // n_brute_force_dphi = 5 比 2*ell_max+1 快得多，结果通常一致
}

/// OptimizationResult 默认值: 尚未求解
OptimizationResult::OptimizationResult()
    : x()
    , seed()
    , cost(0.0)
    , converged(false)
    , iterations(0)
    , n_brute_force(0)
    , status(GSL_CONTINUE)
    , message("not started")
{
}

} // namespace gwalign
