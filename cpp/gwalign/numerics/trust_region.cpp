// cpp/gwalign/numerics/trust_region.cpp
#include "trust_region.hpp"
#include <cmath>
#include <stdexcept>
#include <new>
#include <gsl/gsl_vector.h>
#include <gsl/gsl_matrix.h>
#include <gsl/gsl_blas.h>
#include <gsl/gsl_multifit_nlinear.h>

namespace gwalign {

double reflect_into_bounds(double u, double lower, double upper, double* dx_du) {
    const double L = upper - lower;
    if (!(L > 0.0)) {
        if (dx_du) *dx_du = 0.0;
        return lower;
    }
    double s = std::fmod(u - lower, 2.0 * L);
    if (s < 0.0) s += 2.0 * L;
    if (s <= L) {
        if (dx_du) *dx_du = 1.0;
        return lower + s;
    }
    if (dx_du) *dx_du = -1.0;
    return lower + 2.0 * L - s;
}

double wrap_periodic(double x, double lower, double upper) {
    const double L = upper - lower;
    if (!(L > 0.0)) return lower;
    double s = std::fmod(x - lower, L);
    if (s < 0.0) s += L;
    // fmod 的舍入可能给出 s == L
    if (s >= L) s = 0.0;
    return lower + s;
}

namespace {

// 传给 GSL 回调的参数包
struct TRParams {
    const ResidualFunction* f;
    const JacobianFunction* df;
    const std::vector<ParamBound>* bounds;
    std::size_t n;
    std::size_t p;
    std::vector<double> x;     // 物理参数
    std::vector<double> dx_du; // 映射导数
    std::vector<double> r;
    std::vector<double> J;
};

void map_params(const gsl_vector* u, TRParams* P) {
    for (std::size_t j = 0; j < P->p; ++j) {
        const ParamBound& b = (*P->bounds)[j];
        double uj = gsl_vector_get(u, j);
        if (b.periodic) {
            P->x[j] = uj;
            P->dx_du[j] = 1.0;
        } else {
            P->x[j] = reflect_into_bounds(uj, b.lower, b.upper, &P->dx_du[j]);
        }
    }
}

int tr_residuals(const gsl_vector* u, void* params, gsl_vector* f) {
    TRParams* P = static_cast<TRParams*>(params);
    map_params(u, P);
    (*P->f)(P->x, P->r);
    for (std::size_t i = 0; i < P->n; ++i) {
        if (!std::isfinite(P->r[i])) return GSL_EBADFUNC;
        gsl_vector_set(f, i, P->r[i]);
    }
    return GSL_SUCCESS;
}

int tr_jacobian(const gsl_vector* u, void* params, gsl_matrix* J) {
    TRParams* P = static_cast<TRParams*>(params);
    map_params(u, P);
    (*P->df)(P->x, P->J);
    for (std::size_t i = 0; i < P->n; ++i) {
        for (std::size_t j = 0; j < P->p; ++j) {
            double v = P->J[i * P->p + j] * P->dx_du[j];
            if (!std::isfinite(v)) return GSL_EBADFUNC;
            gsl_matrix_set(J, i, j, v);
        }
    }
    return GSL_SUCCESS;
}

} // namespace

TrustRegionResult trust_region_solve(const ResidualFunction& f,
                                     const JacobianFunction& df,
                                     std::size_t n_residuals,
                                     const std::vector<double>& x0,
                                     const std::vector<ParamBound>& bounds,
                                     const TrustRegionOptions& opts) {
    const std::size_t p = x0.size();
    if (p == 0 || bounds.size() != p) {
        throw std::invalid_argument("trust_region_solve: x0 and bounds must have the same non-zero size");
    }
    if (n_residuals < p) {
        throw std::invalid_argument("trust_region_solve: fewer residuals than parameters");
    }

    TrustRegionResult result;
    result.x = x0;

    TRParams params;
    params.f = &f;
    params.df = &df;
    params.bounds = &bounds;
    params.n = n_residuals;
    params.p = p;
    params.x.assign(p, 0.0);
    params.dx_du.assign(p, 1.0);
    params.r.assign(n_residuals, 0.0);
    params.J.assign(n_residuals * p, 0.0);

    gsl_multifit_nlinear_fdf fdf;
    fdf.f = tr_residuals;
    fdf.df = tr_jacobian;
    fdf.fvv = NULL;
    fdf.n = n_residuals;
    fdf.p = p;
    fdf.params = &params;

    gsl_multifit_nlinear_parameters fdf_params = gsl_multifit_nlinear_default_parameters();
    const gsl_multifit_nlinear_type* T = gsl_multifit_nlinear_trust;
    gsl_multifit_nlinear_workspace* w = gsl_multifit_nlinear_alloc(T, &fdf_params, n_residuals, p);
    if (!w) throw std::bad_alloc();

    // 初值: 反射映射下 u0 = x0 本身 (x0 在边界内)
    gsl_vector* u0 = gsl_vector_alloc(p);
    for (std::size_t j = 0; j < p; ++j) gsl_vector_set(u0, j, x0[j]);

    int status = gsl_multifit_nlinear_init(u0, &fdf, w);
    gsl_vector_free(u0);

    if (status != GSL_SUCCESS) {
        // 初值处残差非有限 (例如归一化为 0)，NaN 原样向外传播
        result.cost = std::nan("");
        result.status = status;
        result.message = std::string("init failed: ") + gsl_strerror(status);
        gsl_multifit_nlinear_free(w);
        return result;
    }

    double chi0 = gsl_blas_dnrm2(gsl_multifit_nlinear_residual(w));
    if (chi0 == 0.0) {
        // 初值已是精确解，梯度为零，trust-region 没有可走的步
        result.cost = 0.0;
        result.status = GSL_SUCCESS;
        result.converged = true;
        result.message = "exact fit at initial guess";
        gsl_multifit_nlinear_free(w);
        return result;
    }

    int info = 0;
    status = gsl_multifit_nlinear_driver(opts.max_iter, opts.xtol, opts.gtol, opts.ftol,
                                         NULL, NULL, &info, w);

    // 无论是否收敛，都取最后接受的迭代点
    gsl_vector* u = gsl_multifit_nlinear_position(w);
    map_params(u, &params);
    for (std::size_t j = 0; j < p; ++j) {
        result.x[j] = bounds[j].periodic
                    ? wrap_periodic(params.x[j], bounds[j].lower, bounds[j].upper)
                    : params.x[j];
    }
    result.cost = gsl_blas_dnrm2(gsl_multifit_nlinear_residual(w));
    result.iterations = gsl_multifit_nlinear_niter(w);
    result.status = status;
    result.converged = (status == GSL_SUCCESS);

    if (status == GSL_SUCCESS) {
        result.message = (info == 1) ? "converged: small step size"
                       : (info == 2) ? "converged: small gradient"
                       : "converged";
    } else {
        result.message = std::string("not converged: ") + gsl_strerror(status);
    }

    gsl_multifit_nlinear_free(w);
    return result;
}

} // namespace gwalign
