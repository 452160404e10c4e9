// Spline, quadrature and grid helpers used by the aligners
#include "numerics/cubic_spline.hpp"
#include "numerics/quadrature.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <complex>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace gwalign;

TEST(CubicSplineTest, InterpolatesSmoothFunction) {
    std::vector<double> x, y;
    for (int i = 0; i <= 1000; ++i) {
        x.push_back(0.01 * i);
        y.push_back(std::sin(0.01 * i));
    }
    CubicSpline s(x, y);
    InterpAccel acc;

    EXPECT_DOUBLE_EQ(s.eval(x[500], acc.get()), y[500]);
    for (double xi = 1.0; xi < 9.0; xi += 0.377) {
        EXPECT_NEAR(s.eval(xi, acc.get()), std::sin(xi), 1e-8);
        EXPECT_NEAR(s.eval_deriv(xi, acc.get()), std::cos(xi), 1e-5);
    }
}

TEST(CubicSplineTest, ExtrapolatesWithEndPolynomial) {
    // 线性数据的自然样条就是这条直线，外推也应保持线性
    std::vector<double> x = {0.0, 1.0, 2.5, 4.0};
    std::vector<double> y = {1.0, 3.0, 6.0, 9.0};
    CubicSpline s(x, y);

    EXPECT_NEAR(s.eval(5.0), 11.0, 1e-12);
    EXPECT_NEAR(s.eval(-1.0), -1.0, 1e-12);
    EXPECT_NEAR(s.eval_deriv(6.0), 2.0, 1e-12);

    // 端点连续
    EXPECT_NEAR(s.eval(4.0 + 1e-12), s.eval(4.0), 1e-10);
}

TEST(CubicSplineTest, RejectsTooFewPoints) {
    EXPECT_THROW(CubicSpline({0.0, 1.0}, {0.0, 1.0}), std::invalid_argument);
    EXPECT_THROW(CubicSpline({0.0, 1.0, 2.0}, {0.0, 1.0}), std::invalid_argument);
}

TEST(CubicSplineTest, ModeInterpolantEvaluatesColumnRange) {
    std::vector<double> t;
    for (int i = 0; i < 50; ++i) t.push_back(0.1 * i);
    const std::size_t n_modes = 3;
    std::vector<std::complex<double>> data(t.size() * n_modes);
    for (std::size_t i = 0; i < t.size(); ++i) {
        data[i * n_modes + 0] = {100.0, 100.0};
        data[i * n_modes + 1] = {t[i], -2.0 * t[i]};
        data[i * n_modes + 2] = {1.0, 0.5};
    }

    ModeInterpolant interp(t, data, n_modes, 1, 2);
    ASSERT_EQ(interp.n_cols(), 2u);

    std::complex<double> out[2];
    std::complex<double> dout[2];
    InterpAccel acc;
    interp.eval(2.345, acc.get(), out);
    interp.eval_deriv(2.345, acc.get(), dout);

    EXPECT_NEAR(out[0].real(), 2.345, 1e-12);
    EXPECT_NEAR(out[0].imag(), -4.69, 1e-12);
    EXPECT_NEAR(out[1].real(), 1.0, 1e-12);
    EXPECT_NEAR(out[1].imag(), 0.5, 1e-12);
    EXPECT_NEAR(dout[0].real(), 1.0, 1e-10);
    EXPECT_NEAR(dout[0].imag(), -2.0, 1e-10);
}

TEST(QuadratureTest, TrapezoidOnNonUniformGrid) {
    std::vector<double> t = {0.0, 0.5, 2.0, 3.0};
    std::vector<double> w = trapezoid_weights(t);
    double total = 0.0;
    for (double v : w) total += v;
    EXPECT_DOUBLE_EQ(total, 3.0);

    std::vector<double> y = {1.0, 2.0, 5.0, 7.0}; // y = 2t + 1
    EXPECT_DOUBLE_EQ(trapezoid(y, t), 12.0);

    EXPECT_DOUBLE_EQ(trapezoid_weights({4.0})[0], 0.0);
}

TEST(QuadratureTest, LinspaceEndpointSemantics) {
    std::vector<double> a = linspace(-1.0, 1.0, 5);
    ASSERT_EQ(a.size(), 5u);
    EXPECT_DOUBLE_EQ(a.front(), -1.0);
    EXPECT_DOUBLE_EQ(a[2], 0.0);
    EXPECT_DOUBLE_EQ(a.back(), 1.0);

    std::vector<double> b = linspace(0.0, 2.0 * M_PI, 4, false);
    ASSERT_EQ(b.size(), 4u);
    EXPECT_DOUBLE_EQ(b[1], 0.5 * M_PI);
    EXPECT_LT(b.back(), 2.0 * M_PI);

    EXPECT_EQ(linspace(3.0, 4.0, 1), std::vector<double>({3.0}));
}

TEST(QuadratureTest, ArgminSkipsNaNAndPrefersFirst) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(argmin({nan, 2.0, 1.0, 1.0, nan}), 2u);
    EXPECT_EQ(argmin({nan, nan}), 0u);
}
