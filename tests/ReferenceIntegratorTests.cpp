#include "quadrature/QuadratureRule.hpp"
#include "quadrature/ReferenceIntegrators.hpp"

#include "catch2/catch.hpp"

#include <boost/math/constants/constants.hpp>
#include <gsl/gsl_errno.h>

#include <cmath>
#include <functional>
#include <limits>
#include <stdexcept>

using namespace quadrature;

namespace
{
constexpr double inf = std::numeric_limits< double >::infinity();
const double     pi  = boost::math::constants::pi< double >();

int handlerCalls = 0;

void countingHandler(const char*, const char*, int, int)
{
    ++handlerCalls;
}
} // namespace

TEST_CASE("Gauss-Hermite agrees with the adaptive integrators", "[reference]")
{
    const GaussHermiteQuadrature<> gauss(120);
    const TanhSinhIntegrator<>     tanh_sinh(1e-12);
    const QuadpackIntegrator<>     quadpack;

    const auto check = [&](const std::function< double(double) >& f) {
        const double reference = gauss.integrate(f, -inf, inf);
        CHECK(tanh_sinh.integrate(f, -inf, inf) == Approx(reference).epsilon(1e-9));
        CHECK(quadpack.integrate(f, -inf, inf) == Approx(reference).epsilon(1e-8));
    };

    check([](double x) { return std::exp(-x * x) * std::cos(x); });
    check([](double x) { return std::exp(-x * x) * x * x * x * x; });
    check([](double x) { return std::exp(-x * x - x); });
    check([](double x) { return std::exp(-2.0 * x * x) * std::cosh(x / 2); });
}

TEST_CASE("Adaptive integrators on half lines and finite intervals", "[reference]")
{
    const TanhSinhIntegrator<> tanh_sinh;
    const QuadpackIntegrator<> quadpack;
    const auto                 decay = [](double x) {
        return std::exp(-x);
    };

    CHECK(tanh_sinh.integrate(decay, 0.0, inf) == Approx(1.0).epsilon(1e-8));
    CHECK(quadpack.integrate(decay, 0.0, inf) == Approx(1.0).epsilon(1e-8));
    CHECK(quadpack.integrate([](double x) { return std::exp(x); }, -inf, 0.0) == Approx(1.0).epsilon(1e-8));
    CHECK(quadpack.integrate([](double x) { return std::sin(x); }, 0.0, pi) == Approx(2.0).epsilon(1e-8));
    CHECK(tanh_sinh.integrate(decay, 1.0, 1.0) == 0.0);
    CHECK(quadpack.integrate(decay, 2.0, 1.0) == 0.0);
}

TEST_CASE("QUADPACK failures reach the caller", "[reference]")
{
    const QuadpackIntegrator<> quadpack;

    SECTION("Exceptions thrown by the integrand are rethrown")
    {
        const auto failing = [](double x) -> double {
            if (x > 0.5)
                throw std::domain_error("integrand failure");
            return x;
        };
        CHECK_THROWS_AS(quadpack.integrate(failing, 0.0, 1.0), std::domain_error);
    }

    SECTION("GSL status codes become runtime errors")
    {
        const QuadpackIntegrator<> starved(0.0, 1e-14, 2);
        CHECK_THROWS_AS(starved.integrate([](double x) { return std::sin(50.0 * x); }, 0.0, 10.0),
                        std::runtime_error);
    }

    SECTION("The caller's GSL error handler is restored")
    {
        handlerCalls                        = 0;
        gsl_error_handler_t* const original = gsl_set_error_handler(&countingHandler);

        const QuadpackIntegrator<> starved(0.0, 1e-14, 2);
        CHECK_THROWS(starved.integrate([](double x) { return std::sin(50.0 * x); }, 0.0, 10.0));
        CHECK(handlerCalls == 0);
        CHECK(gsl_set_error_handler(original) == &countingHandler);
    }
}
