#include "polynomials/HermiteEvaluators.hpp"
#include "quadrature/GaussHermite.hpp"

#include "catch2/catch.hpp"

#include <boost/math/special_functions/factorials.hpp>
#include <boost/math/special_functions/hermite.hpp>

#include <cmath>

using namespace polynomials;

namespace
{
// He_n(x) / sqrt(n!) * e^{-x^2/4} from Boost's physicists' Hermite polynomials
double scaledHermite(unsigned n, double x)
{
    const double He = std::pow(2.0, -0.5 * n) * boost::math::hermite(n, x / std::sqrt(2.0));
    return He / std::sqrt(boost::math::factorial< double >(n)) * std::exp(-x * x / 4);
}
} // namespace

TEST_CASE("Recurrence evaluator reproduces scaled Hermite polynomials", "[evaluators]")
{
    for (const unsigned n : {5u, 30u, 60u, 150u})
        for (const double x : {-3.0, 0.5, 8.0, 12.0})
        {
            const auto   eval     = hermite_recurrence(static_cast< int >(n), x);
            const double value    = scaledHermite(n, x);
            const double previous = scaledHermite(n - 1, x);
            CHECK(eval.value == Approx(value).epsilon(1e-10).margin(1e-300));
            CHECK(eval.derivative == Approx(-x * value + std::sqrt(double(n)) * previous).epsilon(1e-10).margin(1e-12));
        }
}

TEST_CASE("Recurrence evaluator edge cases", "[evaluators]")
{
    SECTION("Degree one")
    {
        const auto eval = hermite_recurrence(1, 2.0);
        CHECK(eval.value == Approx(2.0 * std::exp(-1.0)));
        CHECK(eval.derivative == Approx((1.0 - 4.0) * std::exp(-1.0)));
    }

    SECTION("Odd degrees vanish at the origin")
    {
        CHECK(hermite_recurrence(41, 0.0).value == 0.0);
        CHECK(hermite_recurrence(41, 0.0).derivative != 0.0);
    }

    SECTION("Far outside the oscillatory region the value underflows to zero, not NaN")
    {
        const auto eval = hermite_recurrence(50, 80.0);
        CHECK_FALSE(std::isnan(eval.value));
        CHECK_FALSE(std::isnan(eval.derivative));
    }

    CHECK_THROWS_AS(hermite_recurrence(0, 1.0), ParameterDomainError);
    CHECK_THROWS_AS(hermite_recurrence(-3, 1.0), ParameterDomainError);
}

TEST_CASE("Recurrence table agrees with the single-degree evaluator", "[evaluators]")
{
    for (const double x : {0.3, 4.0, 15.0, 25.0})
    {
        constexpr int n     = 120;
        const auto    table = hermite_recurrence_table(n, x);
        REQUIRE(table.size() == n + 1);
        CHECK(table[0] == Approx(std::exp(-x * x / 4)));
        for (const int k : {1, 2, 17, 60, n})
            CHECK(table[k] == Approx(hermite_recurrence(k, x).value).epsilon(1e-10).margin(1e-300));
    }

    CHECK(hermite_recurrence_table(0, 2.0)[0] == Approx(std::exp(-1.0)));
    CHECK_THROWS_AS(hermite_recurrence_table(-1, 0.0), ParameterDomainError);
}

TEST_CASE("Asymptotic evaluator vanishes at the Gauss-Hermite nodes", "[evaluators]")
{
    constexpr int           n = 201;
    traits::HermiteSettings settings;
    settings.algorithm = traits::HermiteAlgorithm::Recurrence;
    const auto   rule  = quadrature::unweighted_gauss_hermite(n, settings);
    const double mu    = std::sqrt(2.0 * n + 1);

    // Positive nodes only; the centre sits at theta = pi/2.
    for (Eigen::Index i = n / 2 + 1; i < n; ++i)
    {
        const double theta = std::acos(rule.nodes[i] / mu);
        const auto   eval  = hermite_asymptotic(n, theta);
        const double step  = eval.value / (std::sqrt(2.0) * mu * eval.derivative * std::sin(theta));
        CHECK(std::abs(step) < 1e-10);
    }

    CHECK_THROWS_AS(hermite_asymptotic(0, 1.0), ParameterDomainError);
}
