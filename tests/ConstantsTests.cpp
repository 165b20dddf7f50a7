#include "polynomials/HermiteConstants.hpp"

#include "catch2/catch.hpp"

#include <boost/math/special_functions/airy.hpp>
#include <boost/math/special_functions/bessel.hpp>

#include <cmath>

using namespace polynomials;

TEST_CASE("Tabulated Airy zeros match Boost", "[constants]")
{
    for (std::size_t k = 1; k <= constants::airy_roots.size(); ++k)
    {
        const double reference = boost::math::airy_ai_zero< double >(static_cast< int >(k));
        CHECK(constants::airy_root(k) == Approx(reference).epsilon(1e-13));
    }
    // a_1 = -2.33810741045976703848919725...; the table holds the nearest double.
    CHECK(constants::airy_root(1) == -2.338107410459767038489);
    CHECK_THROWS_AS(constants::airy_root(0), EvaluationDomainError);
    CHECK_THROWS_AS(constants::airy_root(12), EvaluationDomainError);
}

TEST_CASE("Tabulated Bessel data match Boost", "[constants]")
{
    SECTION("Zeros of J0")
    {
        for (std::size_t k = 1; k <= constants::j0_roots.size(); ++k)
        {
            const double reference = boost::math::cyl_bessel_j_zero(0.0, static_cast< int >(k));
            CHECK(constants::j0_root(k) == Approx(reference).epsilon(1e-13));
        }
        CHECK_THROWS_AS(constants::j0_root(21), EvaluationDomainError);
    }

    SECTION("J1 squared at the zeros of J0")
    {
        for (std::size_t k = 0; k < constants::besselj1_squared.size(); ++k)
        {
            const double j1 = boost::math::cyl_bessel_j(1, constants::j0_roots[k]);
            CHECK(constants::besselj1_squared[k] == Approx(j1 * j1).epsilon(1e-12));
        }
    }
}

TEST_CASE("Piessens approximation of Bessel zeros", "[constants]")
{
    for (const double nu : {-0.5, 0.0, 0.5, 1.0, 2.5, 5.0})
        for (std::size_t s = 1; s <= 6; ++s)
        {
            const double reference = boost::math::cyl_bessel_j_zero(nu, static_cast< int >(s));
            CHECK(constants::bessel_root_chebyshev(nu, s) == Approx(reference).margin(1e-9));
        }

    CHECK_THROWS_AS(constants::bessel_root_chebyshev(5.5, 1), EvaluationDomainError);
    CHECK_THROWS_AS(constants::bessel_root_chebyshev(1.0, 7), EvaluationDomainError);
}
