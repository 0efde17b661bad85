// NormalQuantileTest.cpp
//
// Unit tests for the standard normal helpers used as the interval
// reference before a calibration window has filled:
//  - compute_normal_quantile (Acklam's rational approximation)
//  - compute_normal_cdf
//  - compute_normal_critical_value (two sided)
//
// Reference: Acklam, P.J. (2010). "An algorithm for computing the inverse
// normal cumulative distribution function."

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <stdexcept>
#include <vector>
#include "NormalQuantile.h"

using Catch::Approx;
using mkc_riskgov::detail::compute_normal_cdf;
using mkc_riskgov::detail::compute_normal_critical_value;
using mkc_riskgov::detail::compute_normal_quantile;

TEST_CASE("compute_normal_quantile: standard critical values",
          "[NormalQuantile][quantile]")
{
    SECTION("95% two sided")
    {
        REQUIRE(compute_normal_quantile(0.975) == Approx(1.959963984540054).margin(1e-9));
        REQUIRE(compute_normal_quantile(0.025) == Approx(-1.959963984540054).margin(1e-9));
    }

    SECTION("90% two sided")
    {
        REQUIRE(compute_normal_quantile(0.95) == Approx(1.644853626951472).margin(1e-9));
    }

    SECTION("99% two sided")
    {
        REQUIRE(compute_normal_quantile(0.995) == Approx(2.575829303548901).margin(1e-9));
    }

    SECTION("Median and quartiles")
    {
        REQUIRE(compute_normal_quantile(0.5) == 0.0);
        REQUIRE(compute_normal_quantile(0.75) == Approx(0.674489750196082).margin(1e-9));
        REQUIRE(compute_normal_quantile(0.25) == Approx(-0.674489750196082).margin(1e-9));
    }
}

TEST_CASE("compute_normal_quantile: tails use the outer approximation",
          "[NormalQuantile][quantile]")
{
    // Both sides of the 0.02425 switch point
    REQUIRE(compute_normal_quantile(0.01) == Approx(-2.326347874040841).margin(1e-8));
    REQUIRE(compute_normal_quantile(0.03) == Approx(-1.880793608151251).margin(1e-8));
    REQUIRE(compute_normal_quantile(0.999) == Approx(3.090232306167814).margin(1e-8));
    REQUIRE(compute_normal_quantile(1e-6) == Approx(-4.753424308822899).margin(1e-7));
}

TEST_CASE("compute_normal_quantile: symmetry and monotonicity",
          "[NormalQuantile][quantile]")
{
    const std::vector<double> probabilities{0.001, 0.01, 0.02, 0.025, 0.05, 0.1, 0.2, 0.3, 0.4, 0.49};

    double previous = -INFINITY;
    for (double p : probabilities)
    {
        const double z = compute_normal_quantile(p);
        REQUIRE(z > previous);
        REQUIRE(compute_normal_quantile(1.0 - p) == Approx(-z).margin(1e-9));
        previous = z;
    }
}

TEST_CASE("compute_normal_quantile: probabilities outside (0, 1) are rejected",
          "[NormalQuantile][quantile]")
{
    REQUIRE_THROWS_AS(compute_normal_quantile(0.0), std::domain_error);
    REQUIRE_THROWS_AS(compute_normal_quantile(1.0), std::domain_error);
    REQUIRE_THROWS_AS(compute_normal_quantile(-0.1), std::domain_error);
    REQUIRE_THROWS_AS(compute_normal_quantile(1.5), std::domain_error);
}

TEST_CASE("compute_normal_cdf: values and inverse of the quantile",
          "[NormalQuantile][cdf]")
{
    REQUIRE(compute_normal_cdf(0.0) == Approx(0.5).margin(1e-15));
    REQUIRE(compute_normal_cdf(1.959963984540054) == Approx(0.975).margin(1e-12));
    REQUIRE(compute_normal_cdf(-1.0) == Approx(0.158655253931457).margin(1e-12));
    REQUIRE(compute_normal_cdf(-40.0) == Approx(0.0).margin(1e-300));
    REQUIRE(compute_normal_cdf(40.0) == Approx(1.0).margin(1e-15));

    for (double p : {0.001, 0.05, 0.3, 0.5, 0.7, 0.95, 0.999})
        REQUIRE(compute_normal_cdf(compute_normal_quantile(p)) == Approx(p).margin(1e-8));
}

TEST_CASE("compute_normal_critical_value: two sided coverage",
          "[NormalQuantile][critical]")
{
    REQUIRE(compute_normal_critical_value(0.90) == Approx(1.644853626951472).margin(1e-9));
    REQUIRE(compute_normal_critical_value(0.95) == Approx(1.959963984540054).margin(1e-9));
    REQUIRE(compute_normal_critical_value(0.80) == Approx(1.281551565544601).margin(1e-9));

    SECTION("Critical value of an absolute score covers the requested mass")
    {
        for (double coverage : {0.5, 0.8, 0.9, 0.98})
        {
            const double z = compute_normal_critical_value(coverage);
            REQUIRE(z > 0.0);
            REQUIRE(compute_normal_cdf(z) - compute_normal_cdf(-z) == Approx(coverage).margin(1e-8));
        }
    }

    SECTION("Coverage outside (0, 1)")
    {
        REQUIRE_THROWS_AS(compute_normal_critical_value(0.0), std::domain_error);
        REQUIRE_THROWS_AS(compute_normal_critical_value(1.0), std::domain_error);
    }
}
