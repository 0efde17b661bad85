// RollingPercentileWindowTest.cpp
//
// Unit tests for RollingPercentileWindow, the bounded window used for the
// latency_p95 and surprisal_p95 guards.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <stdexcept>

#include "RollingPercentileWindow.h"

using namespace mkc_riskgov;
using Catch::Approx;

TEST_CASE("RollingPercentileWindow: construction and empty window", "[RollingPercentileWindow]")
{
  REQUIRE_THROWS_AS(RollingPercentileWindow(0), std::invalid_argument);

  RollingPercentileWindow window(10);
  REQUIRE(window.empty());
  REQUIRE(std::isnan(window.winsorizedPercentile(0.95)));
}

TEST_CASE("RollingPercentileWindow: small windows report the maximum", "[RollingPercentileWindow]")
{
  RollingPercentileWindow window(10);
  window.add(3.0);
  window.add(200.0);
  window.add(5.0);

  REQUIRE(window.winsorizedPercentile(0.95) == Approx(200.0));
}

TEST_CASE("RollingPercentileWindow: evicts oldest values beyond capacity", "[RollingPercentileWindow]")
{
  RollingPercentileWindow window(5);
  for (int i = 1; i <= 8; ++i)
    window.add(static_cast<double>(i));

  REQUIRE(window.size() == 5);
  REQUIRE(window.values().front() == Approx(4.0));
  REQUIRE(window.values().back() == Approx(8.0));
}

TEST_CASE("RollingPercentileWindow: single outlier is winsorized", "[RollingPercentileWindow]")
{
  RollingPercentileWindow window(100);
  for (int i = 0; i < 99; ++i)
    window.add(10.0);
  window.add(1.0e6);

  // The p99 clip pulls the outlier down to the interpolated 99th percentile
  REQUIRE(window.winsorizedPercentile(1.0) < 1.0e6);
  REQUIRE(window.winsorizedPercentile(0.95) == Approx(10.0));
}

TEST_CASE("RollingPercentileWindow: non-finite values are dropped", "[RollingPercentileWindow]")
{
  RollingPercentileWindow window(10);
  window.add(std::nan(""));
  window.add(INFINITY);
  REQUIRE(window.empty());
}

TEST_CASE("RollingPercentileWindow: sustained high values dominate p95", "[RollingPercentileWindow]")
{
  RollingPercentileWindow window(100);
  for (int i = 0; i < 50; ++i)
    window.add(20.0);
  for (int i = 0; i < 10; ++i)
    window.add(200.0);

  REQUIRE(window.winsorizedPercentile(0.95) == Approx(200.0));
}
