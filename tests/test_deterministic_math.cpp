// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

#include "depthfuse/numerics/deterministic_math.hpp"
#include "depthfuse/numerics/robust_stats.hpp"

using namespace depthfuse;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

constexpr double kRelTol = 1e-14;

void expectRelNear(double actual, double expected, double rel = kRelTol) {
  EXPECT_NEAR(actual, expected, std::abs(expected) * rel + 1e-300)
      << "expected " << expected;
}

}  // namespace

// ─── exp ─────────────────────────────────────────────────────────────────────

TEST(DeterministicExpTest, MatchesLibmOverRange) {
  for (double x = -50.0; x <= 50.0; x += 0.37) {
    expectRelNear(det::exp(x), std::exp(x));
  }
}

TEST(DeterministicExpTest, SpecialValues) {
  EXPECT_EQ(det::exp(0.0), 1.0);
  expectRelNear(det::exp(1.0), 2.718281828459045);
  EXPECT_TRUE(std::isinf(det::exp(710.0)));
  EXPECT_EQ(det::exp(-746.0), 0.0);
  EXPECT_TRUE(std::isnan(det::exp(std::numeric_limits<double>::quiet_NaN())));
}

// ─── log ─────────────────────────────────────────────────────────────────────

TEST(DeterministicLogTest, MatchesLibmOverRange) {
  for (double x = 1e-6; x < 1e6; x *= 1.7) {
    EXPECT_NEAR(det::log(x), std::log(x),
                1e-14 * std::max(1.0, std::abs(std::log(x))))
        << "x = " << x;
  }
}

TEST(DeterministicLogTest, SpecialValues) {
  EXPECT_EQ(det::log(1.0), 0.0);
  expectRelNear(det::log(2.0), 0.6931471805599453);
  expectRelNear(det::log(1024.0), 10.0 * 0.6931471805599453);
  EXPECT_TRUE(std::isinf(det::log(0.0)));
  EXPECT_LT(det::log(0.0), 0.0);
  EXPECT_TRUE(std::isnan(det::log(-1.0)));
  EXPECT_TRUE(std::isinf(det::log(std::numeric_limits<double>::infinity())));
}

// ─── sqrt / pow ──────────────────────────────────────────────────────────────

TEST(DeterministicSqrtTest, MatchesLibm) {
  for (double x = 1e-8; x < 1e8; x *= 3.1) {
    EXPECT_DOUBLE_EQ(det::sqrt(x), std::sqrt(x)) << "x = " << x;
  }
  EXPECT_DOUBLE_EQ(det::sqrt(4.0), 2.0);
  EXPECT_DOUBLE_EQ(det::sqrt(0.09), 0.3);
  EXPECT_EQ(det::sqrt(0.0), 0.0);
  EXPECT_TRUE(std::isnan(det::sqrt(-1.0)));
}

TEST(DeterministicPowTest, MatchesLibm) {
  for (double b = 0.05; b < 20.0; b += 0.45) {
    for (double e : {0.5, 1.0, 1.5, 2.0, 3.0}) {
      expectRelNear(det::pow(b, e), std::pow(b, e), 1e-13);
    }
  }
}

TEST(DeterministicPowTest, EdgeCases) {
  EXPECT_EQ(det::pow(5.0, 0.0), 1.0);
  EXPECT_EQ(det::pow(1.0, 1.5), 1.0);
  EXPECT_EQ(det::pow(0.0, 2.0), 0.0);
  EXPECT_TRUE(std::isnan(det::pow(-2.0, 0.5)));
}

TEST(DeterministicMathTest, RepeatedCallsBitIdentical) {
  const double a = det::pow(1.234, 1.5);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(det::pow(1.234, 1.5), a);
  }
}

// ─── Robust statistics ───────────────────────────────────────────────────────

TEST(RobustStatsTest, MedianOddAndEven) {
  EXPECT_DOUBLE_EQ(stats::median({3.0, 1.0, 2.0}), 2.0);
  EXPECT_DOUBLE_EQ(stats::median({4.0, 1.0, 3.0, 2.0}), 2.5);
  EXPECT_DOUBLE_EQ(stats::median({}), 0.0);
}

TEST(RobustStatsTest, MedianIndependentOfOrder) {
  std::vector<double> a = {0.5, -1.0, 7.25, 3.0, 3.0, -0.0, 0.0, 1e-9};
  std::vector<double> b(a.rbegin(), a.rend());
  EXPECT_EQ(stats::median(a), stats::median(b));
}

TEST(RobustStatsTest, NaNSortsLast) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_DOUBLE_EQ(stats::median({nan, 1.0, 2.0}), 2.0);
}

TEST(RobustStatsTest, MedianAbsoluteDeviation) {
  // deviations from median 3: {2, 0, 1, 1, 6} → median 1
  EXPECT_DOUBLE_EQ(stats::medianAbsoluteDeviation({1.0, 3.0, 2.0, 4.0, 9.0}),
                   1.0);
  EXPECT_DOUBLE_EQ(stats::medianAbsoluteDeviation({5.0, 5.0, 5.0}), 0.0);
}
