// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "depthfuse/numerics/deterministic_math.hpp"

#include <cmath>
#include <limits>

namespace depthfuse::det {

namespace {

// ln2 split so that k·kLn2Hi is exact for |k| < 2^11
constexpr double kLn2Hi = 6.93147180369123816490e-01;
constexpr double kLn2Lo = 1.90821492927058770002e-10;
constexpr double kInvLn2 = 1.44269504088896338700e+00;

constexpr double kExpOverflow = 709.782712893383973096;
constexpr double kExpUnderflow = -745.133219101941108420;

constexpr int kExpTerms = 13;
constexpr int kLogTerms = 15;
constexpr int kSqrtIterations = 8;

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

}  // namespace

double exp(double x) {
  if (std::isnan(x)) return x;
  if (x > kExpOverflow) return kInf;
  if (x < kExpUnderflow) return 0.0;
  if (x == 0.0) return 1.0;

  const double k = std::floor(x * kInvLn2 + 0.5);
  const double r = (x - k * kLn2Hi) - k * kLn2Lo;

  // Horner form of Σ r^n/n!, n = 0..12
  double p = 1.0;
  for (int n = kExpTerms - 1; n >= 1; --n) {
    p = 1.0 + p * r / static_cast<double>(n);
  }
  return std::ldexp(p, static_cast<int>(k));
}

double log(double x) {
  if (std::isnan(x) || x < 0.0) return kNaN;
  if (x == 0.0) return -kInf;
  if (std::isinf(x)) return kInf;
  if (x == 1.0) return 0.0;

  int e = 0;
  double m = std::frexp(x, &e);  // m in [0.5, 1)
  m *= 2.0;
  e -= 1;

  const double s = (m - 1.0) / (m + 1.0);
  const double s2 = s * s;

  // Σ s^(2n)/(2n+1), n = 0..14
  double p = 1.0 / static_cast<double>(2 * (kLogTerms - 1) + 1);
  for (int n = kLogTerms - 2; n >= 0; --n) {
    p = 1.0 / static_cast<double>(2 * n + 1) + s2 * p;
  }
  const double ed = static_cast<double>(e);
  return ed * kLn2Hi + (ed * kLn2Lo + 2.0 * s * p);
}

double sqrt(double x) {
  if (std::isnan(x) || x < 0.0) return kNaN;
  if (x == 0.0 || std::isinf(x)) return x;

  int e = 0;
  double m = std::frexp(x, &e);  // m in [0.5, 1)
  if (e % 2 != 0) {
    m *= 2.0;
    e -= 1;
  }
  // m in [0.5, 2), e even
  double g = 0.5 * (1.0 + m);
  for (int i = 0; i < kSqrtIterations; ++i) {
    g = 0.5 * (g + m / g);
  }
  return std::ldexp(g, e / 2);
}

double pow(double base, double exponent) {
  if (std::isnan(base) || std::isnan(exponent)) return kNaN;
  if (exponent == 0.0) return 1.0;
  if (base == 0.0) return exponent > 0.0 ? 0.0 : kInf;
  if (base < 0.0) return kNaN;
  return exp(exponent * log(base));
}

}  // namespace depthfuse::det
