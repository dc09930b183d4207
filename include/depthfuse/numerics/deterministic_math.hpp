// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * deterministic_math.hpp
 *
 * Transcendental functions built only from IEEE-754 basic operations
 * (+, -, *, /) and exact scaling (frexp/ldexp), so that results do not
 * depend on the platform libm.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DEPTHFUSE_NUMERICS_DETERMINISTIC_MATH_HPP
#define DEPTHFUSE_NUMERICS_DETERMINISTIC_MATH_HPP

namespace depthfuse::det {

/**
 * @brief e^x.
 *
 * Range reduction x = k·ln2 + r (|r| ≤ ln2/2) with a split ln2 constant,
 * 13-term Taylor polynomial for e^r, then ldexp by k.
 * Overflows to +inf above ~709.78 and to 0 below ~-745.13.
 */
double exp(double x);

/**
 * @brief Natural logarithm.
 *
 * x = m·2^e with m in [1, 2); ln(m) = 2·atanh((m-1)/(m+1)) from a 15-term
 * series. Returns NaN for x < 0, -inf for 0.
 */
double log(double x);

/// Square root via 8 Newton iterations from an exponent-halving guess.
double sqrt(double x);

/// base^exponent = exp(exponent·log(base)) for base > 0.
double pow(double base, double exponent);

}  // namespace depthfuse::det

#endif  // DEPTHFUSE_NUMERICS_DETERMINISTIC_MATH_HPP
