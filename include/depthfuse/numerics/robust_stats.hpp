// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DEPTHFUSE_NUMERICS_ROBUST_STATS_HPP
#define DEPTHFUSE_NUMERICS_ROBUST_STATS_HPP

#include <vector>

namespace depthfuse::stats {

/**
 * @brief Median under a total order (NaN sorts last, -0 before +0).
 *
 * The result does not depend on input order. Even-sized input returns the
 * mean of the two middle elements. Empty input returns 0.
 */
double median(std::vector<double> values);

/// Median absolute deviation from the median. Empty input returns 0.
double medianAbsoluteDeviation(const std::vector<double>& values);

}  // namespace depthfuse::stats

#endif  // DEPTHFUSE_NUMERICS_ROBUST_STATS_HPP
