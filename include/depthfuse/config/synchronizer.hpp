// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DEPTHFUSE_CONFIG_SYNCHRONIZER_HPP
#define DEPTHFUSE_CONFIG_SYNCHRONIZER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace depthfuse::config {

/// Per-frame barrier over concurrently produced source samples.
struct Synchronizer {
  std::vector<std::string> sources;  ///< Sources every frame must contain
  double sync_tolerance = 0.05;      ///< Max sample age behind newest [s]
  std::size_t buffer_size = 8;       ///< Samples buffered per source
};

}  // namespace depthfuse::config

#endif  // DEPTHFUSE_CONFIG_SYNCHRONIZER_HPP
