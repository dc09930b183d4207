// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * depthfuse.hpp
 *
 * depthfuse: Arbitration, calibration and determinism core for multi-source
 * depth fusion.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DEPTHFUSE_DEPTHFUSE_HPP
#define DEPTHFUSE_DEPTHFUSE_HPP

// Configs
#include "depthfuse/config/depthfuse.hpp"

// Data types
#include "depthfuse/errors.hpp"
#include "depthfuse/fusion/fusion_result.hpp"
#include "depthfuse/types.hpp"

// Core objects
#include "depthfuse/calibration/calibration_harness.hpp"
#include "depthfuse/calibration/calibration_store.hpp"
#include "depthfuse/fusion/frame_synchronizer.hpp"
#include "depthfuse/fusion/fusion_arbitrator.hpp"
#include "depthfuse/health/source_health_tracker.hpp"
#include "depthfuse/noise/noise_model.hpp"
#include "depthfuse/numerics/quantizer.hpp"
#include "depthfuse/uncertainty/uncertainty_propagator.hpp"

// Replay and verification
#include "depthfuse/io/frame_sequence.hpp"
#include "depthfuse/verification/determinism_verifier.hpp"

#endif  // DEPTHFUSE_DEPTHFUSE_HPP
