// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "depthfuse/verification/determinism_verifier.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <utility>

#include "depthfuse/fusion/fusion_arbitrator.hpp"

namespace depthfuse {

namespace {

const char* backendName(QuantizerBackend backend) {
  return backend == QuantizerBackend::Integer ? "integer" : "arithmetic";
}

std::optional<std::int64_t> lookup(const DeterminismVerifier::FieldMap& map,
                                   const std::string& field) {
  auto it = map.find(field);
  if (it == map.end()) return std::nullopt;
  return it->second;
}

}  // namespace

DeterminismVerifier::DeterminismVerifier(const Config& cfg) : cfg_(cfg) {}

std::vector<DeterminismVerifier::FieldMap> DeterminismVerifier::replay(
    const std::vector<FrameInput>& frames, QuantizerBackend backend) const {
  std::vector<QuantizationOverflow> overflows;
  return replay(frames, backend, overflows);
}

std::vector<DeterminismVerifier::FieldMap> DeterminismVerifier::replay(
    const std::vector<FrameInput>& frames, QuantizerBackend backend,
    std::vector<QuantizationOverflow>& overflows) const {
  Config cfg = cfg_;
  cfg.quantization.backend = backend;
  FusionArbitrator arbitrator(cfg);

  std::vector<FieldMap> out;
  out.reserve(frames.size());
  for (const auto& frame : frames) {
    FieldMap fields;
    if (auto result = arbitrator.process(frame)) {
      overflows.insert(overflows.end(), result->overflows.begin(),
                       result->overflows.end());
      for (const auto& [name, value] : result->determinism_fields) {
        if (value.field_class == FieldClass::Deterministic) {
          fields[name] = value.raw;
        }
      }
    }
    out.push_back(std::move(fields));
  }
  return out;
}

VerificationReport DeterminismVerifier::verify(
    const std::vector<FrameInput>& frames, std::size_t runs) const {
  VerificationReport report;
  report.runs = runs;
  report.frames = frames.size();

  const auto reference =
      replay(frames, QuantizerBackend::Arithmetic, report.overflows);

  for (std::size_t run = 0; run < runs; ++run) {
    for (auto backend :
         {QuantizerBackend::Arithmetic, QuantizerBackend::Integer}) {
      if (run == 0 && backend == QuantizerBackend::Arithmetic) continue;
      const auto candidate = replay(frames, backend);

      for (std::size_t i = 0; i < frames.size(); ++i) {
        std::set<std::string> names;
        for (const auto& [name, raw] : reference[i]) names.insert(name);
        for (const auto& [name, raw] : candidate[i]) names.insert(name);

        for (const auto& name : names) {
          ++report.fields_compared;
          auto expected = lookup(reference[i], name);
          auto actual = lookup(candidate[i], name);
          if (expected != actual) {
            report.mismatches.push_back(
                {run, i, backendName(backend), name, expected, actual});
          }
        }
      }
    }
  }

  if (!report.overflows.empty()) {
    spdlog::warn("[DeterminismVerifier] {} field(s) clamped to the fixed-point "
                 "range in the reference run",
                 report.overflows.size());
  }
  if (report.passed()) {
    spdlog::info(
        "[DeterminismVerifier] {} run(s) x {} frame(s): {} fields identical",
        runs, frames.size(), report.fields_compared);
  } else {
    spdlog::error("[DeterminismVerifier] {} mismatch(es) in {} fields compared",
                  report.mismatches.size(), report.fields_compared);
  }
  return report;
}

}  // namespace depthfuse
