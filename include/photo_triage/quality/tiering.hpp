#pragma once

#include "photo_triage/core/types.hpp"

#include <optional>

namespace photo_triage::quality {

struct TierThresholds {
  double keeper = 35.0;
  double ambiguous = 50.0;
};

// score <= keeper -> KEEPER, score >= ambiguous -> DUD, otherwise AMBIGUOUS.
Stage1Tier classify_stage1(double score, const TierThresholds &t);

// Final verdict. stage2 is the escalation result of an ambiguous image, or
// nullopt when escalation failed or was not attempted (needs review).
// stage2 is ignored for keepers and duds.
QualityVerdict resolve_verdict(double score, const TierThresholds &t,
                               const std::optional<StructuredVerdict> &stage2);

} // namespace photo_triage::quality
