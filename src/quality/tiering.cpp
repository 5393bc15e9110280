#include "photo_triage/quality/tiering.hpp"

namespace photo_triage::quality {

Stage1Tier classify_stage1(double score, const TierThresholds& t) {
    if (score <= t.keeper) return Stage1Tier::KEEPER;
    if (score >= t.ambiguous) return Stage1Tier::DUD;
    return Stage1Tier::AMBIGUOUS;
}

QualityVerdict resolve_verdict(double score, const TierThresholds& t,
                               const std::optional<StructuredVerdict>& stage2) {
    QualityVerdict v;
    v.stage1_score = score;
    v.stage1_tier = classify_stage1(score, t);

    switch (v.stage1_tier) {
        case Stage1Tier::KEEPER:
            v.tier = VerdictTier::KEEPER;
            break;
        case Stage1Tier::DUD:
            v.tier = VerdictTier::DUD;
            break;
        case Stage1Tier::AMBIGUOUS:
            if (stage2) {
                v.tier = VerdictTier::AMBIGUOUS_ESCALATED;
                v.stage2 = stage2;
            } else {
                v.tier = VerdictTier::NEEDS_REVIEW;
                v.needs_review = true;
            }
            break;
    }
    return v;
}

} // namespace photo_triage::quality
