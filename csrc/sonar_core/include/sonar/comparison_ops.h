#pragma once

#include "sonar/acoustic_model.h"
#include <vector>

namespace sonar {

// ---------------------------------------------------------------------------
// Batch evaluation
// ---------------------------------------------------------------------------

// One SNRResult per profile, in input order. The first DomainError aborts
// the whole batch; no partial results are returned.
std::vector<SNRResult> evaluate_all(
    const AcousticModel& model,
    const std::vector<SubmarineProfile>& profiles,
    const Scenario& scenario);

// ---------------------------------------------------------------------------
// Ranking
// ---------------------------------------------------------------------------

// Minimum / maximum SNR over already evaluated results. Exact ties go to the
// earliest entry. Throw DomainError on an empty set.
const SNRResult& quietest_of(const std::vector<SNRResult>& results);
const SNRResult& loudest_of(const std::vector<SNRResult>& results);

// Hardest to detect: lowest SNR at the listener
SNRResult quietest(
    const AcousticModel& model,
    const std::vector<SubmarineProfile>& profiles,
    const Scenario& scenario);

// Easiest to detect: highest SNR at the listener
SNRResult loudest(
    const AcousticModel& model,
    const std::vector<SubmarineProfile>& profiles,
    const Scenario& scenario);

} // namespace sonar
