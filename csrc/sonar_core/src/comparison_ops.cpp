#include "sonar/comparison_ops.h"
#include "sonar/errors.h"
#include <cstddef>

namespace sonar {

// ---------------------------------------------------------------------------
// Batch evaluation
// ---------------------------------------------------------------------------

std::vector<SNRResult> evaluate_all(
    const AcousticModel& model,
    const std::vector<SubmarineProfile>& profiles,
    const Scenario& scenario)
{
    std::vector<SNRResult> results;
    results.reserve(profiles.size());
    for (const auto& profile : profiles) {
        results.push_back(model.evaluate(profile, scenario));
    }
    return results;
}

// ---------------------------------------------------------------------------
// Ranking
// ---------------------------------------------------------------------------

const SNRResult& quietest_of(const std::vector<SNRResult>& results) {
    if (results.empty()) throw DomainError("cannot rank an empty set of profiles");
    std::size_t best = 0;
    for (std::size_t i = 1; i < results.size(); ++i) {
        // Strict comparison keeps the first of equal entries
        if (results[i].snr_db < results[best].snr_db) best = i;
    }
    return results[best];
}

const SNRResult& loudest_of(const std::vector<SNRResult>& results) {
    if (results.empty()) throw DomainError("cannot rank an empty set of profiles");
    std::size_t best = 0;
    for (std::size_t i = 1; i < results.size(); ++i) {
        if (results[i].snr_db > results[best].snr_db) best = i;
    }
    return results[best];
}

SNRResult quietest(
    const AcousticModel& model,
    const std::vector<SubmarineProfile>& profiles,
    const Scenario& scenario)
{
    auto results = evaluate_all(model, profiles, scenario);
    return quietest_of(results);
}

SNRResult loudest(
    const AcousticModel& model,
    const std::vector<SubmarineProfile>& profiles,
    const Scenario& scenario)
{
    auto results = evaluate_all(model, profiles, scenario);
    return loudest_of(results);
}

} // namespace sonar
