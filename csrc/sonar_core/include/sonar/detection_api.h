#pragma once

#include "sonar/comparison_ops.h"
#include <string>
#include <vector>

namespace sonar {

// Name-based entry points for the presentation layer. Each comes in two
// forms: one against an explicit registry and model, and one against
// builtin_registry() with a default-configured model.
//
// Unknown names throw NotFoundError; out-of-domain scenarios throw
// DomainError. Batch calls resolve every name before evaluating anything.

SNRResult compute_snr(
    const ProfileRegistry& registry, const AcousticModel& model,
    const std::string& profile_name,
    double speed_kn, double range_m,
    double ambient_noise_db = DEFAULT_AMBIENT_NOISE_DB);

SNRResult compute_snr(
    const std::string& profile_name,
    double speed_kn, double range_m,
    double ambient_noise_db = DEFAULT_AMBIENT_NOISE_DB);

std::vector<ProfileSummary> list_profiles(const ProfileRegistry& registry);
std::vector<ProfileSummary> list_profiles();

std::vector<SNRResult> compare_all(
    const ProfileRegistry& registry, const AcousticModel& model,
    const std::vector<std::string>& profile_names,
    double speed_kn, double range_m,
    double ambient_noise_db = DEFAULT_AMBIENT_NOISE_DB);

std::vector<SNRResult> compare_all(
    const std::vector<std::string>& profile_names,
    double speed_kn, double range_m,
    double ambient_noise_db = DEFAULT_AMBIENT_NOISE_DB);

SNRResult quietest_at(
    const ProfileRegistry& registry, const AcousticModel& model,
    const std::vector<std::string>& profile_names,
    double speed_kn, double range_m,
    double ambient_noise_db = DEFAULT_AMBIENT_NOISE_DB);

SNRResult quietest_at(
    const std::vector<std::string>& profile_names,
    double speed_kn, double range_m,
    double ambient_noise_db = DEFAULT_AMBIENT_NOISE_DB);

SNRResult loudest_at(
    const ProfileRegistry& registry, const AcousticModel& model,
    const std::vector<std::string>& profile_names,
    double speed_kn, double range_m,
    double ambient_noise_db = DEFAULT_AMBIENT_NOISE_DB);

SNRResult loudest_at(
    const std::vector<std::string>& profile_names,
    double speed_kn, double range_m,
    double ambient_noise_db = DEFAULT_AMBIENT_NOISE_DB);

} // namespace sonar
