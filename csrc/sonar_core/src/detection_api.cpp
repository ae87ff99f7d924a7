#include "sonar/detection_api.h"

namespace sonar {

namespace {

const AcousticModel& default_model() {
    static const AcousticModel model;
    return model;
}

std::vector<SubmarineProfile> resolve_all(
    const ProfileRegistry& registry, const std::vector<std::string>& names)
{
    std::vector<SubmarineProfile> profiles;
    profiles.reserve(names.size());
    for (const auto& name : names) {
        profiles.push_back(registry.resolve(name));
    }
    return profiles;
}

} // namespace

SNRResult compute_snr(
    const ProfileRegistry& registry, const AcousticModel& model,
    const std::string& profile_name,
    double speed_kn, double range_m, double ambient_noise_db)
{
    const SubmarineProfile& profile = registry.resolve(profile_name);
    return model.evaluate(profile, Scenario{speed_kn, range_m, ambient_noise_db});
}

SNRResult compute_snr(
    const std::string& profile_name,
    double speed_kn, double range_m, double ambient_noise_db)
{
    return compute_snr(builtin_registry(), default_model(),
                       profile_name, speed_kn, range_m, ambient_noise_db);
}

std::vector<ProfileSummary> list_profiles(const ProfileRegistry& registry) {
    return registry.list_all();
}

std::vector<ProfileSummary> list_profiles() {
    return list_profiles(builtin_registry());
}

std::vector<SNRResult> compare_all(
    const ProfileRegistry& registry, const AcousticModel& model,
    const std::vector<std::string>& profile_names,
    double speed_kn, double range_m, double ambient_noise_db)
{
    auto profiles = resolve_all(registry, profile_names);
    return evaluate_all(model, profiles, Scenario{speed_kn, range_m, ambient_noise_db});
}

std::vector<SNRResult> compare_all(
    const std::vector<std::string>& profile_names,
    double speed_kn, double range_m, double ambient_noise_db)
{
    return compare_all(builtin_registry(), default_model(),
                       profile_names, speed_kn, range_m, ambient_noise_db);
}

SNRResult quietest_at(
    const ProfileRegistry& registry, const AcousticModel& model,
    const std::vector<std::string>& profile_names,
    double speed_kn, double range_m, double ambient_noise_db)
{
    auto results = compare_all(registry, model, profile_names,
                               speed_kn, range_m, ambient_noise_db);
    return quietest_of(results);
}

SNRResult quietest_at(
    const std::vector<std::string>& profile_names,
    double speed_kn, double range_m, double ambient_noise_db)
{
    return quietest_at(builtin_registry(), default_model(),
                       profile_names, speed_kn, range_m, ambient_noise_db);
}

SNRResult loudest_at(
    const ProfileRegistry& registry, const AcousticModel& model,
    const std::vector<std::string>& profile_names,
    double speed_kn, double range_m, double ambient_noise_db)
{
    auto results = compare_all(registry, model, profile_names,
                               speed_kn, range_m, ambient_noise_db);
    return loudest_of(results);
}

SNRResult loudest_at(
    const std::vector<std::string>& profile_names,
    double speed_kn, double range_m, double ambient_noise_db)
{
    return loudest_at(builtin_registry(), default_model(),
                      profile_names, speed_kn, range_m, ambient_noise_db);
}

} // namespace sonar
