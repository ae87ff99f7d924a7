#include "sonar/acoustic_model.h"
#include "sonar/errors.h"
#include <cmath>
#include <string>

namespace sonar {

namespace {

void check_profile(const SubmarineProfile& profile) {
    double v0 = profile.cavitation_onset_kn;
    if (!(v0 > 0.0) || !std::isfinite(v0)) {
        throw DomainError("profile '" + profile.name +
                          "': cavitation onset speed must be positive, got " +
                          std::to_string(v0));
    }
}

void check_speed(double speed_kn) {
    // Negative speed would raise a negative base to a fractional power.
    if (!(speed_kn >= 0.0) || !std::isfinite(speed_kn)) {
        throw DomainError("speed must be finite and >= 0 kn, got " +
                          std::to_string(speed_kn));
    }
}

void check_range(double range_m) {
    if (!(range_m > 0.0) || !std::isfinite(range_m)) {
        throw DomainError("range must be finite and > 0 m, got " +
                          std::to_string(range_m));
    }
}

void check_ambient(double ambient_db) {
    if (!std::isfinite(ambient_db)) {
        throw DomainError("ambient noise level must be finite");
    }
}

} // namespace

AcousticModel::AcousticModel(ModelConfig config)
    : config_(config)
{
    double alpha = config_.absorption_db_per_m;
    if (!(alpha >= 0.0) || !std::isfinite(alpha)) {
        throw DomainError("absorption coefficient must be finite and >= 0 dB/m, got " +
                          std::to_string(alpha));
    }
}

double AcousticModel::cavitation_increment(
    const SubmarineProfile& profile, double speed_kn) const
{
    check_profile(profile);
    check_speed(speed_kn);

    double v0 = profile.cavitation_onset_kn;
    // Onset speed itself belongs to the quiet branch
    if (speed_kn <= v0) return 0.0;
    return profile.cavitation_scale *
           std::pow(speed_kn - v0, profile.cavitation_exponent);
}

double AcousticModel::noise_level(
    const SubmarineProfile& profile, double speed_kn) const
{
    double cav = cavitation_increment(profile, speed_kn);
    // x >= 1 once v >= 0 and v0 > 0, so log10 is always defined
    double x = 1.0 + std::pow(speed_kn / profile.cavitation_onset_kn, profile.noise_growth);
    return profile.base_noise_db + 10.0 * std::log10(x) + cav;
}

double AcousticModel::transmission_loss(double range_m) const {
    check_range(range_m);
    return 20.0 * std::log10(range_m) + config_.absorption_db_per_m * range_m;
}

double AcousticModel::snr(
    const SubmarineProfile& profile, const Scenario& scenario) const
{
    return evaluate(profile, scenario).snr_db;
}

SNRResult AcousticModel::evaluate(
    const SubmarineProfile& profile, const Scenario& scenario) const
{
    check_ambient(scenario.ambient_noise_db);
    double L = noise_level(profile, scenario.speed_kn);
    double TL = transmission_loss(scenario.range_m);
    return {profile.name, L, TL, L - TL - scenario.ambient_noise_db};
}

} // namespace sonar
