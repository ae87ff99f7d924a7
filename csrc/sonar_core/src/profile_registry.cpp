#include "sonar/profile_registry.h"
#include "sonar/errors.h"
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace sonar {

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        unsigned char ca = static_cast<unsigned char>(a[i]);
        unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb)) return false;
    }
    return true;
}

double fit_cavitation_scale(double onset_kn, double max_speed_kn, double exponent) {
    if (!(max_speed_kn > onset_kn)) {
        throw DomainError("top speed must exceed cavitation onset speed");
    }
    return 10.0 / std::pow(max_speed_kn - onset_kn, exponent);
}

ProfileRegistry::ProfileRegistry(std::vector<SubmarineProfile> profiles) {
    profiles_.reserve(profiles.size());
    for (auto& p : profiles) {
        add(std::move(p));
    }
}

void ProfileRegistry::add(SubmarineProfile profile) {
    if (!(profile.cavitation_onset_kn > 0.0) || !std::isfinite(profile.cavitation_onset_kn)) {
        throw DomainError("profile '" + profile.name +
                          "': cavitation onset speed must be positive");
    }
    if (find(profile.name) != nullptr) {
        throw std::invalid_argument("duplicate submarine profile: '" + profile.name + "'");
    }
    profiles_.push_back(std::move(profile));
}

const SubmarineProfile* ProfileRegistry::find(const std::string& name) const {
    for (const auto& p : profiles_) {
        if (iequals(p.name, name)) return &p;
    }
    return nullptr;
}

const SubmarineProfile& ProfileRegistry::resolve(const std::string& name) const {
    const SubmarineProfile* p = find(name);
    if (p == nullptr) throw NotFoundError(name);
    return *p;
}

bool ProfileRegistry::contains(const std::string& name) const {
    return find(name) != nullptr;
}

std::vector<ProfileSummary> ProfileRegistry::list_all() const {
    std::vector<ProfileSummary> out;
    out.reserve(profiles_.size());
    for (const auto& p : profiles_) {
        out.push_back({p.name, p.base_noise_db, p.cavitation_onset_kn,
                       p.max_submerged_speed_kn});
    }
    return out;
}

namespace {

// Hand-tuned class constants. Every class uses p = 2.5; A is fitted so the
// cavitation increment reaches 10 dB at the estimated top submerged speed.
SubmarineProfile make_profile(const char* name, double L0, double v0, double n,
                              double v_max)
{
    constexpr double p = 2.5;
    return {name, L0, v0, n, fit_cavitation_scale(v0, v_max, p), p, v_max};
}

std::vector<SubmarineProfile> builtin_profiles() {
    return {
        //            name           L0     v0    n    v_max
        make_profile("Ohio",        100.0, 21.0, 2.5, 25.0),
        make_profile("Seawolf",      90.0, 20.0, 2.2, 35.0),
        make_profile("Lafayette",   110.0, 18.0, 2.8, 25.0),
        make_profile("Los Angeles", 105.0, 20.0, 2.6, 32.0),
        make_profile("Virginia",     92.0, 22.0, 2.3, 34.0),
    };
}

} // namespace

const ProfileRegistry& builtin_registry() {
    static const ProfileRegistry registry(builtin_profiles());
    return registry;
}

} // namespace sonar
