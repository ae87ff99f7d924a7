#pragma once

#include "sonar/common.h"
#include <cstddef>
#include <string>
#include <vector>

namespace sonar {

// Static acoustic constants for one submarine class.
//   L0   base_noise_db        noise at cruise (dB)
//   v0   cavitation_onset_kn  speed above which cavitation noise applies (kn)
//   n    noise_growth         exponent of the non-cavitating growth term
//   A, p cavitation_scale, cavitation_exponent: dL_cav = A * (v - v0)^p
struct SubmarineProfile {
    std::string name;
    double base_noise_db;
    double cavitation_onset_kn;
    double noise_growth;
    double cavitation_scale;
    double cavitation_exponent;
    double max_submerged_speed_kn;
};

// Row for profile listings
struct ProfileSummary {
    std::string name;
    double base_noise_db;
    double cavitation_onset_kn;
    double max_submerged_speed_kn;
};

// Cavitation scale that yields a 10 dB increment at top submerged speed:
// A = 10 / (v_max - v0)^p
double fit_cavitation_scale(double onset_kn, double max_speed_kn, double exponent);

// Named catalog of profiles, kept in registration order.
// Lookups ignore ASCII case.
class ProfileRegistry {
public:
    ProfileRegistry() = default;
    explicit ProfileRegistry(std::vector<SubmarineProfile> profiles);

    // Throws DomainError on onset speed <= 0, std::invalid_argument on a
    // duplicate name.
    void add(SubmarineProfile profile);

    // Throws NotFoundError when no profile matches.
    const SubmarineProfile& resolve(const std::string& name) const;

    bool contains(const std::string& name) const;
    std::size_t size() const { return profiles_.size(); }
    const std::vector<SubmarineProfile>& profiles() const { return profiles_; }

    std::vector<ProfileSummary> list_all() const;

private:
    const SubmarineProfile* find(const std::string& name) const;

    std::vector<SubmarineProfile> profiles_;
};

// Process-wide catalog of the built-in classes, built once on first use.
const ProfileRegistry& builtin_registry();

} // namespace sonar
