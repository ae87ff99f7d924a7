#pragma once

#include "sonar/common.h"
#include "sonar/profile_registry.h"

namespace sonar {

struct ModelConfig {
    double absorption_db_per_m = DEFAULT_ABSORPTION_DB_PER_M;
};

// One listening geometry: target speed, source-to-listener range and the
// ambient noise at the listener.
struct Scenario {
    double speed_kn;
    double range_m;
    double ambient_noise_db = DEFAULT_AMBIENT_NOISE_DB;
};

struct SNRResult {
    std::string profile_id;
    double noise_level_db;
    double transmission_loss_db;
    double snr_db;
};

// Source level, transmission loss and SNR for passive detection.
// Stateless apart from its config; safe to share between threads.
// Every method throws DomainError before computing on out-of-domain input.
class AcousticModel {
public:
    explicit AcousticModel(ModelConfig config = ModelConfig{});

    const ModelConfig& config() const { return config_; }

    // dL_cav = 0 for v <= v0, A * (v - v0)^p above onset
    double cavitation_increment(const SubmarineProfile& profile, double speed_kn) const;

    // L_p = L0 + 10*log10(1 + (v/v0)^n) + dL_cav
    double noise_level(const SubmarineProfile& profile, double speed_kn) const;

    // TL = 20*log10(r) + alpha*r
    double transmission_loss(double range_m) const;

    // SNR = L_p - TL - NL
    double snr(const SubmarineProfile& profile, const Scenario& scenario) const;

    // All three quantities for one profile; snr_db is derived from the
    // returned components.
    SNRResult evaluate(const SubmarineProfile& profile, const Scenario& scenario) const;

private:
    ModelConfig config_;
};

} // namespace sonar
