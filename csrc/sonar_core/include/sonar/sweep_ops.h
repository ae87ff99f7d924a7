#pragma once

#include "sonar/acoustic_model.h"

namespace sonar {

// Vectorised evaluation for curve plotting. Every element equals the scalar
// AcousticModel call for the same inputs. Any out-of-domain sample throws
// DomainError and nothing is returned.

// (S,) source level for each speed in speeds_kn
Vec noise_level_curve(
    const AcousticModel& model,
    const SubmarineProfile& profile,
    const Vec& speeds_kn);

// (R,) transmission loss for each range in ranges_m
Vec transmission_loss_curve(
    const AcousticModel& model,
    const Vec& ranges_m);

// (S, R) SNR grid: rows follow speeds_kn, columns follow ranges_m.
Mat snr_grid(
    const AcousticModel& model,
    const SubmarineProfile& profile,
    const Vec& speeds_kn,
    const Vec& ranges_m,
    double ambient_noise_db = DEFAULT_AMBIENT_NOISE_DB);

// n evenly spaced speeds over [0, max_submerged_speed_kn] (n >= 2)
Vec linspace_speeds(const SubmarineProfile& profile, int n);

} // namespace sonar
