#include "sonar/sweep_ops.h"
#include "sonar/errors.h"
#include <cmath>

namespace sonar {

Vec noise_level_curve(
    const AcousticModel& model,
    const SubmarineProfile& profile,
    const Vec& speeds_kn)
{
    const int S = static_cast<int>(speeds_kn.size());
    Vec out(S);
    for (int i = 0; i < S; ++i) {
        out(i) = model.noise_level(profile, speeds_kn(i));
    }
    return out;
}

Vec transmission_loss_curve(
    const AcousticModel& model,
    const Vec& ranges_m)
{
    const int R = static_cast<int>(ranges_m.size());
    Vec out(R);
    for (int j = 0; j < R; ++j) {
        out(j) = model.transmission_loss(ranges_m(j));
    }
    return out;
}

Mat snr_grid(
    const AcousticModel& model,
    const SubmarineProfile& profile,
    const Vec& speeds_kn,
    const Vec& ranges_m,
    double ambient_noise_db)
{
    if (!std::isfinite(ambient_noise_db)) {
        throw DomainError("ambient noise level must be finite");
    }

    // Source level depends only on speed and TL only on range, so each is
    // computed once and combined in the same order as AcousticModel::evaluate.
    Vec L = noise_level_curve(model, profile, speeds_kn);
    Vec TL = transmission_loss_curve(model, ranges_m);

    const int S = static_cast<int>(L.size());
    const int R = static_cast<int>(TL.size());
    Mat grid(S, R);
    for (int i = 0; i < S; ++i) {
        for (int j = 0; j < R; ++j) {
            grid(i, j) = L(i) - TL(j) - ambient_noise_db;
        }
    }
    return grid;
}

Vec linspace_speeds(const SubmarineProfile& profile, int n) {
    if (n < 2) throw DomainError("speed sweep needs at least 2 points");
    double v_max = profile.max_submerged_speed_kn;
    if (!(v_max > 0.0) || !std::isfinite(v_max)) {
        throw DomainError("profile '" + profile.name + "' has no positive top speed");
    }
    return Vec::LinSpaced(n, 0.0, v_max);
}

} // namespace sonar
