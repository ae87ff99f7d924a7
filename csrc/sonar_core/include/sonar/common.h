#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

namespace sonar {

// Standard aliases
using Vec = Eigen::VectorXd;
using Mat = Eigen::MatrixXd;

// Seawater absorption used by transmission loss (0.04 dB/km)
constexpr double DEFAULT_ABSORPTION_DB_PER_M = 0.00004;

// Ambient ocean noise at the listener when the caller gives none
constexpr double DEFAULT_AMBIENT_NOISE_DB = 50.0;

// Case-insensitive ASCII comparison for profile names
bool iequals(const std::string& a, const std::string& b);

} // namespace sonar
