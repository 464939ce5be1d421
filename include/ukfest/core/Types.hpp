#pragma once

#include <Eigen/Dense>

namespace ukfest {
using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;
} // namespace ukfest
