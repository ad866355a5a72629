#pragma once

// EIGEN_USE_THREADS is set for every target in CMakeLists.txt
#include <Eigen/Dense>

#include <complex>
#include <memory>

using Index = Eigen::Index;

namespace pn {

using Cx = std::complex<float>;

using ReVector = Eigen::ArrayXf;   // Magnitudes and 0/1 masks, one entry per measurement
using CxVector = Eigen::VectorXcf; // Signal estimates
using CxMatrix = Eigen::MatrixXcf; // Dense sensing matrices, measurements × samples
using ReMatrix = Eigen::MatrixXf;

} // namespace pn
