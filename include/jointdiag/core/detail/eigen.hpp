#pragma once

#include <Eigen/Dense>
#include <Eigen/Eigenvalues>
#include <Eigen/SVD>
#include <complex>

// Introduce 'eig' namespace shorthand in the jointdiag namespace
namespace jd {
  namespace eig = Eigen;

  // Eigen 3.4 provides the dynamic alias templates MatrixX<T>/VectorX<T> used throughout
  static_assert(EIGEN_VERSION_AT_LEAST(3, 4, 0), "jointdiag requires Eigen 3.4 or newer");
} // namespace jd
