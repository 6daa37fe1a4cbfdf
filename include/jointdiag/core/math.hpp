#pragma once

#include <jointdiag/core/detail/eigen.hpp>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <cmath>
#include <complex>
#include <limits>

namespace jd {
  // Shorthand unsigned types
  using uint = unsigned int;

  // Complex working precision
  using cdouble = std::complex<double>;

  // Real counterpart of a real or complex scalar
  template <typename T>
  using real_t = typename eig::NumTraits<T>::Real;

  // Dynamic matrix/vector shorthands over the working scalar
  template <typename T>
  using MatX = eig::MatrixX<T>;
  template <typename T>
  using VecX = eig::VectorX<T>;
  template <typename T>
  using RVecX = eig::VectorX<real_t<T>>;

  // Default solver tolerance; square root of machine epsilon of the real type
  template <typename T>
  inline real_t<T> default_tolerance() {
    return std::sqrt(std::numeric_limits<real_t<T>>::epsilon());
  }

  // Return the Hermitian part (A + A^H) / 2 of a square matrix, discarding
  // asymmetry introduced by floating point error
  template <typename T>
  MatX<T> hermitian(const MatX<T> &A) {
    return ((A + A.adjoint()) * real_t<T>(.5)).eval();
  }

  // Return the unit-modulus factor s such that d * s is real and non-negative;
  // s is 1 if d already is; for real scalars this is a sign flip
  template <typename T>
  T unit_phase(const T &d) {
    real_t<T> r = std::abs(d);
    if (r == real_t<T>(0) || (eig::numext::real(d) >= real_t<T>(0) && eig::numext::imag(d) == real_t<T>(0)))
      return T(1);
    return eig::numext::conj(d) / r;
  }

  // Return diag(A^H * B * C) without forming the full product
  template <typename T>
  VecX<T> diag_product(const MatX<T> &A, const MatX<T> &B, const MatX<T> &C) {
    MatX<T> BC = B * C;
    return (A.conjugate().array() * BC.array()).colwise().sum().transpose().matrix().eval();
  }
} // namespace jd
