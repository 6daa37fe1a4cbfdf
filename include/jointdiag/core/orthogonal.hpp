#pragma once

#include <jointdiag/core/math.hpp>

namespace jd {
  // Return the orthogonal (unitary) matrix nearest to A in the Frobenius norm,
  // through its polar factor: given A = W S V^H, returns W V^H. For a 
  // rectangular A, the result has orthonormal columns (rows if A is wide)
  template <typename T>
  MatX<T> nearest_orthogonal(const MatX<T> &A);

  // Test if A^H A is the identity up to an absolute tolerance
  template <typename T>
  bool is_orthogonal(const MatX<T> &A, real_t<T> tol = 1e-8);
} // namespace jd
