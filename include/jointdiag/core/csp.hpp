#pragma once

#include <jointdiag/core/math.hpp>
#include <jointdiag/core/whitening.hpp>
#include <span>

namespace jd {
  struct CSPInfo {
    WhiteningInfo whitening; // Subspace selection on Cx1 + Cx2
  };

  // Simultaneous diagonalization of two covariance matrices Cx1, Cx2, s.t.
  // F^H (Cx1 + Cx2) F = I, F^H Cx1 F = diag(D), and F^H Cx2 F = I - diag(D)
  template <typename T>
  struct CSPResult {
    MatX<T>       F;    // n x p forward transform
    MatX<T>       iF;   // p x n left-inverse
    eig::VectorXd D;    // Eigenvalues of the whitened Cx1, descending order
    eig::VectorXd arev; // Accumulated regularized eigenvalues of Cx1 + Cx2
    uint          p;    // Retained subspace dimension
  };

  template <typename T>
  CSPResult<T> csp(const MatX<T> &Cx1, const MatX<T> &Cx2, const CSPInfo &info = {});

  // Same as above, on the averages of two sets of covariance matrices
  template <typename T>
  CSPResult<T> csp(std::span<const MatX<T>> Cx1, std::span<const MatX<T>> Cx2, const CSPInfo &info = {});
} // namespace jd
