// Copyright (C) 2024 Mark van de Ruit, Delft University of Technology.
// 
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
// 
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <jointdiag/core/covariance.hpp>
#include <jointdiag/core/math.hpp>
#include <variant>
#include <vector>

namespace jd {
  // Search strategy over accumulated regularized eigenvalues
  enum class SubspaceMethod {
    eFirstAbove, // First index whose accumulated value meets or exceeds the target
    eLastBelow   // Last index whose accumulated value does not exceed the target
  };

  struct WhiteningInfo {
    // Either an explained variance fraction in (0, 1], or an exact subspace dimension
    using Subspace = std::variant<double, uint>;

  public:
    Subspace       subspace = 0.999;
    SubspaceMethod method   = SubspaceMethod::eFirstAbove;
  };

  // Forward/inverse whitening factors of a covariance matrix C,
  // s.t. F^H C F = I_p and iF F = I_p
  template <typename T>
  struct Whitening {
    MatX<T>       F;    // n x p forward factor
    MatX<T>       iF;   // p x n left-inverse
    eig::VectorXd arev; // Accumulated regularized eigenvalues, descending order
    uint          p;    // Retained subspace dimension
  };

  // Normalize descending eigenvalues to unit sum and accumulate them;
  // negative eigenvalues are treated as zero
  eig::VectorXd accumulated_eigenvalues(const eig::VectorXd &eigenvalues);

  // Select a subspace dimension in [1, n] from accumulated eigenvalues
  uint select_subspace(const eig::VectorXd &arev, const WhiteningInfo &info);

  // Build the whitening factors of Hermitian matrix C
  template <typename T>
  Whitening<T> whitening(const MatX<T> &C, const WhiteningInfo &info = {});
  
  // Build per-group whitening factors of the trial-averaged within-group 
  // covariances of C; the same dimension p is enforced on every group. For
  // a variance fraction, p is selected on the trial- and group-averaged spectrum
  template <typename T>
  std::vector<Whitening<T>> whitening(const CovarianceArray<T> &C, const WhiteningInfo &info = {});

  // Return G(k, i, j) = F_i^H C(k, i, j) F_j
  template <typename T>
  CovarianceArray<T> whiten(const CovarianceArray<T> &C, const std::vector<Whitening<T>> &W);
} // namespace jd
