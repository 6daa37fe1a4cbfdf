#pragma once

#include <jointdiag/core/covariance.hpp>
#include <jointdiag/core/math.hpp>
#include <vector>

namespace jd {
  // Single-group ambiguity resolution. Columns of U are greedily reordered s.t. 
  // the trial-averaged diagonal of U^H C(k, 0, 0) U is non-increasing in absolute
  // value; signs are left untouched. Ties keep the earliest column. Returns the
  // reordered averaged diagonal.
  template <typename T>
  RVecX<T> resolve_permutation(MatX<T> &U, const CovarianceArray<T> &C);

  // Multi-group ambiguity resolution. For each output position e, the globally
  // largest |D_ij[h, h]| over pairs i < j and columns h >= e is found (ties keep 
  // the first in scan order i, j, h), the phase of column h is corrected in group j 
  // and in every other group x with respect to reference group i, and column h is 
  // moved to position e in every group. Returns the average over ordered pairs 
  // i != j of the final averaged diagonals. Only pairs (i, x) with the reference
  // group i are sign-corrected, so the result is non-negative and non-increasing
  // for two groups only; with more groups, pairs (j, x) may stay negative.
  template <typename T>
  RVecX<T> resolve_scale_permutation(std::vector<MatX<T>> &U, const CovarianceArray<T> &C);

  // Averaged diagonals without any reordering; the mean over trials of 
  // diag(U_i^H C(k, i, j) U_j), over i = j = 0 for a single group, and over 
  // ordered pairs i != j otherwise
  template <typename T>
  RVecX<T> diagonal_averages(const std::vector<MatX<T>> &U, const CovarianceArray<T> &C);
} // namespace jd
