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
#include <jointdiag/core/whitening.hpp>
#include <memory>
#include <optional>
#include <vector>

namespace jd {
  // Terminal and intermediate states of the OJoB iteration
  enum class OJoBState {
    eInitializing,
    eIterating,
    eConverged,
    eDiverged,
    eMaxIterReached
  };
  
  template <typename T>
  struct OJoBInfo {
    // Objective and constraint
    bool full_model = false; // Also diagonalize within-group terms i == j
    bool pre_white  = false; // Whiten (and reduce) each group first; generalized CCA instead of MCA
    bool sort       = true;  // Resolve column order and sign ambiguity of the solution

    // Opt-in normalization of the covariance array, performed once on a copy
    bool                                    trace_normalize = false;
    std::shared_ptr<const WeightFunction<T>> weights;        // Weighting strategy; none if nullptr

    // Pre-whitening subspace selection, used if pre_white is set
    WhiteningInfo whitening;
    
    // Optional starting transforms, one square matrix per group
    std::optional<std::vector<MatX<T>>> init;

    // Stopping criteria and reporting
    std::optional<real_t<T>> tol;       // Defaults to sqrt(eps)
    uint                     max_iters = 1000;
    bool                     verbose   = false;
  };

  // Iteration state; created at loop entry, updated once per sweep
  template <typename T>
  struct OJoBConvergence {
    uint      iter      = 0;
    real_t<T> conv      = 1;  // Relative change of the sweep metric
    real_t<T> curr      = 0;  // Sweep metric of the current sweep
    real_t<T> prev      = 0;  // Sweep metric of the previous sweep
    real_t<T> tol;
    uint      max_iters;
    bool      converged = false;
    bool      diverged  = false;
    OJoBState state     = OJoBState::eInitializing;

  public:
    // Record the sweep metric of a completed sweep and advance the state
    void update(real_t<T> sweep_metric);
  };

  // Per-invocation scratch buffers, reused across sweeps and columns
  template <typename T>
  struct OJoBWorkspace {
    std::vector<MatX<T>> R;     // Per-column accumulator matrices, n x n each
    MatX<T>              Omega; // Trial-stacked projection buffer, n x k
    
  public:
    OJoBWorkspace(uint n, uint k)
    : R(n, MatX<T>::Zero(n, n)), Omega(MatX<T>::Zero(n, k)) { }
  };

  // Return value for solve(CovarianceArray, OJoBInfo)
  template <typename T>
  struct OJoBResult {
    std::vector<MatX<T>>      U;          // Forward transforms, one per group
    std::vector<MatX<T>>      V;          // Left-inverse transforms, one per group
    RVecX<T>                  lambda;     // Diagonal averages, explained joint covariance
    uint                      iterations; // Number of completed sweeps
    real_t<T>                 conv;       // Final relative change
    bool                      converged;
    bool                      diverged;
    OJoBState                 state;
    std::vector<Whitening<T>> whitening;  // Pre-whitening transforms; empty if unused
  };

  // Run the OJoB solver on a k x m x m covariance array, seeking m transforms
  // U_i that maximize the squared diagonals of U_i^H C(k, i, j) U_j
  template <typename T>
  OJoBResult<T> solve(const CovarianceArray<T> &C, const OJoBInfo<T> &info = {});

  // Validate problem dimensions and solver settings, throwing InvalidConfiguration;
  // called by solve(...) before any computation
  template <typename T>
  void validate(const CovarianceArray<T> &C, const OJoBInfo<T> &info);
} // namespace jd
