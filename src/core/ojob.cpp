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

#include <jointdiag/core/ambiguity.hpp>
#include <jointdiag/core/ojob.hpp>
#include <jointdiag/core/orthogonal.hpp>
#include <jointdiag/core/ranges.hpp>
#include <jointdiag/core/utility.hpp>
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <execution>
#include <optional>
#include <variant>

namespace jd {
  namespace detail {
    // Below this nr. of trials, the projection buffer is filled sequentially
    constexpr static uint par_trials_threshold = 32;

    // Eigenvectors of the sum over trials, and over partner groups j, of G(k, i, j) G(k, i, j)^H;
    // partners exclude j == i unless there is a single group or the full model is requested
    template <typename T>
    std::vector<MatX<T>> init_transforms(const CovarianceArray<T> &G, bool full_model) {
      jd_trace();

      uint m = G.groups(), n = G.dims(0);
      std::vector<MatX<T>> U(m);
      for (uint i = 0; i < m; ++i) {
        MatX<T> S = MatX<T>::Zero(n, n);
        for (uint j = 0; j < m; ++j) {
          guard_continue(j != i || m == 1 || full_model);
          for (uint k = 0; k < G.trials(); ++k)
            S.noalias() += G(k, i, j) * G(k, i, j).adjoint();
        }

        eig::SelfAdjointEigenSolver<MatX<T>> solver(S);
        debug::check_numeric(solver.info() == eig::Success,
          fmt::format("hermitian eigendecomposition failed initializing group {}", i));
        U[i] = solver.eigenvectors();
      }
      return U;
    }

    // R += sum_k w_k w_k^H, with w_k = G(k, i, j) U_j[:, h] stored in column k of Omega
    template <typename T>
    void accumulate(OJoBWorkspace<T>        &ws,
                    const std::vector<uint> &trials,
                    const CovarianceArray<T> &G,
                    const MatX<T>            &Uj,
                    uint h, uint i, uint j) {
      auto project = [&](uint k) { ws.Omega.col(k).noalias() = G(k, i, j) * Uj.col(h); };
      if (trials.size() < par_trials_threshold)
        std::for_each(range_iter(trials), project);
      else
        std::for_each(std::execution::par, range_iter(trials), project);
      ws.R[h].noalias() += ws.Omega * ws.Omega.adjoint();
    }
  } // namespace detail

  template <typename T>
  void OJoBConvergence<T>::update(real_t<T> sweep_metric) {
    iter++;
    curr = sweep_metric;
    
    // The first sweep has no reference; force at least a second sweep
    conv = iter == 1 ? real_t<T>(1) : std::abs((curr - prev) / prev);

    // With the absolute relative change, only a non-finite metric can still signal divergence
    diverged  = !std::isfinite(conv) || conv < real_t<T>(0);
    converged = !diverged && conv <= tol;
    
    if (converged)
      state = OJoBState::eConverged;
    else if (diverged)
      state = OJoBState::eDiverged;
    else if (iter >= max_iters)
      state = OJoBState::eMaxIterReached;
    else
      state = OJoBState::eIterating;

    prev = curr;
  }

  template <typename T>
  void validate(const CovarianceArray<T> &C, const OJoBInfo<T> &info) {
    jd_trace();

    C.validate();
    debug::check_config(C.trials() >= 3 || C.groups() >= 2,
      fmt::format("either k must be at least 3 or m must be at least 2, have k = {}, m = {}",
        C.trials(), C.groups()));
    debug::check_config(!info.tol || *info.tol >= real_t<T>(0),
      "tolerance must be non-negative");
    debug::check_config(info.max_iters > 0, 
      "maximum number of iterations must be positive");
    
    if (info.pre_white) {
      info.whitening.subspace | visit {
        [](uint) { },
        [](double f) {
          debug::check_config(f > 0.0 && f <= 1.0,
            fmt::format("explained variance must lie in (0, 1], is {}", f));
        }
      };
    } else {
      debug::check_config(C.has_uniform_dims(), 
        "groups of different dimension require pre-whitening to a common subspace");
    }

    if (info.init) {
      const auto &init = *info.init;
      debug::check_config(init.size() == C.groups(),
        fmt::format("{} initial transforms given for {} groups", init.size(), C.groups()));
      
      // Working dimension is known up front, unless a variance fraction selects it during whitening
      std::optional<uint> n;
      if (!info.pre_white) {
        n = C.dims(0);
      } else if (std::holds_alternative<uint>(info.whitening.subspace)) {
        uint p = std::max(std::get<uint>(info.whitening.subspace), 1u);
        for (uint i = 0; i < C.groups(); ++i)
          p = std::min(p, C.dims(i));
        n = p;
      }
      
      for (uint i = 0; i < init.size(); ++i) {
        debug::check_config(init[i].rows() == init[i].cols(),
          fmt::format("initial transform {} must be square, is {} x {}", i, init[i].rows(), init[i].cols()));
        guard_continue(n);
        debug::check_config(init[i].rows() == *n,
          fmt::format("initial transform {} is {} x {}, expected {} x {}", 
            i, init[i].rows(), init[i].cols(), *n, *n));
      }
    }
  }

  template <typename T>
  OJoBResult<T> solve(const CovarianceArray<T> &C_, const OJoBInfo<T> &info) {
    jd_trace();

    validate(C_, info);
    
    uint k = C_.trials(), m = C_.groups();

    // Optional normalization, performed on a copy
    CovarianceArray<T> C_normalized;
    if (info.trace_normalize || info.weights) {
      C_normalized = C_;
      normalize(C_normalized, info.trace_normalize, info.weights.get());
    }
    const auto &C = (info.trace_normalize || info.weights) ? C_normalized : C_;
    
    OJoBResult<T> result;

    // Optional pre-whitening; the solver then operates on G(k, i, j) = F_i^H C(k, i, j) F_j
    CovarianceArray<T> C_whitened;
    if (info.pre_white) {
      result.whitening = whitening(C, info.whitening);
      C_whitened       = whiten(C, result.whitening);
    }
    const auto &G = info.pre_white ? C_whitened : C;
    uint n = G.dims(0);
    
    // Starting transforms, caller-seeded or default; shapes are checked here only
    // if a variance fraction determined the working dimension
    std::vector<MatX<T>> U;
    if (info.init) {
      U = *info.init;
      for (uint i = 0; i < m; ++i)
        debug::check_config(U[i].rows() == n && U[i].cols() == n,
          fmt::format("initial transform {} is {} x {}, expected {} x {}", i, U[i].rows(), U[i].cols(), n, n));
    } else {
      U = detail::init_transforms(G, info.full_model);
    }

    OJoBWorkspace<T>   ws(n, k);
    OJoBConvergence<T> cs = { .tol = info.tol.value_or(default_tolerance<T>()), .max_iters = info.max_iters };
    auto trials = vws::iota(0u, k) | view_to<std::vector<uint>>();

    if (info.verbose)
      fmt::print("Iterating OJoB algorithm...\n");
    
    cs.state = OJoBState::eIterating;
    while (cs.state == OJoBState::eIterating) {
      jd_trace_n("ojob_sweep");

      // Groups are updated in order, each seeing the already-updated earlier groups
      real_t<T> sweep_metric = 0;
      for (uint i = 0; i < m; ++i) {
        for (uint h = 0; h < n; ++h) {
          ws.R[h].setZero();
          for (uint j = 0; j < m; ++j) {
            guard_continue(j != i);
            detail::accumulate(ws, trials, G, U[j], h, i, j);
          }
          if (m == 1 || info.full_model)
            detail::accumulate(ws, trials, G, U[i], h, i, i);

          // Power iteration step
          U[i].col(h) = ws.R[h] * U[i].col(h);
        }
        sweep_metric += U[i].squaredNorm() / static_cast<real_t<T>>(n);

        // Force orthogonality through the polar factor
        U[i] = nearest_orthogonal(U[i]);
      }
      cs.update(std::sqrt(sweep_metric / static_cast<real_t<T>>(m)));
      
      if (info.verbose)
        fmt::print("iteration: {}; convergence: {}\n", cs.iter, cs.conv);
      jd_trace_frame();
    }
    
    // Soft failures are reported, but the current solution is still returned
    if (cs.diverged)
      fmt::print(stderr, "Warning: OJoB diverged at iteration {}\n", cs.iter);
    if (cs.state == OJoBState::eMaxIterReached)
      fmt::print(stderr, "Warning: OJoB reached the max number of iterations ({}) before convergence\n", cs.iter);
    if (info.verbose) {
      if (cs.converged)
        fmt::print("Convergence has been attained.\n\n");
      else
        fmt::print("Convergence has not been attained.\n\n");
    }

    // Resolve ambiguity in the whitened space
    if (info.sort)
      result.lambda = m == 1 ? resolve_permutation(U[0], G) : resolve_scale_permutation(U, G);
    else
      result.lambda = diagonal_averages(U, G);

    // Assemble forward and left-inverse transforms in the original space
    result.V.resize(m);
    if (info.pre_white) {
      for (uint i = 0; i < m; ++i) {
        result.V[i] = U[i].adjoint() * result.whitening[i].iF;
        U[i]        = (result.whitening[i].F * U[i]).eval();
      }
    } else {
      for (uint i = 0; i < m; ++i)
        result.V[i] = U[i].adjoint();
    }
    
    result.U          = std::move(U);
    result.iterations = cs.iter;
    result.conv       = cs.conv;
    result.converged  = cs.converged;
    result.diverged   = cs.diverged;
    result.state      = cs.state;
    return result;
  }

  /* Explicit template instantiations for real and complex working precision */

  template struct OJoBConvergence<double>;
  template struct OJoBConvergence<cdouble>;

  template void validate<double>(const CovarianceArray<double> &, const OJoBInfo<double> &);
  template void validate<cdouble>(const CovarianceArray<cdouble> &, const OJoBInfo<cdouble> &);

  template OJoBResult<double>  solve<double>(const CovarianceArray<double> &, const OJoBInfo<double> &);
  template OJoBResult<cdouble> solve<cdouble>(const CovarianceArray<cdouble> &, const OJoBInfo<cdouble> &);
} // namespace jd
