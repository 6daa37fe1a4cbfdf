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

#include <jointdiag/core/whitening.hpp>
#include <jointdiag/core/ranges.hpp>
#include <jointdiag/core/utility.hpp>
#include <algorithm>
#include <execution>
#include <numeric>

namespace jd {
  eig::VectorXd accumulated_eigenvalues(const eig::VectorXd &eigenvalues) {
    jd_trace();

    eig::VectorXd arev = eigenvalues.cwiseMax(0.0);
    double sum = arev.sum();
    debug::check_numeric(sum > 0.0, "spectrum holds no positive eigenvalues");

    arev /= sum;
    std::partial_sum(range_iter(arev), arev.begin());
    return arev;
  }

  uint select_subspace(const eig::VectorXd &arev, const WhiteningInfo &info) {
    uint n = static_cast<uint>(arev.size());
    debug::check_config(n > 0, "cannot select a subspace of an empty spectrum");

    return info.subspace | visit {
      [n](uint p) { return std::clamp(p, 1u, n); },
      [&](double f) {
        debug::check_config(f > 0.0 && f <= 1.0,
          fmt::format("explained variance must lie in (0, 1], is {}", f));
        
        uint p;
        if (info.method == SubspaceMethod::eFirstAbove) {
          auto it = std::find_if(range_iter(arev), [f](double a) { return a >= f; });
          p = static_cast<uint>(std::distance(arev.begin(), it)) + 1;
        } else {
          p = static_cast<uint>(std::count_if(range_iter(arev), [f](double a) { return a <= f; }));
        }

        // Accumulation may fall just short of 1.0, so clamp to the full space
        return std::clamp(p, 1u, n);
      }
    };
  }

  template <typename T>
  Whitening<T> whitening(const MatX<T> &C, const WhiteningInfo &info) {
    jd_trace();
    debug::check_config(C.rows() > 0 && C.rows() == C.cols(),
      fmt::format("whitening requires a square matrix, is {} x {}", C.rows(), C.cols()));
    
    eig::SelfAdjointEigenSolver<MatX<T>> solver(C);
    debug::check_numeric(solver.info() == eig::Success, 
      "hermitian eigendecomposition failed in whitening(...)");

    // Eigen returns an ascending order, flip to descending
    eig::VectorXd lambda = solver.eigenvalues().reverse();
    MatX<T>       E      = solver.eigenvectors().rowwise().reverse();

    Whitening<T> W;
    W.arev = accumulated_eigenvalues(lambda);
    W.p    = select_subspace(W.arev, info);
    
    auto lambda_p = lambda.head(W.p).eval();
    debug::check_numeric(lambda_p.minCoeff() > 0.0,
      fmt::format("retained subspace of dimension {} holds a non-positive eigenvalue ({})", 
        W.p, lambda_p.minCoeff()));

    // Closed-form whitening; F = E D^{-1/2}, iF = D^{1/2} E^H
    auto E_p = E.leftCols(W.p);
    W.F  = E_p * lambda_p.cwiseSqrt().cwiseInverse().template cast<T>().asDiagonal();
    W.iF = lambda_p.cwiseSqrt().template cast<T>().asDiagonal() * E_p.adjoint();

    return W;
  }
  
  template <typename T>
  std::vector<Whitening<T>> whitening(const CovarianceArray<T> &C, const WhiteningInfo &info) {
    jd_trace();

    // Determine the shared subspace dimension
    uint p = info.subspace | visit {
      [](uint p) { return p; },
      [&](double) {
        MatX<T> C_mean = C.mean_within();
        eig::SelfAdjointEigenSolver<MatX<T>> solver(C_mean, eig::EigenvaluesOnly);
        debug::check_numeric(solver.info() == eig::Success, 
          "hermitian eigendecomposition failed in whitening(...)");
        return select_subspace(accumulated_eigenvalues(solver.eigenvalues().reverse()), info);
      }
    };

    // Groups may differ in dimension; a requested dimension cannot exceed the smallest
    for (uint i = 0; i < C.groups(); ++i)
      p = std::min(p, C.dims(i));

    std::vector<Whitening<T>> W(C.groups());
    for (uint i = 0; i < C.groups(); ++i)
      W[i] = whitening(C.mean_within(i), { .subspace = p, .method = info.method });
    return W;
  }

  template <typename T>
  CovarianceArray<T> whiten(const CovarianceArray<T> &C, const std::vector<Whitening<T>> &W) {
    jd_trace();
    debug::check_config(W.size() == C.groups(), 
      fmt::format("{} whitening transforms given for {} groups", W.size(), C.groups()));

    uint m = C.groups();
    CovarianceArray<T> G(C.trials(), m);

    // Triple products are independent per trial
    auto trials = vws::iota(0u, C.trials()) | view_to<std::vector<uint>>();
    std::for_each(std::execution::par, range_iter(trials), [&](uint k) {
      for (uint i = 0; i < m; ++i)
        for (uint j = i; j < m; ++j)
          G.set(k, i, j, W[i].F.adjoint() * C(k, i, j) * W[j].F);
    });

    return G;
  }

  /* Explicit template instantiations for real and complex working precision */

  template Whitening<double>  whitening<double>(const MatX<double> &, const WhiteningInfo &);
  template Whitening<cdouble> whitening<cdouble>(const MatX<cdouble> &, const WhiteningInfo &);
  
  template std::vector<Whitening<double>> 
  whitening<double>(const CovarianceArray<double> &, const WhiteningInfo &);
  template std::vector<Whitening<cdouble>> 
  whitening<cdouble>(const CovarianceArray<cdouble> &, const WhiteningInfo &);
  
  template CovarianceArray<double>  
  whiten<double>(const CovarianceArray<double> &, const std::vector<Whitening<double>> &);
  template CovarianceArray<cdouble> 
  whiten<cdouble>(const CovarianceArray<cdouble> &, const std::vector<Whitening<cdouble>> &);
} // namespace jd
