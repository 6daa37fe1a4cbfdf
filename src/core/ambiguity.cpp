#include <jointdiag/core/ambiguity.hpp>
#include <jointdiag/core/utility.hpp>
#include <utility>

namespace jd {
  namespace detail {
    // Trial-average of diag(U_i^H C(k, i, j) U_j)
    template <typename T>
    VecX<T> mean_diagonal(const MatX<T> &Ui, const MatX<T> &Uj, const CovarianceArray<T> &C, uint i, uint j) {
      VecX<T> d = VecX<T>::Zero(Ui.cols());
      for (uint k = 0; k < C.trials(); ++k)
        d += diag_product<T>(Ui, C(k, i, j), Uj);
      return (d / static_cast<real_t<T>>(C.trials())).eval();
    }

    // All pairwise averaged diagonals, stored as D[i * m + j]
    template <typename T>
    void mean_diagonals(std::vector<VecX<T>> &D, const std::vector<MatX<T>> &U, const CovarianceArray<T> &C) {
      jd_trace();
      uint m = C.groups();
      for (uint i = 0; i < m; ++i)
        for (uint j = 0; j < m; ++j)
          D[i * m + j] = mean_diagonal<T>(U[i], U[j], C, i, j);
    }

    // Average over ordered pairs i != j
    template <typename T>
    RVecX<T> mean_cross_diagonal(const std::vector<VecX<T>> &D, uint m) {
      VecX<T> d = VecX<T>::Zero(D[0].size());
      for (uint i = 0; i < m; ++i)
        for (uint j = 0; j < m; ++j)
          if (i != j)
            d += D[i * m + j];
      return (d / static_cast<real_t<T>>(m * (m - 1))).real().eval();
    }
  } // namespace detail
  
  template <typename T>
  RVecX<T> resolve_permutation(MatX<T> &U, const CovarianceArray<T> &C) {
    jd_trace();
    
    // Diagonal of a Hermitian product is real
    RVecX<T> D = detail::mean_diagonal<T>(U, U, C, 0, 0).real();
    uint n = static_cast<uint>(D.size());
    
    for (uint e = 0; e < n; ++e) {
      // Find the position of the absolute maximum; strict comparison keeps the earliest
      uint      p     = e;
      real_t<T> max_v = 0;
      for (uint h = e; h < n; ++h) {
        if (real_t<T> a = std::abs(D[h]); a > max_v) {
          max_v = a;
          p     = h;
        }
      }
      guard_continue(p != e);

      // Bring the maximum from position p on top
      U.col(p).swap(U.col(e));
      std::swap(D[p], D[e]);
    }

    return D;
  }
  
  template <typename T>
  RVecX<T> resolve_scale_permutation(std::vector<MatX<T>> &U, const CovarianceArray<T> &C) {
    jd_trace();

    uint m = C.groups();
    uint n = static_cast<uint>(U[0].cols());
    
    std::vector<VecX<T>> D(m * m);
    detail::mean_diagonals<T>(D, U, C);

    for (uint e = 0; e < n; ++e) {
      // Find the position of the absolute maximum over all pairs i < j
      uint      bi = 0, bj = 0, bh = e;
      real_t<T> max_v = 0;
      for (uint i = 0; i < m - 1; ++i) {
        for (uint j = i + 1; j < m; ++j) {
          const auto &Dij = D[i * m + j];
          for (uint h = e; h < n; ++h) {
            if (real_t<T> a = std::abs(Dij[h]); a > max_v) {
              max_v = a;
              bi = i, bj = j, bh = h;
            }
          }
        }
      }
      
      // All remaining entries vanish; nothing left to order
      guard_break(max_v > real_t<T>(0));

      // Correct the phase of group j s.t. D_ij[h, h] becomes positive
      if (T s = unit_phase(D[bi * m + bj][bh]); s != T(1))
        U[bj].col(bh) *= s;
      
      // Propagate, using group i as the sign reference for every other group
      for (uint x = 0; x < m; ++x) {
        guard_continue(x != bi && x != bj);
        if (T s = unit_phase(D[bi * m + x][bh]); s != T(1))
          U[x].col(bh) *= s;
      }
      
      // Bring the maximum from position h on top, jointly for every group
      if (bh != e)
        for (auto &Ui : U)
          Ui.col(bh).swap(Ui.col(e));
      
      detail::mean_diagonals<T>(D, U, C);
    }

    return detail::mean_cross_diagonal<T>(D, m);
  }

  template <typename T>
  RVecX<T> diagonal_averages(const std::vector<MatX<T>> &U, const CovarianceArray<T> &C) {
    jd_trace();
    uint m = C.groups();
    if (m == 1)
      return detail::mean_diagonal<T>(U[0], U[0], C, 0, 0).real();

    std::vector<VecX<T>> D(m * m);
    detail::mean_diagonals<T>(D, U, C);
    return detail::mean_cross_diagonal<T>(D, m);
  }

  /* Explicit template instantiations for real and complex working precision */

  template RVecX<double>  resolve_permutation<double>(MatX<double> &, const CovarianceArray<double> &);
  template RVecX<cdouble> resolve_permutation<cdouble>(MatX<cdouble> &, const CovarianceArray<cdouble> &);
  
  template RVecX<double>  
  resolve_scale_permutation<double>(std::vector<MatX<double>> &, const CovarianceArray<double> &);
  template RVecX<cdouble> 
  resolve_scale_permutation<cdouble>(std::vector<MatX<cdouble>> &, const CovarianceArray<cdouble> &);
  
  template RVecX<double>  
  diagonal_averages<double>(const std::vector<MatX<double>> &, const CovarianceArray<double> &);
  template RVecX<cdouble> 
  diagonal_averages<cdouble>(const std::vector<MatX<cdouble>> &, const CovarianceArray<cdouble> &);
} // namespace jd
