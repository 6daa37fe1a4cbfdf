#include <jointdiag/core/csp.hpp>
#include <jointdiag/core/utility.hpp>
#include <numeric>

namespace jd {
  namespace detail {
    template <typename T>
    MatX<T> mean_of(std::span<const MatX<T>> C) {
      debug::check_config(!C.empty(), "cannot average an empty set of covariance matrices");
      MatX<T> sum = std::accumulate(C.begin() + 1, C.end(), C.front(), 
        [](const MatX<T> &a, const MatX<T> &b) { return (a + b).eval(); });
      return hermitian<T>(sum / static_cast<real_t<T>>(C.size()));
    }
  } // namespace detail

  template <typename T>
  CSPResult<T> csp(const MatX<T> &Cx1, const MatX<T> &Cx2, const CSPInfo &info) {
    jd_trace();
    debug::check_config(Cx1.rows() == Cx2.rows() && Cx1.cols() == Cx2.cols(),
      fmt::format("csp(...) requires matrices of equal size, given {} x {} and {} x {}", 
        Cx1.rows(), Cx1.cols(), Cx2.rows(), Cx2.cols()));

    // Whiten the sum, then diagonalize the whitened first matrix
    Whitening<T> W = whitening(hermitian<T>(Cx1 + Cx2), info.whitening);
    MatX<T>      S = hermitian<T>(W.F.adjoint() * Cx1 * W.F);

    eig::SelfAdjointEigenSolver<MatX<T>> solver(S);
    debug::check_numeric(solver.info() == eig::Success, 
      "hermitian eigendecomposition failed in csp(...)");

    // Descending eigenvalue order
    MatX<T> U = solver.eigenvectors().rowwise().reverse();

    CSPResult<T> result;
    result.F    = W.F * U;
    result.iF   = U.adjoint() * W.iF;
    result.D    = solver.eigenvalues().reverse();
    result.arev = std::move(W.arev);
    result.p    = W.p;
    return result;
  }
  
  template <typename T>
  CSPResult<T> csp(std::span<const MatX<T>> Cx1, std::span<const MatX<T>> Cx2, const CSPInfo &info) {
    jd_trace();
    return csp<T>(detail::mean_of<T>(Cx1), detail::mean_of<T>(Cx2), info);
  }

  /* Explicit template instantiations for real and complex working precision */

  template CSPResult<double>  csp<double>(const MatX<double> &, const MatX<double> &, const CSPInfo &);
  template CSPResult<cdouble> csp<cdouble>(const MatX<cdouble> &, const MatX<cdouble> &, const CSPInfo &);
  template CSPResult<double>  
  csp<double>(std::span<const MatX<double>>, std::span<const MatX<double>>, const CSPInfo &);
  template CSPResult<cdouble> 
  csp<cdouble>(std::span<const MatX<cdouble>>, std::span<const MatX<cdouble>>, const CSPInfo &);
} // namespace jd
