#include <jointdiag/core/orthogonal.hpp>
#include <jointdiag/core/utility.hpp>

namespace jd {
  template <typename T>
  MatX<T> nearest_orthogonal(const MatX<T> &A) {
    jd_trace();
    
    eig::JacobiSVD<MatX<T>> svd(A, eig::ComputeThinU | eig::ComputeThinV);
    debug::check_numeric(svd.info() == eig::Success, 
      "singular value decomposition failed in nearest_orthogonal(...)");
    
    // Discard singular values; W V^H is the polar factor
    return (svd.matrixU() * svd.matrixV().adjoint()).eval();
  }

  template <typename T>
  bool is_orthogonal(const MatX<T> &A, real_t<T> tol) {
    MatX<T> I = A.adjoint() * A;
    return (I - MatX<T>::Identity(I.rows(), I.cols())).cwiseAbs().maxCoeff() <= tol;
  }

  /* Explicit template instantiations for real and complex working precision */

  template MatX<double>  nearest_orthogonal<double>(const MatX<double> &);
  template MatX<cdouble> nearest_orthogonal<cdouble>(const MatX<cdouble> &);
  template bool is_orthogonal<double>(const MatX<double> &, double);
  template bool is_orthogonal<cdouble>(const MatX<cdouble> &, double);
} // namespace jd
