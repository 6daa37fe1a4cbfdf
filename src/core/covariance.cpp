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

#include <jointdiag/core/covariance.hpp>
#include <jointdiag/core/ranges.hpp>
#include <algorithm>

namespace jd {
  namespace detail {
    // Center and orient a data matrix s.t. samples are along rows (t x n)
    template <typename T>
    MatX<T> prepare_data(const MatX<T>                &X,
                         const CrossCovarianceInfo<T> &info,
                         uint                          group) {
      using Info = CrossCovarianceInfo<T>;
      
      MatX<T> Y = info.dims == Info::Dims::eRows ? X : MatX<T>(X.transpose());
      switch (info.mean) {
        case Info::Mean::eNone:
          break;
        case Info::Mean::eSample:
          Y.rowwise() -= Y.colwise().mean();
          break;
        case Info::Mean::eProvided:
          debug::check_config(group < info.provided_mean.size(),
            fmt::format("no mean provided for group {}", group));
          debug::check_config(info.provided_mean[group].size() == Y.cols(),
            fmt::format("provided mean for group {} has {} entries, expected {}", 
              group, info.provided_mean[group].size(), Y.cols()));
          Y.rowwise() -= info.provided_mean[group].transpose();
          break;
      }
      return Y;
    }
  } // namespace detail

  template <typename T>
  CovarianceArray<T> CovarianceArray<T>::from_trials(std::span<const MatX<T>> covs) {
    jd_trace();
    CovarianceArray<T> C(static_cast<uint>(covs.size()), 1);
    for (uint k = 0; k < covs.size(); ++k)
      C.set(k, 0, 0, covs[k]);
    return C;
  }

  template <typename T>
  CovarianceArray<T> CovarianceArray<T>::from_blocks(const std::vector<std::vector<MatX<T>>> &blocks) {
    jd_trace();
    uint m = static_cast<uint>(blocks.size());
    CovarianceArray<T> C(1, m);
    for (uint i = 0; i < m; ++i) {
      debug::check_config(blocks[i].size() == m,
        fmt::format("block row {} holds {} blocks, expected {}", i, blocks[i].size(), m));
      for (uint j = i; j < m; ++j)
        C.set(0, i, j, blocks[i][j]);
    }
    return C;
  }

  template <typename T>
  bool CovarianceArray<T>::has_uniform_dims() const {
    guard(m_groups > 0, true);
    for (uint i = 1; i < m_groups; ++i)
      guard(dims(i) == dims(0), false);
    return true;
  }
  
  template <typename T>
  void CovarianceArray<T>::set(uint k, uint i, uint j, const MatX<T> &C) {
    if (i == j) {
      m_data[index(k, i, i)] = hermitian(C);
    } else {
      m_data[index(k, i, j)] = C;
      m_data[index(k, j, i)] = C.adjoint();
    }
  }
  
  template <typename T>
  MatX<T> CovarianceArray<T>::mean_within(uint i) const {
    jd_trace();
    MatX<T> C = MatX<T>::Zero(dims(i), dims(i));
    for (uint k = 0; k < m_trials; ++k)
      C += (*this)(k, i, i);
    return hermitian<T>(C / static_cast<real_t<T>>(m_trials));
  }

  template <typename T>
  MatX<T> CovarianceArray<T>::mean_within() const {
    jd_trace();
    debug::check_config(has_uniform_dims(), 
      "averaging within-group covariances requires groups of equal dimension");
    MatX<T> C = MatX<T>::Zero(dims(0), dims(0));
    for (uint k = 0; k < m_trials; ++k)
      for (uint i = 0; i < m_groups; ++i)
        C += (*this)(k, i, i);
    return hermitian<T>(C / static_cast<real_t<T>>(m_trials * m_groups));
  }
  
  template <typename T>
  void CovarianceArray<T>::validate() const {
    jd_trace();
    debug::check_config(m_trials > 0 && m_groups > 0, 
      fmt::format("covariance array must hold at least one trial and group, has k = {}, m = {}",
        m_trials, m_groups));
    debug::check_config(m_data.size() == static_cast<size_t>(m_trials) * m_groups * m_groups,
      "covariance array holds an unexpected number of blocks");
    
    for (uint k = 0; k < m_trials; ++k) {
      for (uint i = 0; i < m_groups; ++i) {
        const auto &C = (*this)(k, i, i);
        debug::check_config(C.rows() > 0 && C.rows() == C.cols(),
          fmt::format("within-group block ({}, {}, {}) must be square and non-empty, is {} x {}", 
            k, i, i, C.rows(), C.cols()));
        debug::check_config(C.rows() == dims(i),
          fmt::format("block ({}, {}, {}) has {} rows, expected {}", k, i, i, C.rows(), dims(i)));
      }
      for (uint i = 0; i < m_groups; ++i) {
        for (uint j = 0; j < m_groups; ++j) {
          guard_continue(i != j);
          const auto &C = (*this)(k, i, j);
          debug::check_config(C.rows() == dims(i) && C.cols() == dims(j),
            fmt::format("block ({}, {}, {}) is {} x {}, expected {} x {}", 
              k, i, j, C.rows(), C.cols(), dims(i), dims(j)));
        }
      }
    }
  }
  
  template <typename T>
  void normalize(CovarianceArray<T> &C, bool trace_normalize, const WeightFunction<T> *weights) {
    jd_trace();
    guard(trace_normalize || weights);

    uint k = C.trials(), m = C.groups();

    // Per-block scaling factors s_ki; block (k, i, j) is scaled by s_ki * s_kj
    eig::Matrix<real_t<T>, eig::Dynamic, eig::Dynamic> s 
      = eig::Matrix<real_t<T>, eig::Dynamic, eig::Dynamic>::Ones(k, m);
    
    if (trace_normalize) {
      for (uint t = 0; t < k; ++t) {
        for (uint i = 0; i < m; ++i) {
          real_t<T> tr = eig::numext::real(C(t, i, i).trace());
          debug::check_numeric(tr > real_t<T>(0), 
            fmt::format("block ({}, {}, {}) has non-positive trace, cannot normalize", t, i, i));
          s(t, i) = real_t<T>(1) / std::sqrt(tr);
        }
      }
    }
    
    if (weights) {
      for (uint t = 0; t < k; ++t) {
        for (uint i = 0; i < m; ++i) {
          // Weight is evaluated on the trace-normalized block
          MatX<T> Ci = C(t, i, i) * (s(t, i) * s(t, i));
          real_t<T> w = weights->eval(t, i, Ci);
          debug::check_config(w >= real_t<T>(0), 
            fmt::format("weight for trial {}, group {} is negative", t, i));
          s(t, i) *= std::sqrt(w);
        }
      }
    }

    for (uint t = 0; t < k; ++t)
      for (uint i = 0; i < m; ++i)
        for (uint j = 0; j < m; ++j)
          C(t, i, j) *= s(t, i) * s(t, j);
  }
  
  template <typename T>
  MatX<T> covariance(const MatX<T> &X, const CrossCovarianceInfo<T> &info) {
    jd_trace();
    MatX<T> Y = detail::prepare_data(X, info, 0);
    debug::check_config(Y.rows() > 0, "data matrix holds no samples");
    return hermitian<T>((Y.adjoint() * Y) / static_cast<real_t<T>>(Y.rows()));
  }

  template <typename T>
  CovarianceArray<T> cross_covariance(const std::vector<std::vector<MatX<T>>> &data,
                                      const CrossCovarianceInfo<T>            &info) {
    jd_trace();

    uint k = static_cast<uint>(data.size());
    debug::check_config(k > 0, "no trials provided");
    uint m = static_cast<uint>(data[0].size());
    debug::check_config(m > 0, "no groups provided");
    debug::check_config(rng::all_of(data, [m](const auto &d) { return d.size() == m; }),
      "every trial must provide one data matrix per group");

    // Center and orient all data first
    std::vector<std::vector<MatX<T>>> Y(k, std::vector<MatX<T>>(m));
    for (uint t = 0; t < k; ++t)
      for (uint i = 0; i < m; ++i)
        Y[t][i] = detail::prepare_data(data[t][i], info, i);

    CovarianceArray<T> C(k, m);
    for (uint t = 0; t < k; ++t) {
      eig::Index n_samples = Y[t][0].rows();
      debug::check_config(n_samples > 0, fmt::format("trial {} holds no samples", t));
      for (uint i = 0; i < m; ++i) {
        debug::check_config(Y[t][i].rows() == n_samples,
          fmt::format("data matrices of trial {} differ in sample count", t));
        for (uint j = i; j < m; ++j)
          C.set(t, i, j, (Y[t][i].adjoint() * Y[t][j]) / static_cast<real_t<T>>(n_samples));
      }
    }
    return C;
  }

  /* Explicit template instantiations for real and complex working precision */

  template class CovarianceArray<double>;
  template class CovarianceArray<cdouble>;

  template void normalize<double>(CovarianceArray<double> &, bool, const WeightFunction<double> *);
  template void normalize<cdouble>(CovarianceArray<cdouble> &, bool, const WeightFunction<cdouble> *);

  template MatX<double>  covariance<double>(const MatX<double> &, const CrossCovarianceInfo<double> &);
  template MatX<cdouble> covariance<cdouble>(const MatX<cdouble> &, const CrossCovarianceInfo<cdouble> &);

  template CovarianceArray<double> 
  cross_covariance<double>(const std::vector<std::vector<MatX<double>>> &, const CrossCovarianceInfo<double> &);
  template CovarianceArray<cdouble> 
  cross_covariance<cdouble>(const std::vector<std::vector<MatX<cdouble>>> &, const CrossCovarianceInfo<cdouble> &);
} // namespace jd
