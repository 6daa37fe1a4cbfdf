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

#include <jointdiag/core/math.hpp>
#include <jointdiag/core/utility.hpp>
#include <functional>
#include <span>
#include <vector>

namespace jd {
  /**
   * Three-index collection of covariance and cross-covariance matrices,
   * indexed by trial k and group pair (i, j). Block (k, i, j) is an 
   * n_i x n_j matrix, and block (k, j, i) is its conjugate transpose.
   */
  template <typename T>
  class CovarianceArray {
    uint                 m_trials = 0;
    uint                 m_groups = 0;
    std::vector<MatX<T>> m_data;

    size_t index(uint k, uint i, uint j) const {
      return (static_cast<size_t>(k) * m_groups + i) * m_groups + j;
    }

  public:
    CovarianceArray() = default;
    CovarianceArray(uint trials, uint groups)
    : m_trials(trials), m_groups(groups), m_data(static_cast<size_t>(trials) * groups * groups) { }

    // Build a single-group array from k covariance matrices
    static CovarianceArray from_trials(std::span<const MatX<T>> covs);

    // Build a single-trial array from an m x m block layout, blocks[i][j]
    static CovarianceArray from_blocks(const std::vector<std::vector<MatX<T>>> &blocks);

    uint trials() const { return m_trials; }
    uint groups() const { return m_groups; }
    
    // Row dimension of group i, taken from its first within-group block
    uint dims(uint i) const { return static_cast<uint>(m_data[index(0, i, i)].rows()); }

    // Returns true if every group has the same dimension
    bool has_uniform_dims() const;

          MatX<T> &operator()(uint k, uint i, uint j)       { return m_data[index(k, i, j)]; }
    const MatX<T> &operator()(uint k, uint i, uint j) const { return m_data[index(k, i, j)]; }

    // Store block (k, i, j) and its conjugate transpose at (k, j, i);
    // within-group blocks are stored as their Hermitian part
    void set(uint k, uint i, uint j, const MatX<T> &C);

    // Trial-average of within-group block (i, i)
    MatX<T> mean_within(uint i) const;

    // Trial- and group-average of within-group blocks; requires uniform dims
    MatX<T> mean_within() const;

    // Throw InvalidConfiguration if sizes or block shapes are inconsistent
    void validate() const;
  };

  /* Weighting strategies for covariance normalization */

  // Evaluates a non-negative weight for within-group block (trial, group)
  template <typename T>
  class WeightFunction {
  public:
    virtual ~WeightFunction() = default;
    virtual real_t<T> eval(uint trial, uint group, const MatX<T> &C) const = 0;
  };

  // Default strategy; applies no weighting
  template <typename T>
  class UnitWeight : public WeightFunction<T> {
  public:
    real_t<T> eval(uint, uint, const MatX<T> &) const override {
      return real_t<T>(1);
    }
  };

  // Fixed weight per trial, shared by all groups of that trial
  template <typename T>
  class TrialWeights : public WeightFunction<T> {
    std::vector<real_t<T>> m_weights;

  public:
    TrialWeights(std::vector<real_t<T>> weights)
    : m_weights(std::move(weights)) { }

    real_t<T> eval(uint trial, uint, const MatX<T> &) const override {
      debug::check_config(trial < m_weights.size(), 
        fmt::format("no weight provided for trial {}", trial));
      return m_weights[trial];
    }
  };

  // Weight computed from the block itself through a callable, e.g. its trace
  template <typename T>
  class FunctionWeight : public WeightFunction<T> {
  public:
    using Capture = std::function<real_t<T> (const MatX<T> &)>;

  private:
    Capture m_f;

  public:
    FunctionWeight(Capture f)
    : m_f(std::move(f)) { }

    real_t<T> eval(uint, uint, const MatX<T> &C) const override {
      return m_f(C);
    }
  };

  // Scale the array in place, once, before solving; 
  // if trace_normalize, every block (k, i, j) is divided by sqrt(tr C_kii * tr C_kjj),
  // then, if weights are given, multiplied by sqrt(w_ki * w_kj)
  template <typename T>
  void normalize(CovarianceArray<T> &C, bool trace_normalize, const WeightFunction<T> *weights = nullptr);

  /* Sample (cross-)covariance estimation from data matrices */

  template <typename T>
  struct CrossCovarianceInfo {
    // Layout of a data matrix
    enum class Dims {
      eRows, // Samples along rows, variables along columns (t x n)
      eCols  // Samples along columns, variables along rows (n x t)
    };

    // Centering applied to data before estimation
    enum class Mean {
      eNone,     // Data is assumed centered
      eSample,   // Subtract each data matrix's sample mean
      eProvided  // Subtract the provided per-group mean
    };

  public:
    Dims              dims = Dims::eRows;
    Mean              mean = Mean::eNone;
    std::vector<VecX<T>> provided_mean; // One mean vector per group, for Mean::eProvided
  };

  // Estimate covariances for data[k][i], the data matrix of trial k and group i
  template <typename T>
  CovarianceArray<T> cross_covariance(const std::vector<std::vector<MatX<T>>> &data,
                                      const CrossCovarianceInfo<T>            &info = {});

  // Estimate the covariance matrix of a single data matrix
  template <typename T>
  MatX<T> covariance(const MatX<T> &X, const CrossCovarianceInfo<T> &info = {});
} // namespace jd
