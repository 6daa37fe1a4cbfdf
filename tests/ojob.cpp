#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <jointdiag/core/ambiguity.hpp>
#include <jointdiag/core/ojob.hpp>
#include <jointdiag/core/orthogonal.hpp>
#include <data.hpp>
#include <memory>

using namespace jd;

constexpr static double eps = 1e-8;

namespace {
  // k matrices Q diag(d_k) Q^H, exactly diagonalized by unitary Q
  template <typename T>
  std::vector<MatX<T>> diagonalizable_set(test::GaussianSampler<T> &sampler, const MatX<T> &Q, uint k) {
    std::vector<MatX<T>> C(k);
    for (uint i = 0; i < k; ++i) {
      eig::VectorXd d(Q.cols());
      for (uint j = 0; j < d.size(); ++j)
        d[j] = 1.0 + std::abs(eig::numext::real(sampler.next())) * static_cast<double>(j + 1);
      C[i] = Q * d.cast<T>().asDiagonal() * Q.adjoint();
    }
    return C;
  }
} // namespace

TEST_CASE("OJoB convergence tracking") {
  OJoBConvergence<double> cs = { .tol = 1e-3, .max_iters = 10 };

  SECTION("First sweep never converges") {
    cs.update(2.0);
    REQUIRE(cs.iter == 1);
    REQUIRE(cs.conv == 1.0);
    REQUIRE(cs.state == OJoBState::eIterating);
  } // SECTION

  SECTION("Small relative change converges") {
    cs.update(2.0);
    cs.update(2.001);
    REQUIRE(cs.iter == 2);
    REQUIRE_THAT(cs.conv, Catch::Matchers::WithinAbs(0.0005, 1e-12));
    REQUIRE(cs.converged);
    REQUIRE(cs.state == OJoBState::eConverged);
  } // SECTION
  
  SECTION("Non-finite metric diverges") {
    cs.update(0.0);
    cs.update(1.0);
    REQUIRE(cs.diverged);
    REQUIRE_FALSE(cs.converged);
    REQUIRE(cs.state == OJoBState::eDiverged);
  } // SECTION

  SECTION("Iteration cap") {
    for (uint i = 0; i < 10; ++i)
      cs.update(static_cast<double>(i + 1));
    REQUIRE(cs.iter == 10);
    REQUIRE(cs.state == OJoBState::eMaxIterReached);
  } // SECTION
}

TEST_CASE("OJoB configuration") {
  test::GaussianSampler<double> sampler(31);
  
  SECTION("Too few trials for a single group") {
    std::vector<MatX<double>> covs = { test::random_covariance(sampler, 3, 20), 
                                       test::random_covariance(sampler, 3, 20) };
    auto C = CovarianceArray<double>::from_trials(covs);
    REQUIRE_THROWS_AS(solve(C), InvalidConfiguration);
  } // SECTION

  SECTION("Negative tolerance") {
    auto C = test::correlated_covariances(sampler, 3, 2, 3, 30);
    REQUIRE_THROWS_AS(solve<double>(C, { .tol = -1.0 }), InvalidConfiguration);
  } // SECTION
  
  SECTION("Zero iterations") {
    auto C = test::correlated_covariances(sampler, 3, 2, 3, 30);
    REQUIRE_THROWS_AS(solve<double>(C, { .max_iters = 0 }), InvalidConfiguration);
  } // SECTION

  SECTION("Differing dimensions without pre-whitening") {
    CovarianceArray<double> C(3, 2);
    for (uint k = 0; k < 3; ++k) {
      C.set(k, 0, 0, test::random_covariance(sampler, 4, 30));
      C.set(k, 1, 1, test::random_covariance(sampler, 3, 30));
      C.set(k, 0, 1, sampler.next_matrix(4, 3));
    }
    REQUIRE_THROWS_AS(solve(C), InvalidConfiguration);
  } // SECTION

  SECTION("Out of range explained variance") {
    auto C = test::correlated_covariances(sampler, 3, 2, 3, 30);
    REQUIRE_THROWS_AS(solve<double>(C, { .pre_white = true, .whitening = { .subspace = 1.5 } }), 
                      InvalidConfiguration);
  } // SECTION

  SECTION("Initial transforms must match the problem") {
    auto C = test::correlated_covariances(sampler, 3, 2, 3, 30);
    
    OJoBInfo<double> info;
    info.init = std::vector<MatX<double>> { MatX<double>::Identity(3, 3) };
    REQUIRE_THROWS_AS(solve(C, info), InvalidConfiguration);
    
    info.init = std::vector<MatX<double>> { MatX<double>::Identity(3, 3), MatX<double>::Identity(2, 2) };
    REQUIRE_THROWS_AS(validate(C, info), InvalidConfiguration);
    REQUIRE_THROWS_AS(solve(C, info), InvalidConfiguration);

    info.init = std::vector<MatX<double>> { MatX<double>::Identity(3, 3), MatX<double>::Zero(3, 2) };
    REQUIRE_THROWS_AS(validate(C, info), InvalidConfiguration);

    info.init = std::vector<MatX<double>> { MatX<double>::Identity(3, 3), MatX<double>::Identity(3, 3) };
    REQUIRE_NOTHROW(validate(C, info));
  } // SECTION

  SECTION("Initial transforms must match an explicit whitening dimension") {
    auto C = test::correlated_covariances(sampler, 3, 2, 3, 30);

    OJoBInfo<double> info = { .pre_white = true, .whitening = { .subspace = 2u } };
    info.init = std::vector<MatX<double>> { MatX<double>::Identity(3, 3), MatX<double>::Identity(3, 3) };
    REQUIRE_THROWS_AS(validate(C, info), InvalidConfiguration);

    info.init = std::vector<MatX<double>> { MatX<double>::Identity(2, 2), MatX<double>::Identity(2, 2) };
    REQUIRE_NOTHROW(validate(C, info));
    
    // Requested dimensions beyond the smallest group are clamped
    info.whitening.subspace = 7u;
    info.init = std::vector<MatX<double>> { MatX<double>::Identity(3, 3), MatX<double>::Identity(3, 3) };
    REQUIRE_NOTHROW(validate(C, info));
  } // SECTION
}

TEST_CASE("OJoB single group") {
  SECTION("Exactly diagonalizable set") {
    test::GaussianSampler<double> sampler(41);
    MatX<double> Q = nearest_orthogonal<double>(sampler.next_matrix(4, 4));
    auto covs = diagonalizable_set(sampler, Q, 5);
    auto C    = CovarianceArray<double>::from_trials(covs);
    
    auto result = solve(C);
    REQUIRE(result.converged);
    REQUIRE(result.state == OJoBState::eConverged);
    REQUIRE(result.U.size() == 1);
    REQUIRE(result.V.size() == 1);
    REQUIRE(is_orthogonal(result.U[0]));
    REQUIRE(result.V[0].isApprox(result.U[0].transpose()));
    for (const auto &Ck : covs)
      REQUIRE(test::max_off_diagonal<double>(result.U[0].transpose() * Ck * result.U[0]) < eps);
    
    // Averaged diagonal is ordered by decreasing magnitude
    for (uint h = 1; h < result.lambda.size(); ++h)
      REQUIRE(std::abs(result.lambda[h - 1]) >= std::abs(result.lambda[h]));
  } // SECTION
  
  SECTION("Exactly diagonalizable complex set") {
    test::GaussianSampler<cdouble> sampler(42);
    MatX<cdouble> Q = nearest_orthogonal<cdouble>(sampler.next_matrix(4, 4));
    auto covs = diagonalizable_set(sampler, Q, 6);
    auto C    = CovarianceArray<cdouble>::from_trials(covs);

    auto result = solve(C);
    REQUIRE(result.converged);
    REQUIRE(is_orthogonal(result.U[0]));
    for (const auto &Ck : covs)
      REQUIRE(test::max_off_diagonal<cdouble>(result.U[0].adjoint() * Ck * result.U[0]) < eps);
  } // SECTION

  SECTION("Normalization keeps the joint diagonalizer") {
    test::GaussianSampler<double> sampler(43);
    MatX<double> Q = nearest_orthogonal<double>(sampler.next_matrix(5, 5));
    auto covs = diagonalizable_set(sampler, Q, 4);
    auto C    = CovarianceArray<double>::from_trials(covs);
    
    OJoBInfo<double> info = { 
      .trace_normalize = true, 
      .weights = std::make_shared<TrialWeights<double>>(std::vector<double> { 1.0, 2.0, 0.5, 3.0 }) 
    };
    auto result = solve(C, info);
    REQUIRE(is_orthogonal(result.U[0]));
    for (const auto &Ck : covs)
      REQUIRE(test::max_off_diagonal<double>(result.U[0].transpose() * Ck * result.U[0]) < 1e-6);
  } // SECTION

  SECTION("Random set is ordered by magnitude") {
    test::GaussianSampler<double> sampler(44);
    std::vector<MatX<double>> covs(10);
    for (auto &Ck : covs)
      Ck = test::random_covariance(sampler, 10, 50);
    
    auto result = solve(CovarianceArray<double>::from_trials(covs));
    REQUIRE(is_orthogonal(result.U[0]));
    REQUIRE(result.lambda.size() == 10);
    REQUIRE(result.conv >= 0.0);
    REQUIRE(result.iterations <= 1000);
    for (uint h = 1; h < result.lambda.size(); ++h)
      REQUIRE(std::abs(result.lambda[h - 1]) >= std::abs(result.lambda[h]));
  } // SECTION

  SECTION("Iteration cap is reported") {
    test::GaussianSampler<double> sampler(45);
    std::vector<MatX<double>> covs(4);
    for (auto &Ck : covs)
      Ck = test::random_covariance(sampler, 5, 30);
    
    auto result = solve<double>(CovarianceArray<double>::from_trials(covs), { .max_iters = 1 });
    REQUIRE(result.iterations == 1);
    REQUIRE_FALSE(result.converged);
    REQUIRE_FALSE(result.diverged);
    REQUIRE(result.state == OJoBState::eMaxIterReached);
    REQUIRE(is_orthogonal(result.U[0]));
  } // SECTION
  
  SECTION("Verbose progress reporting") {
    test::GaussianSampler<double> sampler(47);
    MatX<double> Q = nearest_orthogonal<double>(sampler.next_matrix(3, 3));
    auto C = CovarianceArray<double>::from_trials(diagonalizable_set(sampler, Q, 3));
    
    auto result = solve<double>(C, { .verbose = true });
    REQUIRE(result.converged);
  } // SECTION

  SECTION("Pre-whitening reduces and whitens") {
    test::GaussianSampler<double> sampler(46);
    std::vector<MatX<double>> covs(5);
    for (auto &Ck : covs)
      Ck = test::random_covariance(sampler, 6, 40);
    
    auto result = solve<double>(CovarianceArray<double>::from_trials(covs), 
      { .pre_white = true, .whitening = { .subspace = 4u } });
    REQUIRE(result.whitening.size() == 1);
    REQUIRE(result.U[0].rows() == 6);
    REQUIRE(result.U[0].cols() == 4);
    REQUIRE(result.V[0].rows() == 4);
    REQUIRE(result.V[0].cols() == 6);

    // Trial-averaged transformed covariance is the identity
    MatX<double> mean = MatX<double>::Zero(4, 4);
    for (const auto &Ck : covs)
      mean += result.U[0].transpose() * Ck * result.U[0];
    mean /= static_cast<double>(covs.size());
    REQUIRE((mean - MatX<double>::Identity(4, 4)).cwiseAbs().maxCoeff() < eps);
    REQUIRE((result.V[0] * result.U[0] - MatX<double>::Identity(4, 4)).cwiseAbs().maxCoeff() < eps);
  } // SECTION
}

TEST_CASE("OJoB multiple groups") {
  SECTION("Single trial reduces to the singular value decomposition") {
    test::GaussianSampler<double> sampler(51);
    MatX<double> C12 = sampler.next_matrix(4, 4);
    MatX<double> I   = MatX<double>::Identity(4, 4);
    auto C = CovarianceArray<double>::from_blocks({ { I, C12 }, { C12.transpose(), I } });

    auto result = solve(C);
    REQUIRE(result.converged);
    REQUIRE(result.U.size() == 2);
    REQUIRE(is_orthogonal(result.U[0]));
    REQUIRE(is_orthogonal(result.U[1]));

    MatX<double> D = result.U[0].transpose() * C12 * result.U[1];
    REQUIRE(test::max_off_diagonal<double>(D) < eps);

    eig::JacobiSVD<MatX<double>> svd(C12);
    for (uint h = 0; h < 4; ++h) {
      REQUIRE_THAT(result.lambda[h], Catch::Matchers::WithinAbs(svd.singularValues()[h], eps));
      REQUIRE_THAT(D(h, h), Catch::Matchers::WithinAbs(svd.singularValues()[h], eps));
    }
  } // SECTION

  SECTION("Two groups, real") {
    test::GaussianSampler<double> sampler(52);
    auto C = test::correlated_covariances(sampler, 4, 2, 4, 60);
    
    auto result = solve(C);
    for (uint i = 0; i < 2; ++i) {
      REQUIRE(is_orthogonal(result.U[i]));
      REQUIRE(result.V[i].isApprox(result.U[i].transpose()));
    }

    // Non-negative and non-increasing after sign and order resolution
    for (uint h = 0; h < result.lambda.size(); ++h)
      REQUIRE(result.lambda[h] >= 0.0);
    for (uint h = 1; h < result.lambda.size(); ++h)
      REQUIRE(result.lambda[h - 1] >= result.lambda[h]);
  } // SECTION
  
  SECTION("Two groups, complex") {
    test::GaussianSampler<cdouble> sampler(53);
    auto C = test::correlated_covariances(sampler, 4, 2, 3, 60);

    auto result = solve(C);
    for (uint i = 0; i < 2; ++i) {
      REQUIRE(is_orthogonal(result.U[i]));
      REQUIRE(result.V[i].isApprox(result.U[i].adjoint()));
    }
    for (uint h = 0; h < result.lambda.size(); ++h)
      REQUIRE(result.lambda[h] >= 0.0);
    for (uint h = 1; h < result.lambda.size(); ++h)
      REQUIRE(result.lambda[h - 1] >= result.lambda[h]);
  } // SECTION

  SECTION("Ten trials of ten variables, real") {
    test::GaussianSampler<double> sampler(58);
    auto C = test::correlated_covariances(sampler, 10, 2, 10, 50);

    auto result = solve(C);
    REQUIRE(result.U[0].rows() == 10);
    REQUIRE(result.U[1].cols() == 10);
    REQUIRE(is_orthogonal(result.U[0]));
    REQUIRE(is_orthogonal(result.U[1]));
    REQUIRE(result.conv >= 0.0);
    REQUIRE(result.iterations <= 1000);
  } // SECTION
  
  SECTION("Ten trials of ten variables, complex") {
    test::GaussianSampler<cdouble> sampler(59);
    auto C = test::correlated_covariances(sampler, 10, 2, 10, 50);

    auto result = solve(C);
    REQUIRE(is_orthogonal(result.U[0]));
    REQUIRE(is_orthogonal(result.U[1]));
    REQUIRE(result.V[1].isApprox(result.U[1].adjoint()));
  } // SECTION

  SECTION("Three groups with the full model") {
    test::GaussianSampler<double> sampler(54);
    auto C = test::correlated_covariances(sampler, 5, 3, 4, 60);
    
    auto result = solve<double>(C, { .full_model = true });
    REQUIRE(result.U.size() == 3);
    for (const auto &U : result.U)
      REQUIRE(is_orthogonal(U));
    REQUIRE(result.lambda.size() == 4);
  } // SECTION

  SECTION("Within-group terms are fit by the full model only") {
    // Cross blocks vanish; each group's within-group blocks share a diagonalizer
    test::GaussianSampler<double> sampler(60);
    std::vector<MatX<double>> Q = { nearest_orthogonal<double>(sampler.next_matrix(3, 3)), 
                                    nearest_orthogonal<double>(sampler.next_matrix(3, 3)) };
    auto within_0 = diagonalizable_set(sampler, Q[0], 3);
    auto within_1 = diagonalizable_set(sampler, Q[1], 3);

    CovarianceArray<double> C(3, 2);
    for (uint k = 0; k < 3; ++k) {
      C.set(k, 0, 0, within_0[k]);
      C.set(k, 1, 1, within_1[k]);
      C.set(k, 0, 1, MatX<double>::Zero(3, 3));
    }

    // Largest off-diagonal element over all transformed within-group blocks
    auto within_off_diagonal = [&C](const std::vector<MatX<double>> &U) {
      double v = 0.0;
      for (uint k = 0; k < C.trials(); ++k)
        for (uint i = 0; i < C.groups(); ++i)
          v = std::max(v, test::max_off_diagonal<double>(U[i].transpose() * C(k, i, i) * U[i]));
      return v;
    };
    
    auto full = solve<double>(C, { .full_model = true });
    REQUIRE(full.converged);
    REQUIRE(within_off_diagonal(full.U) < eps);
    
    OJoBInfo<double> info;
    info.init = std::vector<MatX<double>> { MatX<double>::Identity(3, 3), MatX<double>::Identity(3, 3) };
    auto cross = solve(C, info);
    REQUIRE(within_off_diagonal(cross.U) > 1e-3);
  } // SECTION

  SECTION("Groups update in sweep order") {
    test::GaussianSampler<double> sampler(61);
    MatX<double> C12 = sampler.next_matrix(3, 3);
    MatX<double> I   = MatX<double>::Identity(3, 3);
    auto C = CovarianceArray<double>::from_blocks({ { I, C12 }, { C12.transpose(), I } });

    std::vector<MatX<double>> U = { nearest_orthogonal<double>(sampler.next_matrix(3, 3)),
                                    nearest_orthogonal<double>(sampler.next_matrix(3, 3)) };
    
    // One power step per column of Ui against partner Uj, then the polar factor
    auto step = [](const MatX<double> &Ui, const MatX<double> &Cij, const MatX<double> &Uj) {
      MatX<double> X = Ui;
      for (uint h = 0; h < Ui.cols(); ++h) {
        eig::VectorXd w = Cij * Uj.col(h);
        X.col(h) = w * w.dot(Ui.col(h));
      }
      return nearest_orthogonal(X);
    };
    MatX<double> U0_next   = step(U[0], C12, U[1]);
    MatX<double> U1_next   = step(U[1], C12.transpose(), U0_next);
    MatX<double> U1_stale  = step(U[1], C12.transpose(), U[0]);
    
    OJoBInfo<double> info = { .sort = false, .max_iters = 1 };
    info.init = U;
    auto result = solve(C, info);
    REQUIRE(result.iterations == 1);
    REQUIRE((result.U[0] - U0_next).cwiseAbs().maxCoeff() < eps);
    
    // The second group sees the already-updated first group
    REQUIRE((result.U[1] - U1_next).cwiseAbs().maxCoeff() < eps);
    REQUIRE((result.U[1] - U1_stale).cwiseAbs().maxCoeff() > 1e-6);
  } // SECTION

  SECTION("Three groups, sorted") {
    test::GaussianSampler<double> sampler(62);
    auto C = test::correlated_covariances(sampler, 5, 3, 4, 60);

    auto result = solve(C);
    for (const auto &U : result.U)
      REQUIRE(is_orthogonal(U));

    // Trial-averaged diagonal element e of U_r^T C(k, r, x) U_x
    auto mean_cross = [&](uint r, uint x, uint e) {
      double d = 0.0;
      for (uint k = 0; k < C.trials(); ++k)
        d += (result.U[r].col(e).transpose() * C(k, r, x) * result.U[x].col(e)).value();
      return d / static_cast<double>(C.trials());
    };

    // Every resolved position has a reference group whose pairs are all non-negative
    for (uint e = 0; e < 4; ++e) {
      bool has_reference = false;
      for (uint r = 0; r < 3 && !has_reference; ++r) {
        bool non_negative = true;
        for (uint x = 0; x < 3; ++x)
          if (x != r)
            non_negative = non_negative && mean_cross(r, x, e) >= -1e-10;
        has_reference = non_negative;
      }
      REQUIRE(has_reference);
    }
  } // SECTION

  SECTION("Unsorted output reports plain diagonal averages") {
    test::GaussianSampler<double> sampler(55);
    auto C = test::correlated_covariances(sampler, 4, 3, 3, 60);

    auto result = solve<double>(C, { .sort = false });
    REQUIRE(result.lambda.isApprox(diagonal_averages(result.U, C)));
  } // SECTION

  SECTION("Pre-whitening groups of differing dimension") {
    test::GaussianSampler<double> sampler(56);
    std::vector<std::vector<MatX<double>>> data(4);
    for (auto &trial : data) {
      MatX<double> S = sampler.next_matrix(80, 3);
      trial = { S * sampler.next_matrix(3, 5) + sampler.next_matrix(80, 5) * 0.5,
                S * sampler.next_matrix(3, 3) + sampler.next_matrix(80, 3) * 0.5 };
    }
    auto C = cross_covariance(data);

    auto result = solve<double>(C, { .pre_white = true, .whitening = { .subspace = 3u } });
    REQUIRE(result.whitening.size() == 2);
    REQUIRE(result.U[0].rows() == 5);
    REQUIRE(result.U[0].cols() == 3);
    REQUIRE(result.U[1].rows() == 3);
    REQUIRE(result.U[1].cols() == 3);
    for (uint i = 0; i < 2; ++i) {
      REQUIRE((result.V[i] * result.U[i] - MatX<double>::Identity(3, 3)).cwiseAbs().maxCoeff() < eps);
      
      // Trial-averaged within-group transformed covariance is the identity
      MatX<double> mean = MatX<double>::Zero(3, 3);
      for (uint k = 0; k < C.trials(); ++k)
        mean += result.U[i].transpose() * C(k, i, i) * result.U[i];
      mean /= static_cast<double>(C.trials());
      REQUIRE((mean - MatX<double>::Identity(3, 3)).cwiseAbs().maxCoeff() < eps);
    }

    // A variance fraction is selected on the group-averaged spectrum, requiring equal dimensions
    REQUIRE_THROWS_AS(solve<double>(C, { .pre_white = true, .whitening = { .subspace = 0.9 } }),
                      InvalidConfiguration);
  } // SECTION

  SECTION("Caller-provided starting transforms") {
    test::GaussianSampler<double> sampler(57);
    MatX<double> C12 = sampler.next_matrix(3, 3);
    MatX<double> I   = MatX<double>::Identity(3, 3);
    auto C = CovarianceArray<double>::from_blocks({ { I, C12 }, { C12.transpose(), I } });

    OJoBInfo<double> info;
    info.init = std::vector<MatX<double>> { I, I };
    auto result = solve(C, info);
    REQUIRE(is_orthogonal(result.U[0]));
    REQUIRE(is_orthogonal(result.U[1]));
    REQUIRE(result.iterations >= 2);
  } // SECTION
}
