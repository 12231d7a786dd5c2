#include "data/synthetic.h"
#include "linear_model/coordinate_descent.h"
#include "optimization/objective.h"
#include "test/numerical_tests.h"
#include <cassert>
#include <cmath>
#include <climits>
#include <iostream>
#include <random>

using namespace lassolab;

Eigen::VectorXd least_squares(const Eigen::MatrixXd &A, const Eigen::VectorXd &b) {
  return A.colPivHouseholderQr().solve(b);
}

void test_converges_to_ols() {
  std::cout << "Testing lambda = 0 converges to OLS..." << std::endl;
  std::mt19937 gen(5);
  SyntheticProblem p = make_random_problem(60, 6, gen);
  Eigen::VectorXd beta_ols = least_squares(p.A, p.b);

  for (CoordinateSelection sel : {CoordinateSelection::Random, CoordinateSelection::Cyclic}) {
    CoordinateDescent cd;
    cd.lambda = 0.0;
    cd.max_iter = 3000;
    cd.selection = sel;
    std::mt19937 rng(1);
    LassoResult res = cd.fit(p.A, p.b, rng);

    double error = (res.coef - beta_ols).norm();
    std::cout << "  selection " << static_cast<int>(sel) << " error: " << error << std::endl;
    assert(error < 1e-6);
    assert(res.iterations == 3000);
  }
  std::cout << "[PASS] Coefficients match least squares." << std::endl;
}

void test_monotone_objective() {
  std::cout << "Testing objective is non-increasing..." << std::endl;
  std::mt19937 gen(8);
  SyntheticProblem p = make_sparse_regression(100, 15, 4, 0.5, gen);

  for (double lambda : {0.0, 1.0, 25.0}) {
    CoordinateDescent cd;
    cd.lambda = lambda;
    cd.max_iter = 400;
    cd.trace = true;
    std::mt19937 rng(2);
    LassoResult res = cd.fit(p.A, p.b, rng);

    assert(res.history.size() == 400);
    double f0 = res.history[0].objective_function;
    assert(std::abs(f0 - 0.5 * p.b.squaredNorm()) < 1e-9 * f0);
    assert(res.history.is_non_increasing(1e-10 * f0));
    assert(res.objective_value <= res.history.back().objective_function + 1e-10 * f0);
    for (size_t t = 1; t < res.history.size(); ++t) {
      assert(res.history[t].time >= res.history[t - 1].time);
    }
  }
  std::cout << "[PASS] F(alpha_t+1) <= F(alpha_t)." << std::endl;
}

void test_residual_invariant() {
  std::cout << "Testing residual invariant..." << std::endl;
  std::mt19937 gen(13);
  SyntheticProblem p = make_sparse_regression(40, 10, 3, 0.2, gen);
  p.A.col(7).setZero();

  DenseDesignMatrix dense(p.A);
  SparseDesignMatrix sparse = to_sparse(p.A);

  // Every prefix of the same seeded run: checks the state after each update
  for (const DesignMatrix *A : {static_cast<const DesignMatrix *>(&dense),
                                static_cast<const DesignMatrix *>(&sparse)}) {
    for (int iters = 0; iters <= 80; ++iters) {
      CoordinateDescent cd;
      cd.lambda = 2.0;
      cd.max_iter = iters;
      std::mt19937 rng(4);
      LassoResult res = cd.fit(*A, p.b, rng);
      assert(test::residual_error(*A, p.b, res.coef, res.residual) < 1e-9);
      assert(res.coef(7) == 0.0);
    }
  }
  std::cout << "[PASS] r == b - A*alpha after every update." << std::endl;
}

void test_dense_sparse_same_path() {
  std::cout << "Testing dense and sparse runs agree..." << std::endl;
  std::mt19937 gen(21);
  SyntheticProblem p = make_sparse_regression(50, 12, 3, 0.1, gen);
  CoordinateDescent cd;
  cd.lambda = 3.0;
  cd.max_iter = 500;

  std::mt19937 rng_a(9), rng_b(9);
  LassoResult a = cd.fit(p.A, p.b, rng_a);
  LassoResult b = cd.fit(to_sparse(p.A).eigen(), p.b, rng_b);
  assert((a.coef - b.coef).norm() < 1e-9);
  assert((a.residual - b.residual).norm() < 1e-9);

  // Same seed, same answer
  bool same = test::test_reproducibility([&]() {
    std::mt19937 rng(9);
    return cd.fit(p.A, p.b, rng).coef;
  });
  assert(same);
  std::cout << "[PASS] Backend does not change the iterates." << std::endl;
}

void test_support_recovery() {
  std::cout << "Testing sparse support recovery..." << std::endl;
  std::mt19937 gen(2024);
  SyntheticProblem p = make_sparse_regression(200, 20, 3, 0.1, gen);

  CoordinateDescent cd;
  cd.lambda = 20.0;
  cd.max_iter = 4000;
  std::mt19937 rng(0);
  LassoResult res = cd.fit(p.A, p.b, rng);

  std::cout << "  nonzeros: " << res.nonzeros() << " (Expected: 3)" << std::endl;
  assert(test::same_support(res.coef, p.true_coef));
  for (int j : test::support(p.true_coef)) {
    assert(res.coef(j) * p.true_coef(j) > 0.0);
    assert(std::abs(res.coef(j) - p.true_coef(j)) < 0.5);
  }
  std::cout << "[PASS] Support matches ground truth." << std::endl;
}

void test_large_lambda_gives_zero() {
  std::cout << "Testing lambda >= ||A^T b||_inf..." << std::endl;
  std::mt19937 gen(31);
  SyntheticProblem p = make_random_problem(30, 5, gen);
  double lambda_max = (p.A.transpose() * p.b).cwiseAbs().maxCoeff();

  CoordinateDescent cd;
  cd.lambda = lambda_max * 1.01;
  cd.max_iter = 200;
  std::mt19937 rng(0);
  LassoResult res = cd.fit(p.A, p.b, rng);
  assert(res.nonzeros() == 0);
  assert((res.residual - p.b).norm() == 0.0);
  std::cout << "[PASS] All coefficients zero." << std::endl;
}

void test_self_check() {
  std::cout << "Testing perturbation self-check..." << std::endl;
  std::mt19937 gen(17);
  SyntheticProblem p = make_sparse_regression(80, 8, 3, 0.3, gen);
  p.A.col(2).setZero();

  CoordinateDescent cd;
  cd.lambda = 5.0;
  cd.max_iter = 300;
  cd.check = true;
  cd.check_epsilon = 1e-4;
  cd.selection = CoordinateSelection::Cyclic;
  std::mt19937 rng(0);
  LassoResult res = cd.fit(p.A, p.b, rng);

  // Column 2 is skipped before the check, every other iteration is checked
  int expected_checks = 300 - (300 / 8 + (300 % 8 > 2 ? 1 : 0));
  std::cout << "  checks: " << res.checks_performed << " failed: " << res.check_failures
            << " round-off: " << res.check_roundoff << std::endl;
  assert(res.checks_performed == expected_checks);
  assert(res.check_failures == 0);

  cd.check_epsilon = 0.0;
  bool threw = false;
  try {
    cd.fit(p.A, p.b, rng);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
  std::cout << "[PASS] Exact updates survive perturbation." << std::endl;
}

void test_perturbation_outcomes() {
  std::cout << "Testing perturbation check outcomes..." << std::endl;
  double drop = 0.0;

  // alpha = 0 is far from the minimizer of 0.5 * ||alpha - 1||^2
  DenseDesignMatrix I(Eigen::MatrixXd::Identity(2, 2));
  Eigen::VectorXd ones = Eigen::VectorXd::Ones(2);
  Eigen::VectorXd alpha = Eigen::VectorXd::Zero(2);
  CheckOutcome outcome = perturbation_check(I, ones, 0.0, alpha, 0, 0.1, 1e-9, &drop);
  assert(outcome == CheckOutcome::ObjectiveDecreased);
  assert(std::abs(drop - 0.095) < 1e-12);
  assert(alpha.isZero());

  // One-dimensional: F(a) = 0.5 * (1 - a)^2, evaluated at a = 1 - 1e-3
  DenseDesignMatrix one(Eigen::MatrixXd::Ones(1, 1));
  Eigen::VectorXd b = Eigen::VectorXd::Ones(1);
  Eigen::VectorXd near(1);
  near << 1.0 - 1e-3;
  // drop = 0.5 * eps * (2 * 1e-3 - eps), about 1e-9
  outcome = perturbation_check(one, b, 0.0, near, 0, 1e-6, 1e-6, &drop);
  assert(outcome == CheckOutcome::RoundoffOnly);
  assert(drop > 0.0 && drop < 2e-9);
  outcome = perturbation_check(one, b, 0.0, near, 0, 1e-6, 1e-12);
  assert(outcome == CheckOutcome::ObjectiveDecreased);
  assert(near(0) == 1.0 - 1e-3);

  Eigen::VectorXd exact = Eigen::VectorXd::Ones(1);
  assert(perturbation_check(one, b, 0.0, exact, 0, 1e-6, 1e-9) == CheckOutcome::Passed);

  bool threw = false;
  try {
    perturbation_check(one, b, 0.0, exact, 1, 1e-6, 1e-9);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
  std::cout << "[PASS] Decrease, round-off and pass are told apart." << std::endl;
}

void test_long_trace() {
  std::cout << "Testing trace longer than the reserved block..." << std::endl;
  History h;
  h.reserve(static_cast<size_t>(INT_MAX));
  assert(h.capacity() < static_cast<size_t>(INT_MAX));
  assert(h.empty());

  Eigen::MatrixXd A(2, 1);
  A << 1.0, 2.0;
  Eigen::VectorXd b = Eigen::VectorXd::Ones(2);
  CoordinateDescent cd;
  cd.lambda = 0.1;
  cd.trace = true;
  cd.max_iter = static_cast<int>(History::kMaxReserve) * 3;
  std::mt19937 rng(0);
  LassoResult res = cd.fit(A, b, rng);
  assert(res.history.size() == History::kMaxReserve * 3);
  assert(res.history.is_non_increasing(1e-12));
  std::cout << "[PASS] Trace grows past the reserved block." << std::endl;
}

void test_errors_and_factory() {
  std::cout << "Testing validation and factory..." << std::endl;
  Eigen::MatrixXd A = Eigen::MatrixXd::Ones(4, 2);
  std::mt19937 rng(0);
  CoordinateDescent cd;

  int caught = 0;
  try { cd.fit(A, Eigen::VectorXd::Zero(3), rng); } catch (const std::invalid_argument &) { ++caught; }
  cd.lambda = -1.0;
  try { cd.fit(A, Eigen::VectorXd::Zero(4), rng); } catch (const std::invalid_argument &) { ++caught; }
  try { make_lasso_solver("newton"); } catch (const std::invalid_argument &) { ++caught; }
  assert(caught == 3);

  auto solver = make_lasso_solver("cd", 0.5);
  assert(solver->name() == "CoordinateDescent");
  assert(solver->lambda == 0.5);
  assert(make_lasso_solver("coordinate_descent")->name() == "CoordinateDescent");

  // Zero iterations: initial state
  solver->max_iter = 0;
  LassoResult res = solver->fit(A, Eigen::VectorXd::Ones(4), rng);
  assert(res.iterations == 0 && res.coef.isZero() && res.residual.isOnes());
  std::cout << "[PASS] Validation and factory." << std::endl;
}

int main() {
  std::cout << "--- Coordinate Descent Test ---" << std::endl;
  try {
    test_converges_to_ols();
    test_monotone_objective();
    test_residual_invariant();
    test_dense_sparse_same_path();
    test_support_recovery();
    test_large_lambda_gives_zero();
    test_self_check();
    test_perturbation_outcomes();
    test_long_trace();
    test_errors_and_factory();
  } catch (const std::exception &e) {
    std::cout << "Exception: " << e.what() << std::endl;
    return 1;
  }
  std::cout << "Coordinate Descent Test Passed!" << std::endl;
  return 0;
}
