/**
 * @file bench_lasso.cpp
 * @brief Benchmark: coordinate descent vs stochastic subgradient
 *
 * Usage:
 *   bench_lasso                      synthetic N(0,1) problem, n=1000, d=100
 *   bench_lasso <file.libsvm> [lambda]
 *
 * Prints objective value against elapsed time for both solvers, sampled on
 * a log-spaced iteration grid.
 */

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <string>

#include <Eigen/Dense>

#include "../src/data/libsvm.h"
#include "../src/data/synthetic.h"
#include "../src/linear_model/coordinate_descent.h"
#include "../src/linear_model/subgradient.h"

using namespace lassolab;

void print_trace(const std::string& label, const LassoResult& result) {
  std::cout << "\n=== " << label << " ===" << std::endl;
  std::cout << std::setw(10) << "iter" << std::setw(14) << "time [s]"
            << std::setw(18) << "objective" << std::endl;

  const auto& h = result.history;
  for (size_t it = 1; it <= h.size(); it *= 2) {
    std::cout << std::setw(10) << it - 1 << std::setw(14) << std::fixed
              << std::setprecision(6) << h[it - 1].time << std::setw(18)
              << std::scientific << std::setprecision(8)
              << h[it - 1].objective_function << std::defaultfloat
              << std::endl;
  }
  std::cout << "final objective: " << result.objective_value
            << "  nonzeros: " << result.nonzeros() << std::endl;
}

void run(const DesignMatrix &A, const Eigen::VectorXd &b, double lambda) {
  std::mt19937 gen(42);

  CoordinateDescent cd;
  cd.lambda = lambda;
  cd.max_iter = 20 * A.cols();
  cd.trace = true;
  cd.verbose = true;
  print_trace("Coordinate descent", cd.fit(A, b, gen));

  StochasticSubgradient sgd;
  sgd.lambda = lambda;
  sgd.max_iter = 20 * A.cols();
  sgd.batch_size = 10;
  sgd.step_size = 1e-5;
  sgd.trace = true;
  sgd.verbose = true;
  print_trace("Stochastic subgradient", sgd.fit(A, b, gen));
}

int main(int argc, char **argv) {
  try {
    if (argc > 1) {
      double lambda = argc > 2 ? std::atof(argv[2]) : 1.0;
      LibSVMData data = load_libsvm(argv[1]);
      std::cout << "Loaded " << data.X.rows() << " x " << data.X.cols()
                << " (density " << data.X.density() << ")" << std::endl;
      run(data.X, data.y, lambda);
    } else {
      std::mt19937 gen(0);
      SyntheticProblem p = make_random_problem(1000, 100, gen);
      run(DenseDesignMatrix(p.A), p.b, 1.0);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
