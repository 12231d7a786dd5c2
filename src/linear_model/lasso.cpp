/**
 * @file lasso.cpp
 * @brief Shared Lasso solver plumbing and the solver factory
 */
#include "lasso.h"
#include "coordinate_descent.h"
#include "subgradient.h"
#include "../optimization/objective.h"
#include <iostream>
#include <stdexcept>

namespace lassolab {

LassoResult LassoSolver::fit(const Eigen::MatrixXd& A, const Eigen::VectorXd& b, std::mt19937& rng) {
    DenseDesignMatrix dense(A);
    return fit(dense, b, rng);
}

LassoResult LassoSolver::fit(const SparseMatrixCSC& A, const Eigen::VectorXd& b, std::mt19937& rng) {
    SparseDesignMatrix sparse(A);
    return fit(sparse, b, rng);
}

void LassoSolver::validate(const DesignMatrix& A, const Eigen::VectorXd& b) const {
    check_dimensions(A, b);
    if (lambda < 0.0) {
        throw std::invalid_argument("lambda must be non-negative");
    }
    if (max_iter < 0) {
        throw std::invalid_argument("max_iter must be non-negative");
    }
}

void LassoSolver::report(const LassoResult& result, double seconds) const {
    std::cout << name() << " lambda: " << lambda
              << " Iter: " << result.iterations
              << " Objective: " << result.objective_value
              << " Nonzeros: " << result.nonzeros()
              << " Time: " << seconds << "s" << std::endl;
}

std::unique_ptr<LassoSolver> make_lasso_solver(const std::string& method, double lambda) {
    std::unique_ptr<LassoSolver> solver;
    if (method == "cd" || method == "coordinate_descent") {
        solver = std::make_unique<CoordinateDescent>();
    } else if (method == "sgd" || method == "subgradient") {
        solver = std::make_unique<StochasticSubgradient>();
    } else {
        throw std::invalid_argument("Unknown Lasso solver: " + method);
    }
    solver->lambda = lambda;
    return solver;
}

} // namespace lassolab
