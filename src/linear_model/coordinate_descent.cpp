#include "coordinate_descent.h"
#include "../optimization/objective.h"
#include "../optimization/optimization.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace lassolab {

LassoResult CoordinateDescent::fit(const DesignMatrix& A, const Eigen::VectorXd& b,
                                   std::mt19937& rng) {
    validate(A, b);
    if (check && !(check_epsilon > 0.0)) {
        throw std::invalid_argument("check_epsilon must be positive");
    }

    const int d = A.cols();

    LassoResult result;
    result.coef = Eigen::VectorXd::Zero(d);
    result.residual = b;  // r = b - A*0
    Eigen::VectorXd& alpha = result.coef;
    Eigen::VectorXd& r = result.residual;

    if (trace) result.history.reserve(max_iter);

    std::uniform_int_distribution<int> pick(0, std::max(d - 1, 0));
    Stopwatch clock;

    int t = 0;
    for (t = 0; t < max_iter; ++t) {
        if (trace) {
            result.history.record(clock.elapsed(),
                                  lasso_objective_from_residual(r, lambda, alpha));
        }
        if (d == 0) continue;

        const int i = (selection == CoordinateSelection::Cyclic) ? t % d : pick(rng);

        const double sq_norm = A.column_squared_norm(i);
        if (sq_norm == 0.0) {
            alpha(i) = 0.0;
            continue;
        }

        const double internal = A.column_dot(i, r) + sq_norm * alpha(i);
        const double new_value = optimization::coordinate_minimizer(internal, lambda, sq_norm);

        // Residual first: it needs the old alpha_i
        const double delta = alpha(i) - new_value;
        if (delta != 0.0) {
            A.add_scaled_column(i, delta, r);
        }
        alpha(i) = new_value;

        if (check) {
            verify_coordinate(A, b, alpha, i, t, result);
        }
    }

    result.iterations = t;
    result.objective_value = lasso_objective_from_residual(r, lambda, alpha);

    if (verbose) {
        report(result, clock.elapsed());
        if (check) {
            std::cout << name() << " checks: " << result.checks_performed
                      << " failed: " << result.check_failures
                      << " round-off: " << result.check_roundoff << std::endl;
        }
    }
    return result;
}

CheckOutcome perturbation_check(const DesignMatrix& A, const Eigen::VectorXd& b,
                                double lambda, Eigen::VectorXd& alpha, int i,
                                double epsilon, double tolerance, double* drop) {
    check_dimensions(A, b, &alpha);
    if (i < 0 || i >= alpha.size()) {
        throw std::invalid_argument("Coordinate index out of range: " + std::to_string(i));
    }

    const double value = alpha(i);
    const double base = lasso_objective(A, b, lambda, alpha);

    alpha(i) = value + epsilon;
    const double up = lasso_objective(A, b, lambda, alpha);
    alpha(i) = value - epsilon;
    const double down = lasso_objective(A, b, lambda, alpha);
    alpha(i) = value;

    const double decrease = base - std::min(up, down);
    if (drop != nullptr) *drop = decrease;

    if (decrease <= 0.0) {
        return CheckOutcome::Passed;
    }
    if (decrease <= tolerance * std::max(1.0, std::abs(base))) {
        return CheckOutcome::RoundoffOnly;
    }
    return CheckOutcome::ObjectiveDecreased;
}

void CoordinateDescent::verify_coordinate(const DesignMatrix& A, const Eigen::VectorXd& b,
                                          Eigen::VectorXd& alpha, int i, int iteration,
                                          LassoResult& result) const {
    double drop = 0.0;
    CheckOutcome outcome = perturbation_check(A, b, lambda, alpha, i,
                                              check_epsilon, check_tolerance, &drop);
    ++result.checks_performed;

    switch (outcome) {
        case CheckOutcome::Passed:
            break;
        case CheckOutcome::RoundoffOnly:
            ++result.check_roundoff;
            break;
        case CheckOutcome::ObjectiveDecreased:
            ++result.check_failures;
            std::cerr << "Warning: " << name() << " check failed at iteration " << iteration
                      << ", coordinate " << i << ": objective decreased by " << drop
                      << " under perturbation of " << check_epsilon << std::endl;
            break;
    }
}

} // namespace lassolab
