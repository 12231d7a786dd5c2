#include "subgradient.h"
#include "../optimization/minibatch.h"
#include "../optimization/objective.h"
#include "../optimization/penalizer.h"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace lassolab {

double StochasticSubgradient::step_at(int t) const {
    if (schedule == StepSchedule::InverseSqrt) {
        return step_size / std::sqrt(static_cast<double>(t) + 1.0);
    }
    return step_size;
}

double StochasticSubgradient::batch_scale(int n_rows, int n_batch) const {
    switch (scaling) {
        case BatchScaling::Unbiased: return static_cast<double>(n_rows) / n_batch;
        case BatchScaling::Mean: return 1.0 / n_batch;
        case BatchScaling::Sum: return 1.0;
    }
    return 1.0;
}

LassoResult StochasticSubgradient::fit(const DesignMatrix& A, const Eigen::VectorXd& b,
                                       std::mt19937& rng) {
    validate(A, b);
    if (!(step_size > 0.0)) {
        throw std::invalid_argument("step_size must be positive");
    }
    if (batch_size < 1) {
        throw std::invalid_argument("batch_size must be >= 1");
    }

    const int n = A.rows();
    const int d = A.cols();

    LassoResult result;
    result.coef = Eigen::VectorXd::Zero(d);
    Eigen::VectorXd& alpha = result.coef;

    LassoObjective objective(A, b, lambda);
    const L1Penalty& penalty = objective.penalty();

    if (trace) result.history.reserve(max_iter);

    Stopwatch clock;
    Minibatch batch;

    int t = 0;
    for (t = 0; t < max_iter; ++t) {
        if (trace) {
            result.history.record(clock.elapsed(), objective.value(alpha));
        }

        MinibatchSampler sampler(b, A, batch_size, 1, true, rng);
        if (!sampler.next(batch)) continue;  // n == 0

        LeastSquaresObjective batch_objective(*batch.X, batch.y);
        const double scale = batch_scale(n, static_cast<int>(batch.y.size()));

        Eigen::VectorXd g = scale * batch_objective.gradient(alpha);
        g += penalty.gradient(alpha);

        alpha.noalias() -= step_at(t) * g;
    }

    result.iterations = t;
    result.residual = b - A.multiply(alpha);
    result.objective_value = lasso_objective_from_residual(result.residual, lambda, alpha);

    if (!alpha.allFinite()) {
        std::cerr << "Warning: " << name() << " diverged (non-finite coefficients); "
                  << "step_size " << step_size << " is too large" << std::endl;
    }
    if (verbose) {
        report(result, clock.elapsed());
    }
    return result;
}

} // namespace lassolab
