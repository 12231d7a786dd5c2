/**
 * @file subgradient.h
 * @brief Lassolab - Stochastic Subgradient Descent for the Lasso
 *
 * Per iteration t, with a freshly shuffled minibatch B of rows:
 *
 *   g_t      = scale * A_B^T (A_B alpha_t - b_B) + lambda * sign(alpha_t)
 *   alpha_t+1 = alpha_t - step_t * g_t
 *
 * sign(0) = 0, i.e. the minimum-norm element of the L1 subdifferential is
 * used at the kink.
 *
 * Design Decisions:
 * -----------------
 * 1. **Batch scaling**: Unbiased (default) multiplies the minibatch gradient
 *    by n / |B|; its expectation is the full least-squares gradient.
 *    Mean (1 / |B|) and Sum (1) are also available.
 *
 * 2. **Step schedule**: Constant step_size by default. InverseSqrt uses
 *    step_size / sqrt(t + 1).
 *
 * 3. **Termination**: max_iter only. The iterate is never projected or
 *    thresholded, so coefficients are rarely exactly zero.
 */
#ifndef LASSOLAB_SUBGRADIENT_H
#define LASSOLAB_SUBGRADIENT_H

#include "lasso.h"

namespace lassolab {

enum class BatchScaling {
    Unbiased,  // n / |B|
    Mean,      // 1 / |B|
    Sum        // 1
};

enum class StepSchedule {
    Constant,    // step_size
    InverseSqrt  // step_size / sqrt(t + 1)
};

class StochasticSubgradient : public LassoSolver {
public:
    double step_size = 1e-3;   // gamma
    int batch_size = 1;
    BatchScaling scaling = BatchScaling::Unbiased;
    StepSchedule schedule = StepSchedule::Constant;

    using LassoSolver::fit;

    LassoResult fit(const DesignMatrix& A, const Eigen::VectorXd& b,
                    std::mt19937& rng) override;

    std::string name() const override { return "StochasticSubgradient"; }

    double step_at(int t) const;
    double batch_scale(int n_rows, int n_batch) const;
};

} // namespace lassolab

#endif // LASSOLAB_SUBGRADIENT_H
