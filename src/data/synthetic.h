#ifndef LASSOLAB_SYNTHETIC_H
#define LASSOLAB_SYNTHETIC_H

#include <Eigen/Dense>
#include <random>

namespace lassolab {

struct SyntheticProblem {
    Eigen::MatrixXd A;
    Eigen::VectorXd b;
    Eigen::VectorXd true_coef;  // zero when the target is pure noise
};

// A ~ N(0, 1) entrywise, b ~ U(0, 1)
SyntheticProblem make_random_problem(int n_samples, int n_features, std::mt19937& gen);

/**
 * @brief Sparse ground truth: b = A * coef + N(0, noise_sd^2)
 *
 * The support is n_nonzero distinct features chosen uniformly; their values
 * are +/-U(1, 3) so that no true coefficient is close to zero.
 */
SyntheticProblem make_sparse_regression(int n_samples, int n_features, int n_nonzero,
                                        double noise_sd, std::mt19937& gen);

} // namespace lassolab

#endif // LASSOLAB_SYNTHETIC_H
