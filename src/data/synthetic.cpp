#include "synthetic.h"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace lassolab {

namespace {

Eigen::MatrixXd random_normal_matrix(int rows, int cols, std::mt19937& gen) {
    std::normal_distribution<> dist(0.0, 1.0);
    Eigen::MatrixXd m(rows, cols);
    for (int i = 0; i < rows; ++i)
        for (int j = 0; j < cols; ++j)
            m(i, j) = dist(gen);
    return m;
}

} // namespace

SyntheticProblem make_random_problem(int n_samples, int n_features, std::mt19937& gen) {
    if (n_samples < 0 || n_features < 0) {
        throw std::invalid_argument("Problem dimensions must be non-negative");
    }
    SyntheticProblem p;
    p.A = random_normal_matrix(n_samples, n_features, gen);

    std::uniform_real_distribution<> unif(0.0, 1.0);
    p.b.resize(n_samples);
    for (int i = 0; i < n_samples; ++i) p.b(i) = unif(gen);

    p.true_coef = Eigen::VectorXd::Zero(n_features);
    return p;
}

SyntheticProblem make_sparse_regression(int n_samples, int n_features, int n_nonzero,
                                        double noise_sd, std::mt19937& gen) {
    if (n_samples < 0 || n_features < 0) {
        throw std::invalid_argument("Problem dimensions must be non-negative");
    }
    if (n_nonzero < 0 || n_nonzero > n_features) {
        throw std::invalid_argument("n_nonzero must be in [0, n_features]");
    }
    if (noise_sd < 0.0) {
        throw std::invalid_argument("noise_sd must be non-negative");
    }

    SyntheticProblem p;
    p.A = random_normal_matrix(n_samples, n_features, gen);

    std::vector<int> features(n_features);
    std::iota(features.begin(), features.end(), 0);
    std::shuffle(features.begin(), features.end(), gen);

    std::uniform_real_distribution<> magnitude(1.0, 3.0);
    std::bernoulli_distribution negative(0.5);
    p.true_coef = Eigen::VectorXd::Zero(n_features);
    for (int k = 0; k < n_nonzero; ++k) {
        double v = magnitude(gen);
        p.true_coef(features[k]) = negative(gen) ? -v : v;
    }

    p.b = p.A * p.true_coef;
    if (noise_sd > 0.0) {
        std::normal_distribution<> noise(0.0, noise_sd);
        for (int i = 0; i < n_samples; ++i) p.b(i) += noise(gen);
    }
    return p;
}

} // namespace lassolab
