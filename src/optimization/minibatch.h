/**
 * @file minibatch.h
 * @brief Lassolab - Minibatch Sampler
 *
 * Lazily slices (y, X) into consecutive batches of at most batch_size rows.
 * When shuffling, one permutation of the rows is drawn at construction and
 * applied to y and X together, so row i of a batch's X still belongs to
 * entry i of the batch's y.
 *
 * The sampler keeps references to y and X; both must outlive it.
 *
 * Usage:
 *   MinibatchSampler sampler(y, X, 32, 10, true, rng);
 *   Minibatch batch;
 *   while (sampler.next(batch)) { ... }
 */
#ifndef LASSOLAB_MINIBATCH_H
#define LASSOLAB_MINIBATCH_H

#include <Eigen/Dense>
#include <memory>
#include <random>
#include <vector>
#include "../linalg/design_matrix.h"

namespace lassolab {

struct Minibatch {
    Eigen::VectorXd y;
    std::unique_ptr<DesignMatrix> X;
    std::vector<int> rows;  // source row of each batch entry
};

class MinibatchSampler {
public:
    /**
     * @param y Targets (length n); must outlive the sampler
     * @param X Design matrix (n rows); must outlive the sampler
     * @param batch_size Maximum rows per batch (>= 1)
     * @param num_batches Maximum number of batches to yield (>= 0)
     * @param shuffle Draw a random row permutation from rng
     * @param rng Generator, used only during construction
     * @throws std::invalid_argument on bad sizes
     */
    MinibatchSampler(const Eigen::VectorXd& y, const DesignMatrix& X,
                     int batch_size, int num_batches, bool shuffle,
                     std::mt19937& rng);

    /**
     * @brief Fill batch with the next slice
     * @return false once num_batches batches were yielded or the data ran out
     */
    bool next(Minibatch& batch);

    int batches_yielded() const { return batch_num_; }
    const std::vector<int>& order() const { return order_; }

private:
    const Eigen::VectorXd& y_;
    const DesignMatrix& X_;
    int batch_size_;
    int num_batches_;
    int batch_num_ = 0;
    std::vector<int> order_;
};

} // namespace lassolab

#endif // LASSOLAB_MINIBATCH_H
