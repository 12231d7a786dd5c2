#include "minibatch.h"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace lassolab {

MinibatchSampler::MinibatchSampler(const Eigen::VectorXd& y, const DesignMatrix& X,
                                   int batch_size, int num_batches, bool shuffle,
                                   std::mt19937& rng)
    : y_(y), X_(X), batch_size_(batch_size), num_batches_(num_batches) {
    if (y.size() != X.rows()) {
        throw std::invalid_argument("Dimension mismatch: y.size() != X.rows()");
    }
    if (batch_size < 1) {
        throw std::invalid_argument("batch_size must be >= 1");
    }
    if (num_batches < 0) {
        throw std::invalid_argument("num_batches must be >= 0");
    }

    order_.resize(y.size());
    std::iota(order_.begin(), order_.end(), 0);
    if (shuffle) {
        std::shuffle(order_.begin(), order_.end(), rng);
    }
}

bool MinibatchSampler::next(Minibatch& batch) {
    const int data_size = static_cast<int>(order_.size());
    if (batch_num_ >= num_batches_) return false;

    // batch_num_ * batch_size_ can exceed INT_MAX
    long start = static_cast<long>(batch_num_) * batch_size_;
    if (start >= data_size) return false;
    long end = std::min<long>(start + batch_size_, data_size);

    batch.rows.assign(order_.begin() + start, order_.begin() + end);
    batch.y.resize(end - start);
    for (long k = 0; k < end - start; ++k) {
        batch.y(k) = y_(batch.rows[k]);
    }
    batch.X = X_.select_rows(batch.rows);

    ++batch_num_;
    return true;
}

} // namespace lassolab
