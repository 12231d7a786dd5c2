/**
 * @file libsvm.h
 * @brief Lassolab - LibSVM Sparse Text Format Reader
 *
 * Format, one sample per line:
 *   <label> <index>:<value> <index>:<value> ...
 * Indices are 1-based. Blank lines are skipped and '#' starts a comment.
 */
#ifndef LASSOLAB_LIBSVM_H
#define LASSOLAB_LIBSVM_H

#include <Eigen/Dense>
#include <istream>
#include <string>
#include "../linalg/sparse_core.h"

namespace lassolab {

struct LibSVMData {
    SparseDesignMatrix X;
    Eigen::VectorXd y;
};

/**
 * @brief Parse LibSVM data from a stream
 * @param in Input stream
 * @param n_features Column count; if <= 0 the largest index seen is used
 * @throws std::runtime_error on malformed input (message carries the line number)
 */
LibSVMData read_libsvm(std::istream& in, int n_features = 0);

/**
 * @brief Load a LibSVM file
 * @throws std::runtime_error if the file cannot be opened or parsed
 */
LibSVMData load_libsvm(const std::string& path, int n_features = 0);

} // namespace lassolab

#endif // LASSOLAB_LIBSVM_H
