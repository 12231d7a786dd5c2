/**
 * @file sparse_core.h
 * @brief Lassolab - Sparse Design Matrix Support
 *
 * Provides:
 *   - SparseDesignMatrix: CSC storage for column access, CSR copy for row selection
 *   - Builders from triplets and CSR arrays (scipy.csr_matrix layout)
 *   - to_sparse / sparse_identity utilities
 */
#ifndef LASSOLAB_SPARSE_CORE_H
#define LASSOLAB_SPARSE_CORE_H

#include <Eigen/Sparse>
#include <vector>
#include <stdexcept>
#include "design_matrix.h"

namespace lassolab {

using SparseMatrixCSC = Eigen::SparseMatrix<double, Eigen::ColMajor>;
using SparseMatrixCSR = Eigen::SparseMatrix<double, Eigen::RowMajor>;

// =============================================================================
// Sparse backend
// =============================================================================

/**
 * @brief Sparse design matrix
 *
 * Column operations (coordinate descent) run on the column-major copy.
 * The row-major copy is kept so that minibatch row selection costs
 * O(nnz of the selected rows) instead of O(nnz).
 */
class SparseDesignMatrix : public DesignMatrix {
public:
    SparseDesignMatrix() = default;

    SparseDesignMatrix(int rows, int cols) {
        csc_.resize(rows, cols);
        csr_.resize(rows, cols);
    }

    explicit SparseDesignMatrix(const SparseMatrixCSC& m);

    // Build from triplets (i, j, v); duplicates are summed
    static SparseDesignMatrix from_triplets(const std::vector<int>& row_indices,
                                            const std::vector<int>& col_indices,
                                            const std::vector<double>& values,
                                            int rows, int cols);

    // Build from CSR format (data, indices, indptr)
    static SparseDesignMatrix from_csr(const std::vector<double>& data,
                                       const std::vector<int>& indices,
                                       const std::vector<int>& indptr,
                                       int rows, int cols);

    int rows() const override { return csc_.rows(); }
    int cols() const override { return csc_.cols(); }

    Eigen::VectorXd column(int j) const override;
    double column_squared_norm(int j) const override;
    double column_dot(int j, const Eigen::VectorXd& v) const override;
    void add_scaled_column(int j, double scale, Eigen::VectorXd& v) const override;

    Eigen::VectorXd multiply(const Eigen::VectorXd& x) const override;
    Eigen::VectorXd transpose_multiply(const Eigen::VectorXd& v) const override;

    std::unique_ptr<DesignMatrix> select_rows(const std::vector<int>& indices) const override;

    long nnz() const override { return static_cast<long>(csc_.nonZeros()); }
    bool is_sparse() const override { return true; }

    double density() const {
        if (rows() == 0 || cols() == 0) return 0.0;
        return static_cast<double>(nnz()) / (static_cast<double>(rows()) * cols());
    }

    const SparseMatrixCSC& eigen() const { return csc_; }

private:
    SparseMatrixCSC csc_;
    SparseMatrixCSR csr_;
};

// =============================================================================
// Utility functions
// =============================================================================

/**
 * @brief Convert dense matrix to sparse, dropping |a_ij| <= threshold
 */
SparseDesignMatrix to_sparse(const Eigen::MatrixXd& dense, double threshold = 0.0);

SparseDesignMatrix sparse_identity(int n);

} // namespace lassolab

#endif // LASSOLAB_SPARSE_CORE_H
