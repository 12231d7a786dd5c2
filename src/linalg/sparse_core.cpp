#include "sparse_core.h"
#include <cmath>

namespace lassolab {

SparseDesignMatrix::SparseDesignMatrix(const SparseMatrixCSC& m)
    : csc_(m) {
    csc_.makeCompressed();
    csr_ = csc_;
    csr_.makeCompressed();
}

SparseDesignMatrix SparseDesignMatrix::from_triplets(const std::vector<int>& row_indices,
                                                     const std::vector<int>& col_indices,
                                                     const std::vector<double>& values,
                                                     int rows, int cols) {
    if (row_indices.size() != values.size() || col_indices.size() != values.size()) {
        throw std::invalid_argument("Triplet arrays must have equal length");
    }
    std::vector<Eigen::Triplet<double>> triplets;
    triplets.reserve(values.size());
    for (size_t k = 0; k < values.size(); ++k) {
        if (row_indices[k] < 0 || row_indices[k] >= rows ||
            col_indices[k] < 0 || col_indices[k] >= cols) {
            throw std::out_of_range("Triplet index out of range");
        }
        triplets.emplace_back(row_indices[k], col_indices[k], values[k]);
    }
    SparseMatrixCSC m(rows, cols);
    m.setFromTriplets(triplets.begin(), triplets.end());
    return SparseDesignMatrix(m);
}

SparseDesignMatrix SparseDesignMatrix::from_csr(const std::vector<double>& data,
                                                const std::vector<int>& indices,
                                                const std::vector<int>& indptr,
                                                int rows, int cols) {
    if (static_cast<int>(indptr.size()) != rows + 1) {
        throw std::invalid_argument("indptr must have rows + 1 entries");
    }
    if (data.size() != indices.size()) {
        throw std::invalid_argument("data and indices must have equal length");
    }
    if (indptr.front() != 0 || static_cast<size_t>(indptr.back()) != data.size()) {
        throw std::invalid_argument("indptr must start at 0 and end at nnz");
    }
    for (int i = 0; i < rows; ++i) {
        if (indptr[i] > indptr[i + 1]) {
            throw std::invalid_argument("indptr must be non-decreasing");
        }
    }
    std::vector<Eigen::Triplet<double>> triplets;
    triplets.reserve(data.size());
    for (int i = 0; i < rows; ++i) {
        for (int k = indptr[i]; k < indptr[i + 1]; ++k) {
            if (indices[k] < 0 || indices[k] >= cols) {
                throw std::out_of_range("CSR column index out of range");
            }
            triplets.emplace_back(i, indices[k], data[k]);
        }
    }
    SparseMatrixCSC m(rows, cols);
    m.setFromTriplets(triplets.begin(), triplets.end());
    return SparseDesignMatrix(m);
}

Eigen::VectorXd SparseDesignMatrix::column(int j) const {
    check_column(j);
    return csc_.col(j).toDense();
}

double SparseDesignMatrix::column_squared_norm(int j) const {
    check_column(j);
    double s = 0.0;
    for (SparseMatrixCSC::InnerIterator it(csc_, j); it; ++it) {
        s += it.value() * it.value();
    }
    return s;
}

double SparseDesignMatrix::column_dot(int j, const Eigen::VectorXd& v) const {
    check_column(j);
    if (v.size() != csc_.rows()) {
        throw std::invalid_argument("Dimension mismatch: column length != vector length");
    }
    double s = 0.0;
    for (SparseMatrixCSC::InnerIterator it(csc_, j); it; ++it) {
        s += it.value() * v(it.row());
    }
    return s;
}

void SparseDesignMatrix::add_scaled_column(int j, double scale, Eigen::VectorXd& v) const {
    check_column(j);
    if (v.size() != csc_.rows()) {
        throw std::invalid_argument("Dimension mismatch: column length != vector length");
    }
    for (SparseMatrixCSC::InnerIterator it(csc_, j); it; ++it) {
        v(it.row()) += scale * it.value();
    }
}

Eigen::VectorXd SparseDesignMatrix::multiply(const Eigen::VectorXd& x) const {
    if (x.size() != csc_.cols()) {
        throw std::invalid_argument("Dimension mismatch: A.cols() != x.size()");
    }
    return csc_ * x;
}

Eigen::VectorXd SparseDesignMatrix::transpose_multiply(const Eigen::VectorXd& v) const {
    if (v.size() != csc_.rows()) {
        throw std::invalid_argument("Dimension mismatch: A.rows() != v.size()");
    }
    return csc_.transpose() * v;
}

std::unique_ptr<DesignMatrix> SparseDesignMatrix::select_rows(const std::vector<int>& indices) const {
    std::vector<Eigen::Triplet<double>> triplets;
    for (size_t k = 0; k < indices.size(); ++k) {
        check_row(indices[k]);
        for (SparseMatrixCSR::InnerIterator it(csr_, indices[k]); it; ++it) {
            triplets.emplace_back(static_cast<int>(k), it.col(), it.value());
        }
    }
    SparseMatrixCSC sub(static_cast<int>(indices.size()), csc_.cols());
    sub.setFromTriplets(triplets.begin(), triplets.end());
    return std::make_unique<SparseDesignMatrix>(sub);
}

SparseDesignMatrix to_sparse(const Eigen::MatrixXd& dense, double threshold) {
    std::vector<Eigen::Triplet<double>> triplets;
    for (int i = 0; i < dense.rows(); ++i) {
        for (int j = 0; j < dense.cols(); ++j) {
            if (std::abs(dense(i, j)) > threshold) {
                triplets.emplace_back(i, j, dense(i, j));
            }
        }
    }
    SparseMatrixCSC m(dense.rows(), dense.cols());
    m.setFromTriplets(triplets.begin(), triplets.end());
    return SparseDesignMatrix(m);
}

SparseDesignMatrix sparse_identity(int n) {
    SparseMatrixCSC I(n, n);
    I.setIdentity();
    return SparseDesignMatrix(I);
}

} // namespace lassolab
