/**
 * @file design_matrix.cpp
 * @brief Dense design matrix backend
 */
#include "design_matrix.h"
#include <cmath>
#include <string>

namespace lassolab {

double DesignMatrix::column_norm(int j) const {
    return std::sqrt(column_squared_norm(j));
}

Eigen::VectorXd DenseDesignMatrix::column(int j) const {
    check_column(j);
    return mat_.col(j);
}

double DenseDesignMatrix::column_squared_norm(int j) const {
    check_column(j);
    return mat_.col(j).squaredNorm();
}

double DenseDesignMatrix::column_dot(int j, const Eigen::VectorXd& v) const {
    check_column(j);
    if (v.size() != mat_.rows()) {
        throw std::invalid_argument("Dimension mismatch: column length != vector length");
    }
    return mat_.col(j).dot(v);
}

void DenseDesignMatrix::add_scaled_column(int j, double scale, Eigen::VectorXd& v) const {
    check_column(j);
    if (v.size() != mat_.rows()) {
        throw std::invalid_argument("Dimension mismatch: column length != vector length");
    }
    v.noalias() += scale * mat_.col(j);
}

Eigen::VectorXd DenseDesignMatrix::multiply(const Eigen::VectorXd& x) const {
    if (x.size() != mat_.cols()) {
        throw std::invalid_argument("Dimension mismatch: A.cols() != x.size()");
    }
    return mat_ * x;
}

Eigen::VectorXd DenseDesignMatrix::transpose_multiply(const Eigen::VectorXd& v) const {
    if (v.size() != mat_.rows()) {
        throw std::invalid_argument("Dimension mismatch: A.rows() != v.size()");
    }
    return mat_.transpose() * v;
}

std::unique_ptr<DesignMatrix> DenseDesignMatrix::select_rows(const std::vector<int>& indices) const {
    Eigen::MatrixXd sub(static_cast<int>(indices.size()), mat_.cols());
    for (size_t k = 0; k < indices.size(); ++k) {
        check_row(indices[k]);
        sub.row(k) = mat_.row(indices[k]);
    }
    return std::make_unique<DenseDesignMatrix>(std::move(sub));
}

} // namespace lassolab
