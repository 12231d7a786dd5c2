/**
 * @file objective.cpp
 * @brief Implementation of the Lasso objective components
 */
#include "objective.h"
#include <string>

namespace lassolab {

void check_dimensions(const DesignMatrix& A, const Eigen::VectorXd& b,
                      const Eigen::VectorXd* alpha) {
    if (A.rows() != b.size()) {
        throw std::invalid_argument(
            "Dimension mismatch: A.rows() = " + std::to_string(A.rows()) +
            " != b.size() = " + std::to_string(b.size()));
    }
    if (alpha != nullptr && A.cols() != alpha->size()) {
        throw std::invalid_argument(
            "Dimension mismatch: A.cols() = " + std::to_string(A.cols()) +
            " != alpha.size() = " + std::to_string(alpha->size()));
    }
}

LeastSquaresObjective::LeastSquaresObjective(const DesignMatrix& A_, const Eigen::VectorXd& b_)
    : A(A_), b(b_) {
    check_dimensions(A, b);
}

std::pair<double, Eigen::VectorXd>
LeastSquaresObjective::value_and_gradient(const Eigen::VectorXd& alpha) const {
    Eigen::VectorXd residual = b - A.multiply(alpha);
    double val = 0.5 * residual.squaredNorm();
    Eigen::VectorXd grad = -A.transpose_multiply(residual);
    return {val, grad};
}

double LeastSquaresObjective::value(const Eigen::VectorXd& alpha) const {
    return 0.5 * (A.multiply(alpha) - b).squaredNorm();
}

LassoObjective::LassoObjective(const DesignMatrix& A, const Eigen::VectorXd& b, double lambda)
    : least_squares_(A, b), penalty_(lambda) {}

std::pair<double, Eigen::VectorXd>
LassoObjective::value_and_gradient(const Eigen::VectorXd& alpha) const {
    auto [val, grad] = least_squares_.value_and_gradient(alpha);
    val += penalty_.penalty(alpha);
    grad += penalty_.gradient(alpha);
    return {val, grad};
}

double LassoObjective::value(const Eigen::VectorXd& alpha) const {
    return least_squares_.value(alpha) + penalty_.penalty(alpha);
}

double lasso_objective(const DesignMatrix& A, const Eigen::VectorXd& b,
                       double lambda, const Eigen::VectorXd& alpha) {
    check_dimensions(A, b, &alpha);
    return LassoObjective(A, b, lambda).value(alpha);
}

double lasso_objective(const Eigen::MatrixXd& A, const Eigen::VectorXd& b,
                       double lambda, const Eigen::VectorXd& alpha) {
    return lasso_objective(DenseDesignMatrix(A), b, lambda, alpha);
}

} // namespace lassolab
