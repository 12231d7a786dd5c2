/**
 * @file design_matrix.h
 * @brief Lassolab - Design Matrix Interface
 *
 * Column-oriented access to the n x d design matrix A used by the Lasso
 * solvers. Coordinate descent only touches one column at a time, so the
 * interface exposes column products directly instead of forcing a copy.
 *
 * Implementations:
 *   - DenseDesignMatrix  (Eigen::MatrixXd)
 *   - SparseDesignMatrix (Eigen::SparseMatrix, see sparse_core.h)
 */
#ifndef LASSOLAB_DESIGN_MATRIX_H
#define LASSOLAB_DESIGN_MATRIX_H

#include <Eigen/Dense>
#include <memory>
#include <vector>
#include <stdexcept>
#include <string>

namespace lassolab {

/**
 * @brief Abstract design matrix (rows = samples, columns = features)
 *
 * Dense and sparse backends must agree numerically up to floating-point
 * rounding for every operation.
 */
class DesignMatrix {
public:
    virtual ~DesignMatrix() = default;

    virtual int rows() const = 0;
    virtual int cols() const = 0;

    /**
     * @brief Column j as a dense vector (materialized for sparse storage)
     */
    virtual Eigen::VectorXd column(int j) const = 0;

    /**
     * @brief ||A[:,j]||_2^2
     */
    virtual double column_squared_norm(int j) const = 0;

    double column_norm(int j) const;

    /**
     * @brief <A[:,j], v> without materializing the column
     */
    virtual double column_dot(int j, const Eigen::VectorXd& v) const = 0;

    /**
     * @brief v += scale * A[:,j]
     */
    virtual void add_scaled_column(int j, double scale, Eigen::VectorXd& v) const = 0;

    // A x
    virtual Eigen::VectorXd multiply(const Eigen::VectorXd& x) const = 0;

    // A^T v
    virtual Eigen::VectorXd transpose_multiply(const Eigen::VectorXd& v) const = 0;

    /**
     * @brief Copy the listed rows, in the given order, into a new matrix
     *        with the same storage kind.
     */
    virtual std::unique_ptr<DesignMatrix> select_rows(const std::vector<int>& indices) const = 0;

    virtual long nnz() const = 0;
    virtual bool is_sparse() const = 0;

protected:
    void check_column(int j) const {
        if (j < 0 || j >= cols()) {
            throw std::out_of_range("Column index out of range: " + std::to_string(j));
        }
    }

    void check_row(int i) const {
        if (i < 0 || i >= rows()) {
            throw std::out_of_range("Row index out of range: " + std::to_string(i));
        }
    }
};

/**
 * @brief Dense backend over an owned Eigen::MatrixXd
 */
class DenseDesignMatrix : public DesignMatrix {
public:
    DenseDesignMatrix() = default;
    explicit DenseDesignMatrix(Eigen::MatrixXd m) : mat_(std::move(m)) {}

    int rows() const override { return mat_.rows(); }
    int cols() const override { return mat_.cols(); }

    Eigen::VectorXd column(int j) const override;
    double column_squared_norm(int j) const override;
    double column_dot(int j, const Eigen::VectorXd& v) const override;
    void add_scaled_column(int j, double scale, Eigen::VectorXd& v) const override;

    Eigen::VectorXd multiply(const Eigen::VectorXd& x) const override;
    Eigen::VectorXd transpose_multiply(const Eigen::VectorXd& v) const override;

    std::unique_ptr<DesignMatrix> select_rows(const std::vector<int>& indices) const override;

    long nnz() const override { return static_cast<long>(mat_.size()); }
    bool is_sparse() const override { return false; }

    const Eigen::MatrixXd& eigen() const { return mat_; }

private:
    Eigen::MatrixXd mat_;
};

} // namespace lassolab

#endif // LASSOLAB_DESIGN_MATRIX_H
