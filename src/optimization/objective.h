/**
 * @file objective.h
 * @brief Lassolab - Objective Interface and Lasso Objective
 *
 * Lasso objective:
 *   F(alpha) = 0.5 * ||A alpha - b||_2^2 + lambda * ||alpha||_1
 *
 * The smooth least-squares part and the L1 penalty are kept separate so the
 * stochastic solver can rescale the minibatch gradient of the smooth part
 * without touching the penalty subgradient.
 */
#ifndef LASSOLAB_OBJECTIVE_H
#define LASSOLAB_OBJECTIVE_H

#include <Eigen/Dense>
#include <utility>
#include <stdexcept>
#include "penalizer.h"
#include "../linalg/design_matrix.h"

namespace lassolab {

/**
 * @brief Abstract base class for objective functions
 *
 * For non-smooth objectives gradient() returns a subgradient.
 */
class Objective {
public:
    virtual ~Objective() = default;

    /**
     * @brief Compute objective function value at x
     * @param x Parameter vector
     * @return Objective value (to be minimized)
     */
    virtual double value(const Eigen::VectorXd& x) const = 0;

    /**
     * @brief Compute (sub)gradient of objective at x
     * @param x Parameter vector
     * @return Gradient vector (same dimension as x)
     */
    virtual Eigen::VectorXd gradient(const Eigen::VectorXd& x) const = 0;

    /**
     * @brief Get the dimension of the parameter space
     */
    virtual int dimension() const { return -1; } // -1 means undefined/dynamic
};

/**
 * @brief Objective that computes value and gradient together
 *
 * Both need the residual A x - b, so computing them in one pass halves the
 * number of matrix-vector products.
 */
class EfficientObjective : public Objective {
public:
    virtual std::pair<double, Eigen::VectorXd>
    value_and_gradient(const Eigen::VectorXd& x) const = 0;

    double value(const Eigen::VectorXd& x) const override {
        return value_and_gradient(x).first;
    }

    Eigen::VectorXd gradient(const Eigen::VectorXd& x) const override {
        return value_and_gradient(x).second;
    }
};

/**
 * @brief Least Squares Objective
 *
 * Minimizes: 0.5 * ||A*alpha - b||^2
 * Gradient:  -A^T (b - A*alpha)
 */
class LeastSquaresObjective : public EfficientObjective {
public:
    const DesignMatrix& A;
    const Eigen::VectorXd& b;

    LeastSquaresObjective(const DesignMatrix& A_, const Eigen::VectorXd& b_);

    std::pair<double, Eigen::VectorXd>
    value_and_gradient(const Eigen::VectorXd& alpha) const override;

    double value(const Eigen::VectorXd& alpha) const override;

    int dimension() const override { return A.cols(); }
};

/**
 * @brief Composite Lasso objective: least squares + L1 penalty
 *
 * gradient() is the subgradient -A^T(b - A*alpha) + lambda * sign(alpha),
 * with sign(0) = 0.
 */
class LassoObjective : public EfficientObjective {
public:
    LassoObjective(const DesignMatrix& A, const Eigen::VectorXd& b, double lambda);

    std::pair<double, Eigen::VectorXd>
    value_and_gradient(const Eigen::VectorXd& alpha) const override;

    double value(const Eigen::VectorXd& alpha) const override;

    int dimension() const override { return least_squares_.dimension(); }

    const L1Penalty& penalty() const { return penalty_; }

private:
    LeastSquaresObjective least_squares_;
    L1Penalty penalty_;
};

/**
 * @brief 0.5 * ||A alpha - b||^2 + lambda * ||alpha||_1
 * @throws std::invalid_argument on dimension mismatch
 */
double lasso_objective(const DesignMatrix& A, const Eigen::VectorXd& b,
                       double lambda, const Eigen::VectorXd& alpha);

double lasso_objective(const Eigen::MatrixXd& A, const Eigen::VectorXd& b,
                       double lambda, const Eigen::VectorXd& alpha);

/**
 * @brief Same value computed from a maintained residual r = b - A alpha
 */
inline double lasso_objective_from_residual(const Eigen::VectorXd& residual,
                                            double lambda,
                                            const Eigen::VectorXd& alpha) {
    return 0.5 * residual.squaredNorm() + lambda * alpha.lpNorm<1>();
}

/**
 * @brief Throws std::invalid_argument unless A is n x d, b has n entries
 *        and (when given) alpha has d entries.
 */
void check_dimensions(const DesignMatrix& A, const Eigen::VectorXd& b,
                      const Eigen::VectorXd* alpha = nullptr);

} // namespace lassolab

#endif // LASSOLAB_OBJECTIVE_H
