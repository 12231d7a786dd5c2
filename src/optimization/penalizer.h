/**
 * @file penalizer.h
 * @brief Lassolab - Penalizer Interface
 *
 * The L1 penalty is the only regularizer the Lasso solvers need, but the
 * abstract base keeps the subgradient / prox split explicit.
 */
#ifndef LASSOLAB_PENALIZER_H
#define LASSOLAB_PENALIZER_H

#include <Eigen/Dense>
#include <stdexcept>
#include "optimization.h"

namespace lassolab {

/**
 * @brief Abstract base class for regularization penalties
 */
class Penalizer {
public:
    virtual ~Penalizer() = default;

    /**
     * @brief Compute penalty value
     * @param x Parameter vector
     * @return Penalty value (always >= 0)
     */
    virtual double penalty(const Eigen::VectorXd& x) const = 0;

    /**
     * @brief Compute gradient of penalty (if smooth)
     * @note For non-smooth penalties (L1), returns a subgradient
     */
    virtual Eigen::VectorXd gradient(const Eigen::VectorXd& x) const = 0;

    /**
     * @brief Proximal operator: prox_{step*g}(x) = argmin_z { 0.5||z-x||^2 + step*g(z) }
     */
    virtual Eigen::VectorXd prox(const Eigen::VectorXd& x, double step) const = 0;

    virtual bool is_smooth() const = 0;
};

/**
 * @brief L1 (Lasso) penalty: lambda * ||x||_1
 *
 * Proximal operator: soft thresholding
 *   prox(x_i) = sign(x_i) * max(|x_i| - step * lambda, 0)
 */
class L1Penalty : public Penalizer {
public:
    double lambda;

    explicit L1Penalty(double lam = 1.0) : lambda(lam) {
        if (lam < 0.0) {
            throw std::invalid_argument("L1 penalty coefficient must be non-negative");
        }
    }

    double penalty(const Eigen::VectorXd& x) const override {
        return lambda * x.lpNorm<1>();
    }

    Eigen::VectorXd gradient(const Eigen::VectorXd& x) const override {
        // Subgradient: sign(x) * lambda, with 0 at origin
        Eigen::VectorXd g(x.size());
        for (int i = 0; i < x.size(); ++i) {
            g(i) = lambda * optimization::sign(x(i));
        }
        return g;
    }

    Eigen::VectorXd prox(const Eigen::VectorXd& x, double step) const override {
        const double threshold = lambda * step;
        Eigen::VectorXd result(x.size());
        for (int i = 0; i < x.size(); ++i) {
            result(i) = optimization::soft_threshold(x(i), threshold);
        }
        return result;
    }

    bool is_smooth() const override { return lambda == 0.0; }
};

} // namespace lassolab

#endif // LASSOLAB_PENALIZER_H
