/**
 * @file lasso.h
 * @brief Lassolab - Common Lasso Solver Interface
 *
 * Minimizes: 0.5 * ||A*alpha - b||^2 + lambda * ||alpha||_1
 *
 * Solvers:
 *   - CoordinateDescent     (coordinate_descent.h)
 *   - StochasticSubgradient (subgradient.h)
 *
 * Both run a fixed iteration budget starting from alpha = 0; there is no
 * tolerance-based stopping. All randomness comes from the generator passed
 * to fit(), so a seeded std::mt19937 makes runs reproducible.
 */
#ifndef LASSOLAB_LASSO_H
#define LASSOLAB_LASSO_H

#include <Eigen/Dense>
#include <memory>
#include <random>
#include <string>
#include "../linalg/design_matrix.h"
#include "../linalg/sparse_core.h"
#include "../optimization/history.h"

namespace lassolab {

struct LassoResult {
    Eigen::VectorXd coef;       // alpha after the last iteration (length d)
    Eigen::VectorXd residual;   // b - A*coef (length n)
    History history;            // empty unless trace was enabled
    int iterations = 0;
    double objective_value = 0.0;

    // Coordinate descent self-check statistics (zero when check is off)
    int checks_performed = 0;
    int check_failures = 0;     // objective decreased beyond round-off
    int check_roundoff = 0;     // objective decreased within round-off

    int nonzeros() const {
        return static_cast<int>((coef.array() != 0.0).count());
    }
};

class LassoSolver {
public:
    double lambda = 1.0;
    int max_iter = 1000;
    bool trace = false;     // record (time, objective) every iteration
    bool verbose = false;   // print a summary line after fitting

    virtual ~LassoSolver() = default;

    /**
     * @brief Fit alpha on (A, b)
     * @throws std::invalid_argument on dimension mismatch or bad settings
     */
    virtual LassoResult fit(const DesignMatrix& A, const Eigen::VectorXd& b,
                            std::mt19937& rng) = 0;

    LassoResult fit(const Eigen::MatrixXd& A, const Eigen::VectorXd& b, std::mt19937& rng);
    LassoResult fit(const SparseMatrixCSC& A, const Eigen::VectorXd& b, std::mt19937& rng);

    virtual std::string name() const = 0;

protected:
    void validate(const DesignMatrix& A, const Eigen::VectorXd& b) const;
    void report(const LassoResult& result, double seconds) const;
};

/**
 * @brief Factory: "cd" / "coordinate_descent" or "sgd" / "subgradient"
 */
std::unique_ptr<LassoSolver> make_lasso_solver(const std::string& method, double lambda = 1.0);

} // namespace lassolab

#endif // LASSOLAB_LASSO_H
