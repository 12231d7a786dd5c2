/**
 * @file coordinate_descent.h
 * @brief Lassolab - Randomized Coordinate Descent for the Lasso
 *
 * Each iteration exactly minimizes the objective along a single coordinate i:
 *
 *   z_i       = <a_i, r> + ||a_i||^2 * alpha_i
 *   alpha_i'  = S(z_i, lambda) / ||a_i||^2
 *   r        <- r + a_i * (alpha_i - alpha_i')
 *
 * where a_i is column i of A and r = b - A*alpha is maintained incrementally
 * (O(nnz(a_i)) per step instead of O(nnz(A))). Exact coordinate minimization
 * makes the objective non-increasing from one iteration to the next.
 *
 * Columns with zero norm carry no information; their coefficient is pinned
 * to 0 and the iteration does nothing else.
 *
 * Self-check (check = true):
 * --------------------------
 * After each update the objective is re-evaluated at alpha_i' +/- check_epsilon.
 * A decrease beyond round-off means the update was not a minimizer and is
 * reported on std::cerr. This is a debugging heuristic that depends on
 * check_epsilon; it is not a correctness proof and never aborts the run.
 */
#ifndef LASSOLAB_COORDINATE_DESCENT_H
#define LASSOLAB_COORDINATE_DESCENT_H

#include "lasso.h"

namespace lassolab {

enum class CoordinateSelection {
    Random,  // i ~ Uniform{0, ..., d-1}
    Cyclic   // i = t mod d
};

enum class CheckOutcome {
    Passed,
    RoundoffOnly,       // decrease smaller than check_tolerance * max(1, |F|)
    ObjectiveDecreased
};

/**
 * @brief Perturbation test of coordinate i at alpha
 *
 * Compares F(alpha) with F at alpha_i +/- epsilon. alpha is restored before
 * returning. A drop no larger than tolerance * max(1, |F(alpha)|) is
 * reported as RoundoffOnly.
 *
 * @param drop If non-null, receives F(alpha) - min(F(alpha_i +/- epsilon))
 * @throws std::invalid_argument on dimension mismatch or bad index
 */
CheckOutcome perturbation_check(const DesignMatrix& A, const Eigen::VectorXd& b,
                                double lambda, Eigen::VectorXd& alpha, int i,
                                double epsilon, double tolerance,
                                double* drop = nullptr);

class CoordinateDescent : public LassoSolver {
public:
    CoordinateSelection selection = CoordinateSelection::Random;
    bool check = false;
    double check_epsilon = 1e-6;
    double check_tolerance = 1e-9;   // relative round-off allowance for the check

    using LassoSolver::fit;

    LassoResult fit(const DesignMatrix& A, const Eigen::VectorXd& b,
                    std::mt19937& rng) override;

    std::string name() const override { return "CoordinateDescent"; }

private:
    void verify_coordinate(const DesignMatrix& A, const Eigen::VectorXd& b,
                           Eigen::VectorXd& alpha, int i, int iteration,
                           LassoResult& result) const;
};

} // namespace lassolab

#endif // LASSOLAB_COORDINATE_DESCENT_H
