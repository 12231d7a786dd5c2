
#ifndef LASSOLAB_OPTIMIZATION_H
#define LASSOLAB_OPTIMIZATION_H

#include <cmath>
#include <algorithm>

namespace lassolab {
namespace optimization {

    /**
     * @brief Soft Thresholding Operator
     * S(z, gamma) = sign(z) * max(|z| - gamma, 0)
     *
     * Negative gamma is treated as zero.
     */
    inline double soft_threshold(double z, double gamma) {
        double g = std::max(0.0, gamma);
        if (g == 0.0) return z;

        if (z > g) return z - g;
        if (z < -g) return z + g;
        return 0.0;
    }

    /**
     * @brief Exact minimizer of the Lasso objective along one coordinate
     *
     * With internal = <a_i, r> + ||a_i||^2 * alpha_i, the minimizer of
     *   0.5 * ||r + a_i * (alpha_i - v)||^2 + lambda * |v|
     * over v is S(internal, lambda) / ||a_i||^2.
     *
     * @param internal Coordinate correlation with own contribution added back
     * @param lambda L1 coefficient
     * @param squared_norm ||a_i||^2, must be > 0
     */
    inline double coordinate_minimizer(double internal, double lambda, double squared_norm) {
        if (internal > lambda) return (internal - lambda) / squared_norm;
        if (internal < -lambda) return (internal + lambda) / squared_norm;
        return 0.0;
    }

    // sign(0) = 0
    inline double sign(double x) {
        return (x > 0.0) - (x < 0.0);
    }

} // namespace optimization
} // namespace lassolab

#endif // LASSOLAB_OPTIMIZATION_H
