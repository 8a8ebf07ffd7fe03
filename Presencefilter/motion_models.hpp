// motion_models.hpp
#ifndef PRESENCEFILTER_MOTION_MODELS_HPP_
#define PRESENCEFILTER_MOTION_MODELS_HPP_

#include <Eigen/Dense> // For Eigen types
#include <cmath>       // For std::isfinite

// Project-specific Headers
#include "common_types.hpp" // For ConfigurationError

/**
 * @brief Constant Velocity (CV) motion model for planar indoor motion.
 *
 * State vector: [x, y, vx, vy]^T (4 dimensions).
 * Observation: [x, y]^T, position only.
 * Process noise: continuous white-noise acceleration with standard deviation
 * accel_std_dev on each axis, discretized over the elapsed time dt. Position and
 * velocity noise are correlated, so Q grows with dt and uncertainty keeps growing
 * through sensor outages.
 */
class ConstantVelocityModel2D {
public:
    static constexpr int kStateDim = 4;
    static constexpr int kMeasurementDim = 2;

    using StateType = Eigen::Matrix<double, kStateDim, 1>;
    using CovarianceMatrix = Eigen::Matrix<double, kStateDim, kStateDim>;
    using MeasurementMatrix = Eigen::Matrix<double, kMeasurementDim, kStateDim>;

    /**
     * @brief Constructor for the Constant Velocity Model.
     * @param accel_std_dev Standard deviation of the white-noise acceleration (m/s^2).
     * @throws ConfigurationError if accel_std_dev is not positive.
     */
    explicit ConstantVelocityModel2D(double accel_std_dev)
        : accel_std_dev_(accel_std_dev) {
        if (!std::isfinite(accel_std_dev) || accel_std_dev <= 0.0) {
            throw ConfigurationError("ConstantVelocityModel2D: acceleration noise must be positive.");
        }
    }

    /**
     * @brief State transition matrix F(dt): position advances by velocity * dt, velocity is kept.
     */
    CovarianceMatrix transition(double dt) const {
        CovarianceMatrix F = CovarianceMatrix::Identity();
        F(0, 2) = dt; // x += vx * dt
        F(1, 3) = dt; // y += vy * dt
        return F;
    }

    /**
     * @brief Predicts the state dt seconds ahead.
     */
    StateType f(const StateType& x, double dt) const {
        return transition(dt) * x;
    }

    /**
     * @brief Process noise covariance Q(dt), block diagonal per axis:
     *   [ q dt^3/3   q dt^2/2 ]
     *   [ q dt^2/2   q dt     ]    with q = accel_std_dev^2
     */
    CovarianceMatrix processNoise(double dt) const {
        CovarianceMatrix Q = CovarianceMatrix::Zero();
        const double q = accel_std_dev_ * accel_std_dev_;

        // X-axis (px, vx)
        Q(0, 0) = q * dt * dt * dt / 3.0;
        Q(0, 2) = q * dt * dt / 2.0;
        Q(2, 0) = q * dt * dt / 2.0;
        Q(2, 2) = q * dt;

        // Y-axis (py, vy)
        Q(1, 1) = q * dt * dt * dt / 3.0;
        Q(1, 3) = q * dt * dt / 2.0;
        Q(3, 1) = q * dt * dt / 2.0;
        Q(3, 3) = q * dt;

        return Q;
    }

    /**
     * @brief Observation matrix H selecting (x, y).
     */
    MeasurementMatrix observation() const {
        MeasurementMatrix H = MeasurementMatrix::Zero();
        H(0, 0) = 1.0;
        H(1, 1) = 1.0;
        return H;
    }

    double accelStdDev() const { return accel_std_dev_; }

private:
    double accel_std_dev_;
};

#endif // PRESENCEFILTER_MOTION_MODELS_HPP_
