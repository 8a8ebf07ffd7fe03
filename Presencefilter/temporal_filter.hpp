// temporal_filter.hpp
#ifndef PRESENCEFILTER_TEMPORAL_FILTER_HPP_
#define PRESENCEFILTER_TEMPORAL_FILTER_HPP_

#include <algorithm> // For std::max
#include <cmath>     // For std::isfinite
#include <map>       // For the per-device arena
#include <optional>  // For std::optional (C++17)
#include <string>

#include <Eigen/Dense>
#include <Eigen/Cholesky> // For LLT

// Boost.Math for the innovation gate threshold
#include <boost/math/distributions/chi_squared.hpp>

// Project Specific Includes
#include "common_types.hpp"                // For RawPosition, NumericalError
#include "filter_confidence_estimator.hpp" // For FilterConfidenceEstimator
#include "motion_models.hpp"               // For ConstantVelocityModel2D
#include "tracker_config.hpp"              // For FilterConfig

/**
 * @brief Kalman state of one device. Owned by exactly one PositionKalmanFilter.
 */
struct DeviceTrackState {
    ConstantVelocityModel2D::StateType x = ConstantVelocityModel2D::StateType::Zero();            // [x, y, vx, vy]
    ConstantVelocityModel2D::CovarianceMatrix P = ConstantVelocityModel2D::CovarianceMatrix::Identity();
    double last_update_time = 0.0; // Time the state refers to
    int consecutive_gated = 0;     // Observations rejected by the innovation gate in a row
};

enum class FilterUpdateStatus {
    CORRECTED,      // Observation accepted
    PREDICTED_ONLY, // No observation this step
    GATED_OUT,      // Observation rejected by the innovation gate, prediction kept
    REINITIALIZED,  // Too many gated observations in a row, filter restarted on the observation
    REJECTED        // Update numerically unusable, prediction kept
};

/**
 * @brief Constant-velocity Kalman filter for one device.
 *
 * predict() advances the state by the elapsed time and inflates the covariance by
 * Q(dt). update() corrects with a RawPosition observed as (x, y) whose variance is
 * base_measurement_variance / confidence. The covariance update uses the Joseph form
 * and is re-symmetrized; a covariance that stops being finite, positive semi-definite
 * or below max_covariance_trace is never committed: a diverged prediction resets the
 * covariance around the last position, a diverged update is discarded.
 *
 * @note Not thread-safe. A filter belongs to the tick that processes its device.
 */
class PositionKalmanFilter {
public:
    using StateType = ConstantVelocityModel2D::StateType;
    using CovarianceMatrixType = ConstantVelocityModel2D::CovarianceMatrix;
    using MeasurementType = Eigen::Vector2d;
    using MeasurementCovariance = Eigen::Matrix2d;

    PositionKalmanFilter(const FilterConfig& config, const RawPosition& first_observation, double timestamp)
        : config_(config),
          model_(config.accel_noise_std_dev),
          confidence_estimator_(config.confidence_radius_m),
          gate_threshold_(gateThreshold(config.innovation_gate_probability)) {
        initialize(first_observation, timestamp);
    }

    /**
     * @brief Restarts the filter on an observation: position from the observation,
     * zero velocity, covariance from the observation noise and initial_velocity_std_dev.
     * @throws NumericalError if the observation is not finite.
     */
    void initialize(const RawPosition& observation, double timestamp) {
        if (!std::isfinite(observation.x) || !std::isfinite(observation.y) || !std::isfinite(timestamp)) {
            throw NumericalError("PositionKalmanFilter: cannot initialize on a non-finite observation.");
        }
        state_.x << observation.x, observation.y, 0.0, 0.0;
        state_.P = initialCovariance(measurementVariance(observation.confidence));
        state_.last_update_time = timestamp;
        state_.consecutive_gated = 0;
    }

    /**
     * @brief Advances the filter to timestamp with the constant-velocity model.
     * A timestamp not after the current one leaves the filter untouched.
     * @return False if the predicted covariance diverged and was reset (the position
     * estimate is kept, velocity zeroed).
     */
    bool predict(double timestamp) {
        double dt = timestamp - state_.last_update_time;
        if (!(dt > 0.0)) return true;

        const CovarianceMatrixType F = model_.transition(dt);
        StateType x_pred = F * state_.x;
        CovarianceMatrixType P_pred = F * state_.P * F.transpose() + model_.processNoise(dt);
        P_pred = (P_pred + P_pred.transpose()) * 0.5;
        state_.last_update_time = timestamp;

        if (!x_pred.allFinite() || !isCovarianceHealthy(P_pred)) {
            // Bound the runaway uncertainty: keep the last usable position, restart covariance.
            StateType reset = StateType::Zero();
            if (state_.x.head<2>().allFinite()) reset.head<2>() = state_.x.head<2>();
            state_.x = reset;
            state_.P = initialCovariance(config_.base_measurement_variance / config_.min_measurement_confidence);
            return false;
        }

        state_.x = x_pred;
        state_.P = P_pred;
        return true;
    }

    /**
     * @brief Corrects the predicted state with an observed position.
     * Call predict() for the observation's time first.
     */
    FilterUpdateStatus update(const RawPosition& observation) {
        if (!std::isfinite(observation.x) || !std::isfinite(observation.y)) {
            return FilterUpdateStatus::REJECTED;
        }

        const auto H = model_.observation();
        const MeasurementType z(observation.x, observation.y);
        const MeasurementCovariance R =
            MeasurementCovariance::Identity() * measurementVariance(observation.confidence);

        const MeasurementType innovation = z - H * state_.x;
        const MeasurementCovariance S = H * state_.P * H.transpose() + R;

        Eigen::LLT<MeasurementCovariance> llt_S(S);
        if (!S.allFinite() || llt_S.info() != Eigen::Success) {
            return FilterUpdateStatus::REJECTED;
        }

        // --- Validation Gating ---
        if (gate_threshold_) {
            double nis = innovation.dot(llt_S.solve(innovation));
            if (!std::isfinite(nis) || nis > *gate_threshold_) {
                state_.consecutive_gated++;
                if (state_.consecutive_gated >= config_.max_consecutive_gated) {
                    // The device moved away from the prediction for good; follow it.
                    initialize(observation, state_.last_update_time);
                    return FilterUpdateStatus::REINITIALIZED;
                }
                return FilterUpdateStatus::GATED_OUT;
            }
        }

        // K = P H^T S^-1, solved through the Cholesky factor of S.
        const Eigen::Matrix<double, 4, 2> PHt = state_.P * H.transpose();
        const Eigen::Matrix<double, 4, 2> K = llt_S.solve(PHt.transpose()).transpose();

        StateType x_new = state_.x + K * innovation;

        // Joseph form keeps P symmetric positive semi-definite under rounding.
        const CovarianceMatrixType I_KH = CovarianceMatrixType::Identity() - K * H;
        CovarianceMatrixType P_new = I_KH * state_.P * I_KH.transpose() + K * R * K.transpose();
        P_new = (P_new + P_new.transpose()) * 0.5;

        if (!x_new.allFinite() || !isCovarianceHealthy(P_new)) {
            return FilterUpdateStatus::REJECTED; // Keep the prediction
        }

        state_.x = x_new;
        state_.P = P_new;
        state_.consecutive_gated = 0;
        return FilterUpdateStatus::CORRECTED;
    }

    /**
     * @brief Observation variance for a RawPosition confidence: lower confidence, more noise.
     */
    double measurementVariance(double confidence) const {
        double c = std::isfinite(confidence) ? confidence : 0.0;
        c = std::max(config_.min_measurement_confidence, std::min(1.0, c));
        return config_.base_measurement_variance / c;
    }

    /**
     * @brief True if P is finite, symmetric, positive semi-definite and within the sanity bound.
     */
    bool isCovarianceHealthy(const CovarianceMatrixType& P) const {
        if (!P.allFinite()) return false;
        if (!(P.trace() <= config_.max_covariance_trace)) return false;
        if (!P.isApprox(P.transpose(), 1e-9)) return false;
        // PSD check through a Cholesky decomposition with a small jitter for exact zeros.
        Eigen::LLT<CovarianceMatrixType> llt(P + CovarianceMatrixType::Identity() * 1e-12);
        return llt.info() == Eigen::Success;
    }

    bool isHealthy() const {
        return state_.x.allFinite() && isCovarianceHealthy(state_.P);
    }

    double positionConfidence() const {
        return confidence_estimator_.calculateConfidence(state_.P.topLeftCorner<2, 2>());
    }

    Eigen::Vector2d position() const { return state_.x.head<2>(); }
    Eigen::Vector2d velocity() const { return state_.x.tail<2>(); }
    const DeviceTrackState& trackState() const { return state_; }
    double lastUpdateTime() const { return state_.last_update_time; }
    bool gatingEnabled() const { return gate_threshold_.has_value(); }
    std::optional<double> gateThreshold() const { return gate_threshold_; }

private:
    FilterConfig config_;
    ConstantVelocityModel2D model_;
    FilterConfidenceEstimator confidence_estimator_;
    std::optional<double> gate_threshold_; // Chi-squared(2) quantile, empty when gating is off
    DeviceTrackState state_;

    CovarianceMatrixType initialCovariance(double position_variance) const {
        CovarianceMatrixType P = CovarianceMatrixType::Zero();
        const double v0 = config_.initial_velocity_std_dev * config_.initial_velocity_std_dev;
        P(0, 0) = position_variance;
        P(1, 1) = position_variance;
        P(2, 2) = v0;
        P(3, 3) = v0;
        return P;
    }

    static std::optional<double> gateThreshold(double probability) {
        if (!(probability > 0.0 && probability < 1.0)) return std::nullopt;
        boost::math::chi_squared_distribution<double> chi_sq_dist(2.0);
        return boost::math::quantile(chi_sq_dist, probability);
    }
};

/**
 * @brief Result of one filter step for one device.
 */
struct FilterStep {
    bool initialized = false;        // Filter created or restarted from this tick's observation
    bool covariance_reset = false;   // Prediction diverged and the covariance was reset
    FilterUpdateStatus update = FilterUpdateStatus::PREDICTED_ONLY;
    Eigen::Vector2d position = Eigen::Vector2d::Zero();
    Eigen::Vector2d velocity = Eigen::Vector2d::Zero();
    double confidence = 0.0;

    bool numericalFailure() const {
        return covariance_reset || update == FilterUpdateStatus::REJECTED;
    }
};

/**
 * @brief The TemporalFilter owns one PositionKalmanFilter per device, created lazily
 * on the device's first observation and destroyed by release(). Filters are never
 * shared between devices.
 *
 * @note Not thread-safe; owned by the tracking cycle's tick.
 */
class TemporalFilter {
public:
    /**
     * @throws ConfigurationError if config is invalid, rather than on a device's first observation.
     */
    explicit TemporalFilter(const FilterConfig& config = FilterConfig())
        : config_(config) {
        config_.validate();
    }

    /**
     * @brief Runs one tick for a device: predict to timestamp, then update if an observation exists.
     * @return The filtered estimate, or std::nullopt if the device has no filter and no observation.
     * @throws NumericalError if a new filter would start from a non-finite observation.
     */
    std::optional<FilterStep> step(const std::string& device_id, double timestamp,
                                   const std::optional<RawPosition>& observation) {
        FilterStep result;
        auto it = filters_.find(device_id);
        if (it == filters_.end()) {
            if (!observation) return std::nullopt;
            it = filters_.emplace(device_id, PositionKalmanFilter(config_, *observation, timestamp)).first;
            result.initialized = true;
        } else {
            PositionKalmanFilter& filter = it->second;
            result.covariance_reset = !filter.predict(timestamp);
            if (observation) {
                result.update = filter.update(*observation);
                result.initialized = result.update == FilterUpdateStatus::REINITIALIZED;
            }
        }

        const PositionKalmanFilter& filter = it->second;
        result.position = filter.position();
        result.velocity = filter.velocity();
        result.confidence = filter.positionConfidence();
        return result;
    }

    bool release(const std::string& device_id) { return filters_.erase(device_id) > 0; }
    bool contains(const std::string& device_id) const { return filters_.count(device_id) != 0; }
    size_t size() const { return filters_.size(); }

    const PositionKalmanFilter* find(const std::string& device_id) const {
        auto it = filters_.find(device_id);
        return it == filters_.end() ? nullptr : &it->second;
    }

private:
    FilterConfig config_;
    std::map<std::string, PositionKalmanFilter> filters_;
};

#endif // PRESENCEFILTER_TEMPORAL_FILTER_HPP_
