// tracker_config.hpp
#ifndef PRESENCEFILTER_TRACKER_CONFIG_HPP_
#define PRESENCEFILTER_TRACKER_CONFIG_HPP_

#include <cmath>     // For std::isfinite
#include <string>

// Project-specific Headers
#include "common_types.hpp" // For ConfigurationError
#include "tracker_log.hpp"  // For LogLevel

// Throws ConfigurationError unless value is positive and finite.
inline void requirePositiveParameter(double value, const char* name) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw ConfigurationError(std::string(name) + " must be a positive finite value");
    }
}

/**
 * @brief Tuning for the signal-strength to distance conversion.
 */
struct DistanceModelConfig {
    double min_distance_m = 0.1;   // Lower clamp for converted distances
    double max_distance_m = 100.0; // Upper clamp, beyond indoor usefulness

    void validate() const {
        requirePositiveParameter(min_distance_m, "distance.min_distance_m");
        requirePositiveParameter(max_distance_m, "distance.max_distance_m");
        if (max_distance_m <= min_distance_m) {
            throw ConfigurationError("distance.max_distance_m must exceed distance.min_distance_m");
        }
    }
};

/**
 * @brief Tuning for multilateration and the confidence heuristics.
 */
struct SolverConfig {
    // Normalized determinant (0 = collinear, 1 = perfectly conditioned) below which
    // the linearized system is rejected as near-singular.
    double singularity_epsilon = 1e-6;
    double residual_scale_m = 2.0;     // RMS residual at which the residual factor halves
    double spread_reference_m2 = 4.0;  // Minor-axis positional variance giving a full spread factor
    int saturation_sensor_count = 6;   // Sensor count giving a full count factor
    double min_count_factor = 0.6;     // Count factor at the minimum of 3 sensors
    int refinement_iterations = 5;     // Gauss-Newton steps on the range residuals, 0 disables

    void validate() const {
        requirePositiveParameter(singularity_epsilon, "solver.singularity_epsilon");
        requirePositiveParameter(residual_scale_m, "solver.residual_scale_m");
        requirePositiveParameter(spread_reference_m2, "solver.spread_reference_m2");
        if (saturation_sensor_count < 3) {
            throw ConfigurationError("solver.saturation_sensor_count must be at least 3");
        }
        if (!(min_count_factor > 0.0 && min_count_factor <= 1.0)) {
            throw ConfigurationError("solver.min_count_factor must be in (0, 1]");
        }
        if (refinement_iterations < 0) {
            throw ConfigurationError("solver.refinement_iterations must not be negative");
        }
    }
};

/**
 * @brief Tuning for the per-device constant-velocity Kalman filter.
 */
struct FilterConfig {
    double accel_noise_std_dev = 0.5;         // White-noise acceleration (m/s^2)
    double initial_velocity_std_dev = 1.0;    // Velocity uncertainty at initialization (m/s)
    double base_measurement_variance = 1.0;   // Position variance (m^2) of a confidence 1.0 observation
    double min_measurement_confidence = 0.05; // Floor before inverting confidence into variance
    double confidence_radius_m = 1.5;         // Radius used to turn covariance into a confidence
    double max_covariance_trace = 1e6;        // Divergence bound (m^2 + (m/s)^2)
    double innovation_gate_probability = 0.0; // Chi-squared gate, 0 disables (e.g. 0.997)
    int max_consecutive_gated = 3;            // Gated observations in a row before re-initializing

    void validate() const {
        requirePositiveParameter(accel_noise_std_dev, "filter.accel_noise_std_dev");
        requirePositiveParameter(initial_velocity_std_dev, "filter.initial_velocity_std_dev");
        requirePositiveParameter(base_measurement_variance, "filter.base_measurement_variance");
        if (!(min_measurement_confidence > 0.0 && min_measurement_confidence <= 1.0)) {
            throw ConfigurationError("filter.min_measurement_confidence must be in (0, 1]");
        }
        requirePositiveParameter(confidence_radius_m, "filter.confidence_radius_m");
        requirePositiveParameter(max_covariance_trace, "filter.max_covariance_trace");
        if (!(innovation_gate_probability >= 0.0 && innovation_gate_probability < 1.0)) {
            throw ConfigurationError("filter.innovation_gate_probability must be in [0, 1)");
        }
        if (max_consecutive_gated < 1) {
            throw ConfigurationError("filter.max_consecutive_gated must be at least 1");
        }
    }
};

/**
 * @brief Tuning for the periodic tracking cycle.
 */
struct CycleConfig {
    double tick_interval_s = 1.0;
    double staleness_window_s = 3.0;    // Readings older than this are ignored by a tick
    double inactivity_timeout_s = 30.0; // Devices without readings for this long go stale
    double confidence_threshold = 0.7;  // Below this a published position is flagged
    double publish_epsilon = 1e-4;      // Minimum change in position/confidence to republish
    LogLevel log_level = LogLevel::WARNING;

    void validate() const {
        requirePositiveParameter(tick_interval_s, "cycle.tick_interval_s");
        requirePositiveParameter(staleness_window_s, "cycle.staleness_window_s");
        requirePositiveParameter(inactivity_timeout_s, "cycle.inactivity_timeout_s");
        if (inactivity_timeout_s < staleness_window_s) {
            throw ConfigurationError("cycle.inactivity_timeout_s must not be shorter than cycle.staleness_window_s");
        }
        if (!(confidence_threshold >= 0.0 && confidence_threshold <= 1.0)) {
            throw ConfigurationError("cycle.confidence_threshold must be in [0, 1]");
        }
        if (!(publish_epsilon >= 0.0)) {
            throw ConfigurationError("cycle.publish_epsilon must not be negative");
        }
    }
};

/**
 * @brief Complete configuration for a TrackingCycle.
 */
struct TrackerConfig {
    DistanceModelConfig distance;
    SolverConfig solver;
    FilterConfig filter;
    CycleConfig cycle;

    /**
     * @brief Checks every parameter.
     * @throws ConfigurationError naming the first invalid parameter.
     */
    void validate() const {
        distance.validate();
        solver.validate();
        filter.validate();
        cycle.validate();
    }
};

#endif // PRESENCEFILTER_TRACKER_CONFIG_HPP_
