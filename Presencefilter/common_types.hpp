// common_types.hpp
#ifndef PRESENCEFILTER_COMMON_TYPES_HPP_
#define PRESENCEFILTER_COMMON_TYPES_HPP_

#include <Eigen/Dense> // For Eigen::Vector2d
#include <stdexcept>   // For std::runtime_error
#include <string>      // For sensor, device and zone ids
#include <variant>     // For std::variant (C++17)
#include <vector>      // For std::vector

// --- Errors ---

/**
 * @brief Raised when a configuration write (sensor, zone, tuning parameters)
 * is invalid. Every mutator validates before touching state, so a thrown
 * ConfigurationError leaves the previous configuration in place.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Raised inside one device's processing when its numeric state is unusable
 * (non-finite covariance, failed decomposition). Never escapes a tick.
 */
class NumericalError : public std::runtime_error {
public:
    explicit NumericalError(const std::string& what) : std::runtime_error(what) {}
};

// --- Enums ---

// Reading modality of a fixed sensor
enum class SensorModality {
    SIGNAL_STRENGTH,   // Reports RSSI for a device (BLE/WiFi scanners)
    DIRECT_COORDINATE  // Reports an (x, y) for a device (mmWave, UWB)
};

// How a RawPosition was produced
enum class PositionMethod {
    MULTILATERATION,
    DIRECT,
    FUSED
};

// Per-device lifecycle inside the tracking cycle
enum class TrackState {
    UNINITIALIZED, // Seen, but no position solved yet (or reappeared after going stale)
    TRACKING,      // Filter running
    STALE          // No readings for longer than the inactivity timeout
};

// Per-device, per-tick outcome reported to the host for observability
enum class TickOutcome {
    SUCCESS,              // Raw position solved and filter corrected
    COASTING,             // No fresh readings this tick, filter predicted only
    INSUFFICIENT_SENSORS, // Not enough usable readings to solve a position
    SOLVER_FAILURE,       // Singular / near-singular multilateration geometry
    NUMERICAL_FAILURE,    // Filter divergence or a numeric exception, state reset
    STALE                 // Inactivity timeout reached, track released
};

enum class ZoneTransition {
    ENTERED,
    EXITED
};

// --- Calibration and readings ---

/**
 * @brief Log-distance path-loss calibration for a signal-strength sensor.
 */
struct SignalStrengthCalibration {
    double reference_rssi_dbm = -59.0; // Received level at 1 m
    double path_loss_exponent = 2.5;   // 2.0 free space, 2.5-4.0 indoors
};

/**
 * @brief Calibration for a sensor that reports coordinates directly.
 * The reported confidence is multiplied by confidence_scale.
 */
struct DirectCoordinateCalibration {
    double confidence_scale = 1.0;
};

// The active alternative is the sensor's modality.
using SensorCalibration = std::variant<SignalStrengthCalibration, DirectCoordinateCalibration>;

inline SensorModality modalityOf(const SensorCalibration& calibration) {
    return std::holds_alternative<SignalStrengthCalibration>(calibration)
               ? SensorModality::SIGNAL_STRENGTH
               : SensorModality::DIRECT_COORDINATE;
}

struct SignalStrengthPayload {
    double rssi_dbm = 0.0;
};

struct DirectCoordinatePayload {
    double x = 0.0;
    double y = 0.0;
    double confidence = 1.0; // Intrinsic confidence reported by the sensor [0,1]
};

using ReadingPayload = std::variant<SignalStrengthPayload, DirectCoordinatePayload>;

/**
 * @brief One raw report from a sensor about a device, as pushed by a transport.
 */
struct Reading {
    std::string sensor_id;
    std::string device_id;
    double timestamp = 0.0; // Seconds, same clock as the tick time
    ReadingPayload payload;
};

// --- Positions and events ---

/**
 * @brief Unfiltered position solved for one device in one tick.
 */
struct RawPosition {
    double x = 0.0;
    double y = 0.0;
    double confidence = 0.0; // [0,1]
    int sensor_count = 0;    // Contributing sensors
    PositionMethod method = PositionMethod::MULTILATERATION;
};

/**
 * @brief Filtered position handed to the host for one device.
 */
struct PublishedPosition {
    std::string device_id;
    double x = 0.0;
    double y = 0.0;
    double vx = 0.0;
    double vy = 0.0;
    double confidence = 0.0;      // From the filter covariance, [0,1]
    int sensor_count = 0;         // From the last accepted raw position
    PositionMethod method = PositionMethod::MULTILATERATION;
    double timestamp = 0.0;
    bool below_threshold = false; // Confidence under the configured threshold; still a valid position
};

struct ZoneEvent {
    std::string device_id;
    std::string zone_id;
    ZoneTransition kind = ZoneTransition::ENTERED;
    double timestamp = 0.0;
    double x = 0.0; // Position at transition
    double y = 0.0;
};

struct DeviceDiagnostic {
    std::string device_id;
    TickOutcome outcome = TickOutcome::SUCCESS;
    std::string detail;
    double timestamp = 0.0;
};

// --- Names for logs and diagnostics ---

inline const char* toString(PositionMethod method) {
    switch (method) {
        case PositionMethod::MULTILATERATION: return "multilateration";
        case PositionMethod::DIRECT: return "direct";
        case PositionMethod::FUSED: return "fused";
    }
    return "unknown";
}

inline const char* toString(TickOutcome outcome) {
    switch (outcome) {
        case TickOutcome::SUCCESS: return "success";
        case TickOutcome::COASTING: return "coasting";
        case TickOutcome::INSUFFICIENT_SENSORS: return "insufficient_sensors";
        case TickOutcome::SOLVER_FAILURE: return "solver_failure";
        case TickOutcome::NUMERICAL_FAILURE: return "numerical_failure";
        case TickOutcome::STALE: return "stale";
    }
    return "unknown";
}

inline const char* toString(ZoneTransition kind) {
    return kind == ZoneTransition::ENTERED ? "entered" : "exited";
}

inline const char* toString(TrackState state) {
    switch (state) {
        case TrackState::UNINITIALIZED: return "uninitialized";
        case TrackState::TRACKING: return "tracking";
        case TrackState::STALE: return "stale";
    }
    return "unknown";
}

#endif // PRESENCEFILTER_COMMON_TYPES_HPP_
