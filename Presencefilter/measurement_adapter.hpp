// measurement_adapter.hpp
#ifndef PRESENCEFILTER_MEASUREMENT_ADAPTER_HPP_
#define PRESENCEFILTER_MEASUREMENT_ADAPTER_HPP_

// Standard Library Headers
#include <algorithm>   // For std::min, std::max
#include <cmath>       // For std::pow, std::isfinite
#include <map>         // For the per-tick sensor map
#include <optional>    // For std::optional (C++17)
#include <string>
#include <vector>

// Eigen Library Headers
#include <Eigen/Dense> // For Eigen::Vector2d

// Project-specific Headers
#include "common_types.hpp"    // For Reading, calibration types, ConfigurationError
#include "sensor_registry.hpp" // For Sensor, validateCalibration
#include "tracker_config.hpp"  // For DistanceModelConfig

/**
 * @brief Log-distance path-loss model turning a signal-strength reading into a distance.
 *
 *   distance = 10 ^ ((reference_rssi - measured_rssi) / (10 * path_loss_exponent))
 *
 * Results are clamped to [min_distance_m, max_distance_m]. Corrupt input yields no
 * distance instead of a propagated NaN; a bad calibration is a configuration error.
 */
class DistanceModel {
public:
    explicit DistanceModel(const DistanceModelConfig& config = DistanceModelConfig())
        : min_distance_m_(config.min_distance_m),
          max_distance_m_(config.max_distance_m) {
        if (!(min_distance_m_ > 0.0) || !(max_distance_m_ > min_distance_m_)) {
            throw ConfigurationError("DistanceModel: distance clamp range must be positive and non-empty.");
        }
    }

    /**
     * @brief Converts an RSSI to an estimated distance in meters.
     * @param rssi_dbm Measured level.
     * @param calibration Reference level at 1 m and path-loss exponent of the sensor.
     * @return The clamped distance, or std::nullopt if the reading is not a finite number.
     * @throws ConfigurationError if the path-loss exponent is not positive.
     */
    std::optional<double> rssiToDistance(double rssi_dbm, const SignalStrengthCalibration& calibration) const {
        if (!std::isfinite(calibration.path_loss_exponent) || calibration.path_loss_exponent <= 0.0) {
            throw ConfigurationError("DistanceModel: path-loss exponent must be positive.");
        }
        if (!std::isfinite(calibration.reference_rssi_dbm)) {
            throw ConfigurationError("DistanceModel: reference RSSI must be finite.");
        }
        if (!std::isfinite(rssi_dbm)) {
            return std::nullopt;
        }

        double exponent = (calibration.reference_rssi_dbm - rssi_dbm) / (10.0 * calibration.path_loss_exponent);
        double distance = std::pow(10.0, exponent);
        if (std::isnan(distance) || distance < 0.0) {
            return std::nullopt;
        }
        // pow overflows to +inf for absurd readings; the clamp folds that into max range.
        return std::max(min_distance_m_, std::min(max_distance_m_, distance));
    }

    double minDistance() const { return min_distance_m_; }
    double maxDistance() const { return max_distance_m_; }

private:
    const double min_distance_m_;
    const double max_distance_m_;
};

/**
 * @brief A signal-strength reading converted to a range from a known anchor.
 */
struct RangeMeasurement {
    std::string sensor_id;
    Eigen::Vector2d anchor = Eigen::Vector2d::Zero(); // Sensor location
    double distance_m = 0.0;
    double rssi_dbm = 0.0;
};

/**
 * @brief A direct-coordinate reading with its confidence after sensor scaling.
 */
struct DirectMeasurement {
    std::string sensor_id;
    Eigen::Vector2d position = Eigen::Vector2d::Zero();
    double confidence = 0.0; // [0,1]
};

/**
 * @brief One device's readings for one tick, partitioned by modality.
 */
struct AdaptedMeasurements {
    std::vector<RangeMeasurement> ranges;
    std::vector<DirectMeasurement> directs;
    int dropped_readings = 0; // Unknown/disabled sensor, modality mismatch or corrupt payload

    bool empty() const { return ranges.empty() && directs.empty(); }
};

/**
 * @brief The MeasurementAdapter normalizes a device's raw readings into the two
 * measurement kinds the position solver understands.
 *
 * Each reading is resolved against the sensor it came from: signal-strength
 * readings become ranges through the DistanceModel, direct-coordinate readings
 * keep their position and get their confidence scaled by the sensor calibration.
 * Readings that cannot be used are counted, not thrown.
 */
class MeasurementAdapter {
public:
    explicit MeasurementAdapter(const DistanceModel& distance_model)
        : distance_model_(distance_model) {}

    /**
     * @brief Adapts one device's fresh readings.
     * @param readings The device's readings from the tick snapshot.
     * @param sensors The sensor configuration for this tick, keyed by id.
     * @return The partitioned measurements and the number of dropped readings.
     */
    AdaptedMeasurements adapt(const std::vector<Reading>& readings,
                              const std::map<std::string, Sensor>& sensors) const {
        AdaptedMeasurements adapted;
        for (const auto& reading : readings) {
            auto it = sensors.find(reading.sensor_id);
            if (it == sensors.end() || !it->second.enabled) {
                adapted.dropped_readings++;
                continue;
            }
            const Sensor& sensor = it->second;

            switch (sensor.modality()) {
                case SensorModality::SIGNAL_STRENGTH:
                    if (!adaptSignalStrengthReading(reading, sensor, adapted)) adapted.dropped_readings++;
                    break;
                case SensorModality::DIRECT_COORDINATE:
                    if (!adaptDirectReading(reading, sensor, adapted)) adapted.dropped_readings++;
                    break;
            }
        }
        return adapted;
    }

    const DistanceModel& distanceModel() const { return distance_model_; }

private:
    DistanceModel distance_model_;

    bool adaptSignalStrengthReading(const Reading& reading, const Sensor& sensor, AdaptedMeasurements& out) const {
        const auto* payload = std::get_if<SignalStrengthPayload>(&reading.payload);
        if (payload == nullptr) return false; // Sensor configured for RSSI reported coordinates

        const auto& calibration = std::get<SignalStrengthCalibration>(sensor.calibration);
        std::optional<double> distance = distance_model_.rssiToDistance(payload->rssi_dbm, calibration);
        if (!distance) return false;

        RangeMeasurement range;
        range.sensor_id = sensor.id;
        range.anchor = sensor.location;
        range.distance_m = *distance;
        range.rssi_dbm = payload->rssi_dbm;
        out.ranges.push_back(range);
        return true;
    }

    bool adaptDirectReading(const Reading& reading, const Sensor& sensor, AdaptedMeasurements& out) const {
        const auto* payload = std::get_if<DirectCoordinatePayload>(&reading.payload);
        if (payload == nullptr) return false;
        if (!std::isfinite(payload->x) || !std::isfinite(payload->y) || !std::isfinite(payload->confidence)) {
            return false;
        }

        const auto& calibration = std::get<DirectCoordinateCalibration>(sensor.calibration);
        DirectMeasurement direct;
        direct.sensor_id = sensor.id;
        direct.position = Eigen::Vector2d(payload->x, payload->y);
        direct.confidence = std::max(0.0, std::min(1.0, payload->confidence * calibration.confidence_scale));
        out.directs.push_back(direct);
        return true;
    }
};

#endif // PRESENCEFILTER_MEASUREMENT_ADAPTER_HPP_
