// sensor_registry.hpp
#ifndef PRESENCEFILTER_SENSOR_REGISTRY_HPP_
#define PRESENCEFILTER_SENSOR_REGISTRY_HPP_

#include <Eigen/Dense> // For Eigen::Vector2d
#include <cmath>       // For std::isfinite
#include <map>         // For the ordered sensor collection
#include <mutex>       // For std::mutex, std::lock_guard
#include <optional>    // For std::optional (C++17)
#include <string>
#include <vector>

// Project-specific Headers
#include "common_types.hpp" // For SensorCalibration, ConfigurationError

/**
 * @brief Static description of one fixed sensor.
 */
struct Sensor {
    std::string id;
    std::string name;
    Eigen::Vector2d location = Eigen::Vector2d::Zero(); // Meters, floor-plan frame
    SensorCalibration calibration = SignalStrengthCalibration{};
    bool enabled = true;
    std::optional<double> last_seen; // Timestamp of the newest reading accepted from this sensor

    SensorModality modality() const { return modalityOf(calibration); }
};

/**
 * @brief Validates a calibration block.
 * @throws ConfigurationError for a non-positive path-loss exponent, a non-finite
 * reference level or a confidence scale outside [0, 1].
 */
inline void validateCalibration(const SensorCalibration& calibration) {
    if (const auto* rssi = std::get_if<SignalStrengthCalibration>(&calibration)) {
        if (!std::isfinite(rssi->path_loss_exponent) || rssi->path_loss_exponent <= 0.0) {
            throw ConfigurationError("path-loss exponent must be a positive finite value");
        }
        if (!std::isfinite(rssi->reference_rssi_dbm)) {
            throw ConfigurationError("reference RSSI must be finite");
        }
    } else {
        const auto& direct = std::get<DirectCoordinateCalibration>(calibration);
        if (!std::isfinite(direct.confidence_scale) || direct.confidence_scale < 0.0 || direct.confidence_scale > 1.0) {
            throw ConfigurationError("confidence scale must be in [0, 1]");
        }
    }
}

/**
 * @brief Owns the sensor configuration.
 *
 * Every write is validated before it is applied. Accessors return copies, so a
 * tick can work on a consistent set of sensors while the configuration stream
 * keeps writing.
 */
class SensorRegistry {
public:
    /**
     * @brief Adds a new sensor.
     * @throws ConfigurationError if the sensor is invalid or the id is already registered.
     */
    void addSensor(const Sensor& sensor) {
        validate(sensor);
        std::lock_guard<std::mutex> lock(mutex_);
        if (sensors_.count(sensor.id) != 0) {
            throw ConfigurationError("sensor '" + sensor.id + "' is already registered");
        }
        sensors_.emplace(sensor.id, sensor);
    }

    /**
     * @brief Replaces an existing sensor. last_seen is carried over unless the update sets it.
     * @return False if the id is unknown.
     * @throws ConfigurationError if the sensor is invalid.
     */
    bool updateSensor(const Sensor& sensor) {
        validate(sensor);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sensors_.find(sensor.id);
        if (it == sensors_.end()) return false;
        replace(it->second, sensor);
        return true;
    }

    /**
     * @brief Adds or replaces a sensor, as delivered by a configuration stream.
     * @return True if the sensor was newly added.
     */
    bool upsertSensor(const Sensor& sensor) {
        validate(sensor);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sensors_.find(sensor.id);
        if (it == sensors_.end()) {
            sensors_.emplace(sensor.id, sensor);
            return true;
        }
        replace(it->second, sensor);
        return false;
    }

    bool removeSensor(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return sensors_.erase(id) > 0;
    }

    /**
     * @return True if the flag changed; false for an unknown id or an unchanged flag.
     */
    bool setEnabled(const std::string& id, bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sensors_.find(id);
        if (it == sensors_.end() || it->second.enabled == enabled) return false;
        it->second.enabled = enabled;
        return true;
    }

    /**
     * @brief Replaces the calibration of a sensor. The modality cannot change this way.
     * @return False if the id is unknown.
     * @throws ConfigurationError if the calibration is invalid or of the other modality.
     */
    bool setCalibration(const std::string& id, const SensorCalibration& calibration) {
        validateCalibration(calibration);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sensors_.find(id);
        if (it == sensors_.end()) return false;
        if (modalityOf(calibration) != it->second.modality()) {
            throw ConfigurationError("calibration for sensor '" + id + "' does not match its modality");
        }
        it->second.calibration = calibration;
        return true;
    }

    void markSeen(const std::string& id, double timestamp) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sensors_.find(id);
        if (it == sensors_.end()) return;
        if (!it->second.last_seen || *it->second.last_seen < timestamp) {
            it->second.last_seen = timestamp;
        }
    }

    std::optional<Sensor> getSensor(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sensors_.find(id);
        if (it == sensors_.end()) return std::nullopt;
        return it->second;
    }

    bool contains(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sensors_.count(id) != 0;
    }

    std::vector<Sensor> allSensors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Sensor> out;
        out.reserve(sensors_.size());
        for (const auto& entry : sensors_) out.push_back(entry.second);
        return out;
    }

    std::vector<Sensor> enabledSensors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Sensor> out;
        for (const auto& entry : sensors_) {
            if (entry.second.enabled) out.push_back(entry.second);
        }
        return out;
    }

    // Copy of the whole map, keyed by id, for one tick.
    std::map<std::string, Sensor> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sensors_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sensors_.size();
    }

private:
    static void validate(const Sensor& sensor) {
        if (sensor.id.empty()) {
            throw ConfigurationError("sensor id must not be empty");
        }
        if (!sensor.location.allFinite()) {
            throw ConfigurationError("sensor '" + sensor.id + "' has a non-finite location");
        }
        validateCalibration(sensor.calibration);
    }

    // Caller holds mutex_. Keeps last_seen unless the replacement sets it.
    static void replace(Sensor& stored, const Sensor& sensor) {
        std::optional<double> last_seen = stored.last_seen;
        stored = sensor;
        if (!stored.last_seen) stored.last_seen = last_seen;
    }

    std::map<std::string, Sensor> sensors_;
    mutable std::mutex mutex_;
};

#endif // PRESENCEFILTER_SENSOR_REGISTRY_HPP_
