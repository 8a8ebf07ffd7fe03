// reading_buffer.hpp
#ifndef PRESENCEFILTER_READING_BUFFER_HPP_
#define PRESENCEFILTER_READING_BUFFER_HPP_

#include <cmath>    // For std::isfinite
#include <map>      // For ordered per-device grouping
#include <memory>   // For std::shared_ptr
#include <mutex>    // For std::mutex, std::lock_guard
#include <string>
#include <utility>  // For std::pair
#include <vector>

// Project-specific Headers
#include "common_types.hpp" // For Reading

/**
 * @brief What one tick sees for one device.
 */
struct DeviceReadings {
    std::vector<Reading> fresh;  // Readings within the staleness window, newest per sensor
    double last_reading_time = 0.0; // Newest retained reading, fresh or not
};

/**
 * @brief Immutable view of the buffer taken at tick start.
 */
struct ReadingSnapshot {
    double taken_at = 0.0;
    std::map<std::string, DeviceReadings> devices; // Keyed by device id

    const DeviceReadings* find(const std::string& device_id) const {
        auto it = devices.find(device_id);
        return it == devices.end() ? nullptr : &it->second;
    }
};

/**
 * @brief Latest reading per (sensor, device) pair, written by any number of
 * producer threads and read by the tick through snapshot().
 *
 * The lock is held only for the map update or the copy, never for the solve,
 * so producers are not blocked by a tick's processing.
 */
class ReadingBuffer {
public:
    /**
     * @brief Stores a reading if it is valid and newer than the stored one for its pair.
     * @return True if the reading was stored.
     */
    bool submit(const Reading& reading) {
        if (!isWellFormed(reading)) return false;

        std::lock_guard<std::mutex> lock(mutex_);
        auto key = std::make_pair(reading.sensor_id, reading.device_id);
        auto it = latest_.find(key);
        if (it != latest_.end()) {
            if (it->second.timestamp > reading.timestamp) {
                return false; // Out-of-order arrival, keep the newer one
            }
            it->second = reading;
        } else {
            latest_.emplace(std::move(key), reading);
        }
        return true;
    }

    /**
     * @brief Copies the buffer into an immutable snapshot.
     * @param now Tick time.
     * @param staleness_window Readings older than now - staleness_window are left out of
     * DeviceReadings::fresh. So are readings stamped more than staleness_window in the future.
     */
    std::shared_ptr<const ReadingSnapshot> snapshot(double now, double staleness_window) const {
        auto snap = std::make_shared<ReadingSnapshot>();
        snap->taken_at = now;

        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : latest_) {
            const Reading& reading = entry.second;
            auto inserted = snap->devices.try_emplace(reading.device_id);
            DeviceReadings& device = inserted.first->second;
            if (inserted.second || reading.timestamp > device.last_reading_time) {
                device.last_reading_time = reading.timestamp;
            }
            double age = now - reading.timestamp;
            if (age <= staleness_window && age >= -staleness_window) {
                device.fresh.push_back(reading);
            }
        }
        return snap;
    }

    /**
     * @brief Drops every reading stamped before cutoff.
     * @return Number of readings dropped.
     */
    size_t purgeOlderThan(double cutoff) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = latest_.begin(); it != latest_.end();) {
            if (it->second.timestamp < cutoff) {
                it = latest_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t removeDevice(const std::string& device_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = latest_.begin(); it != latest_.end();) {
            if (it->first.second == device_id) {
                it = latest_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t removeSensor(const std::string& sensor_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto first = latest_.lower_bound(std::make_pair(sensor_id, std::string()));
        auto last = first;
        size_t removed = 0;
        while (last != latest_.end() && last->first.first == sensor_id) {
            ++last;
            ++removed;
        }
        latest_.erase(first, last);
        return removed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return latest_.size();
    }

private:
    static bool isWellFormed(const Reading& reading) {
        if (reading.sensor_id.empty() || reading.device_id.empty()) return false;
        if (!std::isfinite(reading.timestamp)) return false;
        if (const auto* rssi = std::get_if<SignalStrengthPayload>(&reading.payload)) {
            return std::isfinite(rssi->rssi_dbm);
        }
        const auto& direct = std::get<DirectCoordinatePayload>(reading.payload);
        return std::isfinite(direct.x) && std::isfinite(direct.y) &&
               std::isfinite(direct.confidence) &&
               direct.confidence >= 0.0 && direct.confidence <= 1.0;
    }

    // (sensor id, device id) -> newest reading. Ordered by sensor first so removeSensor is a range erase.
    std::map<std::pair<std::string, std::string>, Reading> latest_;
    mutable std::mutex mutex_;
};

#endif // PRESENCEFILTER_READING_BUFFER_HPP_
