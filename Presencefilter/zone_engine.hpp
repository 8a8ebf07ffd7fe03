// zone_engine.hpp
#ifndef PRESENCEFILTER_ZONE_ENGINE_HPP_
#define PRESENCEFILTER_ZONE_ENGINE_HPP_

// Standard Library Headers
#include <algorithm> // For std::min, std::max
#include <cmath>     // For std::abs, std::isfinite
#include <map>
#include <mutex>     // For std::mutex, std::lock_guard
#include <optional>  // For std::optional (C++17)
#include <set>
#include <string>
#include <vector>

// Eigen Library Headers
#include <Eigen/Dense> // For Eigen::Vector2d

// Project-specific Headers
#include "common_types.hpp" // For ZoneEvent, ZoneTransition, ConfigurationError

/**
 * @brief A named polygonal region of the floor plan.
 */
struct Zone {
    std::string id;
    std::string name;
    std::vector<Eigen::Vector2d> vertices; // Closed implicitly, last vertex connects to the first
    bool enabled = true;
};

namespace zone_geometry {

// Relative tolerance for the on-edge test, scaled by the edge length.
constexpr double kBoundaryTolerance = 1e-9;

/**
 * @brief True if point lies on the segment [a, b].
 */
inline bool onSegment(const Eigen::Vector2d& a, const Eigen::Vector2d& b, const Eigen::Vector2d& point) {
    const Eigen::Vector2d ab = b - a;
    const Eigen::Vector2d ap = point - a;
    const double length = ab.norm();
    if (length == 0.0) {
        return ap.norm() <= kBoundaryTolerance;
    }
    double cross = ab.x() * ap.y() - ab.y() * ap.x();
    if (std::abs(cross) > kBoundaryTolerance * std::max(1.0, length) * length) return false;
    double dot = ab.dot(ap);
    return dot >= -kBoundaryTolerance * length && dot <= ab.squaredNorm() + kBoundaryTolerance * length;
}

/**
 * @brief Point-in-polygon test by even-odd ray casting towards +x.
 *
 * A point on an edge or a vertex is classified inside. This makes the result
 * independent of the ray direction for boundary points, and a device standing on
 * a shared wall is in both rooms.
 *
 * @return False for fewer than 3 vertices or a non-finite point.
 */
inline bool containsPoint(const std::vector<Eigen::Vector2d>& vertices, const Eigen::Vector2d& point) {
    const size_t n = vertices.size();
    if (n < 3 || !point.allFinite()) return false;

    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        if (onSegment(vertices[j], vertices[i], point)) return true;
    }

    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Eigen::Vector2d& vi = vertices[i];
        const Eigen::Vector2d& vj = vertices[j];
        // Half-open rule on y counts a vertex touched by the ray exactly once.
        if ((vi.y() > point.y()) != (vj.y() > point.y())) {
            double x_cross = vj.x() + (point.y() - vj.y()) * (vi.x() - vj.x()) / (vi.y() - vj.y());
            if (point.x() < x_cross) inside = !inside;
        }
    }
    return inside;
}

} // namespace zone_geometry

/**
 * @brief The ZoneEngine keeps the zone set and per-device membership, and turns
 * positions into edge-triggered ENTERED/EXITED events.
 *
 * Membership changes only through evaluate(), a zone being disabled or removed,
 * or a device being released. Each call returns the events it produced, ordered by
 * zone id, so a caller can forward them in order. All methods are thread-safe.
 */
class ZoneEngine {
public:
    /**
     * @brief Adds a zone.
     * @throws ConfigurationError if the zone is invalid or the id is taken.
     */
    void addZone(const Zone& zone) {
        validate(zone);
        std::lock_guard<std::mutex> lock(mutex_);
        if (zones_.count(zone.id) != 0) {
            throw ConfigurationError("zone '" + zone.id + "' already exists");
        }
        zones_.emplace(zone.id, zone);
    }

    /**
     * @brief Replaces the name, vertices and enabled flag of an existing zone.
     *
     * Members keep their membership until the next evaluate() re-tests them against
     * the new outline. Disabling through an update behaves like setZoneEnabled(false).
     *
     * @return The EXITED events caused by disabling, empty otherwise. std::nullopt if the zone is unknown.
     * @throws ConfigurationError if the zone is invalid.
     */
    std::optional<std::vector<ZoneEvent>> updateZone(const Zone& zone, double timestamp) {
        validate(zone);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = zones_.find(zone.id);
        if (it == zones_.end()) return std::nullopt;

        std::vector<ZoneEvent> events;
        replace(it->second, zone, timestamp, events);
        return events;
    }

    /**
     * @brief Adds the zone, or updates it if the id exists.
     * @return The events produced by the update.
     */
    std::vector<ZoneEvent> upsertZone(const Zone& zone, double timestamp) {
        validate(zone);
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ZoneEvent> events;
        auto it = zones_.find(zone.id);
        if (it == zones_.end()) {
            zones_.emplace(zone.id, zone);
        } else {
            replace(it->second, zone, timestamp, events);
        }
        return events;
    }

    /**
     * @brief Removes a zone. Devices inside it get an EXITED event.
     * @return The events, empty if the zone is unknown or empty.
     */
    std::vector<ZoneEvent> removeZone(const std::string& zone_id, double timestamp) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ZoneEvent> events;
        if (zones_.erase(zone_id) == 0) return events;
        evictMembers(zone_id, timestamp, events);
        return events;
    }

    /**
     * @brief Enables or disables a zone.
     *
     * Disabling emits EXITED for every current member and clears its membership.
     * A re-enabled zone starts empty; devices already inside get ENTERED on their
     * next evaluation.
     */
    std::vector<ZoneEvent> setZoneEnabled(const std::string& zone_id, bool enabled, double timestamp) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ZoneEvent> events;
        auto it = zones_.find(zone_id);
        if (it == zones_.end() || it->second.enabled == enabled) return events;
        it->second.enabled = enabled;
        if (!enabled) {
            evictMembers(zone_id, timestamp, events);
        }
        return events;
    }

    /**
     * @brief Tests a device position against every enabled zone.
     * @return ENTERED for zones the device just entered, EXITED for zones it just left.
     */
    std::vector<ZoneEvent> evaluate(const std::string& device_id, double x, double y, double timestamp) {
        std::vector<ZoneEvent> events;
        const Eigen::Vector2d point(x, y);
        if (!point.allFinite()) return events;

        std::lock_guard<std::mutex> lock(mutex_);
        std::set<std::string>& current = membership_[device_id];
        for (const auto& entry : zones_) {
            const Zone& zone = entry.second;
            if (!zone.enabled) continue;

            bool inside = zone_geometry::containsPoint(zone.vertices, point);
            bool was_inside = current.count(zone.id) != 0;
            if (inside && !was_inside) {
                current.insert(zone.id);
                events.push_back(makeEvent(device_id, zone.id, ZoneTransition::ENTERED, timestamp, x, y));
            } else if (!inside && was_inside) {
                current.erase(zone.id);
                events.push_back(makeEvent(device_id, zone.id, ZoneTransition::EXITED, timestamp, x, y));
            }
        }
        last_position_[device_id] = point;
        if (current.empty()) membership_.erase(device_id);
        return events;
    }

    /**
     * @brief Takes a device out of every zone it is in and forgets it.
     * @return EXITED events at the device's last evaluated position.
     */
    std::vector<ZoneEvent> releaseDevice(const std::string& device_id, double timestamp) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ZoneEvent> events;
        auto it = membership_.find(device_id);
        if (it != membership_.end()) {
            const Eigen::Vector2d at = lastPosition(device_id);
            for (const auto& zone_id : it->second) {
                events.push_back(makeEvent(device_id, zone_id, ZoneTransition::EXITED, timestamp, at.x(), at.y()));
            }
            membership_.erase(it);
        }
        last_position_.erase(device_id);
        return events;
    }

    // Devices currently inside zone_id, sorted.
    std::vector<std::string> occupants(const std::string& zone_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> devices;
        for (const auto& entry : membership_) {
            if (entry.second.count(zone_id) != 0) devices.push_back(entry.first);
        }
        return devices;
    }

    // Zones device_id is currently inside, sorted.
    std::vector<std::string> zonesOf(const std::string& device_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = membership_.find(device_id);
        if (it == membership_.end()) return {};
        return std::vector<std::string>(it->second.begin(), it->second.end());
    }

    bool isInside(const std::string& device_id, const std::string& zone_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = membership_.find(device_id);
        return it != membership_.end() && it->second.count(zone_id) != 0;
    }

    std::optional<Zone> getZone(const std::string& zone_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = zones_.find(zone_id);
        if (it == zones_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Zone> allZones() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Zone> out;
        out.reserve(zones_.size());
        for (const auto& entry : zones_) out.push_back(entry.second);
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return zones_.size();
    }

private:
    std::map<std::string, Zone> zones_;
    std::map<std::string, std::set<std::string>> membership_; // device id -> zone ids it is inside
    std::map<std::string, Eigen::Vector2d> last_position_;    // device id -> last evaluated position
    mutable std::mutex mutex_;

    static void validate(const Zone& zone) {
        if (zone.id.empty()) {
            throw ConfigurationError("zone id must not be empty");
        }
        if (zone.vertices.size() < 3) {
            throw ConfigurationError("zone '" + zone.id + "' needs at least 3 vertices");
        }
        for (const auto& vertex : zone.vertices) {
            if (!vertex.allFinite()) {
                throw ConfigurationError("zone '" + zone.id + "' has a non-finite vertex");
            }
        }
    }

    static ZoneEvent makeEvent(const std::string& device_id, const std::string& zone_id,
                               ZoneTransition kind, double timestamp, double x, double y) {
        ZoneEvent event;
        event.device_id = device_id;
        event.zone_id = zone_id;
        event.kind = kind;
        event.timestamp = timestamp;
        event.x = x;
        event.y = y;
        return event;
    }

    Eigen::Vector2d lastPosition(const std::string& device_id) const {
        auto it = last_position_.find(device_id);
        return it == last_position_.end() ? Eigen::Vector2d::Zero() : it->second;
    }

    // Caller holds mutex_. Disabling through a replacement evicts the members.
    void replace(Zone& stored, const Zone& zone, double timestamp, std::vector<ZoneEvent>& events) {
        if (stored.enabled && !zone.enabled) {
            evictMembers(zone.id, timestamp, events);
        }
        stored = zone;
    }

    // Caller holds mutex_.
    void evictMembers(const std::string& zone_id, double timestamp, std::vector<ZoneEvent>& events) {
        for (auto it = membership_.begin(); it != membership_.end();) {
            if (it->second.erase(zone_id) != 0) {
                const Eigen::Vector2d at = lastPosition(it->first);
                events.push_back(makeEvent(it->first, zone_id, ZoneTransition::EXITED, timestamp, at.x(), at.y()));
            }
            if (it->second.empty()) {
                it = membership_.erase(it);
            } else {
                ++it;
            }
        }
    }
};

#endif // PRESENCEFILTER_ZONE_ENGINE_HPP_
