// tracking_sink.hpp
#ifndef PRESENCEFILTER_TRACKING_SINK_HPP_
#define PRESENCEFILTER_TRACKING_SINK_HPP_

#include <mutex>  // For the recording sink
#include <vector>

// Project-specific Headers
#include "common_types.hpp" // For PublishedPosition, ZoneEvent, DeviceDiagnostic

/**
 * @brief Host-side receiver of tracking output.
 *
 * Called from the thread running the tick, and from the thread making a zone
 * configuration change for the zone events that change produces. Both hold the
 * cycle's tick lock: implementations must not call back into the TrackingCycle.
 * An exception thrown here is logged by the cycle and the notification is lost.
 */
class TrackingSink {
public:
    virtual ~TrackingSink() = default;

    virtual void onPositionUpdate(const PublishedPosition& position) = 0;
    virtual void onZoneEvent(const ZoneEvent& event) = 0;
    virtual void onDiagnostic(const DeviceDiagnostic& diagnostic) = 0;
};

/**
 * @brief A TrackingSink that keeps everything it receives. Useful for hosts that
 * poll, and for tests.
 */
class RecordingSink : public TrackingSink {
public:
    void onPositionUpdate(const PublishedPosition& position) override {
        std::lock_guard<std::mutex> lock(mutex_);
        positions_.push_back(position);
    }

    void onZoneEvent(const ZoneEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        zone_events_.push_back(event);
    }

    void onDiagnostic(const DeviceDiagnostic& diagnostic) override {
        std::lock_guard<std::mutex> lock(mutex_);
        diagnostics_.push_back(diagnostic);
    }

    std::vector<PublishedPosition> positions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return positions_;
    }

    std::vector<ZoneEvent> zoneEvents() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return zone_events_;
    }

    std::vector<DeviceDiagnostic> diagnostics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return diagnostics_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        positions_.clear();
        zone_events_.clear();
        diagnostics_.clear();
    }

private:
    std::vector<PublishedPosition> positions_;
    std::vector<ZoneEvent> zone_events_;
    std::vector<DeviceDiagnostic> diagnostics_;
    mutable std::mutex mutex_;
};

#endif // PRESENCEFILTER_TRACKING_SINK_HPP_
