// tracking_cycle.hpp
#ifndef PRESENCEFILTER_TRACKING_CYCLE_HPP_
#define PRESENCEFILTER_TRACKING_CYCLE_HPP_

// Standard Library Headers
#include <atomic>             // For the scheduler's run flag
#include <chrono>             // For the default scheduler clock
#include <cmath>              // For std::isfinite, std::abs, std::hypot
#include <condition_variable> // For waking the scheduler on stop()
#include <functional>         // For std::function
#include <map>
#include <memory>             // For std::shared_ptr
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>            // For std::move
#include <vector>

// Project-specific Headers
#include "common_types.hpp"
#include "filter_confidence_estimator.hpp" // For TrackLifecycle
#include "measurement_adapter.hpp"         // For DistanceModel, MeasurementAdapter
#include "person_registry.hpp"             // For PersonRegistry
#include "position_solver.hpp"             // For PositionSolver
#include "reading_buffer.hpp"              // For ReadingBuffer
#include "sensor_registry.hpp"             // For SensorRegistry
#include "temporal_filter.hpp"             // For TemporalFilter
#include "tracker_config.hpp"              // For TrackerConfig
#include "tracker_log.hpp"                 // For TrackerLog
#include "tracking_sink.hpp"               // For TrackingSink
#include "zone_engine.hpp"                 // For ZoneEngine

/**
 * @brief Summary of one tick.
 */
struct TickReport {
    double timestamp = 0.0;
    std::map<std::string, TickOutcome> outcomes; // One entry per device processed this tick
    size_t positions_published = 0;
    size_t zone_events = 0;
    size_t readings_purged = 0;

    size_t count(TickOutcome outcome) const {
        size_t n = 0;
        for (const auto& entry : outcomes) {
            if (entry.second == outcome) ++n;
        }
        return n;
    }
};

/**
 * @brief The TrackingCycle runs the pipeline once per tick:
 *   snapshot -> adapt -> solve -> filter -> zone test -> publish.
 *
 * Producers call submitReading() from any thread; it only touches the reading
 * buffer. tick() is serialized and sees one immutable snapshot of the buffer and
 * of the sensor configuration. Each device is processed on its own: a failure is
 * reported as that device's diagnostic and the tick moves on.
 *
 * Zone configuration changes are serialized with tick() so that the sink receives a
 * device's zone events in the order the membership changed. An exception thrown by
 * the sink is logged and never affects tracking.
 */
class TrackingCycle {
public:
    /**
     * @param config Validated on construction.
     * @param sink Receiver of positions, zone events and diagnostics. May be null.
     * @throws ConfigurationError if config is invalid.
     */
    explicit TrackingCycle(const TrackerConfig& config = TrackerConfig(),
                           std::shared_ptr<TrackingSink> sink = nullptr)
        : config_(validated(config)),
          log_(config.cycle.log_level),
          adapter_(DistanceModel(config.distance)),
          solver_(config.solver),
          filter_(config.filter),
          sink_(std::move(sink)) {}

    TrackingCycle(const TrackingCycle&) = delete;
    TrackingCycle& operator=(const TrackingCycle&) = delete;

    // --- Readings ---

    /**
     * @brief Fire-and-forget arrival of a reading. Never waits for a tick in progress.
     * @return False if the reading was malformed or older than the stored one.
     */
    bool submitReading(const Reading& reading) {
        bool stored = buffer_.submit(reading);
        if (!stored) {
            log_.debug("reading from sensor '", reading.sensor_id, "' for device '", reading.device_id,
                       "' not stored (malformed or out of order)");
        }
        return stored;
    }

    // --- Sensor configuration ---

    void addSensor(const Sensor& sensor) {
        guardConfig("add sensor '" + sensor.id + "'", [&] { registry_.addSensor(sensor); });
        log_.info("sensor '", sensor.id, "' added");
    }

    bool updateSensor(const Sensor& sensor) {
        bool updated = false;
        guardConfig("update sensor '" + sensor.id + "'", [&] { updated = registry_.updateSensor(sensor); });
        if (updated) log_.info("sensor '", sensor.id, "' updated");
        return updated;
    }

    void upsertSensor(const Sensor& sensor) {
        bool added = false;
        guardConfig("upsert sensor '" + sensor.id + "'", [&] { added = registry_.upsertSensor(sensor); });
        log_.info("sensor '", sensor.id, "' ", added ? "added" : "updated");
    }

    // Removes the sensor and the readings it left in the buffer.
    bool removeSensor(const std::string& sensor_id) {
        if (!registry_.removeSensor(sensor_id)) return false;
        buffer_.removeSensor(sensor_id);
        log_.info("sensor '", sensor_id, "' removed");
        return true;
    }

    bool setSensorEnabled(const std::string& sensor_id, bool enabled) {
        bool changed = registry_.setEnabled(sensor_id, enabled);
        if (changed) log_.info("sensor '", sensor_id, "' ", enabled ? "enabled" : "disabled");
        return changed;
    }

    bool setSensorCalibration(const std::string& sensor_id, const SensorCalibration& calibration) {
        bool changed = false;
        guardConfig("calibrate sensor '" + sensor_id + "'",
                    [&] { changed = registry_.setCalibration(sensor_id, calibration); });
        if (changed) log_.info("sensor '", sensor_id, "' recalibrated");
        return changed;
    }

    // --- Zone configuration. Membership events are forwarded to the sink. ---

    void addZone(const Zone& zone) {
        std::lock_guard<std::mutex> tick_lock(tick_mutex_);
        guardConfig("add zone '" + zone.id + "'", [&] { zones_.addZone(zone); });
        log_.info("zone '", zone.id, "' added");
    }

    bool updateZone(const Zone& zone, double timestamp) {
        std::lock_guard<std::mutex> tick_lock(tick_mutex_);
        std::optional<std::vector<ZoneEvent>> events;
        guardConfig("update zone '" + zone.id + "'", [&] { events = zones_.updateZone(zone, timestamp); });
        if (!events) return false;
        log_.info("zone '", zone.id, "' updated");
        forward(*events);
        return true;
    }

    void upsertZone(const Zone& zone, double timestamp) {
        std::lock_guard<std::mutex> tick_lock(tick_mutex_);
        std::vector<ZoneEvent> events;
        guardConfig("upsert zone '" + zone.id + "'", [&] { events = zones_.upsertZone(zone, timestamp); });
        log_.info("zone '", zone.id, "' configured");
        forward(events);
    }

    bool removeZone(const std::string& zone_id, double timestamp) {
        std::lock_guard<std::mutex> tick_lock(tick_mutex_);
        if (!zones_.getZone(zone_id)) return false;
        forward(zones_.removeZone(zone_id, timestamp));
        log_.info("zone '", zone_id, "' removed");
        return true;
    }

    bool setZoneEnabled(const std::string& zone_id, bool enabled, double timestamp) {
        std::lock_guard<std::mutex> tick_lock(tick_mutex_);
        auto zone = zones_.getZone(zone_id);
        if (!zone) return false;
        forward(zones_.setZoneEnabled(zone_id, enabled, timestamp));
        if (zone->enabled != enabled) log_.info("zone '", zone_id, "' ", enabled ? "enabled" : "disabled");
        return true;
    }

    // --- Persons ---

    void addPerson(const Person& person) {
        guardConfig("add person '" + person.id + "'", [&] { persons_.addPerson(person); });
        log_.info("person '", person.id, "' added");
    }

    bool updatePerson(const Person& person) {
        bool updated = false;
        guardConfig("update person '" + person.id + "'", [&] { updated = persons_.updatePerson(person); });
        if (updated) log_.info("person '", person.id, "' updated");
        return updated;
    }

    bool removePerson(const std::string& person_id) {
        bool removed = persons_.removePerson(person_id);
        if (removed) log_.info("person '", person_id, "' removed");
        return removed;
    }

    bool linkDevice(const std::string& person_id, const std::string& device_id) {
        bool linked = false;
        guardConfig("link device '" + device_id + "' to person '" + person_id + "'",
                    [&] { linked = persons_.linkDevice(person_id, device_id); });
        if (linked) log_.info("device '", device_id, "' linked to person '", person_id, "'");
        return linked;
    }

    bool unlinkDevice(const std::string& person_id, const std::string& device_id) {
        bool unlinked = false;
        guardConfig("unlink device '" + device_id + "' from person '" + person_id + "'",
                    [&] { unlinked = persons_.unlinkDevice(person_id, device_id); });
        if (unlinked) log_.info("device '", device_id, "' unlinked from person '", person_id, "'");
        return unlinked;
    }

    bool setActiveDevice(const std::string& person_id, const std::string& device_id) {
        bool changed = false;
        guardConfig("activate device '" + device_id + "' for person '" + person_id + "'",
                    [&] { changed = persons_.setActiveDevice(person_id, device_id); });
        if (changed) log_.info("person '", person_id, "' now tracked by device '", device_id, "'");
        return changed;
    }

    // --- Tick ---

    /**
     * @brief Runs one tracking update at time now (seconds, the readings' clock).
     * @return What happened to each device. Never throws for per-device failures.
     */
    TickReport tick(double now) {
        std::lock_guard<std::mutex> tick_lock(tick_mutex_);
        TickReport report;
        report.timestamp = now;
        if (!std::isfinite(now)) {
            log_.error("tick skipped: non-finite tick time");
            return report;
        }

        // One consistent view for the whole tick.
        std::shared_ptr<const ReadingSnapshot> snapshot = buffer_.snapshot(now, config_.cycle.staleness_window_s);
        const std::map<std::string, Sensor> sensors = registry_.snapshot();
        for (const auto& device : snapshot->devices) {
            for (const auto& reading : device.second.fresh) {
                registry_.markSeen(reading.sensor_id, reading.timestamp);
            }
        }

        std::set<std::string> device_ids;
        for (const auto& device : snapshot->devices) device_ids.insert(device.first);
        for (const auto& device : devices_) device_ids.insert(device.first);

        for (const auto& device_id : device_ids) {
            try {
                processDevice(device_id, now, snapshot->find(device_id), sensors, report);
            } catch (const std::exception& e) {
                recoverDevice(device_id, now, e.what(), report);
            }
        }

        report.readings_purged = buffer_.purgeOlderThan(now - config_.cycle.inactivity_timeout_s);
        pruneStaleDevices(now);
        return report;
    }

    // --- Queries ---

    std::optional<TrackState> deviceState(const std::string& device_id) const {
        std::lock_guard<std::mutex> tick_lock(tick_mutex_);
        auto it = devices_.find(device_id);
        if (it == devices_.end()) return std::nullopt;
        return it->second.lifecycle.getTrackState();
    }

    // Last position handed to the sink for a device that is still tracked.
    std::optional<PublishedPosition> lastPublished(const std::string& device_id) const {
        std::lock_guard<std::mutex> tick_lock(tick_mutex_);
        auto it = devices_.find(device_id);
        if (it == devices_.end()) return std::nullopt;
        return it->second.last_published;
    }

    /**
     * @brief Position of a person: the last position published for their active device.
     * @return std::nullopt for an unknown person or an active device with no current position.
     */
    std::optional<PublishedPosition> personPosition(const std::string& person_id) const {
        std::optional<std::string> device_id = persons_.activeDevice(person_id);
        if (!device_id) return std::nullopt;
        return lastPublished(*device_id);
    }

    // Zones the person's active device is inside, sorted. Empty for an unknown person.
    std::vector<std::string> personZones(const std::string& person_id) const {
        std::optional<std::string> device_id = persons_.activeDevice(person_id);
        if (!device_id) return {};
        return zones_.zonesOf(*device_id);
    }

    std::vector<std::string> trackedDevices() const {
        std::lock_guard<std::mutex> tick_lock(tick_mutex_);
        std::vector<std::string> ids;
        for (const auto& entry : devices_) {
            if (entry.second.lifecycle.getTrackState() == TrackState::TRACKING) ids.push_back(entry.first);
        }
        return ids;
    }

    const SensorRegistry& sensors() const { return registry_; }
    const ZoneEngine& zones() const { return zones_; }
    const PersonRegistry& persons() const { return persons_; }
    const ReadingBuffer& readings() const { return buffer_; }
    const TrackerConfig& config() const { return config_; }
    TrackerLog& log() { return log_; }

private:
    struct DeviceRecord {
        TrackLifecycle lifecycle;
        std::optional<PublishedPosition> last_published;
        int sensor_count = 0; // From the last accepted raw position
        PositionMethod method = PositionMethod::MULTILATERATION;
    };

    TrackerConfig config_;
    TrackerLog log_;
    SensorRegistry registry_;
    ReadingBuffer buffer_;
    MeasurementAdapter adapter_;
    PositionSolver solver_;
    TemporalFilter filter_;   // Tick-owned
    ZoneEngine zones_;
    PersonRegistry persons_;
    std::map<std::string, DeviceRecord> devices_; // Tick-owned
    std::shared_ptr<TrackingSink> sink_;
    mutable std::mutex tick_mutex_;

    static const TrackerConfig& validated(const TrackerConfig& config) {
        config.validate();
        return config;
    }

    template<typename Fn>
    void guardConfig(const std::string& what, Fn&& apply) {
        try {
            apply();
        } catch (const ConfigurationError& e) {
            log_.error("rejected: ", what, ": ", e.what());
            throw;
        }
    }

    void processDevice(const std::string& device_id, double now, const DeviceReadings* readings,
                       const std::map<std::string, Sensor>& sensors, TickReport& report) {
        auto found = devices_.find(device_id);
        if (found == devices_.end()) {
            // Only fresh data starts tracking a device.
            if (readings == nullptr || readings->fresh.empty()) return;
            found = devices_.emplace(device_id, DeviceRecord()).first;
        }
        DeviceRecord& record = found->second;

        if (readings != nullptr && record.lifecycle.observeReading(readings->last_reading_time)) {
            log_.info("device '", device_id, "' reappeared");
        }
        if (record.lifecycle.checkInactivity(now, config_.cycle.inactivity_timeout_s)) {
            markStale(device_id, record, now, report);
            return;
        }
        if (record.lifecycle.getTrackState() == TrackState::STALE) return;

        TickOutcome outcome = TickOutcome::SUCCESS;
        std::string detail;
        std::optional<RawPosition> raw;

        if (readings == nullptr || readings->fresh.empty()) {
            outcome = TickOutcome::COASTING;
            detail = "no fresh readings";
        } else {
            AdaptedMeasurements adapted = adapter_.adapt(readings->fresh, sensors);
            SolveResult solved = solver_.solve(adapted);
            detail = solved.detail;
            if (solved.ok()) {
                raw = solved.position;
            } else {
                outcome = solved.status == SolveStatus::SOLVER_FAILURE ? TickOutcome::SOLVER_FAILURE
                                                                       : TickOutcome::INSUFFICIENT_SENSORS;
            }
            if (adapted.dropped_readings > 0) {
                log_.debug("device '", device_id, "': ", adapted.dropped_readings, " reading(s) unusable");
            }
        }

        std::optional<FilterStep> step = filter_.step(device_id, now, raw);
        if (!step) {
            // Not tracking yet and nothing to start from.
            if (outcome == TickOutcome::COASTING) outcome = TickOutcome::INSUFFICIENT_SENSORS;
            report.outcomes[device_id] = outcome;
            emitDiagnostic(device_id, outcome, detail, now);
            return;
        }

        if (raw) {
            record.lifecycle.onPositionSolved();
            record.sensor_count = raw->sensor_count;
            record.method = raw->method;
            if (step->update == FilterUpdateStatus::GATED_OUT) {
                detail = appendDetail(detail, "observation rejected by the innovation gate");
            } else if (step->update == FilterUpdateStatus::REINITIALIZED) {
                detail = appendDetail(detail, "filter restarted after repeated gate rejections");
            }
        }
        if (step->numericalFailure()) {
            outcome = TickOutcome::NUMERICAL_FAILURE;
            detail = appendDetail(detail, step->covariance_reset ? "covariance diverged during prediction, reset"
                                                                 : "update diverged, prior estimate kept");
        }

        report.outcomes[device_id] = outcome;
        emitDiagnostic(device_id, outcome, detail, now);

        std::vector<ZoneEvent> events = zones_.evaluate(device_id, step->position.x(), step->position.y(), now);
        report.zone_events += events.size();
        forward(events);

        if (publishIfChanged(device_id, record, *step, now)) {
            report.positions_published++;
        }
    }

    // Tracking -> stale: drop the filter, leave all zones, report once.
    void markStale(const std::string& device_id, DeviceRecord& record, double now, TickReport& report) {
        filter_.release(device_id);
        record.last_published.reset();
        std::vector<ZoneEvent> events = zones_.releaseDevice(device_id, now);
        report.zone_events += events.size();
        forward(events);

        report.outcomes[device_id] = TickOutcome::STALE;
        emitDiagnostic(device_id, TickOutcome::STALE, "no readings within the inactivity timeout", now);
        log_.info("device '", device_id, "' went stale");
    }

    // An unexpected failure while processing one device: restart its track from scratch.
    void recoverDevice(const std::string& device_id, double now, const std::string& what, TickReport& report) {
        filter_.release(device_id);
        auto it = devices_.find(device_id);
        if (it != devices_.end()) {
            it->second.lifecycle.onTrackLost();
            it->second.last_published.reset();
        }
        report.outcomes[device_id] = TickOutcome::NUMERICAL_FAILURE;
        log_.warning("device '", device_id, "' processing failed: ", what);
        emitDiagnostic(device_id, TickOutcome::NUMERICAL_FAILURE, what, now);
    }

    bool publishIfChanged(const std::string& device_id, DeviceRecord& record, const FilterStep& step, double now) {
        const double epsilon = config_.cycle.publish_epsilon;
        if (record.last_published) {
            const PublishedPosition& last = *record.last_published;
            bool moved = std::hypot(step.position.x() - last.x, step.position.y() - last.y) > epsilon;
            bool confidence_changed = std::abs(step.confidence - last.confidence) > epsilon;
            if (!moved && !confidence_changed) return false;
        }

        PublishedPosition position;
        position.device_id = device_id;
        position.x = step.position.x();
        position.y = step.position.y();
        position.vx = step.velocity.x();
        position.vy = step.velocity.y();
        position.confidence = step.confidence;
        position.sensor_count = record.sensor_count;
        position.method = record.method;
        position.timestamp = now;
        position.below_threshold = step.confidence < config_.cycle.confidence_threshold;
        record.last_published = position;

        notifySink("position update", device_id, [&](TrackingSink& sink) { sink.onPositionUpdate(position); });
        return true;
    }

    void emitDiagnostic(const std::string& device_id, TickOutcome outcome, const std::string& detail, double now) {
        if (outcome == TickOutcome::SOLVER_FAILURE || outcome == TickOutcome::NUMERICAL_FAILURE) {
            log_.warning("device '", device_id, "': ", toString(outcome), ": ", detail);
        } else if (outcome != TickOutcome::SUCCESS) {
            log_.debug("device '", device_id, "': ", toString(outcome), detail.empty() ? "" : ": ", detail);
        }
        if (!sink_) return;
        DeviceDiagnostic diagnostic;
        diagnostic.device_id = device_id;
        diagnostic.outcome = outcome;
        diagnostic.detail = detail;
        diagnostic.timestamp = now;
        notifySink("diagnostic", device_id, [&](TrackingSink& sink) { sink.onDiagnostic(diagnostic); });
    }

    void forward(const std::vector<ZoneEvent>& events) {
        for (const auto& event : events) {
            log_.info("device '", event.device_id, "' ", toString(event.kind), " zone '", event.zone_id, "'");
            notifySink("zone event", event.device_id, [&](TrackingSink& sink) { sink.onZoneEvent(event); });
        }
    }

    // A failing sink loses that notification only.
    template<typename Fn>
    void notifySink(const char* what, const std::string& device_id, Fn&& deliver) {
        if (!sink_) return;
        try {
            deliver(*sink_);
        } catch (const std::exception& e) {
            log_.warning("sink rejected ", what, " for device '", device_id, "': ", e.what());
        }
    }

    // Stale records are kept one more inactivity period, then forgotten.
    void pruneStaleDevices(double now) {
        for (auto it = devices_.begin(); it != devices_.end();) {
            const TrackLifecycle& lifecycle = it->second.lifecycle;
            if (lifecycle.getTrackState() == TrackState::STALE &&
                now - lifecycle.stale_since_ > config_.cycle.inactivity_timeout_s) {
                it = devices_.erase(it);
            } else {
                ++it;
            }
        }
    }

    static std::string appendDetail(const std::string& detail, const std::string& note) {
        return detail.empty() ? note : detail + "; " + note;
    }
};

/**
 * @brief Drives TrackingCycle::tick() from a background thread every interval.
 *
 * The clock supplies tick times and must be the clock the readings are stamped
 * with. It defaults to std::chrono::steady_clock in seconds.
 */
class TickScheduler {
public:
    using Clock = std::function<double()>;

    static double steadyClockSeconds() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now().time_since_epoch()).count();
    }

    /**
     * @throws ConfigurationError if interval_s is not positive or clock is empty.
     */
    TickScheduler(TrackingCycle& cycle, double interval_s, Clock clock = &TickScheduler::steadyClockSeconds)
        : cycle_(cycle), interval_s_(interval_s), clock_(std::move(clock)) {
        if (!std::isfinite(interval_s) || interval_s <= 0.0) {
            throw ConfigurationError("TickScheduler: tick interval must be positive.");
        }
        if (!clock_) {
            throw ConfigurationError("TickScheduler: clock must be callable.");
        }
    }

    ~TickScheduler() { stop(); }

    TickScheduler(const TickScheduler&) = delete;
    TickScheduler& operator=(const TickScheduler&) = delete;

    // Starts ticking. The first tick runs immediately. No-op if already running.
    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) return;
        running_ = true;
        worker_ = std::thread(&TickScheduler::run, this);
    }

    // Stops after the tick in progress, if any. Safe to call more than once.
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            running_ = false;
        }
        wake_.notify_all();
        if (worker_.joinable()) worker_.join();
    }

    bool running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    size_t ticksRun() const { return ticks_run_.load(); }

    // Runs one tick now on the calling thread.
    TickReport runOnce() {
        TickReport report = cycle_.tick(clock_());
        ticks_run_++;
        return report;
    }

private:
    TrackingCycle& cycle_;
    double interval_s_;
    Clock clock_;
    std::thread worker_;
    bool running_ = false;
    std::atomic<size_t> ticks_run_{0};
    mutable std::mutex mutex_;
    std::condition_variable wake_;

    void run() {
        const auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(interval_s_));
        auto next = std::chrono::steady_clock::now();
        std::unique_lock<std::mutex> lock(mutex_);
        while (running_) {
            lock.unlock();
            try {
                runOnce();
            } catch (const std::exception& e) {
                cycle_.log().error("tick failed: ", e.what());
            }
            lock.lock();
            next += interval;
            wake_.wait_until(lock, next, [this] { return !running_; });
        }
    }
};

#endif // PRESENCEFILTER_TRACKING_CYCLE_HPP_
