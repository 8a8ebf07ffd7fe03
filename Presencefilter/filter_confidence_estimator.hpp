// filter_confidence_estimator.hpp
#ifndef PRESENCEFILTER_FILTER_CONFIDENCE_ESTIMATOR_HPP_
#define PRESENCEFILTER_FILTER_CONFIDENCE_ESTIMATOR_HPP_

#include <Eigen/Dense>   // For Eigen::Matrix2d
#include <algorithm>     // For std::min, std::max
#include <cmath>         // For std::isfinite
#include <limits>        // For std::numeric_limits
#include <stdexcept>     // For std::domain_error (Boost.Math policy errors)

// Boost.Math for the chi-squared distribution
#include <boost/math/distributions/chi_squared.hpp>

// Project-specific Headers
#include "common_types.hpp" // For TrackState, ConfigurationError

/**
 * @brief The FilterConfidenceEstimator maps a filter's positional covariance to a
 * published confidence score in [0, 1].
 *
 * The score is the probability that the true position lies within confidence_radius
 * of the estimate, treating the positional error as isotropic Gaussian with variance
 * sigma^2 = trace(P_pos) / 2 per axis. |e|^2 / sigma^2 is then chi-squared with two
 * degrees of freedom, so
 *
 *   confidence = CDF_chi2(2)(r^2 / sigma^2)
 *
 * which is 1 for a vanishing covariance and decreases monotonically with the trace.
 */
class FilterConfidenceEstimator {
public:
    explicit FilterConfidenceEstimator(double confidence_radius_m = 1.5)
        : confidence_radius_m_(confidence_radius_m),
          position_dist_(2.0) {
        if (!std::isfinite(confidence_radius_m) || confidence_radius_m <= 0.0) {
            throw ConfigurationError("FilterConfidenceEstimator: confidence radius must be positive.");
        }
    }

    /**
     * @brief Confidence from the 2x2 positional block of the filter covariance.
     * @return A score in [0, 1]; 0 for a non-finite covariance or a negative trace.
     */
    double calculateConfidence(const Eigen::Matrix2d& position_covariance) const {
        if (!position_covariance.allFinite()) return 0.0;
        return confidenceFromTrace(position_covariance.trace());
    }

    double confidenceFromTrace(double trace) const {
        if (!std::isfinite(trace) || trace < 0.0) return 0.0;
        if (trace == 0.0) return 1.0;
        double sigma_sq = trace / 2.0;
        double x = (confidence_radius_m_ * confidence_radius_m_) / sigma_sq;
        double score = 0.0;
        try {
            score = boost::math::cdf(position_dist_, x);
        } catch (const std::exception&) {
            // Only reachable for an argument Boost rejects (overflowed x); treat as certain.
            score = x > 0.0 ? 1.0 : 0.0;
        }
        return std::max(0.0, std::min(1.0, score));
    }

    double confidenceRadius() const { return confidence_radius_m_; }

private:
    double confidence_radius_m_;
    boost::math::chi_squared_distribution<double> position_dist_;
};

/**
 * @brief Lifecycle of one device in the tracking cycle.
 *
 *   UNINITIALIZED --first successful solve--> TRACKING
 *   TRACKING / UNINITIALIZED --no reading for inactivity_timeout--> STALE
 *   STALE --new reading--> UNINITIALIZED
 *
 * A TRACKING device stays TRACKING through ticks without a position as long as
 * readings keep arriving within the timeout.
 */
class TrackLifecycle {
public:
    TrackState current_state_ = TrackState::UNINITIALIZED;
    double last_reading_time_ = -std::numeric_limits<double>::infinity(); // Newest reading seen for the device
    double stale_since_ = 0.0;                                             // Tick time of the STALE transition

    /**
     * @brief Records the newest reading time seen in this tick's snapshot.
     * A reading newer than the STALE transition brings the device back as UNINITIALIZED.
     * @return True if the device left STALE.
     */
    bool observeReading(double reading_time) {
        if (reading_time > last_reading_time_) {
            last_reading_time_ = reading_time;
        }
        if (current_state_ == TrackState::STALE && last_reading_time_ > stale_since_) {
            current_state_ = TrackState::UNINITIALIZED;
            return true;
        }
        return false;
    }

    /**
     * @brief Applies the inactivity timeout at tick time now.
     * @return True if the device just became STALE.
     */
    bool checkInactivity(double now, double inactivity_timeout_s) {
        if (current_state_ == TrackState::STALE) return false;
        if (now - last_reading_time_ > inactivity_timeout_s) {
            current_state_ = TrackState::STALE;
            stale_since_ = now;
            return true;
        }
        return false;
    }

    // Called after a successful position solve has initialized or corrected the filter.
    void onPositionSolved() {
        if (current_state_ == TrackState::UNINITIALIZED) {
            current_state_ = TrackState::TRACKING;
        }
    }

    // Called when the filter state had to be dropped without the device going stale.
    void onTrackLost() {
        if (current_state_ == TrackState::TRACKING) {
            current_state_ = TrackState::UNINITIALIZED;
        }
    }

    TrackState getTrackState() const { return current_state_; }
};

#endif // PRESENCEFILTER_FILTER_CONFIDENCE_ESTIMATOR_HPP_
