// temporal_filter_test.cpp
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "temporal_filter.hpp"

namespace {

RawPosition observation(double x, double y, double confidence = 0.9) {
    RawPosition position;
    position.x = x;
    position.y = y;
    position.confidence = confidence;
    position.sensor_count = 3;
    position.method = PositionMethod::MULTILATERATION;
    return position;
}

} // namespace

TEST(ConstantVelocityModelTest, TransitionAndProcessNoise) {
    ConstantVelocityModel2D model(0.5);
    auto F = model.transition(2.0);
    EXPECT_DOUBLE_EQ(F(0, 2), 2.0);
    EXPECT_DOUBLE_EQ(F(1, 3), 2.0);
    EXPECT_DOUBLE_EQ(F(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(F(2, 0), 0.0);

    ConstantVelocityModel2D::StateType x;
    x << 1.0, 2.0, 0.5, -1.0;
    auto moved = model.f(x, 2.0);
    EXPECT_DOUBLE_EQ(moved(0), 2.0);
    EXPECT_DOUBLE_EQ(moved(1), 0.0);
    EXPECT_DOUBLE_EQ(moved(2), 0.5);

    auto Q = model.processNoise(2.0);
    const double q = 0.25;
    EXPECT_NEAR(Q(0, 0), q * 8.0 / 3.0, 1e-12);
    EXPECT_NEAR(Q(0, 2), q * 2.0, 1e-12);
    EXPECT_NEAR(Q(2, 2), q * 2.0, 1e-12);
    EXPECT_NEAR(Q(1, 1), Q(0, 0), 1e-12);
    EXPECT_DOUBLE_EQ(Q(0, 1), 0.0);
    EXPECT_TRUE(Q.isApprox(Q.transpose()));

    auto H = model.observation();
    EXPECT_DOUBLE_EQ(H(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(H(1, 1), 1.0);
    EXPECT_DOUBLE_EQ(H.rightCols<2>().norm(), 0.0);

    EXPECT_THROW(ConstantVelocityModel2D bad(0.0), ConfigurationError);
}

TEST(FilterConfidenceEstimatorTest, MapsCovarianceToProbability) {
    FilterConfidenceEstimator estimator(1.5);
    EXPECT_DOUBLE_EQ(estimator.confidenceFromTrace(0.0), 1.0);
    // sigma^2 = 1, P(chi2(2) <= 2.25) = 1 - exp(-1.125)
    EXPECT_NEAR(estimator.calculateConfidence(Eigen::Matrix2d::Identity()), 1.0 - std::exp(-1.125), 1e-9);

    double previous = 1.0;
    for (double trace = 0.1; trace < 1000.0; trace *= 2.0) {
        double confidence = estimator.confidenceFromTrace(trace);
        EXPECT_LE(confidence, previous);
        EXPECT_GE(confidence, 0.0);
        previous = confidence;
    }

    Eigen::Matrix2d broken = Eigen::Matrix2d::Identity();
    broken(0, 0) = std::numeric_limits<double>::quiet_NaN();
    EXPECT_DOUBLE_EQ(estimator.calculateConfidence(broken), 0.0);
    EXPECT_THROW(FilterConfidenceEstimator bad(0.0), ConfigurationError);
}

TEST(PositionKalmanFilterTest, InitializesOnFirstObservation) {
    FilterConfig config;
    PositionKalmanFilter filter(config, observation(2.0, 3.0, 0.5), 100.0);

    EXPECT_TRUE(filter.position().isApprox(Eigen::Vector2d(2.0, 3.0)));
    EXPECT_TRUE(filter.velocity().isZero());
    EXPECT_DOUBLE_EQ(filter.lastUpdateTime(), 100.0);
    // Position variance follows the observation confidence.
    EXPECT_NEAR(filter.trackState().P(0, 0), 2.0, 1e-12);
    EXPECT_NEAR(filter.trackState().P(2, 2), 1.0, 1e-12);
    EXPECT_TRUE(filter.isHealthy());
    EXPECT_FALSE(filter.gatingEnabled());
}

TEST(PositionKalmanFilterTest, StaticDeviceConvergesAndConfidenceSettles) {
    PositionKalmanFilter filter(FilterConfig(), observation(2.5, 3.5), 0.0);

    std::vector<double> confidences;
    for (int k = 1; k <= 60; ++k) {
        ASSERT_TRUE(filter.predict(static_cast<double>(k)));
        ASSERT_EQ(filter.update(observation(2.0, 3.0)), FilterUpdateStatus::CORRECTED);
        confidences.push_back(filter.positionConfidence());
    }

    EXPECT_NEAR(filter.position().x(), 2.0, 1e-4);
    EXPECT_NEAR(filter.position().y(), 3.0, 1e-4);
    EXPECT_NEAR(filter.velocity().norm(), 0.0, 1e-4);

    // Once converged the confidence does not fall.
    for (size_t k = 30; k < confidences.size(); ++k) {
        EXPECT_GE(confidences[k], confidences[k - 1] - 1e-9) << "step " << k;
    }
    EXPECT_GT(confidences.back(), 0.7);
    EXPECT_TRUE(filter.isHealthy());
}

TEST(PositionKalmanFilterTest, UncertaintyGrowsWithoutObservations) {
    PositionKalmanFilter filter(FilterConfig(), observation(0.0, 0.0), 0.0);
    double previous = filter.positionConfidence();
    for (int k = 1; k <= 10; ++k) {
        ASSERT_TRUE(filter.predict(static_cast<double>(k)));
        double confidence = filter.positionConfidence();
        EXPECT_LT(confidence, previous);
        previous = confidence;
    }
}

TEST(PositionKalmanFilterTest, MovingDeviceIsFollowed) {
    PositionKalmanFilter filter(FilterConfig(), observation(0.0, 0.0, 1.0), 0.0);
    for (int k = 1; k <= 40; ++k) {
        filter.predict(static_cast<double>(k));
        filter.update(observation(0.5 * k, 0.0, 1.0));
    }
    EXPECT_NEAR(filter.velocity().x(), 0.5, 0.05);
    EXPECT_NEAR(filter.position().x(), 20.0, 0.5);
}

TEST(PositionKalmanFilterTest, LowConfidenceObservationCorrectsLess) {
    PositionKalmanFilter trusted(FilterConfig(), observation(0.0, 0.0, 1.0), 0.0);
    PositionKalmanFilter doubtful(FilterConfig(), observation(0.0, 0.0, 1.0), 0.0);
    trusted.predict(1.0);
    doubtful.predict(1.0);
    trusted.update(observation(1.0, 0.0, 0.9));
    doubtful.update(observation(1.0, 0.0, 0.1));

    EXPECT_GT(trusted.position().x(), doubtful.position().x());
    EXPECT_GT(doubtful.position().x(), 0.0);
    EXPECT_LT(trusted.position().x(), 1.0);
}

TEST(PositionKalmanFilterTest, NonAdvancingTimeIsANoOp) {
    PositionKalmanFilter filter(FilterConfig(), observation(1.0, 1.0), 10.0);
    auto before = filter.trackState().P;
    EXPECT_TRUE(filter.predict(10.0));
    EXPECT_TRUE(filter.predict(9.0));
    EXPECT_TRUE(filter.trackState().P.isApprox(before));
    EXPECT_DOUBLE_EQ(filter.lastUpdateTime(), 10.0);
}

TEST(PositionKalmanFilterTest, RejectsNonFiniteObservation) {
    PositionKalmanFilter filter(FilterConfig(), observation(1.0, 1.0), 0.0);
    filter.predict(1.0);
    auto before = filter.trackState();
    EXPECT_EQ(filter.update(observation(std::nan(""), 1.0)), FilterUpdateStatus::REJECTED);
    EXPECT_TRUE(filter.trackState().x.isApprox(before.x));
    EXPECT_TRUE(filter.trackState().P.isApprox(before.P));

    EXPECT_THROW(PositionKalmanFilter(FilterConfig(), observation(std::nan(""), 0.0), 0.0), NumericalError);
}

TEST(PositionKalmanFilterTest, DivergedPredictionResetsCovariance) {
    FilterConfig config;
    config.max_covariance_trace = 100.0;
    PositionKalmanFilter filter(config, observation(4.0, 5.0), 0.0);

    // A long outage pushes the predicted covariance past the bound.
    EXPECT_FALSE(filter.predict(1000.0));
    EXPECT_TRUE(filter.position().isApprox(Eigen::Vector2d(4.0, 5.0)));
    EXPECT_TRUE(filter.velocity().isZero());
    EXPECT_TRUE(filter.isHealthy());
    EXPECT_LE(filter.trackState().P.trace(), config.max_covariance_trace);
    EXPECT_DOUBLE_EQ(filter.lastUpdateTime(), 1000.0);
}

TEST(PositionKalmanFilterTest, CovarianceStaysSymmetricPositiveDefinite) {
    PositionKalmanFilter filter(FilterConfig(), observation(0.0, 0.0, 0.3), 0.0);
    for (int k = 1; k <= 200; ++k) {
        filter.predict(k * 0.1);
        filter.update(observation(std::sin(k * 0.1), std::cos(k * 0.1), (k % 10) / 10.0));
        const auto& P = filter.trackState().P;
        ASSERT_TRUE(P.isApprox(P.transpose(), 1e-12));
        ASSERT_TRUE(filter.isHealthy());
    }
}

TEST(PositionKalmanFilterTest, InnovationGateRejectsOutliersThenFollows) {
    FilterConfig config;
    config.innovation_gate_probability = 0.99;
    config.max_consecutive_gated = 3;
    PositionKalmanFilter filter(config, observation(2.0, 3.0), 0.0);
    ASSERT_TRUE(filter.gatingEnabled());
    EXPECT_NEAR(*filter.gateThreshold(), -2.0 * std::log(0.01), 1e-6);

    for (int k = 1; k <= 10; ++k) {
        filter.predict(static_cast<double>(k));
        ASSERT_EQ(filter.update(observation(2.0, 3.0)), FilterUpdateStatus::CORRECTED);
    }

    filter.predict(11.0);
    EXPECT_EQ(filter.update(observation(50.0, 3.0)), FilterUpdateStatus::GATED_OUT);
    EXPECT_NEAR(filter.position().x(), 2.0, 1e-3);
    filter.predict(12.0);
    EXPECT_EQ(filter.update(observation(50.0, 3.0)), FilterUpdateStatus::GATED_OUT);
    EXPECT_EQ(filter.trackState().consecutive_gated, 2);

    // Third rejection in a row: the device really moved.
    filter.predict(13.0);
    EXPECT_EQ(filter.update(observation(50.0, 3.0)), FilterUpdateStatus::REINITIALIZED);
    EXPECT_TRUE(filter.position().isApprox(Eigen::Vector2d(50.0, 3.0)));
    EXPECT_EQ(filter.trackState().consecutive_gated, 0);
}

TEST(TemporalFilterTest, RejectsEveryInvalidFilterSetting) {
    FilterConfig gate;
    gate.innovation_gate_probability = 1.5;
    EXPECT_THROW(TemporalFilter{gate}, ConfigurationError);

    FilterConfig floor;
    floor.min_measurement_confidence = 0.0;
    EXPECT_THROW(TemporalFilter{floor}, ConfigurationError);

    FilterConfig gated;
    gated.max_consecutive_gated = 0;
    EXPECT_THROW(TemporalFilter{gated}, ConfigurationError);

    FilterConfig variance;
    variance.base_measurement_variance = -1.0;
    EXPECT_THROW(TemporalFilter{variance}, ConfigurationError);

    EXPECT_NO_THROW(TemporalFilter{FilterConfig()});
}

TEST(TemporalFilterTest, CreatesFiltersLazilyPerDevice) {
    TemporalFilter filters;
    EXPECT_FALSE(filters.step("phone", 0.0, std::nullopt).has_value());
    EXPECT_EQ(filters.size(), 0u);

    auto first = filters.step("phone", 0.0, observation(1.0, 1.0));
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->initialized);
    EXPECT_EQ(first->update, FilterUpdateStatus::PREDICTED_ONLY);
    EXPECT_TRUE(filters.contains("phone"));

    filters.step("watch", 0.0, observation(8.0, 8.0));
    EXPECT_EQ(filters.size(), 2u);

    auto corrected = filters.step("phone", 1.0, observation(1.0, 1.0));
    ASSERT_TRUE(corrected.has_value());
    EXPECT_FALSE(corrected->initialized);
    EXPECT_EQ(corrected->update, FilterUpdateStatus::CORRECTED);
    EXPECT_FALSE(corrected->numericalFailure());

    // The other device's state is untouched.
    ASSERT_NE(filters.find("watch"), nullptr);
    EXPECT_DOUBLE_EQ(filters.find("watch")->lastUpdateTime(), 0.0);
    EXPECT_TRUE(filters.find("watch")->position().isApprox(Eigen::Vector2d(8.0, 8.0)));
}

TEST(TemporalFilterTest, CoastsWithoutObservation) {
    TemporalFilter filters;
    auto first = filters.step("phone", 0.0, observation(1.0, 1.0));
    auto coast = filters.step("phone", 2.0, std::nullopt);
    ASSERT_TRUE(coast.has_value());
    EXPECT_EQ(coast->update, FilterUpdateStatus::PREDICTED_ONLY);
    EXPECT_TRUE(coast->position.isApprox(Eigen::Vector2d(1.0, 1.0)));
    EXPECT_LT(coast->confidence, first->confidence);
}

TEST(TemporalFilterTest, ReleaseStartsOverWithFreshCovariance) {
    TemporalFilter filters;
    filters.step("phone", 0.0, observation(1.0, 1.0));
    for (int k = 1; k <= 20; ++k) filters.step("phone", k, std::nullopt);
    double coasted_trace = filters.find("phone")->trackState().P.trace();

    EXPECT_TRUE(filters.release("phone"));
    EXPECT_FALSE(filters.release("phone"));
    EXPECT_FALSE(filters.contains("phone"));

    auto restarted = filters.step("phone", 100.0, observation(5.0, 5.0));
    ASSERT_TRUE(restarted.has_value());
    EXPECT_TRUE(restarted->initialized);
    EXPECT_TRUE(restarted->position.isApprox(Eigen::Vector2d(5.0, 5.0)));
    EXPECT_LT(filters.find("phone")->trackState().P.trace(), coasted_trace);
}

TEST(TemporalFilterTest, ReportsDivergenceAsNumericalFailure) {
    FilterConfig config;
    config.max_covariance_trace = 100.0;
    TemporalFilter filters(config);
    filters.step("phone", 0.0, observation(1.0, 1.0));
    auto step = filters.step("phone", 5000.0, std::nullopt);
    ASSERT_TRUE(step.has_value());
    EXPECT_TRUE(step->covariance_reset);
    EXPECT_TRUE(step->numericalFailure());
    EXPECT_TRUE(step->position.isApprox(Eigen::Vector2d(1.0, 1.0)));
}

TEST(TrackLifecycleTest, StateTransitions) {
    TrackLifecycle lifecycle;
    EXPECT_EQ(lifecycle.getTrackState(), TrackState::UNINITIALIZED);

    lifecycle.observeReading(1.0);
    lifecycle.onPositionSolved();
    EXPECT_EQ(lifecycle.getTrackState(), TrackState::TRACKING);

    EXPECT_FALSE(lifecycle.checkInactivity(20.0, 30.0));
    EXPECT_TRUE(lifecycle.checkInactivity(40.0, 30.0));
    EXPECT_EQ(lifecycle.getTrackState(), TrackState::STALE);
    EXPECT_FALSE(lifecycle.checkInactivity(50.0, 30.0)); // Reported once

    EXPECT_FALSE(lifecycle.observeReading(1.0)); // Old data does not revive it
    EXPECT_TRUE(lifecycle.observeReading(45.0));
    EXPECT_EQ(lifecycle.getTrackState(), TrackState::UNINITIALIZED);
}
