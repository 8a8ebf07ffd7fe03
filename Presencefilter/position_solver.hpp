// position_solver.hpp
#ifndef PRESENCEFILTER_POSITION_SOLVER_HPP_
#define PRESENCEFILTER_POSITION_SOLVER_HPP_

// Standard Library Headers
#include <algorithm>   // For std::min, std::max
#include <cmath>       // For std::sqrt, std::abs, std::isfinite
#include <optional>    // For std::optional (C++17)
#include <string>
#include <utility>     // For std::move
#include <vector>

// Eigen Library Headers
#include <Eigen/Dense>       // For Eigen::MatrixXd, Eigen::VectorXd, Eigen::Matrix2d
#include <Eigen/Eigenvalues> // For Eigen::SelfAdjointEigenSolver

// Project-specific Headers
#include "common_types.hpp"        // For RawPosition, PositionMethod
#include "measurement_adapter.hpp" // For RangeMeasurement, DirectMeasurement, AdaptedMeasurements
#include "tracker_config.hpp"      // For SolverConfig

enum class SolveStatus {
    OK,
    INSUFFICIENT_SENSORS, // Not enough usable readings; nothing to solve
    SOLVER_FAILURE        // Enough readings, but the geometry is singular or near-singular
};

/**
 * @brief Outcome of solving one device in one tick.
 *
 * A position is present if and only if status is OK. A low-confidence position
 * is still OK; "no position" is only ever reported through the status.
 */
struct SolveResult {
    SolveStatus status = SolveStatus::INSUFFICIENT_SENSORS;
    std::optional<RawPosition> position;
    std::string detail; // Human-readable reason for a failure, or a note for a degraded success

    bool ok() const { return status == SolveStatus::OK; }

    static SolveResult success(const RawPosition& position, std::string detail = std::string()) {
        SolveResult result;
        result.status = SolveStatus::OK;
        result.position = position;
        result.detail = std::move(detail);
        return result;
    }

    static SolveResult failure(SolveStatus status, std::string detail) {
        SolveResult result;
        result.status = status;
        result.detail = std::move(detail);
        return result;
    }
};

/**
 * @brief The PositionSolver turns one device's adapted measurements into a RawPosition.
 *
 * - Direct-coordinate measurements are combined by confidence-weighted average.
 * - Ranges from three or more anchors are multilaterated: each circle equation is
 *   subtracted from the reference anchor's to get a linear system in (x, y), solved
 *   directly for three anchors and by least squares for more. The linear estimate is
 *   then refined with a few Gauss-Newton steps on the range residuals.
 * - When both candidates exist they are fused by confidence-weighted average.
 *
 * Multilateration confidence is the product of a residual factor, a geometric spread
 * factor (a coarse dilution-of-precision proxy) and a sensor-count factor.
 */
class PositionSolver {
public:
    static constexpr int kMinAnchors = 3;

    explicit PositionSolver(const SolverConfig& config = SolverConfig())
        : config_(config) {}

    /**
     * @brief Solves one device for one tick.
     * @param measurements The device's adapted measurements.
     * @return OK with a position, or INSUFFICIENT_SENSORS / SOLVER_FAILURE without one.
     */
    SolveResult solve(const AdaptedMeasurements& measurements) const {
        std::optional<RawPosition> direct = combineDirect(measurements.directs);

        SolveResult multi;
        if (static_cast<int>(measurements.ranges.size()) >= kMinAnchors) {
            multi = multilaterate(measurements.ranges);
        } else {
            multi = SolveResult::failure(SolveStatus::INSUFFICIENT_SENSORS,
                                         insufficientDetail(measurements.ranges.size(), measurements.directs.size()));
        }

        if (multi.ok() && direct) {
            return SolveResult::success(fuse(*direct, *multi.position));
        }
        if (multi.ok()) {
            return multi;
        }
        if (direct) {
            // A rejected multilateration does not discard a usable direct position.
            std::string note = multi.status == SolveStatus::SOLVER_FAILURE ? multi.detail : std::string();
            return SolveResult::success(*direct, note);
        }
        return multi;
    }

    /**
     * @brief Combines direct-coordinate measurements by confidence-weighted average.
     *
     * The resulting confidence is sum(c^2) / sum(c): each confidence weighted by
     * itself, so it never exceeds the largest contributing confidence.
     *
     * @return std::nullopt if there are no measurements or all have zero confidence.
     */
    std::optional<RawPosition> combineDirect(const std::vector<DirectMeasurement>& directs) const {
        double total_weight = 0.0;
        double weighted_confidence = 0.0;
        Eigen::Vector2d weighted_position = Eigen::Vector2d::Zero();
        int contributing = 0;

        for (const auto& direct : directs) {
            if (!(direct.confidence > 0.0)) continue; // Zero weight contributes nothing
            total_weight += direct.confidence;
            weighted_position += direct.confidence * direct.position;
            weighted_confidence += direct.confidence * direct.confidence;
            contributing++;
        }
        if (contributing == 0 || total_weight <= 0.0) {
            return std::nullopt;
        }

        RawPosition position;
        position.x = weighted_position.x() / total_weight;
        position.y = weighted_position.y() / total_weight;
        position.confidence = clamp01(weighted_confidence / total_weight);
        position.sensor_count = contributing;
        position.method = PositionMethod::DIRECT;
        return position;
    }

    /**
     * @brief Solves a position from ranges to three or more anchors.
     *
     * Linearization against the first anchor (x0, y0, d0), for each other anchor i:
     *   2(xi - x0) x + 2(yi - y0) y = d0^2 - di^2 + xi^2 - x0^2 + yi^2 - y0^2
     *
     * @return INSUFFICIENT_SENSORS for fewer than three anchors, SOLVER_FAILURE when the
     * normalized determinant of the system is below singularity_epsilon (collinear or
     * coincident anchors), OK otherwise.
     */
    SolveResult multilaterate(const std::vector<RangeMeasurement>& ranges) const {
        const int n = static_cast<int>(ranges.size());
        if (n < kMinAnchors) {
            return SolveResult::failure(SolveStatus::INSUFFICIENT_SENSORS, insufficientDetail(ranges.size(), 0));
        }

        const Eigen::Vector2d& ref = ranges[0].anchor;
        const double d0 = ranges[0].distance_m;

        Eigen::MatrixXd A(n - 1, 2);
        Eigen::VectorXd b(n - 1);
        for (int i = 1; i < n; ++i) {
            const Eigen::Vector2d& anchor = ranges[i].anchor;
            const double di = ranges[i].distance_m;
            A(i - 1, 0) = 2.0 * (anchor.x() - ref.x());
            A(i - 1, 1) = 2.0 * (anchor.y() - ref.y());
            b(i - 1) = d0 * d0 - di * di + anchor.squaredNorm() - ref.squaredNorm();
        }

        Eigen::Vector2d solution;
        if (n == kMinAnchors) {
            // Exactly determined: direct 2x2 solve.
            Eigen::Matrix2d M = A;
            double row_scale = M.row(0).norm() * M.row(1).norm();
            double normalized_det = row_scale > 0.0 ? std::abs(M.determinant()) / row_scale : 0.0;
            if (!(normalized_det >= config_.singularity_epsilon)) {
                return SolveResult::failure(SolveStatus::SOLVER_FAILURE, singularDetail(normalized_det));
            }
            solution = M.partialPivLu().solve(b);
        } else {
            // Overdetermined: least squares. Conditioning judged on the normal matrix,
            // 4 det / trace^2 = 4 l1 l2 / (l1 + l2)^2 in [0, 1].
            Eigen::Matrix2d normal = A.transpose() * A;
            double trace = normal.trace();
            double normalized_det = trace > 0.0 ? 4.0 * normal.determinant() / (trace * trace) : 0.0;
            if (!(normalized_det >= config_.singularity_epsilon)) {
                return SolveResult::failure(SolveStatus::SOLVER_FAILURE, singularDetail(normalized_det));
            }
            solution = A.colPivHouseholderQr().solve(b);
        }

        if (!solution.allFinite()) {
            return SolveResult::failure(SolveStatus::SOLVER_FAILURE, "multilateration produced a non-finite solution");
        }

        solution = refine(solution, ranges);

        RawPosition position;
        position.x = solution.x();
        position.y = solution.y();
        position.confidence = multilaterationConfidence(solution, ranges);
        position.sensor_count = n;
        position.method = PositionMethod::MULTILATERATION;
        return SolveResult::success(position);
    }

    /**
     * @brief Fuses a direct-coordinate candidate with a multilateration candidate.
     *
     * Position is the confidence-weighted average. Confidence is the confidence-weighted
     * average of the two inputs (not their product), so agreement is not penalized.
     */
    RawPosition fuse(const RawPosition& direct, const RawPosition& multilateration) const {
        const double wd = direct.confidence;
        const double wm = multilateration.confidence;
        const double total = wd + wm;
        if (!(total > 0.0)) {
            return direct;
        }

        RawPosition fused;
        fused.x = (wd * direct.x + wm * multilateration.x) / total;
        fused.y = (wd * direct.y + wm * multilateration.y) / total;
        fused.confidence = clamp01((wd * wd + wm * wm) / total);
        fused.sensor_count = direct.sensor_count + multilateration.sensor_count;
        fused.method = PositionMethod::FUSED;
        return fused;
    }

    /**
     * @brief Root-mean-square of (distance from position to anchor - measured distance).
     */
    static double rmsResidual(const Eigen::Vector2d& position, const std::vector<RangeMeasurement>& ranges) {
        if (ranges.empty()) return 0.0;
        double sum_sq = 0.0;
        for (const auto& range : ranges) {
            double r = (position - range.anchor).norm() - range.distance_m;
            sum_sq += r * r;
        }
        return std::sqrt(sum_sq / static_cast<double>(ranges.size()));
    }

    /**
     * @brief Smallest eigenvalue of the anchors' positional covariance (m^2).
     * Zero for collinear anchors; grows as the anchors surround the device.
     */
    static double anchorSpread(const std::vector<RangeMeasurement>& ranges) {
        if (ranges.size() < 2) return 0.0;
        Eigen::Vector2d mean = Eigen::Vector2d::Zero();
        for (const auto& range : ranges) mean += range.anchor;
        mean /= static_cast<double>(ranges.size());

        Eigen::Matrix2d covariance = Eigen::Matrix2d::Zero();
        for (const auto& range : ranges) {
            Eigen::Vector2d diff = range.anchor - mean;
            covariance += diff * diff.transpose();
        }
        covariance /= static_cast<double>(ranges.size());

        Eigen::SelfAdjointEigenSolver<Eigen::Matrix2d> eigen(covariance, Eigen::EigenvaluesOnly);
        if (eigen.info() != Eigen::Success) return 0.0;
        return std::max(0.0, eigen.eigenvalues()(0)); // Ascending order
    }

    double multilaterationConfidence(const Eigen::Vector2d& position, const std::vector<RangeMeasurement>& ranges) const {
        // Factor 1: residual error, inverted and normalized. 1.0 for a perfect fit, 0.5 at residual_scale_m.
        double residual_factor = 1.0 / (1.0 + rmsResidual(position, ranges) / config_.residual_scale_m);

        // Factor 2: geometric spread, penalizing near-collinear anchors.
        double spread_factor = clamp01(anchorSpread(ranges) / config_.spread_reference_m2);

        // Factor 3: sensor count, min_count_factor at 3 anchors up to 1.0 at saturation.
        double count_factor = countFactor(static_cast<int>(ranges.size()));

        return clamp01(residual_factor * spread_factor * count_factor);
    }

    double countFactor(int sensor_count) const {
        if (sensor_count >= config_.saturation_sensor_count) return 1.0;
        if (sensor_count <= kMinAnchors) return config_.min_count_factor;
        double span = static_cast<double>(config_.saturation_sensor_count - kMinAnchors);
        double t = static_cast<double>(sensor_count - kMinAnchors) / span;
        return config_.min_count_factor + (1.0 - config_.min_count_factor) * t;
    }

    const SolverConfig& config() const { return config_; }

private:
    SolverConfig config_;

    static double clamp01(double value) {
        if (!std::isfinite(value)) return 0.0;
        return std::max(0.0, std::min(1.0, value));
    }

    /**
     * @brief Gauss-Newton refinement of the linear estimate on the nonlinear residuals
     * r_i = |p - a_i| - d_i. A step is kept only if it lowers the RMS residual.
     */
    Eigen::Vector2d refine(const Eigen::Vector2d& initial, const std::vector<RangeMeasurement>& ranges) const {
        Eigen::Vector2d current = initial;
        double current_rms = rmsResidual(current, ranges);

        for (int iter = 0; iter < config_.refinement_iterations; ++iter) {
            if (current_rms < 1e-12) break; // Already exact

            Eigen::MatrixXd J(ranges.size(), 2);
            Eigen::VectorXd r(ranges.size());
            bool degenerate = false;
            for (size_t i = 0; i < ranges.size(); ++i) {
                Eigen::Vector2d diff = current - ranges[i].anchor;
                double norm = diff.norm();
                if (norm < 1e-9) { // Jacobian undefined on an anchor
                    degenerate = true;
                    break;
                }
                J.row(i) = (diff / norm).transpose();
                r(i) = norm - ranges[i].distance_m;
            }
            if (degenerate) break;

            Eigen::Matrix2d JtJ = J.transpose() * J;
            Eigen::LDLT<Eigen::Matrix2d> ldlt(JtJ);
            if (ldlt.info() != Eigen::Success || !(std::abs(JtJ.determinant()) > 1e-12)) break;

            Eigen::Vector2d step = ldlt.solve(-J.transpose() * r);
            if (!step.allFinite()) break;

            Eigen::Vector2d candidate = current + step;
            double candidate_rms = rmsResidual(candidate, ranges);
            if (!(candidate_rms < current_rms)) break;

            current = candidate;
            current_rms = candidate_rms;
            if (step.norm() < 1e-9) break;
        }
        return current;
    }

    static std::string insufficientDetail(size_t ranges, size_t directs) {
        return std::to_string(ranges) + " signal-strength sensor(s) and " + std::to_string(directs) +
               " direct-coordinate sensor(s); multilateration needs " + std::to_string(kMinAnchors);
    }

    static std::string singularDetail(double normalized_det) {
        return "multilateration system is singular or near-singular (normalized determinant " +
               std::to_string(normalized_det) + ")";
    }
};

#endif // PRESENCEFILTER_POSITION_SOLVER_HPP_
