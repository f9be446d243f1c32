#pragma once
#include <algorithm>
#include <array>
#include <cstddef>
#include <deque>
#include <utility>
#include <vector>
#include "core/config/EngineConfig.hpp"
#include "core/motion/FilterState.hpp"
#include "core/motion/Vector3.hpp"

namespace st {

constexpr size_t kVelocityWindow = 3;
constexpr size_t kStabilityWindow = 5;
constexpr size_t kJitterWindow = 3;
constexpr size_t kOutlierWindow = 5;
constexpr size_t kMinStabilitySamples = 3;
constexpr float kOutlierSigma = 2.f;
constexpr float kMinMeasurementNoise = 0.1f;
constexpr float kCalibrationNoiseScale = 0.1f;
constexpr float kFastSpeed = 1.f;
constexpr float kSlowSpeed = 0.1f;

namespace detail {

inline std::deque<PositionSample>::const_iterator
windowBegin(const std::deque<PositionSample>& history, size_t count) {
    const size_t n = std::min(count, history.size());
    return history.end() - static_cast<std::ptrdiff_t>(n);
}

inline Vector3 meanOf(std::deque<PositionSample>::const_iterator first,
                      std::deque<PositionSample>::const_iterator last) {
    Vector3 sum;
    size_t n = 0;
    for (auto it = first; it != last; ++it, ++n)
        sum += it->position;
    return n ? sum / static_cast<float>(n) : sum;
}

} // namespace detail

// Mean squared distance of the points from their centroid.
inline float populationVariance(const std::vector<Vector3>& points) {
    if (points.empty())
        return 0.f;
    Vector3 mean;
    for (const auto& p : points)
        mean += p;
    mean /= static_cast<float>(points.size());
    float variance = 0.f;
    for (const auto& p : points)
        variance += (p - mean).lengthSquared();
    return variance / static_cast<float>(points.size());
}

inline float calibratedMeasurementNoise(const std::vector<Vector3>& samples) {
    return std::max(kMinMeasurementNoise, populationVariance(samples) * kCalibrationNoiseScale);
}

inline float smoothingFactorFor(const FilterState& state, const SmootherConfig& config) {
    if (!config.adaptiveSmoothing)
        return config.smoothingFactor;
    const float speed = state.estimatedVelocity.length();
    if (speed > kFastSpeed)
        return config.fastSmoothingFactor;
    if (speed < kSlowSpeed)
        return config.slowSmoothingFactor;
    return config.smoothingFactor;
}

// Averages dp/dt over consecutive pairs of the most recent samples. Leaves the
// velocity untouched when no pair has a positive dt.
inline void estimateVelocity(FilterState& state) {
    if (state.history.size() < 2)
        return;

    auto first = detail::windowBegin(state.history, kVelocityWindow);
    Vector3 total;
    int pairs = 0;
    for (auto it = first + 1; it != state.history.cend(); ++it) {
        const auto& prev = *(it - 1);
        const float dt = static_cast<float>(it->timestamp - prev.timestamp);
        if (dt > 0.f) {
            total += (it->position - prev.position) / dt;
            ++pairs;
        }
    }
    if (pairs == 0)
        return;

    state.estimatedVelocity = total / static_cast<float>(pairs);
    state.velocityUncertainty = state.estimatedVelocity.abs().maxComponent() * 0.1f;
}

inline bool isStableWindow(const std::deque<PositionSample>& history, float threshold) {
    if (history.size() < kMinStabilitySamples)
        return false;
    auto first = detail::windowBegin(history, kStabilityWindow);
    const Vector3 mean = detail::meanOf(first, history.end());
    float variance = 0.f;
    size_t n = 0;
    for (auto it = first; it != history.end(); ++it, ++n)
        variance += (it->position - mean).lengthSquared();
    variance /= static_cast<float>(n);
    return variance < threshold;
}

// Componentwise median of the last three samples, or `position` when there
// are fewer than three.
inline Vector3 medianOfRecent(const std::deque<PositionSample>& history, const Vector3& position) {
    if (history.size() < kJitterWindow)
        return position;
    auto first = detail::windowBegin(history, kJitterWindow);
    std::array<float, kJitterWindow> xs{}, ys{}, zs{};
    size_t i = 0;
    for (auto it = first; it != history.end(); ++it, ++i) {
        xs[i] = it->position.x;
        ys[i] = it->position.y;
        zs[i] = it->position.z;
    }
    std::sort(xs.begin(), xs.end());
    std::sort(ys.begin(), ys.end());
    std::sort(zs.begin(), zs.end());
    const size_t mid = kJitterWindow / 2;
    return {xs[mid], ys[mid], zs[mid]};
}

// Replaces `position` with the recent mean when it lies more than two
// standard deviations from it on any axis.
inline Vector3 rejectOutlier(const std::deque<PositionSample>& history, const Vector3& position) {
    if (history.size() < kOutlierWindow)
        return position;
    auto first = detail::windowBegin(history, kOutlierWindow);
    const Vector3 mean = detail::meanOf(first, history.end());
    Vector3 variance;
    for (auto it = first; it != history.end(); ++it) {
        const Vector3 diff = it->position - mean;
        variance += diff * diff;
    }
    variance /= static_cast<float>(kOutlierWindow);
    const Vector3 threshold = variance.sqrt() * kOutlierSigma;
    if (anyGreater((position - mean).abs(), threshold))
        return mean;
    return position;
}

// One filter step: Kalman-style predict/correct, exponential smoothing,
// velocity and stability refresh. Returns the new smoothed position.
inline Vector3 advance(FilterState& state, const PositionSample& sample, const SmootherConfig& config) {
    state.history.push_back(sample);
    while (state.history.size() > config.historyCapacity)
        state.history.pop_front();

    const Vector3 predicted = state.estimatedPosition + state.estimatedVelocity * config.predictionFactor;

    state.positionUncertainty += config.processNoise;
    state.velocityUncertainty += config.processNoise;

    const float gain = state.positionUncertainty / (state.positionUncertainty + state.measurementNoise);
    const Vector3 innovation = sample.position - predicted;
    state.estimatedPosition = predicted + innovation * gain;
    state.positionUncertainty *= (1.f - gain);

    const float alpha = smoothingFactorFor(state, config);
    state.smoothedPosition = state.smoothedPosition * (1.f - alpha) + state.estimatedPosition * alpha;

    estimateVelocity(state);
    state.stable = isStableWindow(state.history, config.stabilityThreshold);
    return state.smoothedPosition;
}

inline std::pair<FilterState, Vector3> transition(FilterState state, const PositionSample& sample,
                                                  const SmootherConfig& config) {
    const Vector3 smoothed = advance(state, sample, config);
    return {std::move(state), smoothed};
}

inline Vector3 predictPosition(const FilterState& state, float offsetSeconds) {
    return state.estimatedPosition + state.estimatedVelocity * offsetSeconds;
}

} // namespace st
