#pragma once
#include <cstddef>
#include <deque>
#include "core/config/EngineConfig.hpp"
#include "core/motion/Vector3.hpp"

namespace st {

// A tracking sample; timestamp in seconds from any caller-chosen origin.
struct PositionSample {
    Vector3 position;
    double timestamp{0.0};
};

// Recursive estimator state for one tracking session. Mutated once per
// sample, in order.
struct FilterState {
    Vector3 estimatedPosition;
    Vector3 estimatedVelocity;
    Vector3 smoothedPosition;
    float positionUncertainty{1.f};
    float velocityUncertainty{1.f};
    float measurementNoise{0.5f};
    bool stable{false};
    std::deque<PositionSample> history; // oldest first
};

struct MotionDebugInfo {
    Vector3 smoothedPosition;
    Vector3 estimatedPosition;
    Vector3 velocity;
    bool stable{false};
    size_t historySize{0};
    float positionUncertainty{0.f};
    float velocityUncertainty{0.f};
    float measurementNoise{0.f};
};

inline FilterState initialFilterState(const SmootherConfig& config) {
    FilterState state;
    state.estimatedPosition = config.initialPosition;
    state.smoothedPosition = config.initialPosition;
    state.positionUncertainty = config.initialUncertainty;
    state.velocityUncertainty = config.initialUncertainty;
    state.measurementNoise = config.measurementNoise;
    return state;
}

// Clears history and zeroes the estimates. Calibrated measurement noise is kept.
inline void resetFilterState(FilterState& state, const SmootherConfig& config) {
    state.history.clear();
    state.estimatedPosition = Vector3();
    state.estimatedVelocity = Vector3();
    state.smoothedPosition = Vector3();
    state.positionUncertainty = config.initialUncertainty;
    state.velocityUncertainty = config.initialUncertainty;
    state.stable = false;
}

inline MotionDebugInfo debugInfoFor(const FilterState& state) {
    MotionDebugInfo info;
    info.smoothedPosition = state.smoothedPosition;
    info.estimatedPosition = state.estimatedPosition;
    info.velocity = state.estimatedVelocity;
    info.stable = state.stable;
    info.historySize = state.history.size();
    info.positionUncertainty = state.positionUncertainty;
    info.velocityUncertainty = state.velocityUncertainty;
    info.measurementNoise = state.measurementNoise;
    return info;
}

} // namespace st
