#pragma once
#include <sstream>
#include <vector>
#include "core/config/EngineConfig.hpp"
#include "core/motion/FilterState.hpp"
#include "core/motion/MotionFilter.hpp"
#include "core/motion/Vector3.hpp"
#include "utils/Logger.hpp"

namespace st {

// Turns noisy gaze/pointer samples into a stable, predicted position.
// One instance per tracking session; not thread safe.
class MotionSmoother {
public:
    explicit MotionSmoother(const SmootherConfig& config = SmootherConfig())
        : m_config(validated(config)), m_state(initialFilterState(m_config)) {}

    Vector3 update(const PositionSample& sample) { return advance(m_state, sample, m_config); }

    Vector3 update(const Vector3& position, double timestamp) {
        return update(PositionSample{position, timestamp});
    }

    // Linear extrapolation of the filter estimate; does not change state.
    Vector3 predict(float offsetSeconds) const { return predictPosition(m_state, offsetSeconds); }

    bool isStable() const { return m_state.stable; }
    Vector3 velocity() const { return m_state.estimatedVelocity; }
    Vector3 smoothedPosition() const { return m_state.smoothedPosition; }
    Vector3 estimatedPosition() const { return m_state.estimatedPosition; }
    float measurementNoise() const { return m_state.measurementNoise; }
    size_t historySize() const { return m_state.history.size(); }

    // Optional pre-filters for a raw sample before it is passed to update().
    Vector3 applyJitterReduction(const Vector3& position) const {
        return medianOfRecent(m_state.history, position);
    }

    Vector3 applyOutlierRejection(const Vector3& position) const {
        return rejectOutlier(m_state.history, position);
    }

    // Derives measurement noise from the spread of a batch of samples taken
    // while the user holds still.
    void calibrate(const std::vector<Vector3>& samples) {
        if (samples.empty())
            return;
        m_state.measurementNoise = calibratedMeasurementNoise(samples);
        std::ostringstream msg;
        msg << "Motion smoother calibrated from " << samples.size()
            << " samples. Measurement noise: " << m_state.measurementNoise;
        ST_LOG(LogLevel::Info, msg.str());
    }

    void reset() { resetFilterState(m_state, m_config); }

    MotionDebugInfo debugInfo() const { return debugInfoFor(m_state); }

    const FilterState& state() const { return m_state; }
    const SmootherConfig& config() const { return m_config; }

private:
    static const SmootherConfig& validated(const SmootherConfig& config) {
        config.validate();
        return config;
    }

    SmootherConfig m_config;
    FilterState m_state;
};

} // namespace st
