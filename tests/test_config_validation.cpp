#include "core/config/EngineConfig.hpp"
#include "core/correction/CorrectionEngine.hpp"
#include "core/motion/MotionSmoother.hpp"
#include <cassert>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

template <typename Fn>
bool throwsConfigError(Fn fn) {
    try {
        fn();
    } catch (const st::ConfigError &) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    st::CorrectionConfig().validate();
    st::SmootherConfig().validate();

    st::CorrectionConfig noCache;
    noCache.cacheCapacity = 0;
    assert(throwsConfigError([&] { st::CorrectionEngine engine(noCache); }));

    st::CorrectionConfig noSuggestions;
    noSuggestions.maxSuggestions = 0;
    assert(throwsConfigError([&] { noSuggestions.validate(); }));

    st::CorrectionConfig noDistance;
    noDistance.maxEditDistance = 0;
    assert(throwsConfigError([&] { noDistance.validate(); }));

    st::SmootherConfig noHistory;
    noHistory.historyCapacity = 0;
    assert(throwsConfigError([&] { st::MotionSmoother smoother(noHistory); }));

    st::SmootherConfig badAlpha;
    badAlpha.smoothingFactor = 0.f;
    assert(throwsConfigError([&] { badAlpha.validate(); }));
    badAlpha.smoothingFactor = 1.5f;
    assert(throwsConfigError([&] { badAlpha.validate(); }));
    badAlpha.smoothingFactor = 1.f;
    badAlpha.validate();

    st::SmootherConfig badNoise;
    badNoise.measurementNoise = -1.f;
    assert(throwsConfigError([&] { badNoise.validate(); }));
    badNoise.measurementNoise = 0.5f;
    badNoise.processNoise = std::numeric_limits<float>::quiet_NaN();
    assert(throwsConfigError([&] { badNoise.validate(); }));

    st::SmootherConfig badStart;
    badStart.initialPosition = st::Vector3(0.f, std::numeric_limits<float>::infinity(), 0.f);
    assert(throwsConfigError([&] { badStart.validate(); }));

    st::SmootherConfig badThreshold;
    badThreshold.stabilityThreshold = 0.f;
    assert(throwsConfigError([&] { badThreshold.validate(); }));

    // ConfigError is an invalid_argument
    try {
        noCache.validate();
        assert(false);
    } catch (const std::invalid_argument &e) {
        assert(std::string(e.what()).find("cacheCapacity") != std::string::npos);
    }
    return 0;
}
