#pragma once
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include "core/motion/Vector3.hpp"

namespace st {

// Thrown when a component is constructed with unusable settings.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

struct CorrectionConfig {
    size_t cacheCapacity{100};
    size_t maxSuggestions{3};
    size_t maxEditDistance{2};
    size_t maxDictionaryEntries{1000};
    // Drop the cached suggestions of a word whenever learn() changes its entry.
    bool invalidateOnLearn{true};

    void validate() const {
        if (cacheCapacity == 0)
            throw ConfigError("correction.cacheCapacity must be positive");
        if (maxSuggestions == 0)
            throw ConfigError("correction.maxSuggestions must be positive");
        if (maxEditDistance == 0)
            throw ConfigError("correction.maxEditDistance must be positive");
        if (maxDictionaryEntries == 0)
            throw ConfigError("correction.maxDictionaryEntries must be positive");
    }
};

struct SmootherConfig {
    // Velocity is extrapolated over this fixed horizon, not over the sample dt.
    float predictionFactor{0.3f};
    float processNoise{0.1f};
    float measurementNoise{0.5f};
    float smoothingFactor{0.15f};
    float stabilityThreshold{0.01f};
    size_t historyCapacity{10};
    Vector3 initialPosition{0.f, 0.f, -0.5f};
    float initialUncertainty{1.f};

    bool adaptiveSmoothing{false};
    float fastSmoothingFactor{0.3f};
    float slowSmoothingFactor{0.05f};

    void validate() const {
        if (!std::isfinite(predictionFactor))
            throw ConfigError("smoother.predictionFactor must be finite");
        if (!std::isfinite(processNoise) || processNoise < 0.f)
            throw ConfigError("smoother.processNoise must be finite and non-negative");
        if (!std::isfinite(measurementNoise) || measurementNoise <= 0.f)
            throw ConfigError("smoother.measurementNoise must be finite and positive");
        checkFactor(smoothingFactor, "smoother.smoothingFactor");
        checkFactor(fastSmoothingFactor, "smoother.fastSmoothingFactor");
        checkFactor(slowSmoothingFactor, "smoother.slowSmoothingFactor");
        if (!std::isfinite(stabilityThreshold) || stabilityThreshold <= 0.f)
            throw ConfigError("smoother.stabilityThreshold must be finite and positive");
        if (historyCapacity == 0)
            throw ConfigError("smoother.historyCapacity must be positive");
        if (!initialPosition.isFinite())
            throw ConfigError("smoother.initialPosition must be finite");
        if (!std::isfinite(initialUncertainty) || initialUncertainty <= 0.f)
            throw ConfigError("smoother.initialUncertainty must be finite and positive");
    }

private:
    static void checkFactor(float value, const char* name) {
        if (!std::isfinite(value) || value <= 0.f || value > 1.f)
            throw ConfigError(std::string(name) + " must be in (0, 1]");
    }
};

} // namespace st
