#include "core/motion/MotionSmoother.hpp"
#include <cassert>
#include <cmath>

// Every history-based estimate looks at a fixed number of recent samples.
// Each case below feeds more history than the window so that older samples
// would change the answer if they were included.

namespace {

bool near(float a, float b, float eps = 1e-3f) { return std::fabs(a - b) <= eps; }

} // namespace

int main() {
    // velocity: mean of the last two steps only (1 m/s, then 2 and 4 m/s)
    {
        st::MotionSmoother smoother;
        for (int i = 0; i < 7; ++i)
            smoother.update({0.1f * i, 0.f, 0.f}, 0.1 * i);
        assert(near(smoother.velocity().x, 1.f));
        smoother.update({0.7f, 0.f, 0.f}, 0.7);
        smoother.update({0.9f, 0.f, 0.f}, 0.8);
        smoother.update({1.3f, 0.f, 0.f}, 0.9);
        assert(smoother.historySize() == 10);
        assert(near(smoother.velocity().x, 3.f));
        assert(near(smoother.debugInfo().velocityUncertainty, 0.3f));
    }

    // stability: only the last five samples count
    {
        st::MotionSmoother smoother;
        for (int i = 0; i < 5; ++i)
            smoother.update({i % 2 == 0 ? 0.f : 10.f, 1.f, 1.f}, 0.05 * i);
        assert(!smoother.isStable());
        const st::Vector3 still(1.f, 1.f, 1.f);
        for (int i = 5; i < 9; ++i)
            smoother.update(still, 0.05 * i);
        // the last scattered sample is still inside the window
        assert(!smoother.isStable());
        smoother.update(still, 0.45);
        assert(smoother.historySize() == 10);
        assert(smoother.isStable());
    }

    // jitter: median of the last three samples
    {
        st::MotionSmoother smoother;
        for (int i = 0; i < 4; ++i)
            smoother.update({100.f, 0.f, 0.f}, 0.1 * i);
        smoother.update({2.f, 0.f, 0.f}, 0.4);
        smoother.update({3.f, 0.f, 0.f}, 0.5);
        smoother.update({1.f, 0.f, 0.f}, 0.6);
        assert(smoother.applyJitterReduction({50.f, 0.f, 0.f}) == st::Vector3(2.f, 0.f, 0.f));
    }

    // outliers: mean and spread of the last five samples
    {
        st::MotionSmoother smoother;
        const float xs[] = {-50.f, 50.f, -50.f, 0.5f, 1.f, 1.f, 1.f, 1.f};
        for (int i = 0; i < 8; ++i)
            smoother.update({xs[i], 0.f, 0.f}, 0.1 * i);
        // window mean 0.9, standard deviation 0.2, threshold 0.4
        assert(smoother.applyOutlierRejection({1.25f, 0.f, 0.f}) == st::Vector3(1.25f, 0.f, 0.f));
        const st::Vector3 replaced = smoother.applyOutlierRejection({2.f, 0.f, 0.f});
        assert(st::approxEqual(replaced, st::Vector3(0.9f, 0.f, 0.f)));
    }
    return 0;
}
