/**
 * @file SyntheticLevels.hpp
 * @brief Deterministic multi-output synthetic data generator.
 * @author MasterLaplace
 *
 * Produces epochs whose channel data is driven by exactly one of several
 * candidate outputs: the events of output 0 are convolved with a fixed
 * impulse response, projected onto the channels through a fixed spatial
 * pattern, and buried in Gaussian noise. The remaining outputs carry
 * independent random events with no effect on the data.
 *
 * Deterministic for tests (fixed seed), time-seeded when seed == 0.
 *
 * @code
 *   SyntheticLevels gen(42);
 *   auto epochs = gen.generate(10);   // 10 trials
 * @endcode
 */

#pragma once

#include "lcca/stats/Epoch.hpp"

#include <cstdint>
#include <random>
#include <vector>

namespace lcca::sim {

using core::Index;

/**
 * @brief Shape and signal-to-noise profile of the generated data.
 */
struct SyntheticProfile {
    Index channelCount = 4;
    Index outputCount = 2;
    Index eventCount = 1;
    Index tau = 10;
    Index sampleCount = 500;
    double eventProbability = 0.1;
    double noiseToSignal = 2.0;
};

/**
 * @brief Generator of epochs with one true output.
 */
class SyntheticLevels {
public:
    /// @param seed  PRNG seed (0 = time-based)
    explicit SyntheticLevels(std::uint64_t seed = 0, SyntheticProfile profile = {});

    /// @brief Generates @p trials epochs.
    [[nodiscard]] std::vector<stats::Epoch> generate(std::size_t trials);

    /// @brief Index of the output that drives the data.
    [[nodiscard]] Index trueOutput() const noexcept { return 0; }

    [[nodiscard]] const SyntheticProfile& profile() const noexcept { return _profile; }
    [[nodiscard]] const Eigen::VectorXd& spatialPattern() const noexcept { return _pattern; }
    [[nodiscard]] const Eigen::VectorXd& impulseResponse() const noexcept { return _impulse; }

    /// @brief Reseeds the generator; patterns are regenerated.
    void reset(std::uint64_t seed = 0);

private:
    void drawPatterns();

    SyntheticProfile _profile;
    std::mt19937_64 _rng;
    std::normal_distribution<double> _noiseDist{0.0, 1.0};
    std::uniform_real_distribution<double> _eventDist{0.0, 1.0};
    Eigen::VectorXd _pattern;
    Eigen::VectorXd _impulse;
};

} // namespace lcca::sim
