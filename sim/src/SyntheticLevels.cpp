/**
 * @file SyntheticLevels.cpp
 * @brief Implementation of the deterministic multi-output generator.
 */

#include "lcca/sim/SyntheticLevels.hpp"

#include <chrono>
#include <cmath>
#include <numbers>

namespace lcca::sim {

namespace {

std::uint64_t resolveSeed(std::uint64_t seed)
{
    if (seed != 0)
        return seed;
    return static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
}

} // namespace

SyntheticLevels::SyntheticLevels(std::uint64_t seed, SyntheticProfile profile)
    : _profile(profile)
{
    _rng.seed(resolveSeed(seed));
    drawPatterns();
}

void SyntheticLevels::drawPatterns()
{
    _pattern.resize(_profile.channelCount);
    for (Index ch = 0; ch < _profile.channelCount; ++ch)
        _pattern(ch) = _noiseDist(_rng);
    if (_pattern.norm() > 0.0)
        _pattern.normalize();

    // half-sine bump, positive over the whole window
    _impulse.resize(_profile.tau);
    for (Index t = 0; t < _profile.tau; ++t)
        _impulse(t) = std::sin(std::numbers::pi * static_cast<double>(t + 1) / static_cast<double>(_profile.tau + 1));
}

std::vector<stats::Epoch> SyntheticLevels::generate(std::size_t trials)
{
    const Index n = _profile.sampleCount;
    const Index d = _profile.channelCount;
    const Index nY = _profile.outputCount;
    const Index nE = _profile.eventCount;
    const Index tau = _profile.tau;

    std::vector<stats::Epoch> epochs(trials);

    for (auto& epoch : epochs) {
        epoch.events = math::Tensor3(n, nY, nE);
        for (Index s = 0; s < n; ++s)
            for (Index y = 0; y < nY; ++y)
                for (Index e = 0; e < nE; ++e)
                    epoch.events(s, y, e) = _eventDist(_rng) < _profile.eventProbability ? 1.0 : 0.0;

        Eigen::VectorXd source = Eigen::VectorXd::Zero(n);
        for (Index s = 0; s < n; ++s)
            for (Index e = 0; e < nE; ++e) {
                if (epoch.events(s, trueOutput(), e) == 0.0)
                    continue;
                for (Index t = 0; t < tau && s + t < n; ++t)
                    source(s + t) += _impulse(t);
            }

        epoch.data = source * _pattern.transpose();
        for (Index s = 0; s < n; ++s)
            for (Index ch = 0; ch < d; ++ch)
                epoch.data(s, ch) += _profile.noiseToSignal * _noiseDist(_rng);
    }

    return epochs;
}

void SyntheticLevels::reset(std::uint64_t seed)
{
    _rng.seed(resolveSeed(seed));
    drawPatterns();
}

} // namespace lcca::sim
