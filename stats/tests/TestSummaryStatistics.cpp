/**
 * @file TestSummaryStatistics.cpp
 * @brief Unit tests for the covariance accumulator and epoch rejection.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "lcca/stats/OutlierRejection.hpp"
#include "lcca/stats/SummaryStatistics.hpp"

#include <cstdint>
#include <limits>
#include <random>
#include <span>
#include <vector>

using namespace lcca::stats;
using lcca::core::ErrorCode;
using lcca::core::Index;
using Catch::Matchers::WithinAbs;

namespace {

Epoch randomEpoch(std::mt19937_64& rng, Index n, Index d, Index nY, Index nE)
{
    std::normal_distribution<double> noise(0.0, 1.0);
    std::bernoulli_distribution fire(0.2);

    Epoch epoch;
    epoch.data.resize(n, d);
    for (Index s = 0; s < n; ++s)
        for (Index c = 0; c < d; ++c)
            epoch.data(s, c) = noise(rng);

    epoch.events = lcca::math::Tensor3(n, nY, nE);
    for (Index s = 0; s < n; ++s)
        for (Index y = 0; y < nY; ++y)
            for (Index e = 0; e < nE; ++e)
                epoch.events(s, y, e) = fire(rng) ? 1.0 : 0.0;
    return epoch;
}

std::vector<Epoch> randomBatch(std::size_t count, std::uint64_t seed)
{
    std::mt19937_64 rng(seed);
    std::vector<Epoch> epochs;
    for (std::size_t i = 0; i < count; ++i)
        epochs.push_back(randomEpoch(rng, 40, 3, 2, 2));
    return epochs;
}

bool sameTensor(const lcca::math::Tensor4& a, const lcca::math::Tensor4& b)
{
    return lcca::math::asMatrix(a, 1, a.size()).isApprox(lcca::math::asMatrix(b, 1, b.size()), 1e-12);
}

bool sameTensor(const lcca::math::Tensor5& a, const lcca::math::Tensor5& b)
{
    return lcca::math::asMatrix(a, 1, a.size()).isApprox(lcca::math::asMatrix(b, 1, b.size()), 1e-12);
}

} // namespace

TEST_CASE("SummaryStatistics accumulates the documented sums", "[stats]")
{
    Epoch epoch;
    epoch.data.resize(4, 1);
    epoch.data << 1, 2, 3, 4;
    epoch.events = lcca::math::Tensor3(4, 1, 1);
    epoch.events.setValues({{{1}}, {{0}}, {{1}}, {{0}}});

    const std::vector<Epoch> epochs{epoch};

    SECTION("no offset")
    {
        SummaryStatistics stats(1, 1, 1, {.tau = 2, .center = false});
        REQUIRE(stats.accumulate(epochs).has_value());

        REQUIRE_THAT(stats.cxx()(0, 0), WithinAbs(30.0, 1e-12));

        const auto cyx = stats.cyx();
        REQUIRE_THAT(cyx(0, 0, 0, 0), WithinAbs(4.0, 1e-12));
        REQUIRE_THAT(cyx(0, 0, 1, 0), WithinAbs(6.0, 1e-12));

        const auto cyy = stats.cyyCompressed();
        REQUIRE_THAT(cyy(0, 0, 0, 0, 0), WithinAbs(2.0, 1e-12));
        REQUIRE_THAT(cyy(1, 0, 0, 0, 0), WithinAbs(0.0, 1e-12));

        REQUIRE(stats.sampleCount() == 4);
        REQUIRE(stats.epochCount() == 1);
    }

    SECTION("data offset")
    {
        SummaryStatistics stats(1, 1, 1, {.tau = 2, .offset = 1, .center = false});
        REQUIRE(stats.accumulate(epochs).has_value());

        const auto cyx = stats.cyx();
        REQUIRE_THAT(cyx(0, 0, 0, 0), WithinAbs(6.0, 1e-12));
        REQUIRE_THAT(cyx(0, 0, 1, 0), WithinAbs(3.0, 1e-12));
    }

    SECTION("unit normalization divides by the sample count")
    {
        SummaryStatistics stats(1, 1, 1, {.tau = 2, .center = false, .unitNorm = true});
        REQUIRE(stats.accumulate(epochs).has_value());
        REQUIRE_THAT(stats.cxx()(0, 0), WithinAbs(7.5, 1e-12));
        REQUIRE_THAT(stats.cyyCompressed()(0, 0, 0, 0, 0), WithinAbs(0.5, 1e-12));
    }

    SECTION("centering removes the channel mean")
    {
        SummaryStatistics stats(1, 1, 1, {.tau = 1});
        REQUIRE(stats.accumulate(epochs).has_value());
        // deviations -1.5, -0.5, 0.5, 1.5
        REQUIRE_THAT(stats.cxx()(0, 0), WithinAbs(5.0, 1e-12));
        REQUIRE_THAT(stats.cyx()(0, 0, 0, 0), WithinAbs(-1.0, 1e-12));
    }
}

TEST_CASE("SummaryStatistics is additive across batches", "[stats]")
{
    const auto epochs = randomBatch(6, 17);
    const std::span<const Epoch> all(epochs);
    const SummaryStatisticsConfig config{.tau = 3, .badEpochThreshold = 0.0};

    SummaryStatistics once(3, 2, 2, config);
    REQUIRE(once.accumulate(all).has_value());

    SECTION("two calls on the same accumulator")
    {
        SummaryStatistics twice(3, 2, 2, config);
        REQUIRE(twice.accumulate(all.first(2)).has_value());
        REQUIRE(twice.accumulate(all.subspan(2)).has_value());

        REQUIRE(twice.cxx().isApprox(once.cxx(), 1e-12));
        REQUIRE(sameTensor(twice.cyx(), once.cyx()));
        REQUIRE(sameTensor(twice.cyyCompressed(), once.cyyCompressed()));
        REQUIRE(twice.sampleCount() == once.sampleCount());
    }

    SECTION("merge of two accumulators")
    {
        SummaryStatistics left(3, 2, 2, config);
        SummaryStatistics right(3, 2, 2, config);
        REQUIRE(left.accumulate(all.first(4)).has_value());
        REQUIRE(right.accumulate(all.subspan(4)).has_value());
        REQUIRE(left.merge(right).has_value());

        REQUIRE(left.cxx().isApprox(once.cxx(), 1e-12));
        REQUIRE(sameTensor(left.cyx(), once.cyx()));
        REQUIRE(sameTensor(left.cyyCompressed(), once.cyyCompressed()));
        REQUIRE(left.epochCount() == 6);
    }

    SECTION("merge refuses a different shape")
    {
        SummaryStatistics other(3, 2, 2, {.tau = 2});
        auto result = once.merge(other);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == ErrorCode::kShapeMismatch);
    }

    SECTION("reset clears every sum")
    {
        once.reset();
        REQUIRE(once.cxx().isZero());
        REQUIRE(once.epochCount() == 0);
        REQUIRE(once.sampleCount() == 0);
    }
}

TEST_CASE("SummaryStatistics lag-0 event block is symmetric", "[stats]")
{
    const auto epochs = randomBatch(3, 5);
    SummaryStatistics stats(3, 2, 2, {.tau = 4});
    REQUIRE(stats.accumulate(epochs).has_value());

    const auto cyy = stats.cyyCompressed();
    for (Index y = 0; y < 2; ++y)
        for (Index e = 0; e < 2; ++e)
            for (Index z = 0; z < 2; ++z)
                for (Index f = 0; f < 2; ++f)
                    REQUIRE_THAT(cyy(0, y, e, z, f), WithinAbs(cyy(0, z, f, y, e), 1e-12));
}

TEST_CASE("SummaryStatistics validates the whole batch first", "[stats]")
{
    auto epochs = randomBatch(3, 9);

    SECTION("channel count mismatch")
    {
        epochs[2].data = Eigen::MatrixXd::Zero(40, 5);
        SummaryStatistics stats(3, 2, 2);
        auto result = stats.accumulate(epochs);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == ErrorCode::kShapeMismatch);
        REQUIRE(stats.epochCount() == 0);
        REQUIRE(stats.cxx().isZero());
    }

    SECTION("non-finite data")
    {
        epochs[1].data(3, 1) = std::numeric_limits<double>::infinity();
        SummaryStatistics stats(3, 2, 2);
        auto result = stats.accumulate(epochs);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == ErrorCode::kNonFiniteInput);
    }
}

TEST_CASE("Outlier epochs are rejected relative to the median", "[stats][outlier]")
{
    auto epochs = randomBatch(5, 23);
    epochs[3].data *= 100.0;

    const auto keep = selectInlierEpochs(epochs, 4.0);
    REQUIRE(keep.size() == 5);
    REQUIRE_FALSE(keep[3]);
    REQUIRE(keep[0]);
    REQUIRE(keep[4]);

    REQUIRE(selectInlierEpochs(epochs, 0.0) == std::vector<bool>(5, true));

    SummaryStatistics stats(3, 2, 2, {.tau = 2});
    REQUIRE(stats.accumulate(epochs).has_value());
    REQUIRE(stats.epochCount() == 4);
    REQUIRE(stats.rejectedEpochCount() == 1);

    const auto magnitudes = epochMagnitudes(epochs);
    REQUIRE_THAT(magnitudes[3], WithinAbs(epochs[3].data.norm(), 1e-12));
}

TEST_CASE("The median of an even batch averages the middle magnitudes", "[stats][outlier]")
{
    std::vector<Epoch> epochs;
    for (const double magnitude : {10.0, 1.0, 3.0, 1.0}) {
        Epoch epoch;
        epoch.data = Eigen::MatrixXd::Constant(1, 1, magnitude);
        epoch.events = lcca::math::Tensor3(1, 1, 1);
        epoch.events.setZero();
        epochs.push_back(epoch);
    }

    // median 2: the limit is 8, not 4 × 3 = 12
    const auto keep = selectInlierEpochs(epochs, 4.0);
    REQUIRE(keep == std::vector<bool>{false, true, true, true});

    REQUIRE(selectInlierEpochs(epochs, 5.0) == std::vector<bool>(4, true));
}

TEST_CASE("SummaryStatistics reports invalid dimensions on accumulate", "[stats]")
{
    const auto epochs = randomBatch(2, 31);

    SECTION("negative lag count")
    {
        SummaryStatistics stats(3, 2, 2, {.tau = -3});
        REQUIRE(stats.cyx().size() == 0);
        REQUIRE(stats.cyyCompressed().size() == 0);

        auto result = stats.accumulate(epochs);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == ErrorCode::kInvalidArgument);
        REQUIRE(stats.epochCount() == 0);
    }

    SECTION("zero lag count")
    {
        SummaryStatistics stats(3, 2, 2, {.tau = 0});
        auto result = stats.accumulate(epochs);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == ErrorCode::kInvalidArgument);
    }

    SECTION("negative channel count")
    {
        SummaryStatistics stats(-1, 2, 2);
        REQUIRE(stats.cxx().size() == 0);

        auto result = stats.accumulate(epochs);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == ErrorCode::kInvalidArgument);
    }
}
