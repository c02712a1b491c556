/**
 * @file TestWhitener.cpp
 * @brief Unit tests for lcca::math whitening.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "lcca/math/Whitener.hpp"

#include <cstdint>
#include <limits>
#include <random>

using namespace lcca::math;
using Catch::Matchers::WithinAbs;

namespace {

Eigen::MatrixXd randomOrthogonal(Index n, std::uint64_t seed)
{
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> dist(0.0, 1.0);
    Eigen::MatrixXd a(n, n);
    for (Index i = 0; i < n; ++i)
        for (Index j = 0; j < n; ++j)
            a(i, j) = dist(rng);
    return Eigen::HouseholderQR<Eigen::MatrixXd>(a).householderQ();
}

Eigen::MatrixXd withSpectrum(const Eigen::VectorXd& spectrum, std::uint64_t seed)
{
    const Eigen::MatrixXd q = randomOrthogonal(spectrum.size(), seed);
    return q * spectrum.asDiagonal() * q.transpose();
}

} // namespace

TEST_CASE("regularizeCovariance shrinks towards the scaled identity", "[math][whitener]")
{
    Eigen::MatrixXd cov(2, 2);
    cov << 4, 2,
           2, 6;

    const Eigen::MatrixXd full = regularizeCovariance(cov, 1.0);
    REQUIRE_THAT(full(0, 0), WithinAbs(5.0, 1e-12));
    REQUIRE_THAT(full(1, 1), WithinAbs(5.0, 1e-12));
    REQUIRE_THAT(full(0, 1), WithinAbs(0.0, 1e-12));

    REQUIRE(regularizeCovariance(Eigen::MatrixXd::Zero(3, 3), 0.5).isZero());
}

TEST_CASE("retainedComponentCount follows the rcond conventions", "[math][whitener]")
{
    Eigen::VectorXd values(5);
    values << 10.0, 5.0, 1.0, 0.0, -1.0;

    SECTION("relative threshold")
    {
        REQUIRE(retainedComponentCount(values, 0.3) == 2);
        REQUIRE(retainedComponentCount(values, 0.05) == 3);
    }

    SECTION("zero keeps every positive eigenvalue")
    {
        REQUIRE(retainedComponentCount(values, 0.0) == 3);
    }

    SECTION("fraction of the positive mass")
    {
        REQUIRE(retainedComponentCount(values, -0.5) == 1);
        REQUIRE(retainedComponentCount(values, -0.9) == 2);
        REQUIRE(retainedComponentCount(values, -0.99) == 3);
    }

    SECTION("explicit count, capped at the positive eigenvalues")
    {
        REQUIRE(retainedComponentCount(values, -1.0) == 1);
        REQUIRE(retainedComponentCount(values, -2.5) == 2);
        REQUIRE(retainedComponentCount(values, -5.0) == 3);
        REQUIRE(retainedComponentCount(values, -1e30) == 3);
        REQUIRE(retainedComponentCount(values, -std::numeric_limits<double>::max()) == 3);
    }

    SECTION("no positive eigenvalue")
    {
        REQUIRE(retainedComponentCount(Eigen::VectorXd::Zero(3), 0.0) == 0);
        REQUIRE(retainedComponentCount(Eigen::VectorXd(0), -2.0) == 0);
    }
}

TEST_CASE("computeWhitener whitens a full-rank covariance", "[math][whitener]")
{
    Eigen::VectorXd spectrum(5);
    spectrum << 8.0, 4.0, 2.0, 1.0, 0.5;
    const Eigen::MatrixXd cov = withSpectrum(spectrum, 7);

    SECTION("symmetric form")
    {
        auto whitener = computeWhitener(cov, 0.0, 0.0);
        REQUIRE(whitener.has_value());
        REQUIRE(whitener->rank == 5);
        REQUIRE(whitener->matrix.rows() == 5);
        REQUIRE(whitener->matrix.cols() == 5);
        REQUIRE(whitener->matrix.isApprox(whitener->matrix.transpose(), 1e-10));

        const Eigen::MatrixXd white = whitener->matrix.transpose() * cov * whitener->matrix;
        REQUIRE(white.isApprox(Eigen::MatrixXd::Identity(5, 5), 1e-9));
    }

    SECTION("one-sided form")
    {
        auto whitener = computeWhitener(cov, 0.0, 0.0, false);
        REQUIRE(whitener.has_value());
        REQUIRE(whitener->matrix.cols() == 5);

        const Eigen::MatrixXd white = whitener->matrix.transpose() * cov * whitener->matrix;
        REQUIRE(white.isApprox(Eigen::MatrixXd::Identity(5, 5), 1e-9));
    }
}

TEST_CASE("computeWhitener truncates to the requested rank", "[math][whitener]")
{
    Eigen::VectorXd spectrum(5);
    spectrum << 10.0, 5.0, 1.0, 1e-3, 1e-4;
    const Eigen::MatrixXd cov = withSpectrum(spectrum, 11);

    SECTION("count convention")
    {
        auto whitener = computeWhitener(cov, 0.0, -2.0, false);
        REQUIRE(whitener.has_value());
        REQUIRE(whitener->rank == 2);
        REQUIRE(whitener->matrix.cols() == 2);
        REQUIRE(whitener->eigenvalues.size() == 2);
        REQUIRE_THAT(whitener->eigenvalues(0), WithinAbs(10.0, 1e-9));

        const Eigen::MatrixXd white = whitener->matrix.transpose() * cov * whitener->matrix;
        REQUIRE(white.isApprox(Eigen::MatrixXd::Identity(2, 2), 1e-9));
    }

    SECTION("relative convention")
    {
        auto whitener = computeWhitener(cov, 0.0, 1e-2);
        REQUIRE(whitener.has_value());
        REQUIRE(whitener->rank == 3);

        // symmetric whitener: W'CW is the projector onto the retained subspace
        const Eigen::MatrixXd white = whitener->matrix.transpose() * cov * whitener->matrix;
        REQUIRE_THAT(white.trace(), WithinAbs(3.0, 1e-9));
        REQUIRE((white * white).isApprox(white, 1e-9));
    }

    SECTION("fraction convention")
    {
        auto whitener = computeWhitener(cov, 0.0, -0.9);
        REQUIRE(whitener.has_value());
        REQUIRE(whitener->rank == 2);
    }

    SECTION("count larger than any index keeps the full rank")
    {
        auto whitener = computeWhitener(Eigen::MatrixXd::Identity(3, 3), 0.0, -1e30);
        REQUIRE(whitener.has_value());
        REQUIRE(whitener->rank == 3);
        REQUIRE(whitener->matrix.isApprox(Eigen::MatrixXd::Identity(3, 3)));
    }
}

TEST_CASE("computeWhitener degrades gracefully on degenerate input", "[math][whitener]")
{
    SECTION("all-zero matrix gives a zero-rank whitener")
    {
        auto symmetric = computeWhitener(Eigen::MatrixXd::Zero(3, 3), 1e-9, 1e-8);
        REQUIRE(symmetric.has_value());
        REQUIRE(symmetric->degenerate());
        REQUIRE(symmetric->matrix.rows() == 3);
        REQUIRE(symmetric->matrix.cols() == 3);
        REQUIRE(symmetric->matrix.isZero());

        auto oneSided = computeWhitener(Eigen::MatrixXd::Zero(3, 3), 1e-9, 1e-8, false);
        REQUIRE(oneSided.has_value());
        REQUIRE(oneSided->matrix.rows() == 3);
        REQUIRE(oneSided->matrix.cols() == 0);
    }

    SECTION("rank-deficient matrix keeps the non-null subspace")
    {
        Eigen::VectorXd spectrum(4);
        spectrum << 3.0, 1.0, 0.0, 0.0;
        auto whitener = computeWhitener(withSpectrum(spectrum, 3), 0.0, 1e-8);
        REQUIRE(whitener.has_value());
        REQUIRE(whitener->rank == 2);
    }
}

TEST_CASE("computeWhitener rejects invalid matrices", "[math][whitener]")
{
    SECTION("non-square")
    {
        auto whitener = computeWhitener(Eigen::MatrixXd::Identity(3, 4), 0.0, 0.0);
        REQUIRE_FALSE(whitener.has_value());
        REQUIRE(whitener.error().code() == lcca::core::ErrorCode::kShapeMismatch);
    }

    SECTION("non-finite")
    {
        Eigen::MatrixXd cov = Eigen::MatrixXd::Identity(2, 2);
        cov(0, 1) = std::numeric_limits<double>::quiet_NaN();
        auto whitener = computeWhitener(cov, 0.0, 0.0);
        REQUIRE_FALSE(whitener.has_value());
        REQUIRE(whitener.error().code() == lcca::core::ErrorCode::kNonFiniteInput);
    }
}
