/**
 * @file TestConfig.cpp
 * @brief Unit tests for the LevelsCcaConfig builder.
 */

#include <catch2/catch_test_macros.hpp>

#include "lcca/decoder/Config.hpp"

using namespace lcca::decoder;
using lcca::core::ErrorCode;

TEST_CASE("LevelsCcaConfig defaults", "[decoder][config]")
{
    auto config = LevelsCcaConfig::Builder{}.build();
    REQUIRE(config.has_value());

    REQUIRE(config->rank() == 1);
    REQUIRE(config->regX() == 1e-9);
    REQUIRE(config->rcondY() == 1e-8);
    REQUIRE(config->symmetricWhitener());
    REQUIRE(config->tolerance() == 1e-3);
    REQUIRE(config->maxIter() == 100);
    REQUIRE(config->weightSolver().mode == WeightSolverMode::kNegativeRidge);
    REQUIRE(config->weightSolver().maxIter == 30);
}

TEST_CASE("LevelsCcaConfig builder sets both sides at once", "[decoder][config]")
{
    auto config = LevelsCcaConfig::Builder{}
                      .rank(3)
                      .reg(0.1)
                      .rcondY(-2.0)
                      .symmetricWhitener(false)
                      .weightSolverMode(WeightSolverMode::kMultiplicative)
                      .build();
    REQUIRE(config.has_value());

    const CcaOptions options = config->ccaOptions();
    REQUIRE(options.rank == 3);
    REQUIRE(options.regX == 0.1);
    REQUIRE(options.regY == 0.1);
    REQUIRE(options.rcondX == 1e-8);
    REQUIRE(options.rcondY == -2.0);
    REQUIRE_FALSE(options.symmetric);
    REQUIRE(config->weightSolver().mode == WeightSolverMode::kMultiplicative);
}

TEST_CASE("LevelsCcaConfig rejects invalid parameters", "[decoder][config]")
{
    SECTION("rank")
    {
        auto config = LevelsCcaConfig::Builder{}.rank(0).build();
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code() == ErrorCode::kInvalidArgument);
    }

    SECTION("iterations")
    {
        REQUIRE_FALSE(LevelsCcaConfig::Builder{}.maxIter(0).build().has_value());
    }

    SECTION("regularization outside [0, 1]")
    {
        REQUIRE_FALSE(LevelsCcaConfig::Builder{}.regY(1.5).build().has_value());
        REQUIRE_FALSE(LevelsCcaConfig::Builder{}.regX(-0.1).build().has_value());
    }

    SECTION("negative tolerance")
    {
        REQUIRE_FALSE(LevelsCcaConfig::Builder{}.tolerance(-1.0).build().has_value());
    }

    SECTION("weight solver floor")
    {
        WeightSolverConfig weights;
        weights.floor = 0.0;
        REQUIRE_FALSE(LevelsCcaConfig::Builder{}.weightSolver(weights).build().has_value());
    }
}
