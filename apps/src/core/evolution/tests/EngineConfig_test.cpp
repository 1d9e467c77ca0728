#include "core/evolution/EngineConfig.h"

#include <gtest/gtest.h>

using namespace GenEvo;

TEST(EngineConfigTest, DefaultsMatchStandardRun)
{
    const EngineConfig config;

    EXPECT_EQ(config.populationSize, 20);
    EXPECT_EQ(config.genotypeLength, 32);
    EXPECT_DOUBLE_EQ(config.recombinationProbability, 0.8);
    EXPECT_DOUBLE_EQ(config.mutationProbability, 0.8);
    EXPECT_DOUBLE_EQ(config.bitFlipProbability, 0.02);
    EXPECT_EQ(config.tournamentSize, 2);
    EXPECT_FALSE(config.targetFitness.has_value());
    EXPECT_TRUE(config.validate().isValue());
}

TEST(EngineConfigTest, MissingKeysKeepDefaults)
{
    const nlohmann::json j = { { "populationSize", 50 }, { "targetFitness", 1.0 } };

    const EngineConfig config = j.get<EngineConfig>();

    EXPECT_EQ(config.populationSize, 50);
    EXPECT_EQ(config.genotypeLength, 32);
    EXPECT_DOUBLE_EQ(config.bitFlipProbability, 0.02);
    ASSERT_TRUE(config.targetFitness.has_value());
    EXPECT_DOUBLE_EQ(*config.targetFitness, 1.0);
}

TEST(EngineConfigTest, JsonKeepsAllFields)
{
    EngineConfig config;
    config.populationSize = 7;
    config.genotypeLength = 64;
    config.crossoverPoints = 3;
    config.seed = 1234;
    config.targetFitness = 0.9;

    const nlohmann::json j = config;
    const EngineConfig loaded = j.get<EngineConfig>();

    EXPECT_EQ(loaded.populationSize, 7);
    EXPECT_EQ(loaded.genotypeLength, 64);
    EXPECT_EQ(loaded.crossoverPoints, 3);
    EXPECT_EQ(loaded.seed, 1234);
    ASSERT_TRUE(loaded.targetFitness.has_value());
    EXPECT_DOUBLE_EQ(*loaded.targetFitness, 0.9);
}

TEST(EngineConfigTest, AbsentTargetIsNotSerialized)
{
    const nlohmann::json j = EngineConfig{};
    EXPECT_FALSE(j.contains("targetFitness"));
}

TEST(EngineConfigTest, WrongTypeThrows)
{
    const nlohmann::json j = { { "populationSize", "many" } };
    EXPECT_THROW(j.get<EngineConfig>(), nlohmann::json::exception);
}

TEST(EngineConfigTest, ValidateRejectsZeroBitFlipProbability)
{
    EngineConfig config;
    config.bitFlipProbability = 0.0;

    const auto result = config.validate();

    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("bitFlipProbability"), std::string::npos);
}

TEST(EngineConfigTest, ValidateRejectsZeroTournament)
{
    EngineConfig config;
    config.tournamentSize = 0;

    const auto result = config.validate();

    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("tournamentSize"), std::string::npos);
}

TEST(EngineConfigTest, ValidateRejectsEmptyPopulation)
{
    EngineConfig config;
    config.populationSize = 0;
    EXPECT_TRUE(config.validate().isError());
}

TEST(EngineConfigTest, ValidateRejectsOutOfRangeProbabilities)
{
    EngineConfig config;
    config.recombinationProbability = 1.2;
    EXPECT_TRUE(config.validate().isError());

    config = EngineConfig{};
    config.mutationProbability = -0.5;
    EXPECT_TRUE(config.validate().isError());
}

TEST(EngineConfigTest, NegativeSeedIsRejected)
{
    const EngineConfig config = nlohmann::json{ { "seed", -1 } }.get<EngineConfig>();

    EXPECT_EQ(config.seed, -1);
    const auto result = config.validate();
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("seed"), std::string::npos);
}

TEST(EngineConfigTest, SeedMustFitInUnsigned32Bits)
{
    EngineConfig config;
    config.seed = 4294967295LL;
    EXPECT_TRUE(config.validate().isValue());

    config.seed = 4294967296LL;
    EXPECT_TRUE(config.validate().isError());
}
