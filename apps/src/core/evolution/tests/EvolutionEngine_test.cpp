#include "CountingEvolutionConfig.h"
#include "core/evolution/EvolutionEngine.h"
#include "core/evolution/TournamentSelection.h"

#include <gtest/gtest.h>
#include <set>

using namespace GenEvo;

namespace {
constexpr uint32_t SEED = 42;
constexpr size_t POP_SIZE = 12;
} // namespace

class EvolutionEngineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        auto config = std::make_unique<CountingEvolutionConfig>(16);
        counters_ = config.get();
        engine_ = std::make_unique<EvolutionEngine<BinaryGenotype>>(
            POP_SIZE,
            std::move(config),
            std::make_unique<TournamentSelection<BinaryGenotype>>(2),
            SEED);
    }

    std::set<std::string> genotypeTexts() const
    {
        std::set<std::string> texts;
        for (const auto& individual : *engine_->population()) {
            texts.insert(individual.genotype().toString());
        }
        return texts;
    }

    // Owned by engine_.
    CountingEvolutionConfig* counters_ = nullptr;
    std::unique_ptr<EvolutionEngine<BinaryGenotype>> engine_;
};

TEST_F(EvolutionEngineTest, StartsUninitialized)
{
    EXPECT_EQ(engine_->state(), EngineState::Uninitialized);
    EXPECT_EQ(engine_->population(), nullptr);
    EXPECT_EQ(engine_->toString(), "");
    EXPECT_DOUBLE_EQ(engine_->getRecombinationProbability(), 0.8);
    EXPECT_DOUBLE_EQ(engine_->getMutationProbability(), 0.8);
}

TEST_F(EvolutionEngineTest, StartFillsPopulationWithUnevaluatedIndividuals)
{
    engine_->start();

    EXPECT_EQ(engine_->state(), EngineState::Started);
    ASSERT_NE(engine_->population(), nullptr);
    EXPECT_EQ(engine_->population()->size(), POP_SIZE);
    EXPECT_EQ(engine_->population()->evaluatedCount(), 0u);
    EXPECT_EQ(counters_->createCalls, static_cast<int>(POP_SIZE));
    EXPECT_EQ(counters_->evaluateCalls, 0);
}

TEST_F(EvolutionEngineTest, EvaluateBeforeStartDoesNothing)
{
    engine_->evaluate();

    EXPECT_EQ(engine_->state(), EngineState::Uninitialized);
    EXPECT_EQ(counters_->evaluateCalls, 0);
}

TEST_F(EvolutionEngineTest, EvaluateFillsInAllFitness)
{
    engine_->start();
    engine_->evaluate();

    EXPECT_EQ(engine_->state(), EngineState::Evaluated);
    EXPECT_EQ(engine_->population()->evaluatedCount(), POP_SIZE);
    EXPECT_EQ(counters_->evaluateCalls, static_cast<int>(POP_SIZE));
}

TEST_F(EvolutionEngineTest, EvaluateIsIdempotent)
{
    engine_->start();
    engine_->evaluate();

    std::vector<double> before;
    for (const auto& individual : *engine_->population()) {
        before.push_back(*individual.fitness());
    }

    engine_->evaluate();

    std::vector<double> after;
    for (const auto& individual : *engine_->population()) {
        after.push_back(*individual.fitness());
    }
    EXPECT_EQ(before, after);
    EXPECT_EQ(counters_->evaluateCalls, static_cast<int>(POP_SIZE));
}

TEST_F(EvolutionEngineTest, BreedReplacesPopulationWithUnevaluatedOffspring)
{
    engine_->start();
    engine_->evaluate();
    engine_->breed();

    EXPECT_EQ(engine_->state(), EngineState::Bred);
    EXPECT_EQ(engine_->generation(), 1);
    EXPECT_EQ(engine_->population()->size(), POP_SIZE);
    EXPECT_EQ(engine_->population()->evaluatedCount(), 0u);

    engine_->evaluate();
    EXPECT_EQ(counters_->evaluateCalls, static_cast<int>(2 * POP_SIZE));
}

TEST_F(EvolutionEngineTest, BreedWithoutEvaluateStillProducesFullGeneration)
{
    engine_->start();
    engine_->breed();

    EXPECT_EQ(engine_->population()->size(), POP_SIZE);
    EXPECT_EQ(counters_->evaluateCalls, 0);
}

TEST_F(EvolutionEngineTest, NoVariationCopiesParents)
{
    engine_->setRecombinationProbability(0.0);
    engine_->setMutationProbability(0.0);
    engine_->start();
    engine_->evaluate();
    const std::set<std::string> parents = genotypeTexts();

    engine_->breed();

    for (const auto& text : genotypeTexts()) {
        EXPECT_TRUE(parents.count(text) == 1) << text << " is not a copy of a parent";
    }
    EXPECT_EQ(counters_->recombineCalls, 0);
    EXPECT_EQ(counters_->mutateCalls, 0);
}

TEST_F(EvolutionEngineTest, CertainVariationRecombinesAndMutatesEveryChild)
{
    engine_->setRecombinationProbability(1.0);
    engine_->setMutationProbability(1.0);
    engine_->start();
    engine_->evaluate();

    engine_->breed();

    EXPECT_EQ(counters_->recombineCalls, static_cast<int>(POP_SIZE));
    EXPECT_EQ(counters_->mutateCalls, static_cast<int>(POP_SIZE));
}

TEST_F(EvolutionEngineTest, DefaultProbabilitiesMixCloningAndRecombination)
{
    engine_->start();
    for (int i = 0; i < 20; i++) {
        engine_->evaluate();
        engine_->breed();
    }

    // 240 children at p = 0.8: both counts land well inside (150, 235).
    EXPECT_GT(counters_->recombineCalls, 150);
    EXPECT_LT(counters_->recombineCalls, 235);
    EXPECT_GT(counters_->mutateCalls, 150);
    EXPECT_LT(counters_->mutateCalls, 235);
}

TEST_F(EvolutionEngineTest, StartDiscardsExistingPopulation)
{
    engine_->start();
    engine_->evaluate();
    engine_->breed();

    engine_->start();

    EXPECT_EQ(engine_->generation(), 0);
    EXPECT_EQ(engine_->state(), EngineState::Started);
    EXPECT_EQ(engine_->population()->evaluatedCount(), 0u);
    EXPECT_EQ(counters_->createCalls, static_cast<int>(2 * POP_SIZE));
}

TEST_F(EvolutionEngineTest, RenderingPrefixesPopulation)
{
    engine_->start();
    engine_->evaluate();

    const std::string text = engine_->toString();

    EXPECT_EQ(text, "Population:\n" + engine_->population()->toString());
    EXPECT_NE(text.find("best = "), std::string::npos);
}

TEST_F(EvolutionEngineTest, StatsReflectCurrentGeneration)
{
    engine_->start();
    GenerationStats stats = engine_->getStats();
    EXPECT_EQ(stats.populationSize, POP_SIZE);
    EXPECT_EQ(stats.evaluatedCount, 0u);
    EXPECT_FALSE(stats.bestFitness.has_value());

    engine_->evaluate();
    stats = engine_->getStats();
    EXPECT_EQ(stats.evaluatedCount, POP_SIZE);
    ASSERT_TRUE(stats.bestFitness.has_value());
    ASSERT_TRUE(stats.averageFitness.has_value());
    EXPECT_GE(*stats.bestFitness, *stats.averageFitness);
}

TEST_F(EvolutionEngineTest, SameSeedGivesSameRun)
{
    auto other = EvolutionEngine<BinaryGenotype>::withTournament(
        POP_SIZE, std::make_unique<CountingEvolutionConfig>(16), 2, SEED);

    engine_->start();
    other.start();
    for (int i = 0; i < 5; i++) {
        engine_->evaluate();
        engine_->breed();
        other.evaluate();
        other.breed();
    }

    EXPECT_EQ(engine_->toString(), other.toString());
}

TEST_F(EvolutionEngineTest, BreedBeforeStartAborts)
{
    EXPECT_DEATH({ engine_->breed(); }, ".*");
}

TEST_F(EvolutionEngineTest, InvalidProbabilityAborts)
{
    EXPECT_DEATH({ engine_->setMutationProbability(1.5); }, ".*");
    EXPECT_DEATH({ engine_->setRecombinationProbability(-0.1); }, ".*");
}

TEST(EvolutionEngineConstructionTest, ZeroPopulationSizeAborts)
{
    EXPECT_DEATH(
        {
            EvolutionEngine<BinaryGenotype>::withTournament(
                0, std::make_unique<CountingEvolutionConfig>(), 2, SEED);
        },
        ".*");
}
